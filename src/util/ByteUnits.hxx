// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>

/*
 * Binary size units: one kilobyte is 1024 bytes, one megabyte is 1024
 * kilobytes and one gigabyte is 1024 megabytes.  All conversions
 * throw std::overflow_error if the result does not fit into
 * std::size_t.
 */

static constexpr std::size_t KILOBYTE = 1024;
static constexpr std::size_t MEGABYTE = 1024 * KILOBYTE;
static constexpr std::size_t GIGABYTE = 1024 * MEGABYTE;

constexpr std::size_t
MultiplySize(std::size_t value, std::size_t unit)
{
	if (value > std::numeric_limits<std::size_t>::max() / unit)
		throw std::overflow_error("Size is too large");

	return value * unit;
}

constexpr std::size_t
Kilobytes(std::size_t value)
{
	return MultiplySize(value, KILOBYTE);
}

constexpr std::size_t
Megabytes(std::size_t value)
{
	return MultiplySize(value, MEGABYTE);
}

constexpr std::size_t
Gigabytes(std::size_t value)
{
	return MultiplySize(value, GIGABYTE);
}
