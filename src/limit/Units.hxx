// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LengthLimitReader.hxx"
#include "util/ByteUnits.hxx"

/*
 * Shortcuts for constructing a #LengthLimitReader.  An rvalue input
 * is moved into the new object; an lvalue input is referenced, and
 * the caller must not read from it directly while it is wrapped.
 *
 * The unit conversions throw std::overflow_error if the limit does
 * not fit into std::size_t.
 */

template<typename I>
auto
LimitBytes(I &&input, std::size_t max_bytes)
{
	return LengthLimitReader<I>(std::forward<I>(input), max_bytes);
}

template<typename I>
auto
LimitKilobytes(I &&input, std::size_t max_kilobytes)
{
	return LimitBytes(std::forward<I>(input), Kilobytes(max_kilobytes));
}

template<typename I>
auto
LimitMegabytes(I &&input, std::size_t max_megabytes)
{
	return LimitBytes(std::forward<I>(input), Megabytes(max_megabytes));
}

template<typename I>
auto
LimitGigabytes(I &&input, std::size_t max_gigabytes)
{
	return LimitBytes(std::forward<I>(input), Gigabytes(max_gigabytes));
}
