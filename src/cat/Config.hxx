// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/ByteUnits.hxx"

#include <cstddef>
#include <string_view>

struct CatConfig {
	/**
	 * The exclusive upper bound for the number of bytes copied
	 * from standard input.
	 */
	std::size_t max_bytes = MEGABYTE;

	/**
	 * The size of the buffer passed to each read() call.
	 */
	std::size_t buffer_size = 64 * KILOBYTE;

	/**
	 * Handle one "--set NAME=VALUE" option.  Throws
	 * std::runtime_error on error.
	 */
	void HandleSet(std::string_view name, const char *value);
};
