// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

/**
 * Write everything to a (blocking) file descriptor, throwing
 * std::system_error on error.  The file descriptor is not owned by
 * this object.
 */
class FdOutputStream {
	int fd;

public:
	explicit constexpr FdOutputStream(int _fd) noexcept
		:fd(_fd) {}

	void Write(std::span<const std::byte> src);
};
