// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Reader.hxx"

/**
 * A #Reader which reads from a (blocking) file descriptor.  Errors
 * are thrown as std::system_error.  The file descriptor is not owned
 * by this object.
 */
class FdReader final : public Reader {
	int fd;

public:
	explicit constexpr FdReader(int _fd) noexcept
		:fd(_fd) {}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};
