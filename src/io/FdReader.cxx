// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FdReader.hxx"

#include <system_error>

#include <errno.h>
#include <unistd.h>

std::size_t
FdReader::Read(std::span<std::byte> dest)
{
	ssize_t nbytes;
	do {
		nbytes = read(fd, dest.data(), dest.size());
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes < 0)
		throw std::system_error(errno, std::system_category(),
					"Failed to read");

	return nbytes;
}
