// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FdOutputStream.hxx"

#include <system_error>

#include <errno.h>
#include <unistd.h>

void
FdOutputStream::Write(std::span<const std::byte> src)
{
	while (!src.empty()) {
		const auto nbytes = write(fd, src.data(), src.size());
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw std::system_error(errno, std::system_category(),
						"Failed to write");
		}

		src = src.subspan(nbytes);
	}
}
