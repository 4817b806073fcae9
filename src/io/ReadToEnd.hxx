// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Reader.hxx"
#include "ReadTask.hxx"

#include <cassert>
#include <vector>

/**
 * The number of bytes ReadToEnd() appends to the buffer before each
 * read.
 */
static constexpr std::size_t READ_TO_END_CHUNK_SIZE = 8192;

/**
 * Read everything from the given #Reader until it reports
 * end-of-stream, and append it to the given vector.  The buffer
 * passed to the #Reader is never empty.
 *
 * If the #Reader throws, the data read so far remains in #dest and
 * the exception is propagated.
 *
 * @return the number of bytes appended to #dest
 */
template<SyncReader R>
std::size_t
ReadToEnd(R &r, std::vector<std::byte> &dest,
	  std::size_t chunk_size=READ_TO_END_CHUNK_SIZE)
{
	assert(chunk_size > 0);

	const std::size_t start = dest.size();

	while (true) {
		const std::size_t position = dest.size();
		dest.resize(position + chunk_size);

		std::size_t nbytes;
		try {
			nbytes = r.Read(std::span{dest}.subspan(position));
		} catch (...) {
			dest.resize(position);
			throw;
		}

		dest.resize(position + nbytes);
		if (nbytes == 0)
			return dest.size() - start;
	}
}

/**
 * Coroutine version of ReadToEnd().  The #AsyncReader and the vector
 * must remain valid until the #ReadTask has finished or has been
 * destroyed.  If the task is destroyed while a read is pending, the
 * vector contains the data read so far followed by up to #chunk_size
 * bytes of unspecified contents.
 */
template<AsyncReader R>
ReadTask
CoReadToEnd(R &r, std::vector<std::byte> &dest,
	    std::size_t chunk_size=READ_TO_END_CHUNK_SIZE)
{
	assert(chunk_size > 0);

	const std::size_t start = dest.size();

	while (true) {
		const std::size_t position = dest.size();
		dest.resize(position + chunk_size);

		std::size_t nbytes;
		try {
			nbytes = co_await r.CoRead(std::span{dest}.subspan(position));
		} catch (...) {
			dest.resize(position);
			throw;
		}

		dest.resize(position + nbytes);
		if (nbytes == 0)
			co_return dest.size() - start;
	}
}
