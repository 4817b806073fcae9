// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <concepts>
#include <cstddef>
#include <span>

class ReadTask;

/**
 * An interface that can read bytes from a stream until the stream
 * ends.
 */
class Reader {
public:
	Reader() = default;
	Reader(const Reader &) = delete;
	Reader &operator=(const Reader &) = delete;

	/**
	 * Read data from the stream.
	 *
	 * @return the number of bytes read into the given buffer or 0
	 * on end-of-stream
	 */
	virtual std::size_t Read(std::span<std::byte> dest) = 0;

protected:
	~Reader() noexcept = default;
};

/**
 * A type which can read synchronously, i.e. it has a method with the
 * semantics of Reader::Read().  Errors are reported by throwing
 * exceptions.
 */
template<typename R>
concept SyncReader = requires(R &r, std::span<std::byte> dest) {
	{ r.Read(dest) } -> std::convertible_to<std::size_t>;
};

/**
 * A type which can read in a coroutine: its CoRead() method returns a
 * #ReadTask which completes with the number of bytes read into the
 * given buffer, or 0 on end-of-stream.  The task may suspend while
 * waiting for data.
 */
template<typename R>
concept AsyncReader = requires(R &r, std::span<std::byte> dest) {
	{ r.CoRead(dest) } -> std::same_as<ReadTask>;
};
