// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LengthLimitError.hxx"
#include "io/Reader.hxx"
#include "io/ReadTask.hxx"

#include <algorithm>
#include <cassert>
#include <type_traits>
#include <utility>

/**
 * A reader proxy which enforces an upper bound for the number of
 * bytes which may be read from its input.  This protects code which
 * reads request bodies of unknown length (e.g. chunked uploads)
 * against clients which send an endless stream of data.
 *
 * The limit is exclusive: if the input is exactly as long as the
 * limit, the read which would report end-of-stream fails, too.  The
 * caller always gets the data up to the limit, followed by the error
 * created by MakeLengthLimitError().  After that, the object is
 * exhausted and each further read fails the same way.
 *
 * Errors thrown by the input are propagated unchanged.
 *
 * @param R the input type; it must satisfy #SyncReader (enables
 * Read()) and/or #AsyncReader (enables CoRead()); if this is an
 * lvalue reference type, the input is not owned by this object
 */
template<typename R>
requires SyncReader<R> || AsyncReader<R>
class LengthLimitReader {
	R input;

	/**
	 * The number of bytes which may still be read before the
	 * limit is reached.
	 */
	std::size_t remaining;

public:
	template<typename I>
	LengthLimitReader(I &&_input, std::size_t max_bytes)
		noexcept(std::is_nothrow_constructible_v<R, I &&>)
		:input(std::forward<I>(_input)), remaining(max_bytes) {}

	/**
	 * Returns the number of bytes which may be read before the
	 * limit is reached.
	 */
	std::size_t GetRemaining() const noexcept {
		return remaining;
	}

	const std::remove_reference_t<R> &GetInner() const noexcept {
		return input;
	}

	/**
	 * Give up the limit and return the input, which can then be
	 * read until its end.  Its read position is not modified;
	 * the rest of the budget is discarded.
	 */
	R Release() && noexcept(std::is_nothrow_move_constructible_v<R>) {
		return std::forward<R>(input);
	}

	/**
	 * Read from the input, but never more than the remaining
	 * budget.
	 *
	 * Throws the error created by MakeLengthLimitError() if the
	 * budget was already exhausted; in that case, the input is
	 * not accessed.
	 *
	 * @return the number of bytes read or 0 on end-of-stream
	 */
	std::size_t Read(std::span<std::byte> dest) requires SyncReader<R> {
		if (remaining == 0)
			ThrowLengthLimitExceeded();

		if (dest.size() > remaining)
			dest = dest.first(remaining);

		const std::size_t nbytes = input.Read(dest);
		assert(nbytes <= dest.size());

		Consumed(nbytes);
		return nbytes;
	}

	/**
	 * Coroutine version of Read().  The only suspension point is
	 * inside the input's CoRead() method.  The budget is only
	 * updated after the input's read has completed; destroying
	 * the returned #ReadTask before that leaves it unmodified.
	 */
	ReadTask CoRead(std::span<std::byte> dest) requires AsyncReader<R> {
		if (remaining == 0)
			ThrowLengthLimitExceeded();

		if (dest.size() > remaining)
			dest = dest.first(remaining);

		const std::size_t nbytes = co_await input.CoRead(dest);
		assert(nbytes <= dest.size());

		Consumed(nbytes);
		co_return nbytes;
	}

private:
	void Consumed(std::size_t nbytes) noexcept {
		remaining -= std::min(nbytes, remaining);
	}
};

template<typename I>
LengthLimitReader(I &&, std::size_t) -> LengthLimitReader<I>;
