// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Reader.hxx"
#include "ReadTask.hxx"

#include <algorithm>
#include <string_view>

/**
 * A #Reader which reads from a memory buffer.  The buffer is not
 * owned by this object.
 */
class MemoryReader final : public Reader {
	std::span<const std::byte> buffer;

public:
	explicit constexpr MemoryReader(std::span<const std::byte> _buffer) noexcept
		:buffer(_buffer) {}

	explicit MemoryReader(std::string_view _buffer) noexcept
		:buffer(std::as_bytes(std::span{_buffer})) {}

	MemoryReader(MemoryReader &&src) noexcept
		:Reader(), buffer(src.buffer) {}

	/**
	 * Returns the data which has not yet been read.
	 */
	constexpr std::span<const std::byte> GetRemaining() const noexcept {
		return buffer;
	}

	/**
	 * Like Read(), but for use in a coroutine.  This never
	 * suspends.
	 */
	ReadTask CoRead(std::span<std::byte> dest) noexcept {
		co_return Read(dest);
	}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) noexcept override {
		const std::size_t nbytes = std::min(dest.size(), buffer.size());
		std::copy_n(buffer.begin(), nbytes, dest.begin());
		buffer = buffer.subspan(nbytes);
		return nbytes;
	}
};
