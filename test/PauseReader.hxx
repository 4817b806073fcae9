// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/ReadTask.hxx"

#include <algorithm>
#include <cassert>
#include <coroutine>
#include <exception>
#include <span>
#include <string_view>
#include <utility>

/**
 * An #AsyncReader which suspends in each CoRead() call until the
 * test calls Resume().
 */
class PauseReader {
	std::span<const std::byte> data;

	std::coroutine_handle<> waiting;

	std::exception_ptr error;

	std::size_t last_request = 0;

	struct Pause {
		PauseReader &reader;

		~Pause() noexcept {
			/* if the read is canceled, the coroutine
			   frame is destroyed while it is suspended
			   here */
			reader.waiting = nullptr;
		}

		bool await_ready() const noexcept {
			return false;
		}

		void await_suspend(std::coroutine_handle<> coroutine) noexcept {
			reader.waiting = coroutine;
		}

		void await_resume() const noexcept {
		}
	};

public:
	explicit PauseReader(std::string_view _data) noexcept
		:data(std::as_bytes(std::span{_data})) {}

	PauseReader(const PauseReader &) = delete;
	PauseReader &operator=(const PauseReader &) = delete;

	bool IsWaiting() const noexcept {
		return (bool)waiting;
	}

	/**
	 * The size of the buffer passed to the most recent CoRead()
	 * call.
	 */
	std::size_t GetLastRequest() const noexcept {
		return last_request;
	}

	std::size_t GetAvailable() const noexcept {
		return data.size();
	}

	/**
	 * Let the pending CoRead() call finish.
	 */
	void Resume() noexcept {
		assert(waiting);

		std::exchange(waiting, nullptr).resume();
	}

	/**
	 * Let the pending CoRead() call fail with the given error.
	 */
	void Fail(std::exception_ptr _error) noexcept {
		error = std::move(_error);
		Resume();
	}

	ReadTask CoRead(std::span<std::byte> dest) {
		last_request = dest.size();

		co_await Pause{*this};

		if (error)
			std::rethrow_exception(std::exchange(error, {}));

		const std::size_t nbytes = std::min(dest.size(), data.size());
		std::copy_n(data.begin(), nbytes, dest.begin());
		data = data.subspan(nbytes);
		co_return nbytes;
	}
};
