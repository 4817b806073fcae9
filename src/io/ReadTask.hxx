// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <coroutine>
#include <cstddef>
#include <exception>
#include <utility>

/**
 * The coroutine returned by an asynchronous read: it completes with
 * the number of bytes read (or with an exception).
 *
 * It is lazy: nothing runs until it is awaited.  When it finishes,
 * the awaiting coroutine is resumed by symmetric transfer.
 *
 * Destroying a #ReadTask which is suspended cancels the read: its
 * coroutine frame (and every #ReadTask it awaits) is destroyed at its
 * current suspension point.
 */
class [[nodiscard]] ReadTask {
public:
	struct promise_type {
		std::coroutine_handle<> continuation;

		std::size_t value = 0;

		std::exception_ptr error;

		ReadTask get_return_object() noexcept {
			return ReadTask{std::coroutine_handle<promise_type>::from_promise(*this)};
		}

		std::suspend_always initial_suspend() const noexcept {
			return {};
		}

		struct FinalAwaitable {
			bool await_ready() const noexcept {
				return false;
			}

			std::coroutine_handle<> await_suspend(std::coroutine_handle<promise_type> coro) noexcept {
				if (auto c = coro.promise().continuation)
					return c;
				return std::noop_coroutine();
			}

			void await_resume() const noexcept {
			}
		};

		FinalAwaitable final_suspend() const noexcept {
			return {};
		}

		void return_value(std::size_t _value) noexcept {
			value = _value;
		}

		void unhandled_exception() noexcept {
			error = std::current_exception();
		}
	};

private:
	std::coroutine_handle<promise_type> coroutine;

	explicit ReadTask(std::coroutine_handle<promise_type> _coroutine) noexcept
		:coroutine(_coroutine) {}

public:
	ReadTask(ReadTask &&src) noexcept
		:coroutine(std::exchange(src.coroutine, nullptr)) {}

	~ReadTask() noexcept {
		if (coroutine)
			coroutine.destroy();
	}

	ReadTask &operator=(ReadTask &&) = delete;

	auto operator co_await() noexcept {
		struct Awaiter {
			std::coroutine_handle<promise_type> coroutine;

			bool await_ready() const noexcept {
				return coroutine.done();
			}

			std::coroutine_handle<> await_suspend(std::coroutine_handle<> continuation) noexcept {
				coroutine.promise().continuation = continuation;
				return coroutine;
			}

			std::size_t await_resume() {
				auto &p = coroutine.promise();
				if (p.error)
					std::rethrow_exception(p.error);
				return p.value;
			}
		};

		return Awaiter{coroutine};
	}
};
