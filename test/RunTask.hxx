// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/ReadTask.hxx"

#include <coroutine>
#include <exception>
#include <stdexcept>
#include <utility>

/**
 * Runs a #ReadTask from a unit test and records its result.
 */
class TaskRunner {
	struct Driver {
		struct promise_type {
			std::size_t value = 0;
			std::exception_ptr error;

			Driver get_return_object() noexcept {
				return {std::coroutine_handle<promise_type>::from_promise(*this)};
			}

			std::suspend_always initial_suspend() const noexcept {
				return {};
			}

			/* keep the frame (and the result) until the
			   #TaskRunner is destroyed */
			std::suspend_always final_suspend() const noexcept {
				return {};
			}

			void return_value(std::size_t _value) noexcept {
				value = _value;
			}

			void unhandled_exception() noexcept {
				error = std::current_exception();
			}
		};

		std::coroutine_handle<promise_type> coroutine;
	};

	std::coroutine_handle<Driver::promise_type> coroutine;

	static Driver Run(ReadTask task) {
		co_return co_await task;
	}

public:
	explicit TaskRunner(ReadTask &&task)
		:coroutine(Run(std::move(task)).coroutine) {}

	~TaskRunner() noexcept {
		if (coroutine)
			coroutine.destroy();
	}

	TaskRunner(const TaskRunner &) = delete;
	TaskRunner &operator=(const TaskRunner &) = delete;

	/**
	 * Run the task until it finishes or suspends.
	 */
	void Start() noexcept {
		coroutine.resume();
	}

	/**
	 * Destroy the task before it finishes.
	 */
	void Cancel() noexcept {
		std::exchange(coroutine, nullptr).destroy();
	}

	bool IsDone() const noexcept {
		return coroutine && coroutine.done();
	}

	/**
	 * Returns the task's value or rethrows its exception.
	 */
	std::size_t GetValue() const {
		if (!IsDone())
			throw std::logic_error("Task has not finished");

		const auto &p = coroutine.promise();
		if (p.error)
			std::rethrow_exception(p.error);

		return p.value;
	}
};

/**
 * Run a #ReadTask which is known to finish without suspending, and
 * return its value (or rethrow its exception).
 */
inline std::size_t
RunTask(ReadTask &&task)
{
	TaskRunner runner{std::move(task)};
	runner.Start();
	if (!runner.IsDone())
		throw std::logic_error("Task has suspended");

	return runner.GetValue();
}
