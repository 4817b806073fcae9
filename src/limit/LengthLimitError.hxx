// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <system_error>

/**
 * The cause of the error thrown by #LengthLimitReader when the length
 * limit has been reached.  It carries no further information: the
 * caller knows which limit it has configured.
 *
 * This is never thrown directly; it is always nested inside a
 * std::system_error with the error code std::errc::bad_message (see
 * MakeLengthLimitError()).
 */
class LengthLimitExceeded final : public std::exception {
public:
	const char *what() const noexcept override {
		return "Length limit exceeded";
	}
};

/**
 * Create the error reported by #LengthLimitReader: a
 * std::system_error classified as "invalid data"
 * (std::errc::bad_message) with a nested #LengthLimitExceeded.
 */
std::exception_ptr
MakeLengthLimitError() noexcept;

[[noreturn]]
void
ThrowLengthLimitExceeded();

/**
 * Was this error caused by a length limit (and not by the underlying
 * source)?
 */
bool
IsLengthLimitExceeded(std::exception_ptr ep) noexcept;

bool
IsLengthLimitExceeded(const std::exception &e) noexcept;

/**
 * Is this error classified as "invalid data"?
 */
[[gnu::pure]]
static inline bool
IsInvalidData(const std::system_error &e) noexcept
{
	return e.code() == std::errc::bad_message;
}
