// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LengthLimitError.hxx"

void
ThrowLengthLimitExceeded()
{
	try {
		throw LengthLimitExceeded{};
	} catch (...) {
		std::throw_with_nested(std::system_error{
				std::make_error_code(std::errc::bad_message),
				"Length limit exceeded",
			});
	}
}

std::exception_ptr
MakeLengthLimitError() noexcept
{
	try {
		ThrowLengthLimitExceeded();
	} catch (...) {
		return std::current_exception();
	}
}

bool
IsLengthLimitExceeded(std::exception_ptr ep) noexcept
{
	if (!ep)
		return false;

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return IsLengthLimitExceeded(e);
	} catch (...) {
		/* not a std::exception, therefore not ours */
		return false;
	}
}

bool
IsLengthLimitExceeded(const std::exception &e) noexcept
{
	if (dynamic_cast<const LengthLimitExceeded *>(&e) != nullptr)
		return true;

	/* walk down the chain of nested causes */
	const auto *nested = dynamic_cast<const std::nested_exception *>(&e);
	return nested != nullptr &&
		IsLengthLimitExceeded(nested->nested_ptr());
}
