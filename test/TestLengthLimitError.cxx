// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "limit/LengthLimitError.hxx"
#include "util/ErrorChain.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

#include <errno.h>

TEST(LengthLimitError, Classification)
{
	try {
		ThrowLengthLimitExceeded();
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsInvalidData(e));
		EXPECT_TRUE(e.code() == std::errc::bad_message);
		EXPECT_TRUE(IsLengthLimitExceeded(e));

		/* the cause carries no further information */
		try {
			std::rethrow_if_nested(e);
			FAIL() << "No nested cause";
		} catch (const LengthLimitExceeded &cause) {
			EXPECT_STREQ(cause.what(), "Length limit exceeded");
		}
	}
}

TEST(LengthLimitError, ExceptionPtr)
{
	const auto ep = MakeLengthLimitError();
	ASSERT_TRUE(ep);
	EXPECT_TRUE(IsLengthLimitExceeded(ep));

	try {
		std::rethrow_exception(ep);
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsInvalidData(e));
		EXPECT_EQ(JoinErrorMessages(e).find("Length limit exceeded"), 0u);
	}
}

TEST(LengthLimitError, OtherErrors)
{
	EXPECT_FALSE(IsLengthLimitExceeded(std::exception_ptr{}));
	EXPECT_FALSE(IsLengthLimitExceeded(std::make_exception_ptr(std::runtime_error{"foo"})));
	EXPECT_FALSE(IsLengthLimitExceeded(std::make_exception_ptr(42)));

	const std::system_error e(EIO, std::system_category(), "Read failed");
	EXPECT_FALSE(IsLengthLimitExceeded(e));
	EXPECT_FALSE(IsInvalidData(e));

	/* the same classification, but not caused by a limit */
	const std::system_error bad(std::make_error_code(std::errc::bad_message),
				    "Malformed chunk");
	EXPECT_TRUE(IsInvalidData(bad));
	EXPECT_FALSE(IsLengthLimitExceeded(bad));
}

TEST(LengthLimitError, NestedInOtherError)
{
	try {
		try {
			ThrowLengthLimitExceeded();
		} catch (...) {
			std::throw_with_nested(std::runtime_error{"Failed to read request body"});
		}
	} catch (const std::runtime_error &outer) {
		EXPECT_TRUE(IsLengthLimitExceeded(outer));
		EXPECT_TRUE(IsLengthLimitExceeded(std::current_exception()));

		const auto msg = JoinErrorMessages(outer);
		EXPECT_EQ(msg.find("Failed to read request body; Length limit exceeded"), 0u);
		EXPECT_NE(msg.rfind("; Length limit exceeded"), std::string::npos);
	}
}

TEST(ErrorChain, Join)
{
	const std::runtime_error single{"foo"};
	EXPECT_EQ(JoinErrorMessages(single), "foo");

	try {
		try {
			throw std::runtime_error{"inner"};
		} catch (...) {
			std::throw_with_nested(std::runtime_error{"outer"});
		}
	} catch (const std::exception &e) {
		EXPECT_EQ(JoinErrorMessages(e), "outer; inner");
		EXPECT_EQ(JoinErrorMessages(e, ": "), "outer: inner");
	}
}
