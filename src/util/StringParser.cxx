// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringParser.hxx"
#include "ByteUnits.hxx"

#include <fmt/format.h>

#include <stdexcept>

#include <errno.h>
#include <stdlib.h>

/**
 * strtoul() skips leading whitespace and accepts a sign (even a
 * minus sign, which wraps around to a huge value); we accept
 * nothing but digits.
 */
static constexpr bool
IsDigit(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

unsigned long
ParseUnsignedLong(const char *s)
{
	if (!IsDigit(*s))
		throw std::runtime_error(fmt::format("Failed to parse number: '{}'", s));

	char *endptr;
	errno = 0;
	const auto value = strtoul(s, &endptr, 10);
	if (*endptr != 0)
		throw std::runtime_error(fmt::format("Failed to parse number: '{}'", s));

	if (errno == ERANGE)
		throw std::runtime_error(fmt::format("Number is too large: '{}'", s));

	return value;
}

unsigned long
ParsePositiveLong(const char *s, unsigned long max_value)
{
	const auto value = ParseUnsignedLong(s);
	if (value == 0)
		throw std::runtime_error("Value must be positive");

	if (value > max_value)
		throw std::runtime_error("Value is too large");

	return value;
}

std::size_t
ParseSize(const char *s)
{
	if (!IsDigit(*s))
		throw std::runtime_error(fmt::format("Failed to parse size: '{}'", s));

	char *endptr;
	errno = 0;
	const std::size_t value = strtoull(s, &endptr, 10);

	if (errno == ERANGE)
		throw std::runtime_error(fmt::format("Size is too large: '{}'", s));

	try {
		switch (*endptr) {
		case 0:
			return value;

		case 'k':
		case 'K':
			if (endptr[1] != 0)
				break;
			return Kilobytes(value);

		case 'm':
		case 'M':
			if (endptr[1] != 0)
				break;
			return Megabytes(value);

		case 'g':
		case 'G':
			if (endptr[1] != 0)
				break;
			return Gigabytes(value);
		}
	} catch (const std::overflow_error &) {
		throw std::runtime_error(fmt::format("Size is too large: '{}'", s));
	}

	throw std::runtime_error(fmt::format("Unknown size suffix: '{}'", s));
}
