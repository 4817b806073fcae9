// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <string_view>
#include <utility>

/**
 * Set the verbosity.  Messages with a level above this value are
 * discarded; 0 means nothing but fatal errors is printed.  The
 * default is 1.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
bool
IsLogLevelEnabled(unsigned level) noexcept;

/**
 * Format the message and write it to stderr as "DOMAIN: MESSAGE".
 */
void
VLog(std::string_view domain,
     fmt::string_view format_str, fmt::format_args args);

template<typename... Args>
void
Log(unsigned level, std::string_view domain,
    fmt::format_string<Args...> format_str, Args&&... args)
{
	if (!IsLogLevelEnabled(level))
		return;

	VLog(domain, format_str, fmt::make_format_args(args...));
}

/**
 * Writes log messages with a fixed domain.
 */
class DomainLogger {
	std::string_view domain;

public:
	explicit constexpr DomainLogger(std::string_view _domain) noexcept
		:domain(_domain) {}

	template<typename... Args>
	void operator()(unsigned level,
			fmt::format_string<Args...> format_str,
			Args&&... args) const {
		Log(level, domain, format_str, std::forward<Args>(args)...);
	}
};
