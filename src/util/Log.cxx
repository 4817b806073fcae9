// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Log.hxx"

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

bool
IsLogLevelEnabled(unsigned level) noexcept
{
	return level <= log_level;
}

void
VLog(std::string_view domain,
     fmt::string_view format_str, fmt::format_args args)
{
	fmt::print(stderr, "{}: {}\n", domain, fmt::vformat(format_str, args));
}
