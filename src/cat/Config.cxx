// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "util/StringParser.hxx"

#include <stdexcept>

using std::string_view_literals::operator""sv;

void
CatConfig::HandleSet(std::string_view name, const char *value)
{
	if (name == "limit"sv) {
		max_bytes = ParseSize(value);
	} else if (name == "buffer_size"sv) {
		buffer_size = ParsePositiveLong(value, 16 * MEGABYTE);
	} else
		throw std::runtime_error("Unknown variable");
}
