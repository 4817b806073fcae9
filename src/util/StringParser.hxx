// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>

/*
 * Parsers for configuration values.  They all throw
 * std::runtime_error on error.
 */

unsigned long
ParseUnsignedLong(const char *s);

unsigned long
ParsePositiveLong(const char *s, unsigned long max_value);

/**
 * Parse a size in bytes.  The number may be followed by one of the
 * (case insensitive) suffixes "k", "M" and "G" which multiply it by
 * 1024, 1024*1024 and 1024*1024*1024.
 */
std::size_t
ParseSize(const char *s);
