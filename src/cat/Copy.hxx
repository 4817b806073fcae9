// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>

class Reader;
class FdOutputStream;

struct CopyResult {
	/**
	 * The number of bytes which were copied.
	 */
	std::size_t nbytes;

	/**
	 * Was the copy aborted because the input reached the length
	 * limit?
	 */
	bool limit_exceeded;
};

/**
 * Copy everything from the #Reader to the #FdOutputStream, but stop
 * when the input reaches the given (exclusive) length limit.  All
 * data up to the limit is written.
 *
 * Errors other than the length limit are thrown.
 */
CopyResult
CopyLimited(Reader &input, FdOutputStream &output,
	    std::size_t max_bytes, std::size_t buffer_size);
