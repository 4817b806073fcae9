// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Copy.hxx"
#include "limit/Units.hxx"
#include "io/FdOutputStream.hxx"
#include "util/Log.hxx"

#include <vector>

static constexpr DomainLogger logger("copy");

CopyResult
CopyLimited(Reader &input, FdOutputStream &output,
	    std::size_t max_bytes, std::size_t buffer_size)
{
	auto limited = LimitBytes(input, max_bytes);
	std::vector<std::byte> buffer(buffer_size);

	CopyResult result{0, false};

	while (true) {
		std::size_t nbytes;
		try {
			nbytes = limited.Read(buffer);
		} catch (const std::system_error &e) {
			if (!IsLengthLimitExceeded(e))
				throw;

			logger(1, "input has reached the limit of {} bytes",
			       max_bytes);
			result.limit_exceeded = true;
			return result;
		}

		if (nbytes == 0)
			break;

		output.Write(std::span{buffer}.first(nbytes));
		result.nbytes += nbytes;

		logger(5, "copied {} bytes, {} remaining",
		       result.nbytes, limited.GetRemaining());
	}

	logger(3, "end of input after {} bytes", result.nbytes);
	return result;
}
