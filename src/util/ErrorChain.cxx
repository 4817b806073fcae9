// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ErrorChain.hxx"

std::string
JoinErrorMessages(const std::exception &e, std::string_view separator)
{
	std::string result = e.what();

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		result.append(separator);
		result.append(JoinErrorMessages(nested, separator));
	} catch (...) {
		result.append(separator);
		result.append("Unrecognized nested exception");
	}

	return result;
}
