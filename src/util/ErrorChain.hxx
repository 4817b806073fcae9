// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <string>
#include <string_view>

/**
 * Build one message from the exception and all of its nested causes
 * (std::nested_exception), outermost first.
 */
std::string
JoinErrorMessages(const std::exception &e,
		  std::string_view separator="; ");
