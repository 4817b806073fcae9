// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "CommandLine.hxx"
#include "Copy.hxx"
#include "io/FdReader.hxx"
#include "io/FdOutputStream.hxx"
#include "util/ErrorChain.hxx"
#include "util/Log.hxx"

#include <fmt/format.h>

#include <stdlib.h>
#include <unistd.h>

int
main(int argc, char **argv)
try {
	CatConfig config;
	ParseCommandLine(config, argc, argv);

	Log(4, "main", "limit={} buffer_size={}",
	    config.max_bytes, config.buffer_size);

	FdReader input{STDIN_FILENO};
	FdOutputStream output{STDOUT_FILENO};

	const auto result = CopyLimited(input, output,
					config.max_bytes, config.buffer_size);
	return result.limit_exceeded ? 2 : EXIT_SUCCESS;
} catch (const std::exception &e) {
	fmt::print(stderr, "{}\n", JoinErrorMessages(e));
	return EXIT_FAILURE;
}
