// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "util/Log.hxx"
#include "util/ByteUnits.hxx"
#include "util/StringParser.hxx"
#include "version.h"

#include <stdexcept>
#include <string_view>

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <getopt.h>
#include <string.h>

static void
PrintUsage()
{
	puts("usage: length-limit-cat [options] <INPUT >OUTPUT\n\n"
	     "Copy standard input to standard output, but fail if the input\n"
	     "reaches the length limit.\n\n"
	     "valid options:\n"
	     " -h, --help              help (this text)\n"
	     " -V, --version           show length-limit-cat version\n"
	     " -v, --verbose           be more verbose\n"
	     " -q, --quiet             be quiet\n"
	     " -l, --limit SIZE        the limit; SIZE may have a k/M/G suffix\n"
	     " -b, --bytes N           limit in bytes\n"
	     " -k, --kilobytes N       limit in kilobytes (1024 bytes)\n"
	     " -m, --megabytes N       limit in megabytes (1024 kilobytes)\n"
	     " -g, --gigabytes N       limit in gigabytes (1024 megabytes)\n"
	     " -s, --set NAME=VALUE    tweak a setting (limit, buffer_size)\n"
	     "\n"
	     "exit status: 0 if the input ended below the limit,\n"
	     "2 if the limit was reached, 1 on any other error\n"
	     );
}

static void arg_error(const char *argv0, const char *fmt, ...)
	__attribute__ ((noreturn))
	__attribute__((format(printf,2,3)));
static void arg_error(const char *argv0, const char *fmt, ...) {
	if (fmt != nullptr) {
		va_list ap;

		fputs(argv0, stderr);
		fputs(": ", stderr);

		va_start(ap, fmt);
		vfprintf(stderr, fmt, ap);
		va_end(ap);

		putc('\n', stderr);
	}

	fprintf(stderr, "Try '%s --help' for more information.\n",
		argv0);
	exit(1);
}

static void
HandleSet(CatConfig &config,
	  const char *argv0, const char *p)
{
	const char *eq;

	eq = strchr(p, '=');
	if (eq == nullptr)
		arg_error(argv0, "No '=' found in --set argument");

	if (eq == p)
		arg_error(argv0, "No name found in --set argument");

	const std::string_view name(p, eq - p);
	const char *const value = eq + 1;

	try {
		config.HandleSet(name, value);
	} catch (const std::runtime_error &e) {
		arg_error(argv0, "Error while parsing \"--set %.*s\": %s",
			  (int)name.size(), name.data(), e.what());
	}
}

/**
 * Parse a number of units (the argument of --kilobytes etc.) and
 * convert it to bytes.
 */
static std::size_t
ParseLimit(const char *argv0, const char *s, std::size_t unit)
{
	try {
		return MultiplySize(ParseUnsignedLong(s), unit);
	} catch (const std::runtime_error &e) {
		arg_error(argv0, "Invalid limit: %s", e.what());
	}
}

/** read configuration options from the command line */
void
ParseCommandLine(CatConfig &config, int argc, char **argv)
{
	int ret;
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"limit", 1, nullptr, 'l'},
		{"bytes", 1, nullptr, 'b'},
		{"kilobytes", 1, nullptr, 'k'},
		{"megabytes", 1, nullptr, 'm'},
		{"gigabytes", 1, nullptr, 'g'},
		{"set", 1, nullptr, 's'},
		{nullptr, 0, nullptr, 0}
	};

	unsigned verbose = 1;

	while (1) {
		int option_index = 0;

		ret = getopt_long(argc, argv,
				  "hVvql:b:k:m:g:s:",
				  long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(0);

		case 'V':
			printf("length-limit-cat v%s\n", VERSION);
			exit(0);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'l':
			try {
				config.max_bytes = ParseSize(optarg);
			} catch (const std::runtime_error &e) {
				arg_error(argv[0], "Invalid limit: %s", e.what());
			}
			break;

		case 'b':
			config.max_bytes = ParseLimit(argv[0], optarg, 1);
			break;

		case 'k':
			config.max_bytes = ParseLimit(argv[0], optarg, KILOBYTE);
			break;

		case 'm':
			config.max_bytes = ParseLimit(argv[0], optarg, MEGABYTE);
			break;

		case 'g':
			config.max_bytes = ParseLimit(argv[0], optarg, GIGABYTE);
			break;

		case 's':
			HandleSet(config, argv[0], optarg);
			break;

		case '?':
			arg_error(argv[0], nullptr);

		default:
			exit(1);
		}
	}

	/* check non-option arguments */

	if (optind < argc)
		arg_error(argv[0], "unrecognized argument: %s", argv[optind]);

	SetLogLevel(verbose);
}
