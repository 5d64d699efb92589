// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "util/CharUtil.hxx"

#include <fmt/format.h>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#ifndef VERSION
#define VERSION "0.1"
#endif

static void
PrintUsage()
{
	puts("usage: stdio-gateway [options] CONFIG_FILE\n\n"
	     "valid options:\n"
	     " --help\n"
	     " -h             help (this text)\n"
	     " --version\n"
	     " -V             show stdio-gateway version\n"
	     " --verbose\n"
	     " -v             be more verbose\n"
	     " --quiet\n"
	     " -q             be quiet\n"
	     " --port PORT\n"
	     " -p PORT        listen on this TCP port (default 3000)\n"
	     " --check        check the configuration file and exit\n"
	     "\n"
	     );
}

static unsigned
ParsePort(const char *s)
{
	if (!IsDigitASCII(*s))
		throw CommandLineError(fmt::format("Invalid port number: {}", s));

	char *endptr;
	const unsigned long value = strtoul(s, &endptr, 10);
	if (*endptr != 0 || value < 1 || value > 65535)
		throw CommandLineError(fmt::format("Invalid port number: {}", s));

	return value;
}

void
ParseCommandLine(GatewayCmdLine &cmdline, int argc, char **argv)
{
	enum {
		OPTION_CHECK = 0x100,
	};

	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"port", 1, nullptr, 'p'},
		{"check", 0, nullptr, OPTION_CHECK},
		{nullptr, 0, nullptr, 0}
	};

	/* restart scanning (also resets getopt's internal state), and
	   let us report errors */
	optind = 0;
	opterr = 0;

	while (true) {
		int option_index = 0;
		const int ret = getopt_long(argc, argv, ":hVvqp:",
					    long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(EXIT_SUCCESS);

		case 'V':
			printf("stdio-gateway v%s\n", VERSION);
			exit(EXIT_SUCCESS);

		case 'v':
			++cmdline.verbose;
			break;

		case 'q':
			cmdline.verbose = 0;
			break;

		case 'p':
			cmdline.port = ParsePort(optarg);
			break;

		case OPTION_CHECK:
			cmdline.check = true;
			break;

		case ':':
			throw CommandLineError(fmt::format("Option '{}' requires an argument",
							   argv[optind - 1]));

		default:
			throw CommandLineError(fmt::format("Unknown option: {}",
							   argv[optind - 1]));
		}
	}

	/* check non-option arguments */

	if (optind >= argc)
		throw CommandLineError("No configuration file specified");

	cmdline.config_file = argv[optind++];

	if (optind < argc)
		throw CommandLineError(fmt::format("Unrecognized argument: {}",
						   argv[optind]));
}
