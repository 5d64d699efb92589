// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <stdio.h>
#include <stdlib.h>
#include <signal.h>
#include <sysexits.h>

int
main(int argc, char **argv)
try {
	GatewayCmdLine cmdline;

	try {
		ParseCommandLine(cmdline, argc, argv);
	} catch (const CommandLineError &e) {
		fprintf(stderr, "%s: %s\n"
			"Try '%s --help' for more information.\n",
			argv[0], e.what(), argv[0]);
		return EX_USAGE;
	}

	SetLogLevel(cmdline.verbose);

	GatewayConfig config;

	try {
		LoadConfigFile(config, cmdline.config_file);
	} catch (...) {
		PrintException(std::current_exception());
		return EX_CONFIG;
	}

	if (cmdline.check)
		return EXIT_SUCCESS;

	/* writing to a closed socket or pipe is reported as EPIPE */
	signal(SIGPIPE, SIG_IGN);

	GatewayInstance instance(config);

	instance.InitializePools();
	instance.Listen(cmdline.port);

	LogConcat(3, "gateway", "listening on port ", cmdline.port, " with ",
		  instance.pools.size(), " backend(s)");

	instance.event_loop.Dispatch();

	LogConcat(3, "gateway", "exiting");
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
