// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parse command line options.
 */

#pragma once

#include <stdexcept>

struct GatewayCmdLine {
	const char *config_file = nullptr;

	unsigned port = 3000;

	unsigned verbose = 1;

	/**
	 * Only check the configuration file and exit.
	 */
	bool check = false;
};

/**
 * The command line is malformed.  The caller shall print the message
 * and a hint to "--help".
 */
class CommandLineError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Parse the command line.  Prints the help or version text and exits
 * if requested.
 *
 * Throws #CommandLineError on error.
 */
void
ParseCommandLine(GatewayCmdLine &cmdline, int argc, char **argv);
