// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/UniqueFileDescriptor.hxx"

#include <string>
#include <string_view>
#include <vector>

/**
 * Everything needed to launch a child process: the command line, the
 * environment overlay and the file descriptors which become its
 * stdin, stdout and stderr.
 */
struct PreparedChildProcess {
	std::vector<std::string> args;

	/**
	 * "NAME=VALUE" strings which are added to (or override) the
	 * environment inherited from this process.
	 */
	std::vector<std::string> env;

	UniqueFileDescriptor stdin_fd, stdout_fd, stderr_fd;

	PreparedChildProcess() = default;

	PreparedChildProcess(PreparedChildProcess &&) = default;
	PreparedChildProcess &operator=(PreparedChildProcess &&) = default;

	void Append(std::string_view arg) noexcept {
		args.emplace_back(arg);
	}

	void SetEnv(std::string_view name, std::string_view value) noexcept;

	/**
	 * Merge the inherited environment with the overlay.  Overlay
	 * entries replace inherited ones with the same name.
	 */
	std::vector<std::string> MakeEnvironment() const noexcept;
};
