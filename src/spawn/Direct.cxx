// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Direct.hxx"
#include "Prepared.hxx"
#include "system/Error.hxx"
#include "util/ScopeExit.hxx"

#include <stdexcept>

#include <spawn.h>
#include <signal.h>
#include <unistd.h>

static void
AddDup2(posix_spawn_file_actions_t &actions,
	const UniqueFileDescriptor &fd, int target)
{
	if (!fd.IsDefined())
		return;

	int error = posix_spawn_file_actions_adddup2(&actions, fd.Get(),
						     target);
	if (error != 0)
		throw MakeErrno(error, "posix_spawn_file_actions_adddup2() failed");
}

static std::vector<char *>
MakeArgv(const std::vector<std::string> &v) noexcept
{
	std::vector<char *> result;
	result.reserve(v.size() + 1);
	for (const auto &i : v)
		result.push_back(const_cast<char *>(i.c_str()));
	result.push_back(nullptr);
	return result;
}

pid_t
SpawnChildProcess(PreparedChildProcess &&params)
{
	if (params.args.empty())
		throw std::invalid_argument("No command line");

	posix_spawn_file_actions_t actions;
	posix_spawn_file_actions_init(&actions);
	AtScopeExit(&actions) { posix_spawn_file_actions_destroy(&actions); };

	AddDup2(actions, params.stdin_fd, STDIN_FILENO);
	AddDup2(actions, params.stdout_fd, STDOUT_FILENO);
	AddDup2(actions, params.stderr_fd, STDERR_FILENO);

	posix_spawnattr_t attr;
	posix_spawnattr_init(&attr);
	AtScopeExit(&attr) { posix_spawnattr_destroy(&attr); };

	/* the parent blocks SIGCHLD (and the shutdown signals) for its
	   signalfd; the child must not inherit that */
	sigset_t mask;
	sigemptyset(&mask);
	posix_spawnattr_setsigmask(&attr, &mask);

	sigset_t defaults;
	sigemptyset(&defaults);
	sigaddset(&defaults, SIGPIPE);
	sigaddset(&defaults, SIGINT);
	sigaddset(&defaults, SIGTERM);
	sigaddset(&defaults, SIGQUIT);
	sigaddset(&defaults, SIGHUP);
	sigaddset(&defaults, SIGCHLD);
	posix_spawnattr_setsigdefault(&attr, &defaults);

	posix_spawnattr_setflags(&attr,
				 POSIX_SPAWN_SETSIGMASK|POSIX_SPAWN_SETSIGDEF);

	const auto env = params.MakeEnvironment();
	auto argv = MakeArgv(params.args);
	auto envp = MakeArgv(env);

	pid_t pid;
	int error = posix_spawnp(&pid, argv.front(), &actions, &attr,
				 argv.data(), envp.data());
	if (error != 0)
		throw FmtErrno(error, "Failed to execute '{}'",
			       params.args.front());

	/* the child has its own copies now */
	params.stdin_fd.Close();
	params.stdout_fd.Close();
	params.stderr_fd.Close();

	return pid;
}
