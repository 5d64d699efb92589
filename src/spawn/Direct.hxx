// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h>

struct PreparedChildProcess;

/**
 * Launch a child process with posix_spawnp().  The executable is
 * looked up in $PATH.  The child starts with an empty signal mask
 * and default signal dispositions.
 *
 * Throws on error (e.g. if the executable does not exist).
 *
 * @return the process id
 */
pid_t
SpawnChildProcess(PreparedChildProcess &&params);
