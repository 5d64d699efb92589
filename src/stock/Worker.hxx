// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ChildErrorLog.hxx"
#include "io/PipeWriter.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <memory>

#include <signal.h>
#include <sys/types.h>

struct BackendConfig;
class ChildProcessRegistry;

/**
 * A running worker process with pipes connected to its stdin, stdout
 * and stderr.  Destroying this object sends a signal to the process
 * (see SetKillSignal()).
 */
class Worker final {
	ChildProcessRegistry &registry;

	const pid_t pid;

	UniqueFileDescriptor output;

	PipeWriter input;

	ChildErrorLog error_log;

	int kill_signal = SIGTERM;

public:
	Worker(ChildProcessRegistry &_registry, pid_t _pid,
	       UniqueFileDescriptor &&_input,
	       UniqueFileDescriptor &&_output,
	       UniqueFileDescriptor &&_error) noexcept;

	~Worker() noexcept;

	Worker(const Worker &) = delete;
	Worker &operator=(const Worker &) = delete;

	pid_t GetPid() const noexcept {
		return pid;
	}

	/**
	 * The non-blocking read end of the stdout pipe.
	 */
	int GetOutput() const noexcept {
		return output.Get();
	}

	PipeWriter &GetInput() noexcept {
		return input;
	}

	ChildErrorLog &GetErrorLog() noexcept {
		return error_log;
	}

	/**
	 * Choose the signal which is sent by the destructor.
	 */
	void SetKillSignal(int signo) noexcept {
		kill_signal = signo;
	}
};

using WorkerPtr = std::unique_ptr<Worker>;

/**
 * Launch a new worker process.  May be called from any thread.
 *
 * Throws on error.
 */
WorkerPtr
SpawnWorker(ChildProcessRegistry &registry, const BackendConfig &config);
