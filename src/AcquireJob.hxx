// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "thread/Job.hxx"
#include "stock/Worker.hxx"

#include <exception>

class ProcessPool;
class GatewayConnection;

/**
 * Calls ProcessPool::Acquire() in a worker thread (because it may
 * block while spawning) and hands the result to the connection in
 * the main thread.  The job deletes itself after completion.
 */
class AcquireJob final : public ThreadJob {
	ProcessPool &pool;

	/**
	 * The connection which waits for the worker, or nullptr if it
	 * has been closed meanwhile.
	 */
	GatewayConnection *connection;

	WorkerPtr worker;

	std::exception_ptr error;

public:
	AcquireJob(ProcessPool &_pool, GatewayConnection &_connection) noexcept
		:pool(_pool), connection(&_connection) {}

	/**
	 * The connection has been closed.  The worker will be destroyed
	 * as soon as it is available.
	 */
	void Abandon() noexcept {
		connection = nullptr;
	}

	/* virtual methods from class ThreadJob */
	void Run() noexcept override;
	void Done() noexcept override;
};
