// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Worker.hxx"
#include "BackendConfig.hxx"
#include "io/Logger.hxx"

#include <condition_variable>
#include <mutex>
#include <vector>

class ChildProcessRegistry;

/**
 * A pool of pre-spawned idle worker processes for one backend.  It
 * tries to keep at least #BackendConfig::min_pool_size idle workers
 * ready; each worker is handed out exactly once.
 *
 * All public methods are thread-safe.  Replenishment runs in
 * background threads.
 */
class ProcessPool final {
	ChildProcessRegistry &registry;

	const BackendConfig config;

	const Logger logger;

	mutable std::mutex mutex;

	/**
	 * Signalled when a background task finishes.
	 */
	std::condition_variable task_finished;

	/**
	 * Idle workers; the most recently spawned one is at the
	 * back.
	 */
	std::vector<WorkerPtr> idle;

	/**
	 * The number of workers being spawned which are going to be
	 * added to #idle.
	 */
	unsigned n_spawning = 0;

	/**
	 * The number of background replenish threads.
	 */
	unsigned n_tasks = 0;

	bool shutting_down = false;

public:
	ProcessPool(ChildProcessRegistry &_registry,
		    BackendConfig _config) noexcept;

	/**
	 * Kills all idle workers and waits for background replenish
	 * threads to finish.
	 */
	~ProcessPool() noexcept;

	ProcessPool(const ProcessPool &) = delete;
	ProcessPool &operator=(const ProcessPool &) = delete;

	const BackendConfig &GetConfig() const noexcept {
		return config;
	}

	/**
	 * Spawn #BackendConfig::min_pool_size workers concurrently and
	 * wait for all of them.  If any of them fails, all workers
	 * spawned by this call are killed and the first error is
	 * rethrown.
	 */
	void Initialize();

	/**
	 * Hand out an idle worker, or spawn a new one if there is none.
	 * The caller becomes the owner of the returned worker.  This
	 * method may block while spawning.
	 *
	 * Throws if spawning fails.
	 */
	WorkerPtr Acquire();

	/**
	 * Like Acquire(), but never spawns.  This does not block and
	 * may be called from the #EventLoop thread.
	 *
	 * @return an idle worker or nullptr if there is none
	 */
	WorkerPtr TryAcquireIdle() noexcept;

	/**
	 * Kill all idle workers and stop replenishing.
	 */
	void Shutdown() noexcept;

	[[gnu::pure]]
	std::size_t GetIdleCount() const noexcept;

	[[gnu::pure]]
	unsigned GetSpawningCount() const noexcept;

private:
	/**
	 * Spawn a worker and log the time it took.
	 *
	 * Throws on error.
	 */
	WorkerPtr Spawn();

	/**
	 * Launch a background thread which refills the pool.
	 */
	void ScheduleReplenish() noexcept;

	void Replenish();
	void ReplenishThread() noexcept;
};
