// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Queue.hxx"
#include "Worker.hxx"

#include <forward_list>

/**
 * A #ThreadQueue plus a fixed number of #ThreadWorker instances
 * serving it.  To shut down, call Stop() and Join().
 */
class ThreadPool final {
	ThreadQueue queue;

	std::forward_list<ThreadWorker> workers;

	bool joined = false;

public:
	/**
	 * Create the queue and launch the worker threads.
	 *
	 * Throws on error.
	 */
	ThreadPool(EventLoop &event_loop, unsigned n_threads);

	~ThreadPool() noexcept;

	ThreadPool(const ThreadPool &) = delete;
	ThreadPool &operator=(const ThreadPool &) = delete;

	ThreadQueue &GetQueue() noexcept {
		return queue;
	}

	void Stop() noexcept {
		queue.Stop();
	}

	void Join() noexcept;
};
