// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <pthread.h>

class ThreadQueue;

/**
 * A thread that performs queued work.
 */
class ThreadWorker final {
	ThreadQueue &queue;

	pthread_t thread;

public:
	/**
	 * Launch the thread.
	 *
	 * Throws on error.
	 */
	explicit ThreadWorker(ThreadQueue &_queue);

	ThreadWorker(const ThreadWorker &) = delete;
	ThreadWorker &operator=(const ThreadWorker &) = delete;

	/**
	 * Wait for the thread to exit.  You must call
	 * ThreadQueue::Stop() prior to this function.
	 */
	void Join() noexcept {
		pthread_join(thread, nullptr);
	}

private:
	void Run() noexcept;
	static void *ThreadFunc(void *ctx) noexcept;
};
