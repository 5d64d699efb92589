// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Pool.hxx"

ThreadPool::ThreadPool(EventLoop &event_loop, unsigned n_threads)
	:queue(event_loop)
{
	try {
		for (unsigned i = 0; i < n_threads; ++i)
			workers.emplace_front(queue);
	} catch (...) {
		Stop();
		Join();
		throw;
	}
}

ThreadPool::~ThreadPool() noexcept
{
	Stop();
	Join();
}

void
ThreadPool::Join() noexcept
{
	if (joined)
		return;

	joined = true;

	for (auto &i : workers)
		i.Join();
}
