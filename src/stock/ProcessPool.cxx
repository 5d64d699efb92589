// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ProcessPool.hxx"
#include "util/ScopeExit.hxx"

#include <chrono>
#include <thread>

ProcessPool::ProcessPool(ChildProcessRegistry &_registry,
			 BackendConfig _config) noexcept
	:registry(_registry), config(std::move(_config)),
	 logger(config.name)
{
}

ProcessPool::~ProcessPool() noexcept
{
	Shutdown();

	std::unique_lock<std::mutex> lock(mutex);
	task_finished.wait(lock, [this]{ return n_tasks == 0; });
}

WorkerPtr
ProcessPool::Spawn()
{
	const auto start_time = std::chrono::steady_clock::now();

	auto worker = SpawnWorker(registry, config);

	const std::chrono::duration<double, std::milli> duration =
		std::chrono::steady_clock::now() - start_time;
	logger.Fmt(3, "spawned process with PID {} in {:.2f}ms",
		   worker->GetPid(), duration.count());

	return worker;
}

void
ProcessPool::Initialize()
{
	const unsigned n = config.min_pool_size;
	if (n == 0)
		return;

	std::vector<WorkerPtr> workers(n);
	std::vector<std::exception_ptr> errors(n);

	{
		const std::lock_guard<std::mutex> lock(mutex);
		n_spawning += n;
	}

	{
		std::vector<std::thread> threads;
		threads.reserve(n);

		AtScopeExit(&threads, this, n) {
			for (auto &i : threads)
				i.join();

			const std::lock_guard<std::mutex> lock(mutex);
			n_spawning -= n;
		};

		for (unsigned i = 0; i < n; ++i)
			threads.emplace_back([this, &workers, &errors, i]{
				try {
					workers[i] = Spawn();
				} catch (...) {
					errors[i] = std::current_exception();
				}
			});
	}

	for (const auto &e : errors)
		if (e)
			/* the workers which were spawned successfully are
			   killed by the vector destructor */
			std::rethrow_exception(e);

	const std::lock_guard<std::mutex> lock(mutex);
	for (auto &i : workers)
		idle.emplace_back(std::move(i));
}

WorkerPtr
ProcessPool::TryAcquireIdle() noexcept
{
	std::unique_lock<std::mutex> lock(mutex);

	if (idle.empty())
		return nullptr;

	auto worker = std::move(idle.back());
	idle.pop_back();

	const bool below_minimum =
		idle.size() + n_spawning < config.min_pool_size;
	lock.unlock();

	logger(4, "handing out process ", worker->GetPid());

	if (below_minimum)
		ScheduleReplenish();

	return worker;
}

WorkerPtr
ProcessPool::Acquire()
{
	if (auto worker = TryAcquireIdle())
		return worker;

	/* no idle worker: spawn one directly for this caller */
	logger(4, "no idle process, spawning one");
	return Spawn();
}

void
ProcessPool::Shutdown() noexcept
{
	std::vector<WorkerPtr> old;

	{
		const std::lock_guard<std::mutex> lock(mutex);
		shutting_down = true;
		old.swap(idle);
	}

	for (const auto &i : old)
		logger(4, "killing process ", i->GetPid());

	/* the Worker destructor sends SIGTERM */
	old.clear();
}

std::size_t
ProcessPool::GetIdleCount() const noexcept
{
	const std::lock_guard<std::mutex> lock(mutex);
	return idle.size();
}

unsigned
ProcessPool::GetSpawningCount() const noexcept
{
	const std::lock_guard<std::mutex> lock(mutex);
	return n_spawning;
}

void
ProcessPool::ScheduleReplenish() noexcept
{
	{
		const std::lock_guard<std::mutex> lock(mutex);
		if (shutting_down)
			return;

		++n_tasks;
	}

	try {
		std::thread(&ProcessPool::ReplenishThread, this).detach();
	} catch (...) {
		logger(1, "failed to launch replenish thread: ",
		       std::current_exception());

		const std::lock_guard<std::mutex> lock(mutex);
		--n_tasks;
		task_finished.notify_all();
	}
}

inline void
ProcessPool::Replenish()
{
	{
		const std::lock_guard<std::mutex> lock(mutex);
		if (shutting_down ||
		    idle.size() + n_spawning >= config.min_pool_size)
			return;

		++n_spawning;
	}

	WorkerPtr worker;

	try {
		worker = Spawn();
	} catch (...) {
		const std::lock_guard<std::mutex> lock(mutex);
		--n_spawning;
		throw;
	}

	{
		const std::lock_guard<std::mutex> lock(mutex);
		--n_spawning;

		/* check again: other spawns may have completed in the
		   meantime */
		if (!shutting_down &&
		    idle.size() + n_spawning < config.min_pool_size) {
			idle.emplace_back(std::move(worker));
			return;
		}
	}

	logger(4, "killing surplus process ", worker->GetPid());
}

void
ProcessPool::ReplenishThread() noexcept
{
	try {
		Replenish();
	} catch (...) {
		logger(1, "failed to replenish pool: ",
		       std::current_exception());
	}

	/* notify while holding the lock; the destructor may free this
	   object as soon as the lock is released */
	const std::lock_guard<std::mutex> lock(mutex);
	--n_tasks;
	task_finished.notify_all();
}
