// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "stock/ProcessPool.hxx"
#include "spawn/Registry.hxx"
#include "spawn/ExitListener.hxx"
#include "event/Loop.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <initializer_list>
#include <optional>
#include <set>
#include <system_error>
#include <thread>
#include <vector>

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace std::chrono_literals;

static BackendConfig
MakeBackend(std::initializer_list<const char *> args,
	    unsigned min_pool_size)
{
	BackendConfig config("test");
	config.args.assign(args.begin(), args.end());
	config.min_pool_size = min_pool_size;
	return config;
}

namespace {

class ProcessPoolTest : public ::testing::Test {
protected:
	EventLoop event_loop;
	ChildProcessRegistry registry{event_loop};

	static void SetUpTestSuite() {
		signal(SIGPIPE, SIG_IGN);
	}

	/**
	 * Run the event loop until the predicate returns true or a
	 * timeout expires.
	 */
	template<typename P>
	bool RunUntil(P &&predicate) {
		const auto deadline = std::chrono::steady_clock::now() + 10s;
		while (!predicate()) {
			if (std::chrono::steady_clock::now() > deadline)
				return false;

			event_loop.LoopOnceNonBlock();
			std::this_thread::sleep_for(1ms);
		}

		return true;
	}

	/**
	 * Read from the worker's stdout until a newline arrives.
	 */
	std::string ReadLine(Worker &worker) {
		std::string result;

		const bool found = RunUntil([&]{
			struct pollfd pfd{worker.GetOutput(), POLLIN, 0};
			if (poll(&pfd, 1, 0) <= 0)
				return false;

			char buffer[256];
			const ssize_t nbytes = read(worker.GetOutput(),
						    buffer, sizeof(buffer));
			if (nbytes <= 0)
				return true;

			result.append(buffer, nbytes);
			return result.find('\n') != result.npos;
		});

		EXPECT_TRUE(found);
		return result;
	}
};

struct RecordingExitListener final : ExitListener {
	std::optional<int> status;

	void OnChildProcessExit(int _status) noexcept override {
		status = _status;
	}
};

} // anonymous namespace

TEST_F(ProcessPoolTest, Initialize)
{
	ProcessPool pool(registry, MakeBackend({"cat"}, 2));
	EXPECT_EQ(pool.GetIdleCount(), 0u);

	pool.Initialize();
	EXPECT_EQ(pool.GetIdleCount(), 2u);
	EXPECT_EQ(pool.GetSpawningCount(), 0u);
	EXPECT_EQ(registry.GetCount(), 2u);
}

TEST_F(ProcessPoolTest, Disabled)
{
	ProcessPool pool(registry, MakeBackend({"cat"}, 0));
	pool.Initialize();
	EXPECT_EQ(pool.GetIdleCount(), 0u);

	/* spawned directly, no replenishment */
	auto worker = pool.Acquire();
	ASSERT_TRUE(worker);
	EXPECT_GT(worker->GetPid(), 0);
	EXPECT_EQ(pool.GetIdleCount(), 0u);
	EXPECT_EQ(pool.GetSpawningCount(), 0u);
}

TEST_F(ProcessPoolTest, Replenish)
{
	ProcessPool pool(registry, MakeBackend({"cat"}, 2));
	pool.Initialize();

	auto a = pool.Acquire();
	ASSERT_TRUE(a);

	/* the replacement arrives asynchronously */
	EXPECT_TRUE(RunUntil([&]{
		return pool.GetIdleCount() == 2 && pool.GetSpawningCount() == 0;
	}));

	auto b = pool.Acquire();
	auto c = pool.Acquire();
	auto d = pool.Acquire();

	std::set<pid_t> pids{a->GetPid(), b->GetPid(), c->GetPid(), d->GetPid()};
	EXPECT_EQ(pids.size(), 4u);

	EXPECT_TRUE(RunUntil([&]{
		return pool.GetIdleCount() == 2 && pool.GetSpawningCount() == 0;
	}));
}

TEST_F(ProcessPoolTest, NoOvershoot)
{
	ProcessPool pool(registry, MakeBackend({"cat"}, 2));
	pool.Initialize();

	/* two threads drain the pool repeatedly while replacements
	   are being spawned */
	std::atomic_uint n_running{2};
	std::vector<WorkerPtr> workers(10);
	auto acquire = [&pool, &n_running](WorkerPtr *begin, WorkerPtr *end){
		for (auto *i = begin; i != end; ++i) {
			*i = pool.Acquire();
			std::this_thread::sleep_for(2ms);
		}

		--n_running;
	};

	std::thread a(acquire, &workers[0], &workers[5]);
	std::thread b(acquire, &workers[5], &workers[0] + workers.size());

	std::size_t max_idle = 0;
	unsigned max_spawning = 0;
	auto sample = [&]{
		max_idle = std::max(max_idle, pool.GetIdleCount());
		max_spawning = std::max(max_spawning, pool.GetSpawningCount());
	};

	while (n_running > 0) {
		sample();
		event_loop.LoopOnceNonBlock();
	}

	a.join();
	b.join();

	EXPECT_TRUE(RunUntil([&]{
		sample();
		return pool.GetIdleCount() == 2 && pool.GetSpawningCount() == 0;
	}));

	/* keep sampling for a while; late replacements must be
	   discarded */
	const auto until = std::chrono::steady_clock::now() + 200ms;
	while (std::chrono::steady_clock::now() < until) {
		sample();
		event_loop.LoopOnceNonBlock();
		std::this_thread::sleep_for(1ms);
	}

	EXPECT_LE(max_idle, 2u);
	EXPECT_LE(max_spawning, 2u);
	EXPECT_EQ(pool.GetIdleCount(), 2u);

	std::set<pid_t> pids;
	for (const auto &i : workers) {
		ASSERT_TRUE(i);
		pids.insert(i->GetPid());
	}

	EXPECT_EQ(pids.size(), workers.size());
}

TEST_F(ProcessPoolTest, TryAcquireIdle)
{
	ProcessPool pool(registry, MakeBackend({"cat"}, 1));
	EXPECT_FALSE(pool.TryAcquireIdle());
	EXPECT_EQ(registry.GetCount(), 0u);

	pool.Initialize();

	auto worker = pool.TryAcquireIdle();
	ASSERT_TRUE(worker);

	/* the replacement arrives asynchronously; nothing is spawned
	   for the caller */
	EXPECT_TRUE(RunUntil([&]{
		return pool.GetIdleCount() == 1 && pool.GetSpawningCount() == 0;
	}));

	auto second = pool.TryAcquireIdle();
	ASSERT_TRUE(second);
	EXPECT_NE(second->GetPid(), worker->GetPid());
}

TEST_F(ProcessPoolTest, Concurrent)
{
	ProcessPool pool(registry, MakeBackend({"cat"}, 2));
	pool.Initialize();

	/* more acquirers than idle workers: nobody waits for another */
	std::vector<WorkerPtr> workers(6);
	std::vector<std::thread> threads;
	for (auto &i : workers)
		threads.emplace_back([&pool, &i]{ i = pool.Acquire(); });

	for (auto &i : threads)
		i.join();

	std::set<pid_t> pids;
	for (const auto &i : workers) {
		ASSERT_TRUE(i);
		pids.insert(i->GetPid());
	}

	EXPECT_EQ(pids.size(), workers.size());

	EXPECT_TRUE(RunUntil([&]{
		return pool.GetSpawningCount() == 0 && pool.GetIdleCount() == 2;
	}));
}

TEST_F(ProcessPoolTest, Echo)
{
	ProcessPool pool(registry, MakeBackend({"cat"}, 1));
	pool.Initialize();

	auto worker = pool.Acquire();
	worker->GetInput().Write("hello\n");
	EXPECT_EQ(ReadLine(*worker), "hello\n");

	worker->GetInput().Write("{\"jsonrpc\":\"2.0\"}\n");
	EXPECT_EQ(ReadLine(*worker), "{\"jsonrpc\":\"2.0\"}\n");
}

TEST_F(ProcessPoolTest, Environment)
{
	auto config = MakeBackend({"/bin/sh", "-c", "echo \"$GATEWAY_TEST\""}, 0);
	config.env.emplace_back("GATEWAY_TEST", "foo bar");
	ProcessPool pool(registry, std::move(config));

	auto worker = pool.Acquire();
	EXPECT_EQ(ReadLine(*worker), "foo bar\n");
}

TEST_F(ProcessPoolTest, SpawnFailure)
{
	ProcessPool pool(registry,
			 MakeBackend({"/nonexistent/stdio-gateway-backend"}, 0));
	EXPECT_THROW(pool.Acquire(), std::system_error);

	ProcessPool pool2(registry,
			  MakeBackend({"/nonexistent/stdio-gateway-backend"}, 3));
	EXPECT_THROW(pool2.Initialize(), std::system_error);
	EXPECT_EQ(pool2.GetIdleCount(), 0u);
	EXPECT_EQ(pool2.GetSpawningCount(), 0u);
}

TEST_F(ProcessPoolTest, Shutdown)
{
	ProcessPool pool(registry, MakeBackend({"cat"}, 3));
	pool.Initialize();
	EXPECT_EQ(registry.GetCount(), 3u);

	pool.Shutdown();
	EXPECT_EQ(pool.GetIdleCount(), 0u);

	/* the idle workers have been sent SIGTERM */
	EXPECT_TRUE(RunUntil([&]{ return registry.GetCount() == 0; }));

	/* still usable, but without replenishment */
	auto worker = pool.Acquire();
	ASSERT_TRUE(worker);
	EXPECT_TRUE(RunUntil([&]{ return pool.GetSpawningCount() == 0; }));
	EXPECT_EQ(pool.GetIdleCount(), 0u);
}

TEST_F(ProcessPoolTest, ExitStatus)
{
	ProcessPool pool(registry, MakeBackend({"/bin/sh", "-c", "exit 3"}, 0));

	auto worker = pool.Acquire();
	RecordingExitListener listener;

	auto status = registry.SetExitListener(worker->GetPid(), listener);
	if (!status) {
		EXPECT_TRUE(RunUntil([&]{ return listener.status.has_value(); }));
		status = listener.status;
	}

	ASSERT_TRUE(status);
	EXPECT_TRUE(WIFEXITED(*status));
	EXPECT_EQ(WEXITSTATUS(*status), 3);
}

TEST_F(ProcessPoolTest, Kill)
{
	ProcessPool pool(registry, MakeBackend({"cat"}, 0));

	auto worker = pool.Acquire();
	const pid_t pid = worker->GetPid();
	EXPECT_EQ(registry.GetCount(), 1u);

	/* SIGINT terminates "cat" */
	worker->SetKillSignal(SIGINT);
	worker.reset();

	EXPECT_TRUE(RunUntil([&]{ return registry.GetCount() == 0; }));
	EXPECT_EQ(kill(pid, 0), -1);
}
