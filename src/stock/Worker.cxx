// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Worker.hxx"
#include "BackendConfig.hxx"
#include "spawn/Registry.hxx"
#include "spawn/Prepared.hxx"

#include <fmt/format.h>

Worker::Worker(ChildProcessRegistry &_registry, pid_t _pid,
	       UniqueFileDescriptor &&_input,
	       UniqueFileDescriptor &&_output,
	       UniqueFileDescriptor &&_error) noexcept
	:registry(_registry), pid(_pid),
	 output(std::move(_output)),
	 input(registry.GetEventLoop(), std::move(_input),
	       fmt::format("child[{}]", pid)),
	 error_log(registry.GetEventLoop(), std::move(_error), pid)
{
}

Worker::~Worker() noexcept
{
	registry.Kill(pid, kill_signal);
}

WorkerPtr
SpawnWorker(ChildProcessRegistry &registry, const BackendConfig &config)
{
	PreparedChildProcess p;
	p.args = config.args;

	for (const auto &[name, value] : config.env)
		p.SetEnv(name, value);

	auto [stdin_r, stdin_w] = UniqueFileDescriptor::CreatePipe();
	auto [stdout_r, stdout_w] = UniqueFileDescriptor::CreatePipe();
	auto [stderr_r, stderr_w] = UniqueFileDescriptor::CreatePipe();

	stdin_w.SetNonBlocking();
	stdout_r.SetNonBlocking();
	stderr_r.SetNonBlocking();

	p.stdin_fd = std::move(stdin_r);
	p.stdout_fd = std::move(stdout_w);
	p.stderr_fd = std::move(stderr_w);

	const pid_t pid = registry.Spawn(config.name, std::move(p));

	return std::make_unique<Worker>(registry, pid,
					std::move(stdin_w),
					std::move(stdout_r),
					std::move(stderr_r));
}
