// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "Config.hxx"
#include "stock/ProcessPool.hxx"

GatewayListener::GatewayListener(GatewayInstance &_instance) noexcept
	:ServerSocket(_instance.event_loop), instance(_instance)
{
}

void
GatewayListener::OnAccept(UniqueFileDescriptor &&fd,
			  std::string &&address) noexcept
{
	instance.AddConnection(std::move(fd), std::move(address));
}

void
GatewayListener::OnAcceptError(std::exception_ptr ep) noexcept
{
	LogConcat(2, "listener", ep);
}

GatewayInstance::GatewayInstance(const GatewayConfig &config)
	:shutdown_listener(event_loop, BIND_THIS_METHOD(ShutdownCallback)),
	 child_process_registry(event_loop),
	 listener(*this)
{
	/* block the shutdown signals before launching threads, so
	   they inherit the signal mask */
	shutdown_listener.Enable();

	for (const auto &i : config.backends)
		pools.emplace(i.name,
			      std::make_unique<ProcessPool>(child_process_registry,
							    i));

	thread_pool = std::make_unique<ThreadPool>(event_loop,
						   N_PROVISIONING_THREADS);
}

GatewayInstance::~GatewayInstance() noexcept
{
	connections.clear_and_dispose([](GatewayConnection *c){ delete c; });

	/* wait for pending provisioning jobs before the pools go away */
	thread_pool.reset();
}

void
GatewayInstance::InitializePools()
{
	for (auto &[name, pool] : pools)
		pool->Initialize();
}

ProcessPool *
GatewayInstance::FindPool(std::string_view key) const noexcept
{
	auto i = pools.find(key);
	if (i == pools.end())
		return nullptr;

	return i->second.get();
}

void
GatewayInstance::AddConnection(UniqueFileDescriptor &&fd,
			       std::string &&address) noexcept
{
	auto *c = new GatewayConnection(*this, std::move(fd),
					std::move(address));
	connections.push_back(*c);
}

void
GatewayInstance::Shutdown() noexcept
{
	shutdown_listener.Disable();
	listener.RemoveEvent();

	connections.clear_and_dispose([](GatewayConnection *c){ delete c; });

	for (auto &[name, pool] : pools)
		pool->Shutdown();

	if (thread_pool) {
		thread_pool->Stop();
		thread_pool->Join();
	}

	event_loop.Break();
}

void
GatewayInstance::ShutdownCallback() noexcept
{
	Shutdown();
}
