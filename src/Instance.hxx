// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Connection.hxx"
#include "event/Loop.hxx"
#include "event/ShutdownListener.hxx"
#include "spawn/Registry.hxx"
#include "net/ServerSocket.hxx"
#include "thread/Pool.hxx"

#include <boost/intrusive/list.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>

struct GatewayConfig;
class ProcessPool;

struct GatewayInstance;

/**
 * Listener for incoming connections.
 */
class GatewayListener final : public ServerSocket {
	GatewayInstance &instance;

public:
	explicit GatewayListener(GatewayInstance &_instance) noexcept;

protected:
	/* virtual methods from class ServerSocket */
	void OnAccept(UniqueFileDescriptor &&fd,
		      std::string &&address) noexcept override;
	void OnAcceptError(std::exception_ptr ep) noexcept override;
};

struct GatewayInstance final {
	/**
	 * The number of threads which spawn workers for connections
	 * arriving while their pool has no idle worker.
	 */
	static constexpr unsigned N_PROVISIONING_THREADS = 8;

	EventLoop event_loop;

	ShutdownListener shutdown_listener;

	/**
	 * Must be constructed before any thread is launched, because
	 * it blocks SIGCHLD.
	 */
	ChildProcessRegistry child_process_registry;

	/**
	 * Maps the routing key to the pool.
	 */
	std::map<std::string, std::unique_ptr<ProcessPool>, std::less<>> pools;

	std::unique_ptr<ThreadPool> thread_pool;

	GatewayListener listener;

	boost::intrusive::list<GatewayConnection,
			       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
			       boost::intrusive::constant_time_size<false>> connections;

	/**
	 * Throws on error.
	 */
	explicit GatewayInstance(const GatewayConfig &config);

	~GatewayInstance() noexcept;

	GatewayInstance(const GatewayInstance &) = delete;
	GatewayInstance &operator=(const GatewayInstance &) = delete;

	/**
	 * Pre-spawn the idle workers of all pools.
	 *
	 * Throws on error.
	 */
	void InitializePools();

	/**
	 * Throws on error.
	 */
	void Listen(unsigned port) {
		listener.ListenTCP(port);
	}

	[[gnu::pure]]
	ProcessPool *FindPool(std::string_view key) const noexcept;

	ThreadQueue &GetThreadQueue() noexcept {
		return thread_pool->GetQueue();
	}

	void AddConnection(UniqueFileDescriptor &&fd,
			   std::string &&address) noexcept;

	/**
	 * Close all connections, kill all idle workers and stop the
	 * event loop.
	 */
	void Shutdown() noexcept;

private:
	void ShutdownCallback() noexcept;
};
