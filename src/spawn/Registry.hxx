// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/SignalEvent.hxx"
#include "event/DeferEvent.hxx"
#include "event/TimerEvent.hxx"

#include <boost/intrusive/set.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

struct rusage;

struct PreparedChildProcess;
class ExitListener;

/**
 * Keeps track of child processes and reaps them when they exit.
 * SIGCHLD is received through a signalfd; construct this object
 * before launching any threads, so they inherit the blocked signal
 * mask.
 *
 * Spawn() and Kill() may be called from any thread.  All other
 * methods may only be called from the #EventLoop thread, and exit
 * notifications are delivered there.
 */
class ChildProcessRegistry final {
	EventLoop &event_loop;

	struct ChildProcess final
		: boost::intrusive::set_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {

		const pid_t pid;

		const std::string name;

		/**
		 * The time when this child process was started.
		 */
		const std::chrono::steady_clock::time_point start_time;

		ExitListener *listener = nullptr;

		/**
		 * The wait status of a process which has exited before
		 * anybody registered a listener; -1 while it is running.
		 */
		int exit_status = -1;

		/**
		 * Has Kill() been called?
		 */
		bool killed = false;

		/**
		 * This timer is set up by Kill().  If the child process
		 * hasn't exited after a certain amount of time, we send
		 * SIGKILL.
		 */
		TimerEvent kill_timeout_event;

		ChildProcess(EventLoop &_event_loop,
			     pid_t _pid, std::string_view _name) noexcept;

		void OnExit(int status, const struct rusage &rusage) noexcept;

		void KillTimeoutCallback() noexcept;
	};

	struct Compare {
		[[gnu::pure]]
		bool operator()(const ChildProcess &a, const ChildProcess &b) const noexcept {
			return a.pid < b.pid;
		}

		[[gnu::pure]]
		bool operator()(const ChildProcess &a, pid_t b) const noexcept {
			return a.pid < b;
		}

		[[gnu::pure]]
		bool operator()(pid_t a, const ChildProcess &b) const noexcept {
			return a < b.pid;
		}
	};

	using ChildProcessSet =
		boost::intrusive::set<ChildProcess,
				      boost::intrusive::compare<Compare>,
				      boost::intrusive::constant_time_size<true>>;

	/**
	 * Protects #children and the mutable attributes of its items.
	 */
	mutable std::mutex mutex;

	ChildProcessSet children;

	SignalEvent sigchld_event;

	/**
	 * Used to invoke Reap() as soon as possible after startup,
	 * to catch up with SIGCHLDs that may have been missed.
	 */
	DeferEvent defer_reap;

public:
	/**
	 * Throws on error.
	 */
	explicit ChildProcessRegistry(EventLoop &_event_loop);

	~ChildProcessRegistry() noexcept;

	ChildProcessRegistry(const ChildProcessRegistry &) = delete;
	ChildProcessRegistry &operator=(const ChildProcessRegistry &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	/**
	 * Launch a child process and register it.  May be called from
	 * any thread.
	 *
	 * Throws on error.
	 *
	 * @param name a name for log messages
	 */
	pid_t Spawn(std::string_view name, PreparedChildProcess &&params);

	/**
	 * Register a listener which will be invoked when the child
	 * process exits.
	 *
	 * @return std::nullopt if the listener has been registered, or
	 * the wait status if the process has already exited (in which
	 * case the listener will never be invoked)
	 */
	std::optional<int> SetExitListener(pid_t pid,
					   ExitListener &listener) noexcept;

	/**
	 * Send a signal to the child process and unregister its
	 * listener.  If it doesn't exit after a timeout, SIGKILL is
	 * sent.  May be called from any thread.
	 */
	void Kill(pid_t pid, int signo) noexcept;

	[[gnu::pure]]
	std::size_t GetCount() const noexcept;

private:
	void OnSigchld(int signo) noexcept;
	void Reap() noexcept;
};
