// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/BindMethod.hxx"

#include <event2/event.h>
#include <event2/event_struct.h>

class EventLoop;

/**
 * Monitor a file descriptor for readiness.  This is a wrapper for a
 * persistent libevent "struct event"; changing the set of scheduled
 * flags re-assigns it.
 */
class SocketEvent final {
	EventLoop &event_loop;

	struct event event;

	int fd = -1;

	/**
	 * The flags which are currently registered with libevent.
	 */
	unsigned scheduled_flags = 0;

	using Callback = BoundMethod<void(unsigned events)>;
	const Callback callback;

public:
	static constexpr unsigned READ = EV_READ;
	static constexpr unsigned WRITE = EV_WRITE;

	SocketEvent(EventLoop &_event_loop, Callback _callback,
		    int _fd=-1) noexcept
		:event_loop(_event_loop), fd(_fd), callback(_callback) {}

	~SocketEvent() noexcept {
		Cancel();
	}

	SocketEvent(const SocketEvent &) = delete;
	SocketEvent &operator=(const SocketEvent &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	int GetFd() const noexcept {
		return fd;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Set the file descriptor.  Must not be called while events are
	 * scheduled.
	 */
	void Open(int _fd) noexcept {
		fd = _fd;
	}

	/**
	 * Unregister and forget the file descriptor (without closing
	 * it).
	 */
	int Release() noexcept {
		Cancel();
		int result = fd;
		fd = -1;
		return result;
	}

	unsigned GetScheduledFlags() const noexcept {
		return scheduled_flags;
	}

	void Schedule(unsigned flags) noexcept;

	void Cancel() noexcept {
		Schedule(0);
	}

	void ScheduleRead() noexcept {
		Schedule(GetScheduledFlags() | READ);
	}

	void ScheduleWrite() noexcept {
		Schedule(GetScheduledFlags() | WRITE);
	}

	void CancelRead() noexcept {
		Schedule(GetScheduledFlags() & ~READ);
	}

	void CancelWrite() noexcept {
		Schedule(GetScheduledFlags() & ~WRITE);
	}

private:
	static void EventCallback(evutil_socket_t fd, short events,
				  void *ctx) noexcept;
};
