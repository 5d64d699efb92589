// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/SocketEvent.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/BindMethod.hxx"

#include <atomic>

/**
 * Send notifications from a worker thread to the main thread.
 */
class Notify final {
	using Callback = BoundMethod<void()>;
	const Callback callback;

	const UniqueFileDescriptor fd;

	SocketEvent event;

	std::atomic_bool pending{false};

public:
	/**
	 * Throws on error.
	 */
	Notify(EventLoop &event_loop, Callback _callback);

	~Notify() noexcept {
		event.Cancel();
	}

	Notify(const Notify &) = delete;
	Notify &operator=(const Notify &) = delete;

	void Enable() noexcept {
		event.ScheduleRead();
	}

	void Disable() noexcept {
		event.Cancel();
	}

	/**
	 * Wake up the main thread.  May be called from any thread.
	 */
	void Signal() noexcept;

private:
	void EventFdCallback(unsigned events) noexcept;
};
