// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/BindMethod.hxx"

#include <event2/event.h>
#include <event2/event_struct.h>

#include <chrono>

class EventLoop;

/**
 * Invoke an event callback after a certain amount of time.
 */
class TimerEvent final {
	struct event event;

	using Callback = BoundMethod<void()>;
	const Callback callback;

public:
	using Duration = std::chrono::steady_clock::duration;

	TimerEvent(EventLoop &loop, Callback _callback) noexcept;

	~TimerEvent() noexcept {
		Cancel();
	}

	TimerEvent(const TimerEvent &) = delete;
	TimerEvent &operator=(const TimerEvent &) = delete;

	bool IsPending() const noexcept {
		return evtimer_pending(&event, nullptr);
	}

	void Schedule(Duration d) noexcept;

	void Cancel() noexcept {
		evtimer_del(&event);
	}

private:
	static void TimerCallback(evutil_socket_t fd, short events,
				  void *ctx) noexcept;
};
