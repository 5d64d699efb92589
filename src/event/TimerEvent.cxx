// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimerEvent.hxx"
#include "Loop.hxx"

TimerEvent::TimerEvent(EventLoop &loop, Callback _callback) noexcept
	:callback(_callback)
{
	evtimer_assign(&event, loop.Get(), TimerCallback, this);
}

void
TimerEvent::Schedule(Duration d) noexcept
{
	const auto us = std::chrono::duration_cast<std::chrono::microseconds>(d).count();

	const struct timeval tv{
		.tv_sec = time_t(us / 1000000),
		.tv_usec = suseconds_t(us % 1000000),
	};

	evtimer_add(&event, &tv);
}

void
TimerEvent::TimerCallback(evutil_socket_t, short, void *ctx) noexcept
{
	auto &event = *(TimerEvent *)ctx;
	event.callback();
}
