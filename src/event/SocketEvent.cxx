// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketEvent.hxx"
#include "Loop.hxx"

#include <assert.h>

void
SocketEvent::Schedule(unsigned flags) noexcept
{
	if (flags == scheduled_flags)
		return;

	if (scheduled_flags != 0)
		event_del(&event);

	scheduled_flags = flags;

	if (flags != 0) {
		assert(fd >= 0);

		event_assign(&event, event_loop.Get(), fd, short(flags|EV_PERSIST),
			     EventCallback, this);
		event_add(&event, nullptr);
	}
}

void
SocketEvent::EventCallback(evutil_socket_t, short events, void *ctx) noexcept
{
	auto &event = *(SocketEvent *)ctx;
	event.callback(unsigned(events) & (READ|WRITE));
}
