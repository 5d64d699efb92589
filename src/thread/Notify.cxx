// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Notify.hxx"
#include "system/Error.hxx"

#include <stdint.h>
#include <sys/eventfd.h>

static UniqueFileDescriptor
CreateEventFD()
{
	int fd = eventfd(0, EFD_NONBLOCK|EFD_CLOEXEC);
	if (fd < 0)
		throw MakeErrno("eventfd() failed");

	return UniqueFileDescriptor{fd};
}

Notify::Notify(EventLoop &event_loop, Callback _callback)
	:callback(_callback),
	 fd(CreateEventFD()),
	 event(event_loop, BIND_THIS_METHOD(EventFdCallback), fd.Get())
{
	event.ScheduleRead();
}

void
Notify::Signal() noexcept
{
	if (!pending.exchange(true)) {
		static constexpr uint64_t value = 1;
		(void)fd.Write(&value, sizeof(value));
	}
}

inline void
Notify::EventFdCallback(unsigned) noexcept
{
	uint64_t value;
	(void)fd.Read(&value, sizeof(value));

	if (pending.exchange(false))
		callback();
}
