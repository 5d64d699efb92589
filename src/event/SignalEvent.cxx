// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SignalEvent.hxx"
#include "system/Error.hxx"

#include <sys/signalfd.h>
#include <unistd.h>

SignalEvent::SignalEvent(EventLoop &loop, Callback _callback) noexcept
	:event(loop, BIND_THIS_METHOD(EventCallback)), callback(_callback)
{
	sigemptyset(&mask);
}

SignalEvent::~SignalEvent() noexcept
{
	event.Cancel();

	if (fd >= 0)
		close(fd);
}

void
SignalEvent::Enable()
{
	/* block the signals before creating the signalfd, so none
	   gets lost in between */
	sigprocmask(SIG_BLOCK, &mask, nullptr);

	fd = signalfd(fd, &mask, SFD_NONBLOCK|SFD_CLOEXEC);
	if (fd < 0)
		throw MakeErrno("signalfd() failed");

	event.Open(fd);
	event.ScheduleRead();
}

void
SignalEvent::Disable() noexcept
{
	sigprocmask(SIG_UNBLOCK, &mask, nullptr);

	event.Cancel();
}

void
SignalEvent::EventCallback(unsigned) noexcept
{
	struct signalfd_siginfo info;
	ssize_t nbytes = read(fd, &info, sizeof(info));
	if (nbytes <= 0) {
		Disable();
		return;
	}

	callback(info.ssi_signo);
}
