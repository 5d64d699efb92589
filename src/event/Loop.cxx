// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Loop.hxx"

#include <event2/event.h>
#include <event2/thread.h>

#include <stdexcept>

#include <assert.h>

static struct event_base *
CreateEventBase()
{
	/* enable locking once, before the first event_base is
	   created */
	static const bool threads_enabled = evthread_use_pthreads() == 0;
	if (!threads_enabled)
		throw std::runtime_error("evthread_use_pthreads() failed");

	struct event_base *base = event_base_new();
	if (base == nullptr)
		throw std::runtime_error("event_base_new() failed");

	return base;
}

EventLoop::EventLoop()
	:event_base(CreateEventBase())
{
}

EventLoop::~EventLoop() noexcept
{
	assert(defer.empty());

	event_base_free(event_base);
}

void
EventLoop::Dispatch() noexcept
{
	quit = false;

	RunDeferred();

	while (!quit) {
		Loop(EVLOOP_ONCE);
		RunDeferred();
	}
}

void
EventLoop::LoopOnceNonBlock() noexcept
{
	RunDeferred();
	Loop(EVLOOP_ONCE|EVLOOP_NONBLOCK);
	RunDeferred();
}

void
EventLoop::LoopOnce() noexcept
{
	RunDeferred();
	Loop(EVLOOP_ONCE);
	RunDeferred();
}

void
EventLoop::Break() noexcept
{
	quit = true;
	event_base_loopbreak(event_base);
}

void
EventLoop::Defer(DeferEvent &e) noexcept
{
	defer.push_back(e);
}

void
EventLoop::CancelDefer(DeferEvent &e) noexcept
{
	defer.erase(defer.iterator_to(e));
}

inline void
EventLoop::Loop(int flags) noexcept
{
	event_base_loop(event_base, flags);
}

void
EventLoop::RunDeferred() noexcept
{
	while (!defer.empty())
		defer.pop_front_and_dispose([](DeferEvent *e){
			e->OnDeferred();
		});
}
