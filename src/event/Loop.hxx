// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "DeferEvent.hxx"

#include <boost/intrusive/list.hpp>

struct event_base;

/**
 * Wrapper for a struct event_base.
 *
 * libevent's pthread locking is enabled before the first
 * #event_base is created, which allows adding and deleting events
 * from other threads.  Everything else (including #DeferEvent) may
 * only be used from the thread which runs the loop.
 */
class EventLoop final {
	struct event_base *const event_base;

	boost::intrusive::list<DeferEvent,
			       boost::intrusive::member_hook<DeferEvent,
							     DeferEvent::SiblingsHook,
							     &DeferEvent::siblings>,
			       boost::intrusive::constant_time_size<false>> defer;

	bool quit = false;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	struct event_base *Get() const noexcept {
		return event_base;
	}

	/**
	 * Run the loop until Break() is called.
	 */
	void Dispatch() noexcept;

	/**
	 * Handle all events which are ready now, without blocking.
	 * This is used by the unit tests to drive the loop.
	 */
	void LoopOnceNonBlock() noexcept;

	/**
	 * Wait for at least one event and handle it.
	 */
	void LoopOnce() noexcept;

	void Break() noexcept;

	void Defer(DeferEvent &e) noexcept;
	void CancelDefer(DeferEvent &e) noexcept;

private:
	void Loop(int flags) noexcept;
	void RunDeferred() noexcept;
};
