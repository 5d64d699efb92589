// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SocketEvent.hxx"
#include "util/BindMethod.hxx"

#include <assert.h>
#include <signal.h>

/**
 * Receive signals through a signalfd.  Enable() blocks the signals
 * in the calling thread; call it before launching other threads, so
 * they inherit the signal mask.
 */
class SignalEvent final {
	int fd = -1;

	SocketEvent event;

	sigset_t mask;

	using Callback = BoundMethod<void(int)>;
	const Callback callback;

public:
	SignalEvent(EventLoop &loop, Callback _callback) noexcept;

	SignalEvent(EventLoop &loop, int signo, Callback _callback) noexcept
		:SignalEvent(loop, _callback) {
		Add(signo);
	}

	~SignalEvent() noexcept;

	SignalEvent(const SignalEvent &) = delete;
	SignalEvent &operator=(const SignalEvent &) = delete;

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	void Add(int signo) noexcept {
		assert(fd < 0);

		sigaddset(&mask, signo);
	}

	/**
	 * Throws on error.
	 */
	void Enable();

	void Disable() noexcept;

private:
	void EventCallback(unsigned events) noexcept;
};
