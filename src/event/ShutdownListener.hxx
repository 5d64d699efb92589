// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SignalEvent.hxx"

/**
 * Listener for shutdown signals (SIGTERM, SIGINT, SIGQUIT).
 */
class ShutdownListener final {
	SignalEvent event;

	using Callback = BoundMethod<void()>;
	const Callback callback;

public:
	ShutdownListener(EventLoop &loop, Callback _callback) noexcept;

	~ShutdownListener() noexcept {
		Disable();
	}

	ShutdownListener(const ShutdownListener &) = delete;
	ShutdownListener &operator=(const ShutdownListener &) = delete;

	void Enable() {
		event.Enable();
	}

	void Disable() noexcept {
		event.Disable();
	}

private:
	void SignalCallback(int signo) noexcept;
};
