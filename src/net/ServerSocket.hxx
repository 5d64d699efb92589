// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/UniqueFileDescriptor.hxx"
#include "event/SocketEvent.hxx"

#include <exception>
#include <string>

/**
 * A TCP socket listening for incoming connections.  Accepted sockets
 * are non-blocking and close-on-exec.
 */
class ServerSocket {
	UniqueFileDescriptor fd;

	SocketEvent event;

public:
	explicit ServerSocket(EventLoop &event_loop) noexcept;

	virtual ~ServerSocket() noexcept;

	ServerSocket(const ServerSocket &) = delete;
	ServerSocket &operator=(const ServerSocket &) = delete;

	/**
	 * Listen on all interfaces; tries IPv6 (dual-stack) first and
	 * falls back to IPv4.  Port 0 chooses an arbitrary free port.
	 *
	 * Throws on error.
	 */
	void ListenTCP(unsigned port);

	/**
	 * Returns the local port number.
	 *
	 * Throws on error.
	 */
	unsigned GetLocalPort() const;

	void AddEvent() noexcept {
		event.ScheduleRead();
	}

	void RemoveEvent() noexcept {
		event.Cancel();
	}

protected:
	/**
	 * A new incoming connection has been established.
	 *
	 * @param address the peer address in printable form
	 */
	virtual void OnAccept(UniqueFileDescriptor &&connection,
			      std::string &&address) noexcept = 0;

	virtual void OnAcceptError(std::exception_ptr ep) noexcept = 0;

private:
	void EventCallback(unsigned events) noexcept;
};
