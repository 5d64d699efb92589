// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LineSplitter.hxx"
#include "stock/Worker.hxx"
#include "spawn/ExitListener.hxx"
#include "event/SocketEvent.hxx"
#include "event/DeferEvent.hxx"
#include "io/Logger.hxx"
#include "stdio-gateway/WebSocket.hxx"

#include <optional>
#include <string>
#include <string_view>

class ChildProcessRegistry;

class SessionHandler {
public:
	/**
	 * The worker has printed a line which shall be sent to the
	 * client as a text message.
	 */
	virtual void OnSessionLine(std::string_view line) noexcept = 0;

	/**
	 * The session is over (the worker has exited or misbehaved).
	 * The handler shall close the connection and destroy the
	 * #Session; the caller returns immediately.
	 */
	virtual void OnSessionEnd(StdioGateway::WebSocketCloseCode code,
				  std::string_view reason) noexcept = 0;
};

/**
 * Bridges one client connection with one worker process: lines read
 * from the worker's stdout become messages, and messages received
 * from the client are written to its stdin.  When the worker exits,
 * its pending output is delivered and the session ends, even if a
 * descendant still holds the stdout pipe.  Destroying the session
 * sends SIGINT to the worker.
 */
class Session final : ExitListener {
	const std::string id;

	const Logger logger;

	SessionHandler &handler;

	WorkerPtr worker;

	SocketEvent output_event;

	/**
	 * Ends the session if the worker had already exited when the
	 * session was created.
	 */
	DeferEvent defer_end;

	LineSplitter line_splitter;

	/**
	 * The wait status of the worker after it has exited.
	 */
	std::optional<int> exit_status;

	bool output_eof = false;

	bool output_suspended = false;

public:
	Session(ChildProcessRegistry &registry, WorkerPtr &&_worker,
		std::string &&_id, SessionHandler &_handler) noexcept;

	~Session() noexcept;

	Session(const Session &) = delete;
	Session &operator=(const Session &) = delete;

	const std::string &GetId() const noexcept {
		return id;
	}

	/**
	 * A message was received from the client.  It is written to
	 * the worker's stdin, followed by a newline.
	 */
	void OnMessage(std::string_view payload) noexcept;

	/**
	 * Stop reading the worker's stdout (backpressure).
	 */
	void SuspendOutput() noexcept;

	void ResumeOutput() noexcept;

private:
	enum class ReadResult {
		DATA,
		AGAIN,
		END_OF_FILE,

		/**
		 * The handler has been invoked and the session has been
		 * destroyed.
		 */
		DESTROYED,
	};

	ReadResult ReadOutput() noexcept;

	void LogExit(int status) const noexcept;

	/**
	 * The worker has exited: deliver what is left in the stdout
	 * pipe, then end the session.
	 */
	void End() noexcept;

	void OnOutputReady(unsigned events) noexcept;
	void OnDeferredEnd() noexcept;

	/* virtual methods from class ExitListener */
	void OnChildProcessExit(int status) noexcept override;
};
