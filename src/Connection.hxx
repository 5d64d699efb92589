// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Session.hxx"
#include "websocket/Parser.hxx"
#include "http/Status.hxx"
#include "event/SocketEvent.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "io/Logger.hxx"

#include <boost/intrusive/list_hook.hpp>

#include <exception>
#include <memory>
#include <string>

struct GatewayInstance;
class ProcessPool;
class AcquireJob;

/**
 * One client connection: reads the HTTP upgrade request, obtains a
 * worker from the pool and then runs the WebSocket #Session.
 */
class GatewayConnection final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>,
	  SessionHandler {

	enum class State {
		/**
		 * Waiting for the HTTP request head.
		 */
		REQUEST,

		/**
		 * Waiting for #AcquireJob.
		 */
		PROVISIONING,

		/**
		 * The WebSocket session is running.
		 */
		SESSION,

		/**
		 * The connection will be closed as soon as the output
		 * buffer has been flushed; input is ignored.
		 */
		CLOSING,
	};

	GatewayInstance &instance;

	const Logger logger;

	UniqueFileDescriptor fd;

	SocketEvent event;

	State state = State::REQUEST;

	std::string input, output;

	/**
	 * The routing key of this connection.
	 */
	std::string backend;

	/**
	 * The "Sec-WebSocket-Accept" value for the response.
	 */
	std::string websocket_accept;

	AcquireJob *job = nullptr;

	WebSocketParser websocket_parser;

	std::unique_ptr<Session> session;

	/**
	 * Has reading the worker's output been suspended because
	 * #output grew too large?
	 */
	bool output_throttled = false;

public:
	GatewayConnection(GatewayInstance &_instance,
			  UniqueFileDescriptor &&_fd,
			  std::string &&address) noexcept;

	~GatewayConnection() noexcept;

	GatewayConnection(const GatewayConnection &) = delete;
	GatewayConnection &operator=(const GatewayConnection &) = delete;

	/**
	 * Called by #AcquireJob in the main thread, or directly if an
	 * idle worker was available.
	 */
	void OnAcquireDone(WorkerPtr &&worker, std::exception_ptr error) noexcept;

private:
	void Destroy() noexcept {
		delete this;
	}

	void Send(std::string_view data) noexcept;

	/**
	 * Send an HTTP error response and close the connection.
	 */
	void SendMessageResponse(HttpStatus status,
				 std::string_view body) noexcept;

	/**
	 * Send a close frame and close the connection.  This destroys
	 * the #Session.
	 */
	void CloseWebSocket(StdioGateway::WebSocketCloseCode code,
			    std::string_view reason={}) noexcept;

	/**
	 * Send the given close frame, destroy the #Session and
	 * discard further input.
	 */
	void SendCloseFrame(std::string_view frame) noexcept;

	void StartProvisioning(ProcessPool &pool) noexcept;

	/**
	 * Try to parse the request head from #input.
	 */
	void ParseRequest() noexcept;

	void ParseFrames() noexcept;

	/**
	 * @return false if the connection has been destroyed
	 */
	bool Fill() noexcept;

	/**
	 * @return false if the connection has been destroyed
	 */
	bool Flush() noexcept;

	void OnSocketReady(unsigned events) noexcept;

	/* virtual methods from class SessionHandler */
	void OnSessionLine(std::string_view line) noexcept override;
	void OnSessionEnd(StdioGateway::WebSocketCloseCode code,
			  std::string_view reason) noexcept override;
};
