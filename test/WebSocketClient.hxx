// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/UniqueFileDescriptor.hxx"
#include "stdio-gateway/WebSocket.hxx"

#include <string>
#include <string_view>

/**
 * A minimal blocking WebSocket client for tests and debugging tools.
 * All methods throw on error; reads time out after a few seconds.
 */
class WebSocketClient {
	UniqueFileDescriptor fd;

	std::string input;

public:
	struct Frame {
		StdioGateway::WebSocketOpcode opcode;
		std::string payload;
	};

	/**
	 * Connect to the given TCP port on localhost.
	 *
	 * @param timeout the receive timeout in seconds (0 disables it)
	 */
	void Connect(unsigned port, unsigned timeout=10);

	void SendRaw(std::string_view data);

	/**
	 * Send a GET request with the WebSocket upgrade headers.
	 */
	void SendUpgradeRequest(std::string_view uri);

	/**
	 * Receive the HTTP response head.
	 *
	 * @return the head without the terminating empty line; the
	 * status line is the first line
	 */
	std::string ReceiveResponseHead();

	/**
	 * Receive everything until the server closes the connection.
	 */
	std::string ReceiveAll();

	/**
	 * Send a masked frame with the FIN bit set.
	 */
	void SendFrame(StdioGateway::WebSocketOpcode opcode,
		       std::string_view payload);

	/**
	 * Receive one frame from the server.
	 *
	 * @return false if the server has closed the connection
	 */
	bool ReceiveFrame(Frame &frame);

private:
	/**
	 * Read more data into #input.
	 *
	 * @return false on end of stream
	 */
	bool Fill();

	bool FillTo(std::size_t size);
};
