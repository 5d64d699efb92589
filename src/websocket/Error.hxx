// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "stdio-gateway/WebSocket.hxx"

#include <stdexcept>

/**
 * The peer has violated the WebSocket protocol.  The connection
 * shall be closed with the given close code.
 */
class WebSocketProtocolError : public std::runtime_error {
	StdioGateway::WebSocketCloseCode code;

public:
	WebSocketProtocolError(StdioGateway::WebSocketCloseCode _code,
			       const char *msg) noexcept
		:std::runtime_error(msg), code(_code) {}

	StdioGateway::WebSocketCloseCode GetCode() const noexcept {
		return code;
	}
};
