// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "stdio-gateway/WebSocket.hxx"

#include <string>
#include <string_view>

/**
 * Append an unmasked (server-to-client) frame with the FIN bit set to
 * the given buffer.
 */
void
AppendWebSocketFrame(std::string &dest, StdioGateway::WebSocketOpcode opcode,
		     std::string_view payload) noexcept;

/**
 * Append a close frame carrying the given status code (and an
 * optional reason, truncated to fit into a control frame).
 */
void
AppendWebSocketClose(std::string &dest, StdioGateway::WebSocketCloseCode code,
		     std::string_view reason={}) noexcept;
