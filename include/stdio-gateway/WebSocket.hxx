// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Definitions for the WebSocket protocol (RFC 6455) as spoken by
 * stdio-gateway.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace StdioGateway {

enum class WebSocketOpcode : uint8_t {
	CONTINUATION = 0x0,
	TEXT = 0x1,
	BINARY = 0x2,
	CLOSE = 0x8,
	PING = 0x9,
	PONG = 0xa,
};

/**
 * Status codes sent in close frames.
 */
enum class WebSocketCloseCode : uint16_t {
	/**
	 * The worker process has exited successfully, or the client
	 * has closed the session.
	 */
	NORMAL = 1000,

	PROTOCOL_ERROR = 1002,

	/**
	 * A message (or a line from the worker) exceeds
	 * #MAX_MESSAGE_SIZE.
	 */
	MESSAGE_TOO_BIG = 1009,

	/**
	 * The worker process has crashed or exited with a non-zero
	 * status.
	 */
	INTERNAL_ERROR = 1011,
};

static constexpr uint8_t WEBSOCKET_FIN = 0x80;
static constexpr uint8_t WEBSOCKET_RSV_MASK = 0x70;
static constexpr uint8_t WEBSOCKET_OPCODE_MASK = 0x0f;
static constexpr uint8_t WEBSOCKET_MASKED = 0x80;
static constexpr uint8_t WEBSOCKET_LENGTH_MASK = 0x7f;

/**
 * Control frames must not carry more payload than this.
 */
static constexpr std::size_t WEBSOCKET_MAX_CONTROL_PAYLOAD = 125;

/**
 * The largest message accepted from a client and the longest line
 * accepted from a worker.
 */
static constexpr std::size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

/**
 * The only protocol version supported by this server.
 */
static constexpr unsigned WEBSOCKET_VERSION = 13;

} // namespace StdioGateway
