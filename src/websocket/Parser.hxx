// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "stdio-gateway/WebSocket.hxx"

#include <cstddef>
#include <string>
#include <string_view>

/**
 * A complete message (after reassembly of fragments) or a control
 * frame.
 */
struct WebSocketMessage {
	StdioGateway::WebSocketOpcode opcode;

	std::string payload;
};

/**
 * Parses frames sent by a WebSocket client and reassembles
 * fragmented messages.
 */
class WebSocketParser {
	const std::size_t max_message_size;

	/**
	 * The payload of the fragmented message being received.
	 */
	std::string fragments;

	/**
	 * The opcode of the fragmented message being received, or
	 * CONTINUATION if there is none.
	 */
	StdioGateway::WebSocketOpcode fragment_opcode =
		StdioGateway::WebSocketOpcode::CONTINUATION;

public:
	explicit WebSocketParser(std::size_t _max_message_size=StdioGateway::MAX_MESSAGE_SIZE) noexcept
		:max_message_size(_max_message_size) {}

	/**
	 * Parse one frame from the beginning of the buffer.
	 *
	 * Throws #WebSocketProtocolError on protocol violations.
	 *
	 * @param message receives a complete message or a control
	 * frame
	 * @param complete set to true if #message has been filled;
	 * false if the frame was a fragment which does not complete a
	 * message yet
	 * @return the number of bytes consumed, or 0 if the buffer does
	 * not contain a complete frame yet
	 */
	std::size_t Parse(std::string_view input, WebSocketMessage &message,
			  bool &complete);
};
