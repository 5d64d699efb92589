// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Parser.hxx"
#include "Error.hxx"

#include <cstdint>
#include <utility>

using namespace StdioGateway;

[[gnu::const]]
static bool
IsValidOpcode(unsigned opcode) noexcept
{
	switch (WebSocketOpcode(opcode)) {
	case WebSocketOpcode::CONTINUATION:
	case WebSocketOpcode::TEXT:
	case WebSocketOpcode::BINARY:
	case WebSocketOpcode::CLOSE:
	case WebSocketOpcode::PING:
	case WebSocketOpcode::PONG:
		return true;
	}

	return false;
}

[[gnu::const]]
static constexpr bool
IsControl(WebSocketOpcode opcode) noexcept
{
	return (unsigned(opcode) & 0x8) != 0;
}

[[gnu::pure]]
static uint64_t
ReadBigEndian(const uint8_t *p, std::size_t n) noexcept
{
	uint64_t value = 0;
	for (std::size_t i = 0; i < n; ++i)
		value = (value << 8) | p[i];
	return value;
}

std::size_t
WebSocketParser::Parse(std::string_view input, WebSocketMessage &message,
		       bool &complete)
{
	complete = false;

	const auto *p = (const uint8_t *)input.data();

	if (input.size() < 2)
		return 0;

	const bool fin = (p[0] & WEBSOCKET_FIN) != 0;

	if (p[0] & WEBSOCKET_RSV_MASK)
		throw WebSocketProtocolError(WebSocketCloseCode::PROTOCOL_ERROR,
					     "Reserved bits set");

	const unsigned raw_opcode = p[0] & WEBSOCKET_OPCODE_MASK;
	if (!IsValidOpcode(raw_opcode))
		throw WebSocketProtocolError(WebSocketCloseCode::PROTOCOL_ERROR,
					     "Unknown opcode");

	const auto opcode = WebSocketOpcode(raw_opcode);

	if (!(p[1] & WEBSOCKET_MASKED))
		throw WebSocketProtocolError(WebSocketCloseCode::PROTOCOL_ERROR,
					     "Client frame not masked");

	std::size_t header_size = 2;
	uint64_t length = p[1] & WEBSOCKET_LENGTH_MASK;

	if (length == 126) {
		header_size += 2;
		if (input.size() < header_size)
			return 0;

		length = ReadBigEndian(p + 2, 2);
	} else if (length == 127) {
		header_size += 8;
		if (input.size() < header_size)
			return 0;

		length = ReadBigEndian(p + 2, 8);
		if (length & (uint64_t(1) << 63))
			throw WebSocketProtocolError(WebSocketCloseCode::PROTOCOL_ERROR,
						     "Malformed payload length");
	}

	if (IsControl(opcode)) {
		if (!fin)
			throw WebSocketProtocolError(WebSocketCloseCode::PROTOCOL_ERROR,
						     "Fragmented control frame");

		if (length > WEBSOCKET_MAX_CONTROL_PAYLOAD)
			throw WebSocketProtocolError(WebSocketCloseCode::PROTOCOL_ERROR,
						     "Control frame too large");
	} else {
		if (opcode == WebSocketOpcode::CONTINUATION) {
			if (fragment_opcode == WebSocketOpcode::CONTINUATION)
				throw WebSocketProtocolError(WebSocketCloseCode::PROTOCOL_ERROR,
							     "Unexpected continuation frame");
		} else if (fragment_opcode != WebSocketOpcode::CONTINUATION)
			throw WebSocketProtocolError(WebSocketCloseCode::PROTOCOL_ERROR,
						     "Expected continuation frame");

		/* check the size before waiting for the payload, so a
		   huge frame is never buffered */
		if (length > max_message_size - fragments.size())
			throw WebSocketProtocolError(WebSocketCloseCode::MESSAGE_TOO_BIG,
						     "Message too big");
	}

	const uint8_t *mask = p + header_size;
	header_size += 4;

	if (input.size() < header_size ||
	    input.size() - header_size < length)
		return 0;

	std::string payload(input.data() + header_size, std::size_t(length));
	for (std::size_t i = 0; i < payload.size(); ++i)
		payload[i] ^= mask[i % 4];

	const std::size_t consumed = header_size + std::size_t(length);

	if (IsControl(opcode)) {
		message.opcode = opcode;
		message.payload = std::move(payload);
		complete = true;
	} else if (fin) {
		if (opcode == WebSocketOpcode::CONTINUATION) {
			fragments.append(payload);
			message.opcode = std::exchange(fragment_opcode,
						       WebSocketOpcode::CONTINUATION);
			message.payload = std::move(fragments);
			fragments.clear();
		} else {
			message.opcode = opcode;
			message.payload = std::move(payload);
		}

		complete = true;
	} else {
		if (opcode != WebSocketOpcode::CONTINUATION)
			fragment_opcode = opcode;

		fragments.append(payload);
	}

	return consumed;
}
