// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Writer.hxx"

#include <cstdint>

using namespace StdioGateway;

void
AppendWebSocketFrame(std::string &dest, WebSocketOpcode opcode,
		     std::string_view payload) noexcept
{
	dest.push_back(char(WEBSOCKET_FIN | uint8_t(opcode)));

	const uint64_t length = payload.size();
	if (length < 126) {
		dest.push_back(char(length));
	} else if (length <= 0xffff) {
		dest.push_back(char(126));
		dest.push_back(char(length >> 8));
		dest.push_back(char(length));
	} else {
		dest.push_back(char(127));
		for (int shift = 56; shift >= 0; shift -= 8)
			dest.push_back(char(length >> shift));
	}

	dest.append(payload);
}

void
AppendWebSocketClose(std::string &dest, WebSocketCloseCode code,
		     std::string_view reason) noexcept
{
	if (reason.size() > WEBSOCKET_MAX_CONTROL_PAYLOAD - 2)
		reason = reason.substr(0, WEBSOCKET_MAX_CONTROL_PAYLOAD - 2);

	std::string payload;
	payload.reserve(2 + reason.size());
	payload.push_back(char(unsigned(code) >> 8));
	payload.push_back(char(unsigned(code)));
	payload.append(reason);

	AppendWebSocketFrame(dest, WebSocketOpcode::CLOSE, payload);
}
