// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Response.hxx"
#include "stdio-gateway/WebSocket.hxx"

#include <fmt/format.h>

std::string
MakeHttpMessageResponse(HttpStatus status, std::string_view body) noexcept
{
	/* tell the client which protocol it should have asked for */
	const std::string_view extra_headers =
		status == HttpStatus::UPGRADE_REQUIRED
		? "upgrade: websocket\r\nsec-websocket-version: 13\r\n"
		: "";

	return fmt::format("HTTP/1.1 {}\r\n"
			   "content-type: text/plain\r\n"
			   "content-length: {}\r\n"
			   "{}"
			   "connection: close\r\n"
			   "\r\n"
			   "{}",
			   http_status_to_string(status), body.size(),
			   extra_headers, body);
}

std::string
MakeWebSocketUpgradeResponse(std::string_view accept) noexcept
{
	return fmt::format("HTTP/1.1 {}\r\n"
			   "upgrade: websocket\r\n"
			   "connection: upgrade\r\n"
			   "sec-websocket-accept: {}\r\n"
			   "\r\n",
			   http_status_to_string(HttpStatus::SWITCHING_PROTOCOLS),
			   accept);
}
