// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Upgrade.hxx"
#include "Request.hxx"
#include "List.hxx"
#include "MessageResponse.hxx"
#include "stdio-gateway/WebSocket.hxx"

#include <fmt/format.h>

bool
http_is_upgrade(const HttpRequestHead &request) noexcept
{
	const auto *upgrade = request.GetHeader("upgrade");
	return upgrade != nullptr &&
		http_list_contains_i(*upgrade, "websocket");
}

std::string_view
CheckWebSocketUpgrade(const HttpRequestHead &request)
{
	if (!http_is_upgrade(request))
		throw HttpMessageResponse(HttpStatus::UPGRADE_REQUIRED,
					  "WebSocket upgrade required");

	const auto *connection = request.GetHeader("connection");
	if (connection == nullptr ||
	    !http_list_contains_i(*connection, "upgrade"))
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Missing 'Connection: upgrade'");

	const auto *version = request.GetHeader("sec-websocket-version");
	if (version == nullptr ||
	    *version != fmt::format("{}", StdioGateway::WEBSOCKET_VERSION))
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Unsupported WebSocket version");

	const auto *key = request.GetHeader("sec-websocket-key");
	if (key == nullptr || key->empty())
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Missing WebSocket key");

	return *key;
}
