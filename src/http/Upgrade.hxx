// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Validation of WebSocket upgrade requests.
 */

#pragma once

#include <string_view>

struct HttpRequestHead;

/**
 * Does the request ask for a protocol upgrade?
 */
[[gnu::pure]]
bool
http_is_upgrade(const HttpRequestHead &request) noexcept;

/**
 * Check whether the request is a valid WebSocket upgrade request.
 *
 * Throws #HttpMessageResponse (426 Upgrade Required if no WebSocket
 * upgrade was requested, 400 Bad Request on other violations).
 *
 * @return the "Sec-WebSocket-Key" value
 */
std::string_view
CheckWebSocketUpgrade(const HttpRequestHead &request);
