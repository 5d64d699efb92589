// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

/**
 * Calculate the "Sec-WebSocket-Accept" response header value for the
 * given "Sec-WebSocket-Key" request header value: the Base64-encoded
 * SHA-1 digest of the key concatenated with the RFC 6455 GUID.
 */
[[gnu::pure]]
std::string
MakeWebSocketAccept(std::string_view key) noexcept;
