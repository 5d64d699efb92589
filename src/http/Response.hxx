// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Status.hxx"

#include <string>
#include <string_view>

/**
 * Generate a complete response with a text/plain body.  The
 * connection is supposed to be closed after sending it.
 */
std::string
MakeHttpMessageResponse(HttpStatus status, std::string_view body) noexcept;

/**
 * Generate the "101 Switching Protocols" response which completes a
 * WebSocket handshake.
 *
 * @param accept the "Sec-WebSocket-Accept" value
 */
std::string
MakeWebSocketUpgradeResponse(std::string_view accept) noexcept;
