// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * The HTTP status codes sent by the gateway.
 */
enum class HttpStatus : uint_least16_t {
	SWITCHING_PROTOCOLS = 101,

	BAD_REQUEST = 400,
	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	UPGRADE_REQUIRED = 426,
	REQUEST_HEADER_FIELDS_TOO_LARGE = 431,

	INTERNAL_SERVER_ERROR = 500,
	SERVICE_UNAVAILABLE = 503,
};

/**
 * Returns the status line text, e.g. "404 Not Found".
 */
[[gnu::const]]
const char *
http_status_to_string(HttpStatus status) noexcept;
