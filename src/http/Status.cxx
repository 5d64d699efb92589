// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Status.hxx"

const char *
http_status_to_string(HttpStatus status) noexcept
{
	switch (status) {
	case HttpStatus::SWITCHING_PROTOCOLS:
		return "101 Switching Protocols";

	case HttpStatus::BAD_REQUEST:
		return "400 Bad Request";

	case HttpStatus::NOT_FOUND:
		return "404 Not Found";

	case HttpStatus::METHOD_NOT_ALLOWED:
		return "405 Method Not Allowed";

	case HttpStatus::UPGRADE_REQUIRED:
		return "426 Upgrade Required";

	case HttpStatus::REQUEST_HEADER_FIELDS_TOO_LARGE:
		return "431 Request Header Fields Too Large";

	case HttpStatus::INTERNAL_SERVER_ERROR:
		break;

	case HttpStatus::SERVICE_UNAVAILABLE:
		return "503 Service Unavailable";
	}

	return "500 Internal Server Error";
}
