// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Status.hxx"

#include <stdexcept>
#include <string>

/**
 * An exception which can be thrown to indicate that a certain HTTP
 * response shall be sent to our HTTP client (before the connection
 * gets closed).  The message is the text/plain response body.
 */
class HttpMessageResponse : public std::runtime_error {
	HttpStatus status;

public:
	HttpMessageResponse(HttpStatus _status, const char *_msg) noexcept
		:std::runtime_error(_msg), status(_status) {}

	HttpMessageResponse(HttpStatus _status, const std::string &_msg) noexcept
		:std::runtime_error(_msg), status(_status) {}

	HttpStatus GetStatus() const noexcept {
		return status;
	}
};
