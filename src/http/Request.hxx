// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * The maximum size of the request head (request line plus headers).
 */
static constexpr std::size_t MAX_HTTP_REQUEST_HEAD_SIZE = 8192;

/**
 * A parsed HTTP/1.x request head.
 */
struct HttpRequestHead {
	std::string method;

	std::string uri;

	/**
	 * Header names are lower case; values have surrounding
	 * whitespace removed.
	 */
	std::vector<std::pair<std::string, std::string>> headers;

	/**
	 * Find the first header with the given (lower case) name.
	 *
	 * @return nullptr if there is no such header
	 */
	[[gnu::pure]]
	const std::string *GetHeader(std::string_view name) const noexcept;
};

/**
 * Find the end of the request head, i.e. the empty line terminating
 * the headers.  Bare LF line endings are tolerated.
 *
 * @return the size of the head including the empty line, or 0 if the
 * head is not complete yet
 */
[[gnu::pure]]
std::size_t
FindHttpRequestHeadEnd(std::string_view buffer) noexcept;

/**
 * Parse a complete request head (as delimited by
 * FindHttpRequestHeadEnd()).
 *
 * Throws #HttpMessageResponse (400 Bad Request) if it is malformed.
 */
HttpRequestHead
ParseHttpRequestHead(std::string_view head);

/**
 * Extract the routing key from a request URI: the last non-empty path
 * segment, without query string.
 */
[[gnu::pure]]
std::string_view
GetRoutingKey(std::string_view uri) noexcept;
