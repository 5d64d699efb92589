// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Request.hxx"
#include "MessageResponse.hxx"
#include "Chars.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>

const std::string *
HttpRequestHead::GetHeader(std::string_view name) const noexcept
{
	for (const auto &[key, value] : headers)
		if (key == name)
			return &value;

	return nullptr;
}

std::size_t
FindHttpRequestHeadEnd(std::string_view buffer) noexcept
{
	std::size_t position = 0;

	while (true) {
		const auto newline = buffer.find('\n', position);
		if (newline == buffer.npos)
			return 0;

		const auto line = buffer.substr(position, newline - position);
		position = newline + 1;

		if (line.empty() || line == "\r")
			return position;
	}
}

[[gnu::pure]]
static bool
IsValidToken(std::string_view s) noexcept
{
	return !s.empty() && std::all_of(s.begin(), s.end(), char_is_http_token);
}

[[gnu::pure]]
static bool
IsValidHeaderValue(std::string_view s) noexcept
{
	return std::all_of(s.begin(), s.end(), char_is_http_value);
}

static void
ParseRequestLine(HttpRequestHead &head, std::string_view line)
{
	const auto space1 = line.find(' ');
	if (space1 == line.npos)
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Malformed request line");

	const auto method = line.substr(0, space1);
	line.remove_prefix(space1 + 1);

	const auto space2 = line.find(' ');
	if (space2 == line.npos)
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Malformed request line");

	const auto uri = line.substr(0, space2);
	const auto version = line.substr(space2 + 1);

	if (!IsValidToken(method) || uri.empty() ||
	    std::any_of(uri.begin(), uri.end(), [](char ch){
		    return ch == ' ' || char_is_http_ctl(ch);
	    }))
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Malformed request line");

	if (version.substr(0, 7) != "HTTP/1.")
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Unsupported HTTP version");

	head.method = method;
	head.uri = uri;
}

static void
ParseHeaderLine(HttpRequestHead &head, std::string_view line)
{
	const auto colon = line.find(':');
	if (colon == line.npos)
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Malformed header line");

	const auto name = line.substr(0, colon);
	const auto value = Strip(line.substr(colon + 1));

	if (!IsValidToken(name) || !IsValidHeaderValue(value))
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Malformed header line");

	std::string lower_name;
	lower_name.reserve(name.size());
	for (char ch : name)
		lower_name.push_back(ToLowerASCII(ch));

	head.headers.emplace_back(std::move(lower_name), std::string{value});
}

HttpRequestHead
ParseHttpRequestHead(std::string_view head)
{
	HttpRequestHead result;
	bool first = true;

	while (!head.empty()) {
		auto newline = head.find('\n');
		auto line = head.substr(0, newline);
		head.remove_prefix(newline == head.npos ? head.size() : newline + 1);

		if (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);

		if (first) {
			ParseRequestLine(result, line);
			first = false;
		} else if (line.empty())
			break;
		else if (line.front() == ' ' || line.front() == '\t')
			/* obsolete line folding (RFC 9112 5.2) */
			throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
						  "Folded header line");
		else
			ParseHeaderLine(result, line);
	}

	if (first)
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  "Empty request");

	return result;
}

std::string_view
GetRoutingKey(std::string_view uri) noexcept
{
	uri = uri.substr(0, uri.find_first_of("?#"));

	while (!uri.empty() && uri.back() == '/')
		uri.remove_suffix(1);

	const auto slash = uri.rfind('/');
	if (slash != uri.npos)
		uri.remove_prefix(slash + 1);

	return uri;
}
