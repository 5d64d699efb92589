// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * HTTP character classes according to RFC 9110 5.6.2.
 */

#pragma once

constexpr bool
char_is_http_ctl(char ch) noexcept
{
	return (((unsigned char)ch) <= 0x1f) || ch == 0x7f;
}

constexpr bool
char_is_http_separator(char ch) noexcept
{
	return ch == '(' || ch == ')' || ch == '<' || ch == '>' ||
		ch == '@' || ch == ',' || ch == ';' || ch == ':' ||
		ch == '\\' || ch == '"' || ch == '/' ||
		ch == '[' || ch == ']' ||
		ch == '?' || ch == '=' || ch == '{' || ch == '}' ||
		ch == ' ' || ch == '\t';
}

constexpr bool
char_is_http_token(char ch) noexcept
{
	return (ch & 0x80) == 0 && !char_is_http_ctl(ch) &&
		!char_is_http_separator(ch);
}

/**
 * May this character appear in a header value?
 */
constexpr bool
char_is_http_value(char ch) noexcept
{
	return ch == '\t' || !char_is_http_ctl(ch);
}
