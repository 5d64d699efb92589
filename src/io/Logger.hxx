// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

/**
 * Log levels: 1 = error, 2 = warning, 3 = info, 4 = debug, 5 and
 * above = trace.  Messages with a level above the configured
 * verbosity are discarded.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

[[gnu::pure]]
static inline bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= GetLogLevel();
}

/**
 * Write one line to stderr, prefixed with the domain (if any).
 */
void
LogLine(std::string_view domain, std::string_view text) noexcept;

namespace LoggerDetail {

void
AppendLogArg(std::string &dest, std::exception_ptr ep) noexcept;

static inline void
AppendLogArg(std::string &dest, std::string_view s) noexcept
{
	dest.append(s);
}

static inline void
AppendLogArg(std::string &dest, const char *s) noexcept
{
	dest.append(s != nullptr ? s : "(null)");
}

static inline void
AppendLogArg(std::string &dest, const std::string &s) noexcept
{
	dest.append(s);
}

static inline void
AppendLogArg(std::string &dest, char ch) noexcept
{
	dest.push_back(ch);
}

template<typename T>
static inline void
AppendLogArg(std::string &dest, const T &value) noexcept
{
	fmt::format_to(std::back_inserter(dest), "{}", value);
}

} // namespace LoggerDetail

/**
 * Concatenate all arguments and log the result.
 */
template<typename... Args>
void
LogConcat(unsigned level, std::string_view domain, Args&&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	std::string text;
	(LoggerDetail::AppendLogArg(text, std::forward<Args>(args)), ...);
	LogLine(domain, text);
}

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	LogLine(domain, fmt::format(format_str, std::forward<Args>(args)...));
}

/**
 * A logger bound to a domain name.
 */
class Logger {
	std::string domain;

public:
	Logger() = default;

	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	std::string_view GetDomain() const noexcept {
		return domain;
	}

	template<typename... Args>
	void operator()(unsigned level, Args&&... args) const noexcept {
		LogConcat(level, domain, std::forward<Args>(args)...);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		LogFmt(level, domain, format_str, std::forward<Args>(args)...);
	}
};
