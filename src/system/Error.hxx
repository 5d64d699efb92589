// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <system_error>
#include <utility>

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.  The
 * C++ standard does not define this well, and this code is based on
 * observations what C++ standard library implementations actually
 * use.
 */
[[gnu::const]]
static inline const std::error_category &
ErrnoCategory() noexcept
{
	return std::system_category();
}

static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code, ErrnoCategory()),
				 msg);
}

static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

template<typename... Args>
static inline std::system_error
FmtErrno(int code, fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return MakeErrno(code,
			 fmt::format(format_str,
				     std::forward<Args>(args)...).c_str());
}

template<typename... Args>
static inline std::system_error
FmtErrno(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return FmtErrno(errno, format_str, std::forward<Args>(args)...);
}

[[gnu::pure]]
static inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}
