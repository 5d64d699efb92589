// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

template<typename... Args>
static inline std::runtime_error
FmtRuntimeError(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return std::runtime_error{fmt::format(format_str, std::forward<Args>(args)...)};
}
