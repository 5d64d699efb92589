// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Utilities for comma separated HTTP header lists.
 */

#pragma once

#include <string_view>

/**
 * Does the comma separated list contain the specified item
 * (case-insensitive)?
 */
[[gnu::pure]]
bool
http_list_contains_i(std::string_view list, std::string_view item) noexcept;
