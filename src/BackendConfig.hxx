// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <utility>
#include <vector>

/**
 * Describes one backend: the routing key and how to launch its
 * worker processes.
 */
struct BackendConfig {
	/**
	 * The routing key, i.e. the last path segment of the request
	 * URI.
	 */
	std::string name;

	/**
	 * The executable and its arguments.
	 */
	std::vector<std::string> args;

	/**
	 * Environment variables added to the inherited environment.
	 */
	std::vector<std::pair<std::string, std::string>> env;

	/**
	 * The number of idle workers to keep ready.
	 */
	unsigned min_pool_size = 1;

	BackendConfig() = default;

	explicit BackendConfig(std::string &&_name) noexcept
		:name(std::move(_name)) {}
};
