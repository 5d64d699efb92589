// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "BackendConfig.hxx"

#include <string_view>
#include <vector>

/**
 * Configuration which describes the backends served by the gateway.
 */
struct GatewayConfig {
	std::vector<BackendConfig> backends;

	[[gnu::pure]]
	const BackendConfig *FindBackend(std::string_view name) const noexcept;

	/**
	 * Throws on error.
	 */
	void Check() const;
};

/**
 * Load the specified JSON configuration file.  It has the same shape
 * as the "mcpServers" section of an MCP client configuration; each
 * entry becomes a #BackendConfig.
 *
 * Throws std::system_error if the file cannot be opened, and a
 * nested exception describing the problem on all other errors.
 */
void
LoadConfigFile(GatewayConfig &config, const char *path);
