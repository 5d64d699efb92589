// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "system/Error.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/ScopeExit.hxx"

#include <nlohmann/json.hpp>

#include <stdexcept>

#include <stdio.h>

using std::string_view_literals::operator""sv;

const BackendConfig *
GatewayConfig::FindBackend(std::string_view name) const noexcept
{
	for (const auto &i : backends)
		if (i.name == name)
			return &i;

	return nullptr;
}

void
GatewayConfig::Check() const
{
	if (backends.empty())
		throw std::runtime_error("No backends configured");
}

static void
CheckObject(const nlohmann::json &j, const char *what)
{
	if (!j.is_object())
		throw FmtRuntimeError("{} must be an object", what);
}

static void
LoadEnv(const nlohmann::json &j, BackendConfig &backend)
{
	CheckObject(j, "\"env\"");

	for (const auto &[name, value] : j.items()) {
		if (name.empty() || name.find('=') != name.npos)
			throw FmtRuntimeError("Invalid environment variable name '{}'",
					      name);

		backend.env.emplace_back(name, value.get<std::string>());
	}
}

static void
from_json(const nlohmann::json &j, BackendConfig &backend)
{
	CheckObject(j, "Server");

	backend.args.clear();
	backend.args.emplace_back(j.at("command"sv).get<std::string>());
	if (backend.args.front().empty())
		throw std::runtime_error("Empty \"command\"");

	if (const auto args = j.find("args"sv); args != j.end())
		for (const auto &i : args->get<std::vector<std::string>>())
			backend.args.emplace_back(i);

	if (const auto env = j.find("env"sv); env != j.end())
		LoadEnv(*env, backend);

	if (const auto size = j.find("min_pool_size"sv); size != j.end()) {
		if (!size->is_number_unsigned())
			throw std::runtime_error("\"min_pool_size\" must be a non-negative integer");

		backend.min_pool_size = size->get<unsigned>();
	}
}

static void
from_json(const nlohmann::json &j, GatewayConfig &config)
{
	CheckObject(j, "Configuration");

	const auto &servers = j.at("mcpServers"sv);
	CheckObject(servers, "\"mcpServers\"");

	for (const auto &[name, value] : servers.items()) {
		try {
			if (name.empty())
				throw std::runtime_error("Empty server name");

			if (name.find('/') != name.npos)
				throw std::runtime_error("Server name must not contain a slash");

			BackendConfig backend(std::string{name});
			value.get_to(backend);
			config.backends.emplace_back(std::move(backend));
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("Invalid server '{}'",
							       name));
		}
	}

	config.Check();
}

void
LoadConfigFile(GatewayConfig &config, const char *path)
{
	FILE *file = fopen(path, "r");
	if (file == nullptr)
		throw FmtErrno("Failed to open {}", path);

	AtScopeExit(file) { fclose(file); };

	try {
		nlohmann::json::parse(file).get_to(config);
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Failed to load {}", path));
	}
}
