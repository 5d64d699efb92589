// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Prepared.hxx"

#include <algorithm>

#include <unistd.h>

[[gnu::pure]]
static std::string_view
GetEnvName(std::string_view entry) noexcept
{
	return entry.substr(0, entry.find('='));
}

void
PreparedChildProcess::SetEnv(std::string_view name,
			     std::string_view value) noexcept
{
	std::string entry;
	entry.reserve(name.size() + 1 + value.size());
	entry.append(name);
	entry.push_back('=');
	entry.append(value);

	auto i = std::find_if(env.begin(), env.end(), [name](const auto &e){
		return GetEnvName(e) == name;
	});

	if (i != env.end())
		*i = std::move(entry);
	else
		env.emplace_back(std::move(entry));
}

std::vector<std::string>
PreparedChildProcess::MakeEnvironment() const noexcept
{
	std::vector<std::string> result;

	for (char **i = environ; *i != nullptr; ++i) {
		const std::string_view name = GetEnvName(*i);
		const bool overridden =
			std::any_of(env.begin(), env.end(), [name](const auto &e){
				return GetEnvName(e) == name;
			});

		if (!overridden)
			result.emplace_back(*i);
	}

	result.insert(result.end(), env.begin(), env.end());
	return result;
}
