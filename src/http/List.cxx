// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "List.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

[[gnu::pure]]
static bool
EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	if (a.size() != b.size())
		return false;

	for (std::size_t i = 0; i < a.size(); ++i)
		if (ToLowerASCII(a[i]) != ToLowerASCII(b[i]))
			return false;

	return true;
}

bool
http_list_contains_i(std::string_view list, std::string_view item) noexcept
{
	while (!list.empty()) {
		std::string_view current;

		const auto comma = list.find(',');
		if (comma == list.npos) {
			current = list;
			list = {};
		} else {
			current = list.substr(0, comma);
			list.remove_prefix(comma + 1);
		}

		if (EqualsIgnoreCase(Strip(current), item))
			return true;
	}

	return false;
}
