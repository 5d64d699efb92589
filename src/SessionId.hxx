// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <cstdint>
#include <string>

/**
 * A random session identifier (RFC 4122 version 4 UUID).
 */
class SessionId {
	std::array<uint8_t, 16> data{};

public:
	[[gnu::pure]]
	bool IsDefined() const noexcept {
		for (auto i : data)
			if (i != 0)
				return true;
		return false;
	}

	/**
	 * Generate a new random id.
	 *
	 * Throws on error.
	 */
	void Generate();

	[[gnu::pure]]
	bool operator==(const SessionId &other) const noexcept {
		return data == other.data;
	}

	/**
	 * Format as "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx".
	 */
	[[gnu::pure]]
	std::string Format() const noexcept;
};
