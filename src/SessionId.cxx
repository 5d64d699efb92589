// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SessionId.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <fmt/format.h>

#include <openssl/err.h>
#include <openssl/rand.h>

void
SessionId::Generate()
{
	if (RAND_bytes(data.data(), data.size()) != 1)
		throw FmtRuntimeError("RAND_bytes() failed: {}",
				      ERR_error_string(ERR_get_error(), nullptr));

	/* version 4 */
	data[6] = (data[6] & 0x0f) | 0x40;

	/* variant 1 (RFC 4122) */
	data[8] = (data[8] & 0x3f) | 0x80;
}

std::string
SessionId::Format() const noexcept
{
	std::string result;
	result.reserve(36);

	for (std::size_t i = 0; i < data.size(); ++i) {
		if (i == 4 || i == 6 || i == 8 || i == 10)
			result.push_back('-');

		fmt::format_to(std::back_inserter(result), "{:02x}",
			       unsigned(data[i]));
	}

	return result;
}
