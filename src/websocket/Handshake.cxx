// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Handshake.hxx"

#include <openssl/evp.h>
#include <openssl/sha.h>

static constexpr std::string_view websocket_guid =
	"258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string
MakeWebSocketAccept(std::string_view key) noexcept
{
	std::string input;
	input.reserve(key.size() + websocket_guid.size());
	input.append(key);
	input.append(websocket_guid);

	unsigned char digest[SHA_DIGEST_LENGTH];
	SHA1((const unsigned char *)input.data(), input.size(), digest);

	/* 4 output bytes per 3 input bytes, plus the null terminator */
	unsigned char base64[(SHA_DIGEST_LENGTH + 2) / 3 * 4 + 1];
	const int length = EVP_EncodeBlock(base64, digest, sizeof(digest));

	return {(const char *)base64, std::size_t(length)};
}
