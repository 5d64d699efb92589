// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "WebSocketClient.hxx"
#include "ClientFrame.hxx"
#include "system/Error.hxx"

#include <stdexcept>

#include <errno.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

using namespace StdioGateway;

void
WebSocketClient::Connect(unsigned port, unsigned timeout)
{
	fd = UniqueFileDescriptor(socket(AF_INET, SOCK_STREAM|SOCK_CLOEXEC, 0));
	if (!fd.IsDefined())
		throw MakeErrno("Failed to create socket");

	if (timeout > 0) {
		const struct timeval tv{time_t(timeout), 0};
		setsockopt(fd.Get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
	}

	struct sockaddr_in address{};
	address.sin_family = AF_INET;
	address.sin_port = htons(port);
	address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

	if (connect(fd.Get(), (const struct sockaddr *)&address,
		    sizeof(address)) < 0)
		throw MakeErrno("Failed to connect");
}

void
WebSocketClient::SendRaw(std::string_view data)
{
	while (!data.empty()) {
		const ssize_t nbytes = send(fd.Get(), data.data(), data.size(),
					    MSG_NOSIGNAL);
		if (nbytes < 0)
			throw MakeErrno("Failed to send");

		data.remove_prefix(nbytes);
	}
}

void
WebSocketClient::SendUpgradeRequest(std::string_view uri)
{
	std::string request = "GET ";
	request.append(uri);
	request.append(" HTTP/1.1\r\n"
		       "Host: localhost\r\n"
		       "Upgrade: websocket\r\n"
		       "Connection: Upgrade\r\n"
		       "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
		       "Sec-WebSocket-Version: 13\r\n"
		       "\r\n");
	SendRaw(request);
}

bool
WebSocketClient::Fill()
{
	char buffer[16384];
	const ssize_t nbytes = recv(fd.Get(), buffer, sizeof(buffer), 0);
	if (nbytes < 0) {
		if (errno == ECONNRESET)
			return false;

		throw MakeErrno("Failed to receive");
	}

	if (nbytes == 0)
		return false;

	input.append(buffer, nbytes);
	return true;
}

bool
WebSocketClient::FillTo(std::size_t size)
{
	while (input.size() < size)
		if (!Fill())
			return false;

	return true;
}

std::string
WebSocketClient::ReceiveResponseHead()
{
	std::size_t end;
	while ((end = input.find("\r\n\r\n")) == input.npos)
		if (!Fill())
			throw std::runtime_error("Premature end of response head");

	std::string head = input.substr(0, end);
	input.erase(0, end + 4);
	return head;
}

std::string
WebSocketClient::ReceiveAll()
{
	while (Fill()) {}

	return std::move(input);
}

void
WebSocketClient::SendFrame(WebSocketOpcode opcode, std::string_view payload)
{
	SendRaw(MakeClientFrame(opcode, payload));
}

bool
WebSocketClient::ReceiveFrame(Frame &frame)
{
	if (!FillTo(2))
		return false;

	const auto *p = (const uint8_t *)input.data();
	if (p[1] & WEBSOCKET_MASKED)
		throw std::runtime_error("Server frame is masked");

	std::size_t header_size = 2;
	uint64_t length = p[1] & WEBSOCKET_LENGTH_MASK;
	if (length >= 126) {
		const std::size_t n = length == 126 ? 2 : 8;
		header_size += n;
		if (!FillTo(header_size))
			return false;

		p = (const uint8_t *)input.data();
		length = 0;
		for (std::size_t i = 0; i < n; ++i)
			length = (length << 8) | p[2 + i];
	}

	if (!FillTo(header_size + length))
		return false;

	frame.opcode = WebSocketOpcode(input[0] & WEBSOCKET_OPCODE_MASK);
	frame.payload = input.substr(header_size, length);
	input.erase(0, header_size + length);
	return true;
}
