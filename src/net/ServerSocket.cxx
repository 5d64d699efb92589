// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ServerSocket.hxx"
#include "system/Error.hxx"

#include <fmt/format.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

ServerSocket::ServerSocket(EventLoop &event_loop) noexcept
	:event(event_loop, BIND_THIS_METHOD(EventCallback))
{
}

ServerSocket::~ServerSocket() noexcept
{
	event.Cancel();
}

static UniqueFileDescriptor
CreateListener(int domain, const struct sockaddr *address,
	       socklen_t address_length)
{
	UniqueFileDescriptor fd{socket(domain,
				       SOCK_STREAM|SOCK_NONBLOCK|SOCK_CLOEXEC,
				       0)};
	if (!fd.IsDefined())
		throw MakeErrno("Failed to create socket");

	const int one = 1;
	setsockopt(fd.Get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

	if (domain == AF_INET6) {
		/* accept IPv4 connections as well */
		const int zero = 0;
		setsockopt(fd.Get(), IPPROTO_IPV6, IPV6_V6ONLY,
			   &zero, sizeof(zero));
	}

	if (bind(fd.Get(), address, address_length) < 0)
		throw MakeErrno("Failed to bind");

	if (listen(fd.Get(), 256) < 0)
		throw MakeErrno("Failed to listen");

	return fd;
}

void
ServerSocket::ListenTCP(unsigned port)
{
	struct sockaddr_in6 sin6{};
	sin6.sin6_family = AF_INET6;
	sin6.sin6_addr = in6addr_any;
	sin6.sin6_port = htons(port);

	try {
		fd = CreateListener(AF_INET6, (const struct sockaddr *)&sin6,
				    sizeof(sin6));
	} catch (const std::system_error &e) {
		if (!IsErrno(e, EAFNOSUPPORT))
			throw;

		/* no IPv6 support in the kernel */
		struct sockaddr_in sin{};
		sin.sin_family = AF_INET;
		sin.sin_addr.s_addr = htonl(INADDR_ANY);
		sin.sin_port = htons(port);

		fd = CreateListener(AF_INET, (const struct sockaddr *)&sin,
				    sizeof(sin));
	}

	event.Cancel();
	event.Open(fd.Get());
	AddEvent();
}

unsigned
ServerSocket::GetLocalPort() const
{
	struct sockaddr_storage ss;
	socklen_t length = sizeof(ss);
	if (getsockname(fd.Get(), (struct sockaddr *)&ss, &length) < 0)
		throw MakeErrno("getsockname() failed");

	switch (ss.ss_family) {
	case AF_INET:
		return ntohs(((const struct sockaddr_in *)&ss)->sin_port);

	case AF_INET6:
		return ntohs(((const struct sockaddr_in6 *)&ss)->sin6_port);
	}

	return 0;
}

static std::string
ToString(const struct sockaddr_storage &ss) noexcept
{
	char buffer[INET6_ADDRSTRLEN];

	switch (ss.ss_family) {
	case AF_INET: {
		const auto &sin = (const struct sockaddr_in &)ss;
		if (inet_ntop(AF_INET, &sin.sin_addr, buffer, sizeof(buffer)) == nullptr)
			break;

		return fmt::format("{}:{}", buffer, ntohs(sin.sin_port));
	}

	case AF_INET6: {
		const auto &sin6 = (const struct sockaddr_in6 &)ss;
		if (inet_ntop(AF_INET6, &sin6.sin6_addr, buffer, sizeof(buffer)) == nullptr)
			break;

		return fmt::format("[{}]:{}", buffer, ntohs(sin6.sin6_port));
	}
	}

	return "unknown";
}

void
ServerSocket::EventCallback(unsigned) noexcept
{
	struct sockaddr_storage ss;
	socklen_t length = sizeof(ss);

	UniqueFileDescriptor connection{
		accept4(fd.Get(), (struct sockaddr *)&ss, &length,
			SOCK_NONBLOCK|SOCK_CLOEXEC),
	};
	if (!connection.IsDefined()) {
		const int e = errno;
		if (e != EAGAIN && e != EINTR)
			OnAcceptError(std::make_exception_ptr(MakeErrno(e, "Failed to accept connection")));
		return;
	}

	const int one = 1;
	setsockopt(connection.Get(), IPPROTO_TCP, TCP_NODELAY,
		   &one, sizeof(one));

	OnAccept(std::move(connection), ToString(ss));
}
