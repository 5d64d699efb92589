// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UniqueFileDescriptor.hxx"
#include "system/Error.hxx"

#include <fcntl.h>
#include <unistd.h>

void
UniqueFileDescriptor::Close() noexcept
{
	if (fd >= 0)
		close(std::exchange(fd, -1));
}

void
UniqueFileDescriptor::SetNonBlocking()
{
	int flags = fcntl(fd, F_GETFL);
	if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
		throw MakeErrno("Failed to set O_NONBLOCK");
}

ssize_t
UniqueFileDescriptor::Read(void *buffer, std::size_t length) const noexcept
{
	return read(fd, buffer, length);
}

ssize_t
UniqueFileDescriptor::Write(const void *buffer, std::size_t length) const noexcept
{
	return write(fd, buffer, length);
}

std::pair<UniqueFileDescriptor, UniqueFileDescriptor>
UniqueFileDescriptor::CreatePipe()
{
	int fds[2];
	if (pipe2(fds, O_CLOEXEC) < 0)
		throw MakeErrno("pipe() failed");

	return {UniqueFileDescriptor{fds[0]}, UniqueFileDescriptor{fds[1]}};
}
