// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PipeWriter.hxx"
#include "system/Error.hxx"

#include <errno.h>

PipeWriter::PipeWriter(EventLoop &event_loop, UniqueFileDescriptor &&_fd,
		       std::string_view log_domain) noexcept
	:logger(log_domain), fd(std::move(_fd)),
	 event(event_loop, BIND_THIS_METHOD(OnSocketReady), fd.Get())
{
}

void
PipeWriter::Write(std::string_view data) noexcept
{
	if (failed || data.empty())
		return;

	buffer.append(data);

	if (!(event.GetScheduledFlags() & SocketEvent::WRITE))
		Flush();
}

void
PipeWriter::Flush() noexcept
{
	while (!buffer.empty()) {
		ssize_t nbytes = fd.Write(buffer.data(), buffer.size());
		if (nbytes < 0) {
			const int e = errno;
			if (e == EAGAIN) {
				event.ScheduleWrite();
				return;
			}

			if (e == EINTR)
				continue;

			logger(2, "write to child stdin failed: ",
			       std::make_exception_ptr(MakeErrno(e, "write() failed")));
			failed = true;
			buffer.clear();
			buffer.shrink_to_fit();
			event.Cancel();
			fd.Close();
			return;
		}

		buffer.erase(0, nbytes);
	}

	event.Cancel();
}

void
PipeWriter::OnSocketReady(unsigned) noexcept
{
	Flush();
}
