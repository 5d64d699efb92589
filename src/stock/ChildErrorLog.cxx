// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ChildErrorLog.hxx"
#include "io/Logger.hxx"

#include <fmt/format.h>

#include <errno.h>
#include <string.h>

ChildErrorLog::ChildErrorLog(EventLoop &event_loop,
			     UniqueFileDescriptor &&_fd, pid_t pid) noexcept
	:fd(std::move(_fd)),
	 event(event_loop, BIND_THIS_METHOD(OnSocketReady), fd.Get()),
	 domain(fmt::format("child[{}]", pid))
{
	event.ScheduleRead();
}

ChildErrorLog::~ChildErrorLog() noexcept
{
	event.Cancel();

	if (!fd.IsDefined())
		return;

	/* a descendant may keep the pipe open; don't wait for it */
	for (unsigned i = 0; i < 16; ++i) {
		const ssize_t nbytes = fd.Read(buffer + fill,
					       sizeof(buffer) - fill);
		if (nbytes <= 0)
			break;

		fill += nbytes;
		ConsumeLines();
	}

	Flush();
}

void
ChildErrorLog::SetSession(std::string_view session_id) noexcept
{
	prefix = fmt::format("[session {}] ", session_id);
}

void
ChildErrorLog::LogErrorLine(std::string_view line) const noexcept
{
	if (!line.empty() && line.back() == '\r')
		line.remove_suffix(1);

	if (!line.empty())
		LogConcat(2, domain, prefix, line);
}

void
ChildErrorLog::ConsumeLines() noexcept
{
	std::string_view rest{buffer, fill};

	while (true) {
		const auto newline = rest.find('\n');
		if (newline == rest.npos)
			break;

		LogErrorLine(rest.substr(0, newline));
		rest.remove_prefix(newline + 1);
	}

	if (rest.size() == sizeof(buffer)) {
		/* line too long; log what we have */
		LogErrorLine(rest);
		rest = {};
	}

	memmove(buffer, rest.data(), rest.size());
	fill = rest.size();
}

void
ChildErrorLog::Flush() noexcept
{
	LogErrorLine({buffer, fill});
	fill = 0;
}

void
ChildErrorLog::OnSocketReady(unsigned) noexcept
{
	ssize_t nbytes = fd.Read(buffer + fill, sizeof(buffer) - fill);
	if (nbytes < 0 && errno == EAGAIN)
		return;

	if (nbytes <= 0) {
		/* end of file or error; the process is gone */
		Flush();
		event.Cancel();
		fd.Close();
		return;
	}

	fill += nbytes;
	ConsumeLines();
}
