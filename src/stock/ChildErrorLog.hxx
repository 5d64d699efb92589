// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/UniqueFileDescriptor.hxx"
#include "event/SocketEvent.hxx"

#include <string>
#include <string_view>

#include <sys/types.h>

/**
 * Reads the stderr pipe of a worker process and copies each line to
 * the log, tagged with the process id and (once the worker has been
 * handed to a client) the session id.
 */
class ChildErrorLog final {
	UniqueFileDescriptor fd;

	SocketEvent event;

	const std::string domain;

	std::string prefix;

	std::size_t fill = 0;

	char buffer[1024];

public:
	/**
	 * May be called from any thread.
	 */
	ChildErrorLog(EventLoop &event_loop, UniqueFileDescriptor &&_fd,
		      pid_t pid) noexcept;

	/**
	 * Logs what is left in the pipe before closing it.
	 */
	~ChildErrorLog() noexcept;

	ChildErrorLog(const ChildErrorLog &) = delete;
	ChildErrorLog &operator=(const ChildErrorLog &) = delete;

	/**
	 * Tag all following lines with this session id.  Only to be
	 * called from the #EventLoop thread.
	 */
	void SetSession(std::string_view session_id) noexcept;

private:
	void LogErrorLine(std::string_view line) const noexcept;
	void ConsumeLines() noexcept;
	void Flush() noexcept;

	void OnSocketReady(unsigned events) noexcept;
};
