// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueFileDescriptor.hxx"
#include "Logger.hxx"
#include "event/SocketEvent.hxx"

#include <string>
#include <string_view>

/**
 * Writes data to a non-blocking pipe.  Data which cannot be written
 * right away is buffered and flushed as soon as the pipe becomes
 * writable again.
 *
 * The constructor may be called from any thread; everything else
 * only from the #EventLoop thread.
 */
class PipeWriter final {
	const Logger logger;

	UniqueFileDescriptor fd;

	SocketEvent event;

	std::string buffer;

	/**
	 * Set after a write error.  All further data is discarded.
	 */
	bool failed = false;

public:
	PipeWriter(EventLoop &event_loop, UniqueFileDescriptor &&_fd,
		   std::string_view log_domain) noexcept;

	~PipeWriter() noexcept {
		event.Cancel();
	}

	PipeWriter(const PipeWriter &) = delete;
	PipeWriter &operator=(const PipeWriter &) = delete;

	bool IsFailed() const noexcept {
		return failed;
	}

	std::size_t GetBufferedSize() const noexcept {
		return buffer.size();
	}

	void Write(std::string_view data) noexcept;

private:
	void Flush() noexcept;
	void OnSocketReady(unsigned events) noexcept;
};
