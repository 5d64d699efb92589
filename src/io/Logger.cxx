// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <atomic>

#include <unistd.h>

static std::atomic_uint log_level{1};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

unsigned
GetLogLevel() noexcept
{
	return log_level.load(std::memory_order_relaxed);
}

void
LogLine(std::string_view domain, std::string_view text) noexcept
{
	std::string line;
	line.reserve(domain.size() + text.size() + 3);

	if (!domain.empty()) {
		line.append(domain);
		line.append(": ");
	}

	line.append(text);
	line.push_back('\n');

	/* a single write() call, so lines from different threads
	   don't get mixed */
	(void)write(STDERR_FILENO, line.data(), line.size());
}

namespace LoggerDetail {

void
AppendLogArg(std::string &dest, std::exception_ptr ep) noexcept
{
	dest.append(GetFullMessage(ep));
}

} // namespace LoggerDetail
