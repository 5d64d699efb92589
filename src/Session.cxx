// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Session.hxx"
#include "spawn/Registry.hxx"

#include <fmt/format.h>

#include <cassert>

#include <errno.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace StdioGateway;

Session::Session(ChildProcessRegistry &registry, WorkerPtr &&_worker,
		 std::string &&_id, SessionHandler &_handler) noexcept
	:id(std::move(_id)),
	 logger(fmt::format("session {}", id)),
	 handler(_handler),
	 worker(std::move(_worker)),
	 output_event(registry.GetEventLoop(), BIND_THIS_METHOD(OnOutputReady),
		      worker->GetOutput()),
	 defer_end(registry.GetEventLoop(), BIND_THIS_METHOD(OnDeferredEnd)),
	 line_splitter(MAX_MESSAGE_SIZE)
{
	/* a well-behaved worker exits cleanly on SIGINT */
	worker->SetKillSignal(SIGINT);
	worker->GetErrorLog().SetSession(id);

	logger(3, "started with process ", worker->GetPid());

	exit_status = registry.SetExitListener(worker->GetPid(), *this);
	if (exit_status)
		defer_end.Schedule();
	else
		output_event.ScheduleRead();
}

Session::~Session() noexcept
{
	output_event.Cancel();
	defer_end.Cancel();

	if (!exit_status)
		logger(4, "terminating process ", worker->GetPid());
}

void
Session::OnMessage(std::string_view payload) noexcept
{
	std::string line;
	line.reserve(payload.size() + 1);
	line.append(payload);
	line.push_back('\n');

	worker->GetInput().Write(line);
}

void
Session::SuspendOutput() noexcept
{
	output_suspended = true;
	output_event.CancelRead();
}

void
Session::ResumeOutput() noexcept
{
	output_suspended = false;

	if (!output_eof)
		output_event.ScheduleRead();
}

void
Session::LogExit(int status) const noexcept
{
	const pid_t pid = worker->GetPid();

	if (WIFSIGNALED(status))
		logger(1, "process ", pid, " died from signal ",
		       WTERMSIG(status));
	else if (WEXITSTATUS(status) != 0)
		logger(1, "process ", pid, " exited with status ",
		       WEXITSTATUS(status));
	else
		logger(3, "process ", pid, " exited");
}

Session::ReadResult
Session::ReadOutput() noexcept
{
	char buffer[65536];
	ssize_t nbytes = read(worker->GetOutput(), buffer, sizeof(buffer));
	if (nbytes < 0) {
		if (errno == EAGAIN)
			return ReadResult::AGAIN;

		if (errno == EINTR)
			return ReadResult::DATA;

		logger(2, "failed to read from process: ", strerror(errno));
		nbytes = 0;
	}

	if (nbytes == 0) {
		output_eof = true;
		output_event.Cancel();

		if (const std::size_t discarded = line_splitter.Finish();
		    discarded > 0)
			logger(4, "discarding unterminated line (", discarded,
			       " bytes)");

		return ReadResult::END_OF_FILE;
	}

	try {
		line_splitter.Feed({buffer, std::size_t(nbytes)},
				   [this](std::string &&line){
					   logger(5, line);
					   handler.OnSessionLine(line);
				   });
	} catch (const LineSplitter::TooLong &) {
		logger(2, "process ", worker->GetPid(), " printed a line which is too long");
		handler.OnSessionEnd(WebSocketCloseCode::MESSAGE_TOO_BIG,
				     "Line too long");
		return ReadResult::DESTROYED;
	}

	return ReadResult::DATA;
}

void
Session::End() noexcept
{
	assert(exit_status);

	/* a descendant may keep the pipe open and write forever;
	   stop after this many reads */
	unsigned n = 64;

	while (!output_eof && n-- > 0) {
		switch (ReadOutput()) {
		case ReadResult::DATA:
		case ReadResult::END_OF_FILE:
			continue;

		case ReadResult::AGAIN:
			break;

		case ReadResult::DESTROYED:
			return;
		}

		break;
	}

	if (!output_eof) {
		output_event.Cancel();

		if (const std::size_t discarded = line_splitter.Finish();
		    discarded > 0)
			logger(4, "discarding unterminated line (", discarded,
			       " bytes)");
	}

	const int status = *exit_status;
	LogExit(status);

	if (WIFEXITED(status) && WEXITSTATUS(status) == 0)
		handler.OnSessionEnd(WebSocketCloseCode::NORMAL,
				     "Process exited");
	else
		handler.OnSessionEnd(WebSocketCloseCode::INTERNAL_ERROR,
				     "Process failed");
}

void
Session::OnOutputReady(unsigned) noexcept
{
	/* end of file is not the end of the session; that is decided
	   by the worker's exit */
	ReadOutput();
}

void
Session::OnDeferredEnd() noexcept
{
	End();
}

void
Session::OnChildProcessExit(int status) noexcept
{
	exit_status = status;
	End();
}
