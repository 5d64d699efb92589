// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Registry.hxx"
#include "ExitListener.hxx"
#include "Direct.hxx"
#include "Prepared.hxx"
#include "io/Logger.hxx"

#include <memory>

#include <errno.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/wait.h>

static constexpr std::chrono::seconds child_kill_timeout{60};

[[gnu::const]]
static double
ToDouble(const struct timeval &tv) noexcept
{
	return tv.tv_sec + tv.tv_usec / 1000000.;
}

ChildProcessRegistry::ChildProcess::ChildProcess(EventLoop &_event_loop,
						 pid_t _pid,
						 std::string_view _name) noexcept
	:pid(_pid), name(_name),
	 start_time(std::chrono::steady_clock::now()),
	 kill_timeout_event(_event_loop, BIND_THIS_METHOD(KillTimeoutCallback))
{
}

void
ChildProcessRegistry::ChildProcess::OnExit(int status,
					   const struct rusage &rusage) noexcept
{
	if (WIFSIGNALED(status)) {
		unsigned level = 1;
		if (!WCOREDUMP(status) &&
		    (WTERMSIG(status) == SIGTERM || WTERMSIG(status) == SIGINT))
			level = 4;

		LogFmt(level, "child",
		       "child process '{}' (pid {}) died from signal {}{}",
		       name, pid, WTERMSIG(status),
		       WCOREDUMP(status) ? " (core dumped)" : "");
	} else if (WEXITSTATUS(status) == 0)
		LogFmt(5, "child", "child process '{}' (pid {}) exited with success",
		       name, pid);
	else
		LogFmt(2, "child", "child process '{}' (pid {}) exited with status {}",
		       name, pid, WEXITSTATUS(status));

	const std::chrono::duration<double> elapsed =
		std::chrono::steady_clock::now() - start_time;

	LogFmt(6, "child",
	       "stats on '{}' (pid {}): {:1.3f}s elapsed, {:1.3f}s user, {:1.3f}s sys, {}/{} faults, {}/{} switches",
	       name, pid, elapsed.count(),
	       ToDouble(rusage.ru_utime), ToDouble(rusage.ru_stime),
	       rusage.ru_minflt, rusage.ru_majflt,
	       rusage.ru_nvcsw, rusage.ru_nivcsw);
}

void
ChildProcessRegistry::ChildProcess::KillTimeoutCallback() noexcept
{
	LogFmt(3, "child",
	       "sending SIGKILL to child process '{}' (pid {}) due to timeout",
	       name, pid);

	if (kill(pid, SIGKILL) < 0)
		LogFmt(1, "child", "failed to kill child process '{}' (pid {}): {}",
		       name, pid, strerror(errno));
}

ChildProcessRegistry::ChildProcessRegistry(EventLoop &_event_loop)
	:event_loop(_event_loop),
	 sigchld_event(event_loop, SIGCHLD, BIND_THIS_METHOD(OnSigchld)),
	 defer_reap(event_loop, BIND_THIS_METHOD(Reap))
{
	sigchld_event.Enable();

	/* schedule an immediate waitpid() run, just in case we lost a
	   SIGCHLD */
	defer_reap.Schedule();
}

ChildProcessRegistry::~ChildProcessRegistry() noexcept
{
	sigchld_event.Disable();
	defer_reap.Cancel();

	children.clear_and_dispose(std::default_delete<ChildProcess>());
}

pid_t
ChildProcessRegistry::Spawn(std::string_view name,
			    PreparedChildProcess &&params)
{
	/* hold the lock while spawning, so Reap() cannot collect the
	   new process before it is registered */
	const std::lock_guard<std::mutex> lock(mutex);

	const pid_t pid = SpawnChildProcess(std::move(params));

	LogFmt(5, "child", "added child process '{}' (pid {})", name, pid);

	children.insert(*new ChildProcess(event_loop, pid, name));
	return pid;
}

std::optional<int>
ChildProcessRegistry::SetExitListener(pid_t pid,
				      ExitListener &listener) noexcept
{
	std::unique_lock<std::mutex> lock(mutex);

	auto i = children.find(pid, Compare());
	if (i == children.end())
		/* unknown or abandoned; report it as exit status 255 */
		return W_EXITCODE(255, 0);

	if (i->exit_status >= 0) {
		std::unique_ptr<ChildProcess> child(&*i);
		children.erase(i);
		return child->exit_status;
	}

	i->listener = &listener;
	return std::nullopt;
}

void
ChildProcessRegistry::Kill(pid_t pid, int signo) noexcept
{
	std::unique_lock<std::mutex> lock(mutex);

	auto i = children.find(pid, Compare());
	if (i == children.end())
		/* already reaped */
		return;

	auto &child = *i;

	if (child.exit_status >= 0) {
		/* it has exited already, but nobody has claimed the
		   status yet */
		children.erase(i);
		lock.unlock();
		delete &child;
		return;
	}

	child.listener = nullptr;

	if (child.killed)
		return;

	LogFmt(5, "child", "sending signal {} to child process '{}' (pid {})",
	       signo, child.name, pid);

	if (kill(pid, signo) < 0) {
		LogFmt(1, "child", "failed to kill child process '{}' (pid {}): {}",
		       child.name, pid, strerror(errno));

		/* if we can't kill the process, we can't do much, so
		   let's just ignore the process from now on */
		children.erase(i);
		lock.unlock();
		delete &child;
		return;
	}

	child.killed = true;
	child.kill_timeout_event.Schedule(child_kill_timeout);
}

std::size_t
ChildProcessRegistry::GetCount() const noexcept
{
	const std::lock_guard<std::mutex> lock(mutex);
	return children.size();
}

void
ChildProcessRegistry::OnSigchld(int) noexcept
{
	Reap();
}

void
ChildProcessRegistry::Reap() noexcept
{
	std::unique_lock<std::mutex> lock(mutex);

	pid_t pid;
	int status;
	struct rusage rusage;
	while ((pid = wait4(-1, &status, WNOHANG, &rusage)) > 0) {
		auto i = children.find(pid, Compare());
		if (i == children.end())
			continue;

		auto &child = *i;
		child.kill_timeout_event.Cancel();
		child.OnExit(status, rusage);

		if (child.listener != nullptr) {
			ExitListener &listener = *child.listener;
			std::unique_ptr<ChildProcess> owned(&child);
			children.erase(i);

			/* the listener may call back into this object */
			lock.unlock();
			listener.OnChildProcessExit(status);
			lock.lock();
		} else if (child.killed) {
			children.erase(i);
			delete &child;
		} else
			/* keep the status for SetExitListener() */
			child.exit_status = status;
	}
}
