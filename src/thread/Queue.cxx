// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Queue.hxx"

#include <assert.h>

ThreadQueue::ThreadQueue(EventLoop &event_loop)
	:notify(event_loop, BIND_THIS_METHOD(WakeupCallback))
{
}

ThreadQueue::~ThreadQueue() noexcept
{
	assert(!alive);

	assert(busy.empty());

	/* finish the jobs whose Done() method has not been invoked yet,
	   so they get a chance to free their resources */
	while (!done.empty()) {
		ThreadJob &job = done.front();
		done.pop_front();
		job.state = ThreadJob::State::INITIAL;
		job.Done();
	}

	waiting.clear();
}

void
ThreadQueue::WakeupCallback() noexcept
{
	std::unique_lock<std::mutex> lock(mutex);

	while (!done.empty()) {
		ThreadJob &job = done.front();
		assert(job.state == ThreadJob::State::DONE);

		done.pop_front();
		job.state = ThreadJob::State::INITIAL;

		/* Done() may destroy the job or add new jobs, so call it
		   without holding the lock */
		lock.unlock();
		job.Done();
		lock.lock();
	}

	const bool empty = IsEmpty();

	lock.unlock();

	if (empty)
		notify.Disable();
}

void
ThreadQueue::Stop() noexcept
{
	const std::lock_guard<std::mutex> lock(mutex);
	alive = false;
	cond.notify_all();
}

void
ThreadQueue::Add(ThreadJob &job) noexcept
{
	{
		const std::lock_guard<std::mutex> lock(mutex);
		assert(alive);
		assert(job.state == ThreadJob::State::INITIAL);

		job.state = ThreadJob::State::WAITING;
		waiting.push_back(job);
		cond.notify_one();
	}

	notify.Enable();
}

ThreadJob *
ThreadQueue::Wait() noexcept
{
	std::unique_lock<std::mutex> lock(mutex);

	while (true) {
		if (!alive)
			return nullptr;

		if (!waiting.empty()) {
			auto &job = waiting.front();
			assert(job.state == ThreadJob::State::WAITING);

			job.state = ThreadJob::State::BUSY;
			waiting.pop_front();
			busy.push_back(job);
			return &job;
		}

		/* queue is empty, wait for a new job to be added */
		cond.wait(lock);
	}
}

void
ThreadQueue::Done(ThreadJob &job) noexcept
{
	assert(job.state == ThreadJob::State::BUSY);

	{
		const std::lock_guard<std::mutex> lock(mutex);

		job.state = ThreadJob::State::DONE;
		busy.erase(busy.iterator_to(job));
		done.push_back(job);
	}

	notify.Signal();
}

bool
ThreadQueue::Cancel(ThreadJob &job) noexcept
{
	const std::lock_guard<std::mutex> lock(mutex);

	switch (job.state) {
	case ThreadJob::State::INITIAL:
		/* already idle */
		return true;

	case ThreadJob::State::WAITING:
		/* cancel it */
		waiting.erase(waiting.iterator_to(job));
		job.state = ThreadJob::State::INITIAL;
		return true;

	case ThreadJob::State::BUSY:
		/* no chance */
		return false;

	case ThreadJob::State::DONE:
		/* the Done() callback hasn't been invoked yet; it will be
		   invoked by WakeupCallback() */
		return false;
	}

	assert(false);
	__builtin_unreachable();
}
