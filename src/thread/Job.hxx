// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/intrusive/list_hook.hpp>

/**
 * A job that shall be executed in a worker thread.
 */
class ThreadJob
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {
public:
	enum class State {
		/**
		 * The job is not in any queue.
		 */
		INITIAL,

		/**
		 * The job has been added to the queue, but is not being
		 * worked on yet.
		 */
		WAITING,

		/**
		 * The job is being performed via Run().
		 */
		BUSY,

		/**
		 * The job has finished, but the Done() method has not
		 * been invoked yet.
		 */
		DONE,
	};

	State state = State::INITIAL;

	virtual ~ThreadJob() noexcept = default;

	/**
	 * Is this job currently idle, i.e. not being worked on by a
	 * worker thread?  This method may be called only from the main
	 * thread.  A "true" return value guarantees that no worker thread
	 * is and will be working on it, and its internal data structures
	 * may be accessed without mutex protection.  Use this method with
	 * caution.
	 */
	bool IsIdle() const noexcept {
		return state == State::INITIAL;
	}

	/**
	 * Do the work.  This is called in a worker thread.
	 */
	virtual void Run() noexcept = 0;

	/**
	 * The job has finished.  This is called in the main thread.
	 */
	virtual void Done() noexcept = 0;
};
