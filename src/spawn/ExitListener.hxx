// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Handler for the exit of a child process registered with
 * #ChildProcessRegistry.
 */
class ExitListener {
public:
	/**
	 * @param status the wait status as returned by waitpid()
	 */
	virtual void OnChildProcessExit(int status) noexcept = 0;
};
