// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DeferEvent.hxx"
#include "Loop.hxx"

void
DeferEvent::Schedule() noexcept
{
	if (!IsPending())
		loop.Defer(*this);
}

void
DeferEvent::Cancel() noexcept
{
	if (IsPending())
		loop.CancelDefer(*this);
}
