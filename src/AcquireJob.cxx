// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcquireJob.hxx"
#include "Connection.hxx"
#include "stock/ProcessPool.hxx"

void
AcquireJob::Run() noexcept
{
	try {
		worker = pool.Acquire();
	} catch (...) {
		error = std::current_exception();
	}
}

void
AcquireJob::Done() noexcept
{
	auto *const c = connection;
	auto w = std::move(worker);
	auto e = std::move(error);
	delete this;

	if (c != nullptr)
		c->OnAcquireDone(std::move(w), std::move(e));
	else if (w)
		LogConcat(4, "gateway", "client is gone, discarding process ",
			  w->GetPid());
}
