// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later

#pragma once

#include "IoRing.hxx"
#include "AsyncTask.hxx"

/**
 * Run the task until it finishes, completing io_uring requests while
 * it is suspended.  Returns the task's value or rethrows its
 * exception.  The task must only wait for requests on this #IoRing.
 */
template<typename T>
T
RunAsync(IoRing &ring, AsyncTask<T> &&task)
{
	task.Resume();

	try {
		while (!task.IsFinished())
			ring.WaitAndComplete();
	} catch (...) {
		/* the kernel may still write to buffers in the
		   suspended coroutine frame, which is about to be
		   destroyed */
		ring.Abandon();
		throw;
	}

	return task.GetResult();
}
