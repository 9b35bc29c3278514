// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later

#pragma once

#include <liburing.h>

#include <coroutine>

class IoRing;

/**
 * The completion slot of one io_uring request.  Awaiting it suspends
 * the coroutine until the kernel has completed the request; the
 * result is the "res" field of the completion (a negative errno value
 * on error).
 *
 * The object (and all buffers the request refers to) must stay alive
 * until the request has completed.
 */
class IoRequest {
	friend IoRing;

	std::coroutine_handle<> waiter;

	int result;

	bool complete = false;

public:
	IoRequest() noexcept = default;

	IoRequest(const IoRequest &) = delete;
	IoRequest &operator=(const IoRequest &) = delete;

	bool await_ready() const noexcept {
		return complete;
	}

	void await_suspend(std::coroutine_handle<> _waiter) noexcept {
		waiter = _waiter;
	}

	int await_resume() const noexcept {
		return result;
	}
};

/**
 * Owns a "struct io_uring" and hands completions to the
 * #IoRequest instances that were enqueued.
 */
class IoRing {
	struct io_uring ring;

	/**
	 * The number of requests enqueued whose completion has not
	 * been consumed yet.
	 */
	unsigned n_in_flight = 0;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit IoRing(unsigned entries);
	~IoRing() noexcept;

	IoRing(const IoRing &) = delete;
	IoRing &operator=(const IoRing &) = delete;

	bool IsIdle() const noexcept {
		return n_in_flight == 0;
	}

	/**
	 * Obtain an empty submission queue entry.  If the submission
	 * queue is full, it is submitted to the kernel first.
	 */
	struct io_uring_sqe &GetSqe();

	/**
	 * Attach the request to a prepared submission queue entry.
	 * It is submitted by the next WaitAndComplete() call.
	 */
	void Enqueue(struct io_uring_sqe &sqe, IoRequest &request) noexcept;

	/**
	 * Submit all enqueued requests, wait for at least one
	 * completion and resume the coroutines waiting for the
	 * completed requests.  Throws std::logic_error if no request
	 * is in flight.
	 */
	void WaitAndComplete();

	/**
	 * Wait until all requests in flight have completed, without
	 * resuming anybody.  Afterwards, the coroutine frames
	 * containing their #IoRequest objects and buffers may be
	 * destroyed.
	 */
	void Abandon() noexcept;

private:
	/**
	 * Consume all available completions.
	 *
	 * @param resume resume the waiting coroutines?
	 */
	void ConsumeCompletions(bool resume) noexcept;
};
