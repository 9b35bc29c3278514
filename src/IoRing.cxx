// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later

#include "IoRing.hxx"

#include <fmt/format.h>

#include <stdexcept>

#include <errno.h>

IoRing::IoRing(unsigned entries)
{
	const int res = io_uring_queue_init(entries, &ring, 0);
	if (res < 0)
		throw fmt::system_error(-res, "io_uring_queue_init() failed");
}

IoRing::~IoRing() noexcept
{
	io_uring_queue_exit(&ring);
}

struct io_uring_sqe &
IoRing::GetSqe()
{
	auto *sqe = io_uring_get_sqe(&ring);
	if (sqe == nullptr) [[unlikely]] {
		const int res = io_uring_submit(&ring);
		if (res < 0)
			throw fmt::system_error(-res, "io_uring_submit() failed");

		sqe = io_uring_get_sqe(&ring);
		if (sqe == nullptr)
			throw std::runtime_error{"io_uring submission queue is full"};
	}

	return *sqe;
}

void
IoRing::Enqueue(struct io_uring_sqe &sqe, IoRequest &request) noexcept
{
	io_uring_sqe_set_data(&sqe, &request);
	++n_in_flight;
}

void
IoRing::WaitAndComplete()
{
	if (n_in_flight == 0)
		throw std::logic_error{"No io_uring request in flight"};

	const int res = io_uring_submit_and_wait(&ring, 1);
	if (res < 0 && res != -EINTR)
		throw fmt::system_error(-res, "io_uring_submit_and_wait() failed");

	ConsumeCompletions(true);
}

void
IoRing::Abandon() noexcept
{
	while (n_in_flight > 0) {
		const int res = io_uring_submit_and_wait(&ring, 1);
		if (res < 0 && res != -EINTR)
			/* the ring is broken; nothing more will
			   complete */
			break;

		ConsumeCompletions(false);
	}
}

void
IoRing::ConsumeCompletions(bool resume) noexcept
{
	struct io_uring_cqe *cqe;
	while (io_uring_peek_cqe(&ring, &cqe) == 0) {
		auto &request = *static_cast<IoRequest *>(io_uring_cqe_get_data(cqe));
		request.result = cqe->res;
		request.complete = true;
		io_uring_cqe_seen(&ring, cqe);
		--n_in_flight;

		/* the coroutine may enqueue more requests */
		if (resume && request.waiter)
			request.waiter.resume();
	}
}
