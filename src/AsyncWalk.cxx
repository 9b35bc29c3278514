// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later

#include "AsyncWalk.hxx"
#include "IoRing.hxx"
#include "PosixDirectory.hxx"

#include <fmt/format.h>

#include <fcntl.h> // for O_DIRECTORY
#include <sys/stat.h> // for struct statx
#include <sys/sysmacros.h> // for makedev()

static AsyncTask<FileStatus>
StatAsync(IoRing &ring, const std::string &path)
{
	struct statx stx;
	IoRequest request;

	auto &sqe = ring.GetSqe();
	io_uring_prep_statx(&sqe, AT_FDCWD, path.c_str(),
			    AT_STATX_SYNC_AS_STAT, STATX_TYPE|STATX_INO, &stx);
	ring.Enqueue(sqe, request);

	const int res = co_await request;
	if (res < 0)
		throw fmt::system_error(-res, "Failed to stat {:?}", path);

	co_return FileStatus{
		.type = FileTypeFromMode(stx.stx_mode),
		.id = {
			makedev(stx.stx_dev_major, stx.stx_dev_minor),
			stx.stx_ino,
		},
	};
}

static AsyncTask<int>
OpenDirectoryAsync(IoRing &ring, const std::string &path)
{
	IoRequest request;

	auto &sqe = ring.GetSqe();
	io_uring_prep_openat(&sqe, AT_FDCWD, path.c_str(),
			     O_RDONLY|O_DIRECTORY|O_CLOEXEC, 0);
	ring.Enqueue(sqe, request);

	const int res = co_await request;
	if (res < 0)
		throw fmt::system_error(-res, "Failed to open {:?}", path);

	co_return res;
}

AsyncTask<std::optional<WalkEntry>>
AsyncWalk::Next()
{
	while (true) {
		switch (walk.Step()) {
		case Walk::Action::STAT:
			walk.OnStat(co_await StatAsync(ring, walk.GetRequestPath()));
			break;

		case Walk::Action::OPEN_DIRECTORY:
			{
				const int fd = co_await OpenDirectoryAsync(ring, walk.GetRequestPath());
				walk.OnOpenDirectory(std::make_unique<PosixDirectoryListing>(fd, walk.GetRequestPath()));
			}

			break;

		case Walk::Action::RESOLVE:
			walk.OnResolve(ResolvePath(walk.GetRequestPath()));
			break;

		case Walk::Action::ENTRY:
			co_return walk.TakeEntry();

		case Walk::Action::END:
			co_return std::nullopt;
		}
	}
}
