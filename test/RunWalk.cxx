// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Manual test program for AsyncWalk: walks the given directory with
 * io_uring and prints every entry.
 */

#include "AsyncWalk.hxx"
#include "Error.hxx"
#include "IoRing.hxx"
#include "RunAsync.hxx"

#include <fmt/core.h>

#include <cstddef>

#include <stdlib.h> // for strtol()

static AsyncTask<std::size_t>
WalkAsync(IoRing &ring, const char *path, WalkOptions options)
{
	AsyncWalk walk{ring, path, std::move(options)};

	std::size_t n = 0;
	while (const auto entry = co_await walk.Next()) {
		fmt::print("{} {:?}\n",
			   entry->IsDirectory() ? 'd' : entry->IsFile() ? 'f' : '?',
			   entry->path);
		++n;
	}

	co_return n;
}

int
main(int argc, char **argv) noexcept
try {
	const char *path = ".";
	WalkOptions options;

	if (argc > 4) {
		fmt::print(stderr, "Usage: RunWalk [PATH [MAX_DEPTH [FOLLOW]]]\n");
		return EXIT_FAILURE;
	}

	if (argc > 1)
		path = argv[1];

	if (argc > 2)
		options.max_depth = static_cast<int>(strtol(argv[2], nullptr, 10));

	if (argc > 3)
		options.follow_symlinks = strtol(argv[3], nullptr, 10) != 0;

	IoRing ring{64};

	const auto n = RunAsync(ring, WalkAsync(ring, path, std::move(options)));
	fmt::print("{} entries\n", n);

	return EXIT_SUCCESS;
} catch (...) {
	PrintErrorChain(std::current_exception());
	return EXIT_FAILURE;
}
