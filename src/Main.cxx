// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Options.hxx"
#include "SyncWalk.hxx"
#include "Error.hxx"
#include "config.h"

#ifdef HAVE_LIBURING
#include "AsyncWalk.hxx"
#include "IoRing.hxx"
#include "RunAsync.hxx"
#endif

#include <fmt/core.h>

#include <cstddef>
#include <optional>
#include <stdexcept>

#include <stdlib.h> // for EXIT_SUCCESS

[[gnu::const]]
static char
TypeLetter(FileType type) noexcept
{
	switch (type) {
	case FileType::REGULAR:
		return 'f';

	case FileType::DIRECTORY:
		return 'd';

	case FileType::SYMLINK:
		return 'l';

	case FileType::OTHER:
		break;
	}

	return '?';
}

static void
PrintEntry(const WalkEntry &entry, bool long_format) noexcept
{
	if (long_format)
		fmt::print("{} {}\n", TypeLetter(entry.type), entry.path);
	else
		fmt::print("{}\n", entry.path);
}

static std::size_t
RunSyncWalk(const char *root, WalkOptions &&walk_options, bool long_format)
{
	std::size_t n = 0;

	for (const auto &entry : SyncWalk{root, std::move(walk_options)}) {
		PrintEntry(entry, long_format);
		++n;
	}

	return n;
}

#ifdef HAVE_LIBURING

static AsyncTask<std::size_t>
WalkAsync(IoRing &ring, const char *root,
	  WalkOptions walk_options, bool long_format)
{
	AsyncWalk walk{ring, root, std::move(walk_options)};

	std::size_t n = 0;
	while (const auto entry = co_await walk.Next()) {
		PrintEntry(*entry, long_format);
		++n;
	}

	co_return n;
}

#endif

static int
Run(const Options &options)
{
	const WalkOptions walk_options = MakeWalkOptions(options);

#ifdef HAVE_LIBURING
	std::optional<IoRing> ring;
	if (options.use_uring)
		ring.emplace(64);
#else
	if (options.use_uring)
		throw std::runtime_error{"io_uring support is disabled"};
#endif

	for (const char *root : options.roots) {
		std::size_t n;

#ifdef HAVE_LIBURING
		if (ring)
			n = RunAsync(*ring, WalkAsync(*ring, root,
						      walk_options,
						      options.long_format));
		else
#endif
			n = RunSyncWalk(root, WalkOptions{walk_options},
					options.long_format);

		if (!options.quiet)
			fmt::print(stderr, "{}: {} entries\n", root, n);
	}

	return EXIT_SUCCESS;
}

int
main(int argc, char **argv) noexcept
try {
	const auto options = ParseCommandLine(argc, argv);

	return Run(options);
} catch (...) {
	PrintErrorChain(std::current_exception());
	return EXIT_FAILURE;
}
