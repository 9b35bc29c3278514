// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Options.hxx"
#include "Config.hxx"
#include "config.h"

#include <fmt/core.h>

#include <charconv>

#include <getopt.h>
#include <stdlib.h> // for EXIT_SUCCESS
#include <string.h>

static void
PrintVersion() noexcept
{
	fmt::print("dirwalk version " VERSION "\n");
}

static void
PrintHelp(const char *argv0) noexcept
{
	if (argv0 == nullptr)
		argv0 = "dirwalk";

	fmt::print(stderr,
		   "Format:\n"
		   "  {} [options] [ROOT...]\n"
		   "  {} -V\n"
		   "\n"
		   "Options:\n"
		   "  -f <configfile>\tLoad a walk profile\n"
		   "  -d <depth>\tDescend at most this many levels\n"
		   "  -e <suffix>\tOnly print paths with this suffix (repeatable)\n"
		   "  -m <regex>\tOnly print paths matching this pattern (repeatable)\n"
		   "  -s <regex>\tSkip paths matching this pattern (repeatable)\n"
		   "  -L\tFollow symbolic links\n"
		   "  -F\tDon't print files\n"
		   "  -D\tDon't print directories\n"
		   "  -l\tPrint the file type before each path\n"
		   "  -a\tUse io_uring\n"
		   "  -q\tDon't print a summary\n"
		   "  -V\tPrint version and exit\n",
		   argv0, argv0);
}

static int
ParseDepth(const char *s) noexcept
{
	const char *const last = s + strlen(s);

	int value;
	auto [ptr, ec] = std::from_chars(s, last, value, 10);
	if (ptr == s || ptr != last || ec != std::errc{}) {
		fmt::print(stderr, "Malformed depth: '{}'\n", s);
		exit(EXIT_FAILURE);
	}

	return value;
}

Options
ParseCommandLine(int argc, char **argv)
{
	/* handle help request */
	if (argc == 2 && strcmp(argv[1], "--help") == 0) {
		PrintHelp(argv[0]);
		exit(EXIT_FAILURE);
	}

	if (argc == 2 && strcmp(argv[1], "--version") == 0) {
		PrintVersion();
		exit(EXIT_SUCCESS);
	}

	Options options;

	int opt;
	while ((opt = getopt(argc, argv, "f:d:e:m:s:LFDlaqV")) != EOF) {
		switch (opt) {
		case 'f':
			options.configfile = optarg;
			break;

		case 'd':
			options.max_depth = ParseDepth(optarg);
			break;

		case 'e':
			options.exts.emplace_back(optarg);
			break;

		case 'm':
			options.match.emplace_back(optarg);
			break;

		case 's':
			options.skip.emplace_back(optarg);
			break;

		case 'L':
			options.follow_symlinks = true;
			break;

		case 'F':
			options.omit_files = true;
			break;

		case 'D':
			options.omit_dirs = true;
			break;

		case 'l':
			options.long_format = true;
			break;

		case 'a':
			options.use_uring = true;
			break;

		case 'q':
			options.quiet = true;
			break;

		case 'V':
			PrintVersion();
			exit(EXIT_SUCCESS);

		default:
			PrintHelp(argv[0]);
			exit(EXIT_FAILURE);
		}
	}

	for (int i = optind; i < argc; ++i)
		options.roots.push_back(argv[i]);

	if (options.roots.empty())
		options.roots.push_back(".");

	return options;
}

template<typename T>
static void
AppendAll(std::optional<std::vector<T>> &dest, const std::vector<T> &src)
{
	if (src.empty())
		return;

	if (!dest)
		dest.emplace();

	dest->insert(dest->end(), src.begin(), src.end());
}

WalkOptions
MakeWalkOptions(const Options &options)
{
	WalkOptions walk = options.configfile != nullptr
		? LoadConfigFile(options.configfile).walk
		: WalkOptions{};

	if (options.max_depth)
		walk.max_depth = *options.max_depth;

	AppendAll(walk.exts, options.exts);
	AppendAll(walk.match, options.match);
	AppendAll(walk.skip, options.skip);

	if (options.follow_symlinks)
		walk.follow_symlinks = true;

	if (options.omit_files)
		walk.include_files = false;

	if (options.omit_dirs)
		walk.include_dirs = false;

	return walk;
}
