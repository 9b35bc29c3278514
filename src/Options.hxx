// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "WalkOptions.hxx"

#include <optional>
#include <string>
#include <vector>

struct Options {
	/**
	 * An optional walk profile; the other options are applied on
	 * top of it.
	 */
	const char *configfile = nullptr;

	std::vector<const char *> roots;

	std::optional<int> max_depth;

	ExtensionList exts;
	PatternList match, skip;

	bool follow_symlinks = false;
	bool omit_files = false, omit_dirs = false;

	/**
	 * Print a type letter before each path.
	 */
	bool long_format = false;

	/**
	 * Use #AsyncWalk instead of #SyncWalk.
	 */
	bool use_uring = false;

	/**
	 * Don't print the summary to stderr.
	 */
	bool quiet = false;
};

/**
 * Throws std::regex_error if a pattern is malformed.
 */
Options
ParseCommandLine(int argc, char **argv);

/**
 * Load the walk profile (if one was specified) and apply the command
 * line options on top of it.  Throws on error.
 */
WalkOptions
MakeWalkOptions(const Options &options);
