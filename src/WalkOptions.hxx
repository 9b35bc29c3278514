// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <limits>
#include <optional>
#include <regex>
#include <string>
#include <vector>

/**
 * A list of path suffixes (e.g. ".txt").
 */
using ExtensionList = std::vector<std::string>;

/**
 * A list of regular expressions which are searched anywhere in a
 * path.
 */
using PatternList = std::vector<std::regex>;

struct WalkOptions {
	/**
	 * The number of directory levels below the root which may be
	 * listed.  0 means only the root itself is visited; a
	 * negative value means nothing is visited at all.
	 */
	int max_depth = std::numeric_limits<int>::max();

	bool include_files = true, include_dirs = true;

	/**
	 * Resolve symbolic links and visit their targets?  If false,
	 * symbolic links are neither reported nor traversed.
	 */
	bool follow_symlinks = false;

	/**
	 * If set, only paths ending with one of these suffixes are
	 * reported.  This never prevents descending into a directory.
	 */
	std::optional<ExtensionList> exts;

	/**
	 * If set, only paths matching at least one of these patterns
	 * are reported.  This never prevents descending into a
	 * directory.
	 */
	std::optional<PatternList> match;

	/**
	 * Paths matching one of these patterns are not reported, and
	 * matching directories are not descended into.
	 */
	std::optional<PatternList> skip;
};
