// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "WalkOptions.hxx"

#include <string_view>

/**
 * Decide whether the given path passes the rule sets.  A nullptr
 * rule set does not constrain anything.
 *
 * @param exts if not nullptr, the path must end with one of these
 * suffixes
 * @param match if not nullptr, the path must match at least one of
 * these patterns
 * @param skip if not nullptr, the path must not match any of these
 * patterns
 */
bool
FilterPath(std::string_view path,
	   const ExtensionList *exts,
	   const PatternList *match,
	   const PatternList *skip);

/**
 * Apply all rule sets of the given #WalkOptions.
 */
inline bool
FilterPath(std::string_view path, const WalkOptions &options)
{
	return FilterPath(path,
			  options.exts ? &*options.exts : nullptr,
			  options.match ? &*options.match : nullptr,
			  options.skip ? &*options.skip : nullptr);
}

/**
 * Apply only the "skip" rule set.  This decides whether a directory
 * may be descended into.
 */
inline bool
FilterPrune(std::string_view path, const WalkOptions &options)
{
	return FilterPath(path, nullptr, nullptr,
			  options.skip ? &*options.skip : nullptr);
}
