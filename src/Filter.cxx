// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Filter.hxx"

#include <algorithm>

[[gnu::pure]]
static bool
HasAnySuffix(std::string_view path, const ExtensionList &exts) noexcept
{
	return std::any_of(exts.begin(), exts.end(), [path](const auto &ext){
		return path.ends_with(ext);
	});
}

static bool
MatchesAny(std::string_view path, const PatternList &patterns)
{
	return std::any_of(patterns.begin(), patterns.end(), [path](const auto &pattern){
		return std::regex_search(path.begin(), path.end(), pattern);
	});
}

bool
FilterPath(std::string_view path,
	   const ExtensionList *exts,
	   const PatternList *match,
	   const PatternList *skip)
{
	if (exts != nullptr && !HasAnySuffix(path, *exts))
		return false;

	if (match != nullptr && !MatchesAny(path, *match))
		return false;

	if (skip != nullptr && MatchesAny(path, *skip))
		return false;

	return true;
}
