// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "PathUtil.hxx"

#include <vector>

using std::string_view_literals::operator""sv;

std::string
NormalizePath(std::string_view path)
{
	if (path.empty())
		return ".";

	const bool absolute = path.front() == '/';
	const bool trailing_slash = path.back() == '/';

	std::vector<std::string_view> segments;

	while (!path.empty()) {
		std::string_view segment;

		if (const auto slash = path.find('/'); slash != path.npos) {
			segment = path.substr(0, slash);
			path = path.substr(slash + 1);
		} else {
			segment = path;
			path = {};
		}

		if (segment.empty() || segment == "."sv)
			continue;

		if (segment == ".."sv) {
			if (!segments.empty() && segments.back() != ".."sv)
				segments.pop_back();
			else if (!absolute)
				/* a relative path may climb above its
				   start; an absolute one stops at "/" */
				segments.push_back(segment);
			continue;
		}

		segments.push_back(segment);
	}

	std::string result;
	if (absolute)
		result.push_back('/');

	for (const auto segment : segments) {
		if (!result.empty() && result.back() != '/')
			result.push_back('/');
		result.append(segment);
	}

	if (result.empty())
		result.push_back('.');

	if (trailing_slash && result.back() != '/')
		result.push_back('/');

	return result;
}

std::string
JoinPath(std::string_view a, std::string_view b)
{
	if (a.empty())
		return NormalizePath(b);

	if (b.empty())
		return NormalizePath(a);

	std::string joined;
	joined.reserve(a.size() + 1 + b.size());
	joined.append(a);
	joined.push_back('/');
	joined.append(b);
	return NormalizePath(joined);
}

std::string_view
BaseName(std::string_view path) noexcept
{
	while (path.size() > 1 && path.back() == '/')
		path.remove_suffix(1);

	if (path == "/"sv)
		return {};

	if (const auto slash = path.rfind('/'); slash != path.npos)
		path = path.substr(slash + 1);

	return path;
}
