// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>

/**
 * Lexically normalize a path: collapse duplicate slashes, remove "."
 * segments and resolve ".." segments without consulting the
 * filesystem.  A trailing slash is preserved.  An empty path is
 * converted to ".".
 */
std::string
NormalizePath(std::string_view path);

/**
 * Join two path segments with a slash and normalize the result.
 * Empty segments are ignored.
 */
std::string
JoinPath(std::string_view a, std::string_view b);

/**
 * Return the last segment of the path, ignoring trailing slashes.
 * Returns an empty string for "/" and for the empty path.
 */
[[gnu::pure]]
std::string_view
BaseName(std::string_view path) noexcept;
