// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "FileStatus.hxx"

#include <string>

/**
 * One filesystem node visited by #Walk.  Instances are constructed
 * for every node which passes the filters and are never modified
 * afterwards.
 */
struct WalkEntry {
	/**
	 * The base name of #path.
	 */
	std::string name;

	/**
	 * The full path, built by joining the walk root with all
	 * names leading to this node.
	 */
	std::string path;

	FileType type;

	[[gnu::pure]]
	bool IsFile() const noexcept {
		return type == FileType::REGULAR;
	}

	[[gnu::pure]]
	bool IsDirectory() const noexcept {
		return type == FileType::DIRECTORY;
	}

	[[gnu::pure]]
	bool IsSymbolicLink() const noexcept {
		return type == FileType::SYMLINK;
	}

	bool operator==(const WalkEntry &) const noexcept = default;
};
