// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>

/**
 * A temporary directory which is populated by a unit test and
 * deleted recursively by the destructor.
 */
class TempTree {
	std::string root;

public:
	TempTree();
	~TempTree() noexcept;

	TempTree(const TempTree &) = delete;
	TempTree &operator=(const TempTree &) = delete;

	const std::string &GetRoot() const noexcept {
		return root;
	}

	/**
	 * Build an absolute path to a node inside the tree.
	 */
	std::string Path(std::string_view relative) const;

	void MakeDirectory(std::string_view relative) const;
	void MakeFile(std::string_view relative,
		      std::string_view contents={}) const;
	void MakeSymlink(std::string_view relative, const char *target) const;
};
