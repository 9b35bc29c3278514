// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "FileStatus.hxx"

/**
 * One child reported by a #DirectoryListing.
 */
struct DirectoryRecord {
	/**
	 * The name of the child.  Only valid until the next
	 * DirectoryListing::Read() call.  May be nullptr if the
	 * listing is corrupt.
	 */
	const char *name;

	FileType type;
};

/**
 * An open directory which can be iterated one child at a time.  The
 * special entries "." and ".." are never reported.  Destructing the
 * object releases all resources.
 */
class DirectoryListing {
public:
	virtual ~DirectoryListing() noexcept = default;

	/**
	 * Identifies the directory being listed.
	 */
	[[gnu::pure]]
	virtual FileId GetFileId() const noexcept = 0;

	/**
	 * Read the next child.
	 *
	 * Throws on I/O error.
	 *
	 * @return false if the end of the listing has been reached
	 */
	virtual bool Read(DirectoryRecord &record) = 0;
};
