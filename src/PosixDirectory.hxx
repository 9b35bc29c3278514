// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "DirectoryListing.hxx"

#include <memory>
#include <string>

#include <dirent.h>

/**
 * A #DirectoryListing implementation using readdir().  The type of
 * each child is taken from "d_type"; if the filesystem does not
 * provide it, fstatat() is called for that child.
 */
class PosixDirectoryListing final : public DirectoryListing {
	DIR *const dir;

	/**
	 * The path of this directory, for error messages.
	 */
	const std::string path;

	FileId id;

public:
	/**
	 * Throws on error.
	 *
	 * @param fd a directory file descriptor; ownership is
	 * transferred to this object (also if the constructor
	 * throws)
	 * @param path the path of the directory for error messages
	 */
	PosixDirectoryListing(int fd, const std::string &path);
	~PosixDirectoryListing() noexcept override;

	PosixDirectoryListing(const PosixDirectoryListing &) = delete;
	PosixDirectoryListing &operator=(const PosixDirectoryListing &) = delete;

	// virtual methods from DirectoryListing
	FileId GetFileId() const noexcept override {
		return id;
	}

	bool Read(DirectoryRecord &record) override;
};

/**
 * Open the given directory for listing (blocking).  Throws on error.
 */
std::unique_ptr<DirectoryListing>
OpenDirectoryListing(const std::string &path);

/**
 * Query the type and identity of the given path, following symbolic
 * links (blocking).  Throws on error.
 */
FileStatus
StatPath(const std::string &path);

/**
 * Resolve all symbolic links in the given path and return the
 * canonical absolute path.  Throws on error.
 */
std::string
ResolvePath(const std::string &path);
