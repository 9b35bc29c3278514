// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <sys/types.h> // for dev_t, ino_t

enum class FileType {
	REGULAR,
	DIRECTORY,
	SYMLINK,

	/**
	 * Anything else: device, FIFO, socket.
	 */
	OTHER,
};

/**
 * Uniquely identifies an inode on this host.
 */
struct FileId {
	dev_t dev = 0;
	ino_t ino = 0;

	constexpr bool operator==(const FileId &) const noexcept = default;
};

/**
 * The subset of "struct stat" needed by #Walk.
 */
struct FileStatus {
	FileType type;
	FileId id;
};

[[gnu::const]]
FileType
FileTypeFromMode(unsigned mode) noexcept;
