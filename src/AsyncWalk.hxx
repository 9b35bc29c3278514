// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later

#pragma once

#include "Walk.hxx"
#include "AsyncTask.hxx"

#include <optional>

class IoRing;

/**
 * Walk a filesystem tree asynchronously.  Metadata queries and
 * opening directories are submitted to io_uring and the calling
 * coroutine is suspended until they complete.  The sequence of
 * entries is the same as the one produced by #SyncWalk.
 *
 * Reading directory entries and resolving symbolic links are
 * blocking operations, because io_uring does not implement them.
 */
class AsyncWalk final {
	IoRing &ring;

	Walk walk;

public:
	[[nodiscard]]
	AsyncWalk(IoRing &_ring,
		  std::string_view root, WalkOptions &&options)
		:ring(_ring), walk(root, std::move(options)) {}

	/**
	 * Produce the next entry.  Throws on error; after that, this
	 * object must not be used anymore.  This object must not be
	 * destructed while the returned task is running.
	 *
	 * @return the next entry or std::nullopt if the walk is
	 * finished
	 */
	AsyncTask<std::optional<WalkEntry>> Next();
};
