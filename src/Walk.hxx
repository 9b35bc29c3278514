// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "WalkEntry.hxx"
#include "WalkOptions.hxx"
#include "FileStatus.hxx"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class DirectoryListing;

/**
 * The traversal engine: walks a filesystem tree depth-first and
 * produces one #WalkEntry at a time, in pre-order.
 *
 * This class does not perform any I/O by itself (except for reading
 * from an already-open #DirectoryListing).  Instead, Step() tells the
 * caller which operation is needed next, and the caller passes the
 * result back by calling OnStat(), OnOpenDirectory() or OnResolve().
 * This allows driving the same algorithm with blocking system calls
 * (#SyncWalk) and with io_uring (#AsyncWalk).
 *
 * Recursion is implemented with an explicit stack of open
 * directories, so the call stack does not grow with the depth of the
 * tree.
 */
class Walk final {
	/**
	 * The options are owned here and shared by all levels of the
	 * tree; they are never modified.
	 */
	const WalkOptions options;

	/**
	 * A directory whose children are being listed.
	 */
	struct Frame {
		std::string path;

		/**
		 * The remaining depth budget of this directory;
		 * always at least 1.
		 */
		int depth;

		std::unique_ptr<DirectoryListing> listing;
	};

	/**
	 * The stack of open directories; the innermost one is at the
	 * back.  All of them are ancestors of the node currently
	 * being processed.
	 */
	std::vector<Frame> frames;

	enum class State {
		/**
		 * Begin processing #node: decide whether to report
		 * it.
		 */
		NODE,

		/**
		 * Waiting for OnStat() with the status of #node.
		 */
		NODE_STAT,

		/**
		 * Decide whether to list the children of #node.
		 */
		DESCEND,

		/**
		 * Waiting for OnOpenDirectory().
		 */
		OPEN,

		/**
		 * Read the next child of the innermost #Frame.
		 */
		CHILDREN,

		/**
		 * Waiting for OnResolve() with the target of a
		 * symbolic link.
		 */
		RESOLVE,

		/**
		 * A symbolic link was resolved; its target needs to
		 * be stat'ed.
		 */
		RESOLVED,

		/**
		 * Waiting for OnStat() with the status of a symbolic
		 * link target.
		 */
		RESOLVED_STAT,

		END,
	} state = State::NODE;

	/**
	 * The node (the root or a non-file child) which is about to
	 * be reported and descended into.
	 */
	struct {
		std::string path;
		int depth;
	} node;

	/**
	 * The path the pending operation shall be performed on.
	 */
	std::string request_path;

	/**
	 * An entry which is ready to be returned by TakeEntry().
	 */
	std::optional<WalkEntry> pending_entry;

public:
	enum class Action {
		/**
		 * Call OnStat() with the status of
		 * GetRequestPath(), following symbolic links.
		 */
		STAT,

		/**
		 * Call OnOpenDirectory() with a listing of
		 * GetRequestPath().
		 */
		OPEN_DIRECTORY,

		/**
		 * Call OnResolve() with the canonical path of
		 * GetRequestPath().
		 */
		RESOLVE,

		/**
		 * An entry is available; call TakeEntry().
		 */
		ENTRY,

		/**
		 * The walk is finished.
		 */
		END,
	};

	/**
	 * @param root the path of the root directory; it does not
	 * need to be normalized
	 */
	[[nodiscard]]
	Walk(std::string_view root, WalkOptions &&_options);
	~Walk() noexcept;

	Walk(const Walk &) = delete;
	Walk &operator=(const Walk &) = delete;

	/**
	 * Advance the walk until an operation is needed, an entry is
	 * available or the walk is finished.  If a previously
	 * requested operation has not been completed yet, the same
	 * #Action is returned again.
	 *
	 * Throws #CorruptListingError if a directory listing is
	 * corrupt and passes on exceptions thrown by
	 * DirectoryListing::Read().
	 */
	Action Step();

	/**
	 * The path the operation returned by Step() shall be
	 * performed on.
	 */
	[[gnu::pure]]
	const std::string &GetRequestPath() const noexcept {
		return request_path;
	}

	/**
	 * Complete an #Action::STAT operation.
	 */
	void OnStat(const FileStatus &status);

	/**
	 * Complete an #Action::OPEN_DIRECTORY operation.
	 */
	void OnOpenDirectory(std::unique_ptr<DirectoryListing> listing);

	/**
	 * Complete an #Action::RESOLVE operation.
	 */
	void OnResolve(std::string &&real_path) noexcept;

	/**
	 * Obtain the entry after Step() has returned #Action::ENTRY.
	 */
	WalkEntry TakeEntry() noexcept;

private:
	/**
	 * Is the given directory already being listed?  Following a
	 * symbolic link to it would loop forever.
	 */
	[[gnu::pure]]
	bool IsAncestor(FileId id) const noexcept;

	void BeginNode(std::string &&path, int depth) noexcept {
		node.path = std::move(path);
		node.depth = depth;
		state = State::NODE;
	}

	/**
	 * Read the next child of the innermost #Frame and decide
	 * what to do with it.
	 */
	void ReadChild();
};
