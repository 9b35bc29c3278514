// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Walk.hxx"
#include "DirectoryListing.hxx"
#include "Error.hxx"
#include "Filter.hxx"
#include "PathUtil.hxx"

#include <algorithm>
#include <cassert>

Walk::Walk(std::string_view root, WalkOptions &&_options)
	:options(std::move(_options))
{
	node.path = root;
	node.depth = options.max_depth;
}

Walk::~Walk() noexcept = default;

Walk::Action
Walk::Step()
{
	while (true) {
		if (pending_entry)
			return Action::ENTRY;

		switch (state) {
		case State::NODE:
			if (node.depth < 0) {
				/* depth budget exhausted; this can only
				   happen if the caller passed a negative
				   max_depth */
				state = State::CHILDREN;
				break;
			}

			if (options.include_dirs && FilterPath(node.path, options)) {
				/* the root of each (sub)tree has no type
				   hint, so it needs to be stat'ed */
				request_path = NormalizePath(node.path);
				state = State::NODE_STAT;
				return Action::STAT;
			}

			state = State::DESCEND;
			break;

		case State::NODE_STAT:
		case State::RESOLVED_STAT:
			return Action::STAT;

		case State::DESCEND:
			/* only "skip" prunes; "exts" and "match" only
			   suppress reporting */
			if (node.depth < 1 || !FilterPrune(node.path, options)) {
				state = State::CHILDREN;
				break;
			}

			request_path = node.path;
			state = State::OPEN;
			return Action::OPEN_DIRECTORY;

		case State::OPEN:
			return Action::OPEN_DIRECTORY;

		case State::CHILDREN:
			if (frames.empty()) {
				state = State::END;
				return Action::END;
			}

			ReadChild();
			break;

		case State::RESOLVE:
			return Action::RESOLVE;

		case State::RESOLVED:
			state = State::RESOLVED_STAT;
			return Action::STAT;

		case State::END:
			return Action::END;
		}
	}
}

inline void
Walk::ReadChild()
{
	assert(!frames.empty());

	auto &frame = frames.back();

	DirectoryRecord record;
	if (!frame.listing->Read(record)) {
		/* this directory is finished; continue with its
		   parent */
		frames.pop_back();
		return;
	}

	if (record.name == nullptr || *record.name == 0)
		throw CorruptListingError{"Directory entry without a name in " + frame.path};

	std::string path = JoinPath(frame.path, record.name);

	switch (record.type) {
	case FileType::SYMLINK:
		if (options.follow_symlinks) {
			request_path = std::move(path);
			state = State::RESOLVE;
		}

		break;

	case FileType::REGULAR:
		if (options.include_files && FilterPath(path, options))
			pending_entry = WalkEntry{
				.name = record.name,
				.path = std::move(path),
				.type = record.type,
			};

		break;

	case FileType::DIRECTORY:
	case FileType::OTHER:
		BeginNode(std::move(path), frame.depth - 1);
		break;
	}
}

void
Walk::OnStat(const FileStatus &status)
{
	switch (state) {
	case State::NODE_STAT:
		pending_entry = WalkEntry{
			.name = std::string{BaseName(request_path)},
			.path = request_path,
			.type = status.type,
		};

		state = State::DESCEND;
		break;

	case State::RESOLVED_STAT:
		/* continue as if the symlink target were the child */
		assert(!frames.empty());

		state = State::CHILDREN;

		if (status.type == FileType::REGULAR) {
			if (options.include_files && FilterPath(request_path, options))
				pending_entry = WalkEntry{
					.name = std::string{BaseName(request_path)},
					.path = request_path,
					.type = status.type,
				};
		} else if (!IsAncestor(status.id)) {
			/* the target has already been stat'ed; report it
			   right away instead of going through
			   State::NODE */
			node.path = request_path;
			node.depth = frames.back().depth - 1;

			if (options.include_dirs && FilterPath(node.path, options))
				pending_entry = WalkEntry{
					.name = std::string{BaseName(node.path)},
					.path = node.path,
					.type = status.type,
				};

			state = State::DESCEND;
		}

		break;

	default:
		/* no STAT operation was requested */
		assert(false);
		break;
	}
}

void
Walk::OnOpenDirectory(std::unique_ptr<DirectoryListing> listing)
{
	assert(state == State::OPEN);
	assert(listing);

	frames.push_back(Frame{
		.path = std::move(node.path),
		.depth = node.depth,
		.listing = std::move(listing),
	});

	state = State::CHILDREN;
}

void
Walk::OnResolve(std::string &&real_path) noexcept
{
	assert(state == State::RESOLVE);

	request_path = std::move(real_path);
	state = State::RESOLVED;
}

WalkEntry
Walk::TakeEntry() noexcept
{
	assert(pending_entry);

	WalkEntry entry = std::move(*pending_entry);
	pending_entry.reset();
	return entry;
}

bool
Walk::IsAncestor(FileId id) const noexcept
{
	return std::any_of(frames.begin(), frames.end(), [id](const auto &frame){
		return frame.listing->GetFileId() == id;
	});
}
