// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Walk.hxx"

#include <cstddef>
#include <iterator>
#include <optional>

/**
 * Walk a filesystem tree using blocking system calls.  Each Next()
 * call performs just enough I/O to produce one entry.
 *
 * Example:
 *
 *     for (const auto &entry : SyncWalk{"/etc", {}})
 *             fmt::print("{}\n", entry.path);
 */
class SyncWalk final {
	Walk walk;

public:
	[[nodiscard]]
	SyncWalk(std::string_view root, WalkOptions &&options)
		:walk(root, std::move(options)) {}

	/**
	 * Produce the next entry.  Throws on error; after that, this
	 * object must not be used anymore.
	 *
	 * @return the next entry or std::nullopt if the walk is
	 * finished
	 */
	std::optional<WalkEntry> Next();

	class iterator {
		SyncWalk *walk = nullptr;

		std::optional<WalkEntry> current;

	public:
		using iterator_category = std::input_iterator_tag;
		using value_type = WalkEntry;
		using difference_type = std::ptrdiff_t;
		using pointer = const WalkEntry *;
		using reference = const WalkEntry &;

		iterator() noexcept = default;

		explicit iterator(SyncWalk &_walk)
			:walk(&_walk), current(_walk.Next()) {}

		reference operator*() const noexcept {
			return *current;
		}

		pointer operator->() const noexcept {
			return &*current;
		}

		iterator &operator++() {
			current = walk->Next();
			return *this;
		}

		void operator++(int) {
			++*this;
		}

		/**
		 * Two iterators are equal if both are at the end.
		 */
		bool operator==(const iterator &other) const noexcept {
			return !current && !other.current;
		}
	};

	/**
	 * Start iterating.  This must be called only once.
	 */
	iterator begin() {
		return iterator{*this};
	}

	iterator end() noexcept {
		return {};
	}
};
