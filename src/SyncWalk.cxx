// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "SyncWalk.hxx"
#include "PosixDirectory.hxx"

std::optional<WalkEntry>
SyncWalk::Next()
{
	while (true) {
		switch (walk.Step()) {
		case Walk::Action::STAT:
			walk.OnStat(StatPath(walk.GetRequestPath()));
			break;

		case Walk::Action::OPEN_DIRECTORY:
			walk.OnOpenDirectory(OpenDirectoryListing(walk.GetRequestPath()));
			break;

		case Walk::Action::RESOLVE:
			walk.OnResolve(ResolvePath(walk.GetRequestPath()));
			break;

		case Walk::Action::ENTRY:
			return walk.TakeEntry();

		case Walk::Action::END:
			return std::nullopt;
		}
	}
}
