// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "TempTree.hxx"

#include <fmt/format.h>

#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdio.h> // for remove()
#include <stdlib.h> // for mkdtemp()
#include <sys/stat.h>
#include <unistd.h>

TempTree::TempTree()
{
	char buffer[] = "/tmp/dirwalk-test-XXXXXX";
	if (mkdtemp(buffer) == nullptr)
		throw fmt::system_error(errno, "Failed to create {:?}", std::string_view{buffer});

	root = buffer;
}

static int
RemoveCallback(const char *path, const struct stat *, int, struct FTW *) noexcept
{
	return remove(path);
}

TempTree::~TempTree() noexcept
{
	nftw(root.c_str(), RemoveCallback, 64, FTW_DEPTH|FTW_PHYS);
}

std::string
TempTree::Path(std::string_view relative) const
{
	std::string path = root;
	path.push_back('/');
	path.append(relative);
	return path;
}

void
TempTree::MakeDirectory(std::string_view relative) const
{
	const auto path = Path(relative);
	if (mkdir(path.c_str(), 0700) < 0)
		throw fmt::system_error(errno, "Failed to create directory {:?}", path);
}

void
TempTree::MakeFile(std::string_view relative, std::string_view contents) const
{
	const auto path = Path(relative);
	const int fd = open(path.c_str(), O_CREAT|O_EXCL|O_WRONLY|O_CLOEXEC, 0600);
	if (fd < 0)
		throw fmt::system_error(errno, "Failed to create file {:?}", path);

	const auto nbytes = write(fd, contents.data(), contents.size());
	close(fd);

	if (nbytes != static_cast<ssize_t>(contents.size()))
		throw fmt::system_error(errno, "Failed to write {:?}", path);
}

void
TempTree::MakeSymlink(std::string_view relative, const char *target) const
{
	const auto path = Path(relative);
	if (symlink(target, path.c_str()) < 0)
		throw fmt::system_error(errno, "Failed to create symlink {:?}", path);
}
