// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "PosixDirectory.hxx"
#include "PathUtil.hxx"

#include <fmt/format.h>

#include <errno.h>
#include <fcntl.h> // for O_DIRECTORY
#include <stdlib.h> // for realpath(), free()
#include <sys/stat.h>
#include <unistd.h> // for close()

FileType
FileTypeFromMode(unsigned mode) noexcept
{
	if (S_ISREG(mode))
		return FileType::REGULAR;
	else if (S_ISDIR(mode))
		return FileType::DIRECTORY;
	else if (S_ISLNK(mode))
		return FileType::SYMLINK;
	else
		return FileType::OTHER;
}

static constexpr FileType
FileTypeFromDirentType(unsigned char d_type) noexcept
{
	switch (d_type) {
	case DT_REG:
		return FileType::REGULAR;

	case DT_DIR:
		return FileType::DIRECTORY;

	case DT_LNK:
		return FileType::SYMLINK;

	default:
		return FileType::OTHER;
	}
}

[[gnu::pure]]
static bool
IsSpecialFilename(const char *s) noexcept
{
	return s[0] == '.' && (s[1] == 0 || (s[1] == '.' && s[2] == 0));
}

static DIR *
FdOpenDir(int fd, const std::string &path)
{
	DIR *dir = fdopendir(fd);
	if (dir == nullptr) {
		const int e = errno;
		close(fd);
		throw fmt::system_error(e, "Failed to open directory {:?}", path);
	}

	return dir;
}

PosixDirectoryListing::PosixDirectoryListing(int fd, const std::string &_path)
	:dir(FdOpenDir(fd, _path)), path(_path)
{
	struct stat st;
	if (fstat(dirfd(dir), &st) < 0) {
		const int e = errno;
		closedir(dir);
		throw fmt::system_error(e, "Failed to stat directory {:?}", path);
	}

	id = {st.st_dev, st.st_ino};
}

PosixDirectoryListing::~PosixDirectoryListing() noexcept
{
	closedir(dir);
}

bool
PosixDirectoryListing::Read(DirectoryRecord &record)
{
	while (true) {
		errno = 0;
		const struct dirent *ent = readdir(dir);
		if (ent == nullptr) {
			if (errno != 0)
				throw fmt::system_error(errno, "Failed to read directory {:?}", path);

			return false;
		}

		if (IsSpecialFilename(ent->d_name))
			continue;

		record.name = ent->d_name;

		if (ent->d_type != DT_UNKNOWN) {
			record.type = FileTypeFromDirentType(ent->d_type);
		} else {
			/* this filesystem doesn't fill d_type; ask
			   the kernel explicitly */
			struct stat st;
			if (fstatat(dirfd(dir), ent->d_name, &st,
				    AT_SYMLINK_NOFOLLOW) < 0)
				throw fmt::system_error(errno, "Failed to stat {:?}",
							JoinPath(path, ent->d_name));

			record.type = FileTypeFromMode(st.st_mode);
		}

		return true;
	}
}

std::unique_ptr<DirectoryListing>
OpenDirectoryListing(const std::string &path)
{
	const int fd = open(path.c_str(), O_RDONLY|O_DIRECTORY|O_CLOEXEC);
	if (fd < 0)
		throw fmt::system_error(errno, "Failed to open {:?}", path);

	return std::make_unique<PosixDirectoryListing>(fd, path);
}

FileStatus
StatPath(const std::string &path)
{
	struct stat st;
	if (stat(path.c_str(), &st) < 0)
		throw fmt::system_error(errno, "Failed to stat {:?}", path);

	return {
		.type = FileTypeFromMode(st.st_mode),
		.id = {st.st_dev, st.st_ino},
	};
}

std::string
ResolvePath(const std::string &path)
{
	const std::unique_ptr<char, decltype(&free)> resolved{
		realpath(path.c_str(), nullptr),
		free,
	};
	if (!resolved)
		throw fmt::system_error(errno, "Failed to resolve {:?}", path);

	return resolved.get();
}
