// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "SyncWalk.hxx"
#include "PosixDirectory.hxx"
#include "TempTree.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <ranges>
#include <set>
#include <string>
#include <system_error>
#include <vector>

static_assert(std::input_iterator<SyncWalk::iterator>);
static_assert(std::ranges::input_range<SyncWalk>);

namespace {

std::vector<WalkEntry>
Collect(std::string_view root, WalkOptions options={})
{
	std::vector<WalkEntry> result;
	for (const auto &entry : SyncWalk{root, std::move(options)})
		result.push_back(entry);
	return result;
}

std::set<std::string>
PathSet(const std::vector<WalkEntry> &entries)
{
	std::set<std::string> result;
	for (const auto &entry : entries)
		result.emplace(entry.path);
	return result;
}

/**
 * Returns the index of the entry with the given path or -1.
 */
int
IndexOf(const std::vector<WalkEntry> &entries, std::string_view path)
{
	const auto i = std::find_if(entries.begin(), entries.end(), [path](const auto &entry){
		return entry.path == path;
	});

	return i == entries.end() ? -1 : int(i - entries.begin());
}

class SyncWalkTest : public ::testing::Test {
protected:
	TempTree tree;

	/**
	 * root/{a.txt, sub/{b.txt, .git/{c}}}
	 */
	void SetUp() override {
		tree.MakeFile("a.txt", "a");
		tree.MakeDirectory("sub");
		tree.MakeFile("sub/b.txt", "b");
		tree.MakeDirectory("sub/.git");
		tree.MakeFile("sub/.git/c");
	}
};

} // namespace

TEST_F(SyncWalkTest, CountsRootAndAllDescendants)
{
	const auto entries = Collect(tree.GetRoot());
	EXPECT_EQ(entries.size(), 6u);

	EXPECT_EQ(PathSet(entries),
		  (std::set<std::string>{
			  tree.GetRoot(),
			  tree.Path("a.txt"),
			  tree.Path("sub"),
			  tree.Path("sub/b.txt"),
			  tree.Path("sub/.git"),
			  tree.Path("sub/.git/c"),
		  }));
}

TEST_F(SyncWalkTest, PreOrder)
{
	const auto entries = Collect(tree.GetRoot());
	ASSERT_FALSE(entries.empty());
	EXPECT_EQ(entries.front().path, tree.GetRoot());

	EXPECT_LT(IndexOf(entries, tree.Path("sub")),
		  IndexOf(entries, tree.Path("sub/b.txt")));
	EXPECT_LT(IndexOf(entries, tree.Path("sub")),
		  IndexOf(entries, tree.Path("sub/.git")));
	EXPECT_LT(IndexOf(entries, tree.Path("sub/.git")),
		  IndexOf(entries, tree.Path("sub/.git/c")));
}

TEST_F(SyncWalkTest, EntryTypes)
{
	for (const auto &entry : Collect(tree.GetRoot())) {
		if (entry.name == "a.txt" || entry.name == "b.txt" || entry.name == "c")
			EXPECT_TRUE(entry.IsFile()) << entry.path;
		else
			EXPECT_TRUE(entry.IsDirectory()) << entry.path;

		EXPECT_FALSE(entry.IsSymbolicLink());
	}
}

TEST_F(SyncWalkTest, Skip)
{
	WalkOptions options;
	options.skip = PatternList{std::regex{"/\\.git"}};

	const auto entries = Collect(tree.GetRoot(), std::move(options));
	EXPECT_EQ(PathSet(entries),
		  (std::set<std::string>{
			  tree.GetRoot(),
			  tree.Path("a.txt"),
			  tree.Path("sub"),
			  tree.Path("sub/b.txt"),
		  }));
}

TEST_F(SyncWalkTest, Exts)
{
	WalkOptions options;
	options.exts = ExtensionList{".txt"};

	EXPECT_EQ(PathSet(Collect(tree.GetRoot(), std::move(options))),
		  (std::set<std::string>{
			  tree.Path("a.txt"),
			  tree.Path("sub/b.txt"),
		  }));
}

TEST_F(SyncWalkTest, MaxDepth)
{
	WalkOptions options;
	options.max_depth = 0;

	const auto entries = Collect(tree.GetRoot(), std::move(options));
	ASSERT_EQ(entries.size(), 1u);
	EXPECT_EQ(entries.front().path, tree.GetRoot());

	options = {};
	options.max_depth = 1;
	EXPECT_EQ(PathSet(Collect(tree.GetRoot(), std::move(options))),
		  (std::set<std::string>{
			  tree.GetRoot(),
			  tree.Path("a.txt"),
			  tree.Path("sub"),
		  }));
}

TEST_F(SyncWalkTest, IncludeFilesFalse)
{
	WalkOptions options;
	options.include_files = false;

	for (const auto &entry : Collect(tree.GetRoot(), std::move(options)))
		EXPECT_FALSE(entry.IsFile()) << entry.path;
}

TEST_F(SyncWalkTest, RootIsNormalized)
{
	WalkOptions options;
	options.max_depth = 0;

	const auto entries = Collect(tree.GetRoot() + "//./", std::move(options));
	ASSERT_EQ(entries.size(), 1u);
	EXPECT_EQ(entries.front().path, tree.GetRoot() + "/");
	EXPECT_EQ(entries.front().name, tree.GetRoot().substr(tree.GetRoot().rfind('/') + 1));
}

TEST_F(SyncWalkTest, Idempotent)
{
	EXPECT_EQ(Collect(tree.GetRoot()), Collect(tree.GetRoot()));
}

TEST_F(SyncWalkTest, SymlinksSkippedByDefault)
{
	tree.MakeSymlink("link", "sub");
	tree.MakeSymlink("dangling", "nonexistent");

	const auto entries = Collect(tree.GetRoot());
	EXPECT_EQ(entries.size(), 6u);
	EXPECT_EQ(IndexOf(entries, tree.Path("link")), -1);
	EXPECT_EQ(IndexOf(entries, tree.Path("dangling")), -1);
}

TEST_F(SyncWalkTest, FollowSymlinks)
{
	TempTree other;
	other.MakeFile("x");

	tree.MakeSymlink("link", other.GetRoot().c_str());
	tree.MakeSymlink("file-link", "a.txt");

	WalkOptions options;
	options.follow_symlinks = true;

	const auto entries = Collect(tree.GetRoot(), std::move(options));
	const auto real_other = ResolvePath(other.GetRoot());

	EXPECT_NE(IndexOf(entries, real_other), -1);
	EXPECT_NE(IndexOf(entries, real_other + "/x"), -1);
	EXPECT_EQ(IndexOf(entries, tree.Path("link")), -1);

	/* the file link is reported with its resolved path */
	const auto real_a = ResolvePath(tree.Path("a.txt"));
	EXPECT_EQ(std::count_if(entries.begin(), entries.end(), [&real_a](const auto &entry){
		return entry.path == real_a && entry.IsFile();
	}), real_a == tree.Path("a.txt") ? 2 : 1);
}

TEST_F(SyncWalkTest, FollowSymlinkLoop)
{
	tree.MakeSymlink("sub/up", "..");

	WalkOptions options;
	options.follow_symlinks = true;

	/* this must terminate */
	EXPECT_EQ(Collect(tree.GetRoot(), std::move(options)).size(), 6u);
}

TEST_F(SyncWalkTest, DanglingSymlinkFails)
{
	tree.MakeSymlink("dangling", "nonexistent");

	WalkOptions options;
	options.follow_symlinks = true;

	EXPECT_THROW(Collect(tree.GetRoot(), std::move(options)), std::system_error);
}

TEST_F(SyncWalkTest, MissingRoot)
{
	try {
		Collect(tree.Path("nonexistent"));
		FAIL() << "No exception";
	} catch (const std::system_error &e) {
		EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
	}
}

TEST_F(SyncWalkTest, MissingRootWithoutDirs)
{
	WalkOptions options;
	options.include_dirs = false;

	/* the root is not stat'ed, but listing it fails */
	EXPECT_THROW(Collect(tree.Path("nonexistent"), std::move(options)),
		     std::system_error);
}

TEST_F(SyncWalkTest, EarlyTermination)
{
	SyncWalk walk{tree.GetRoot(), {}};

	const auto first = walk.Next();
	ASSERT_TRUE(first);
	EXPECT_EQ(first->path, tree.GetRoot());

	const auto second = walk.Next();
	ASSERT_TRUE(second);

	/* destructing the walk here closes the open directory */
}

TEST_F(SyncWalkTest, NextAfterEnd)
{
	WalkOptions options;
	options.max_depth = 0;

	SyncWalk walk{tree.GetRoot(), std::move(options)};
	EXPECT_TRUE(walk.Next());
	EXPECT_FALSE(walk.Next());
	EXPECT_FALSE(walk.Next());
}

TEST_F(SyncWalkTest, PostfixIncrement)
{
	WalkOptions options;
	options.max_depth = 1;

	SyncWalk walk{tree.GetRoot(), std::move(options)};

	std::size_t n = 0;
	for (auto i = walk.begin(); i != walk.end(); i++)
		++n;

	EXPECT_EQ(n, 3u);
}
