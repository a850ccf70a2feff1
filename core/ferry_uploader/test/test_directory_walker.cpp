// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for DirectoryWalker
 */

#include <gtest/gtest.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "directory_walker.hpp"
#include "test_helpers.hpp"
#include "uploader_errors.hpp"

using namespace ferry::uploader;
using namespace ferry::uploader::test;

class DirectoryWalkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::canonical(createTempDir("ferry_walker_")).string();
  }

  void TearDown() override {
    cleanupTempDir(test_dir_);
  }

  std::vector<std::string> collectKeys(DirectoryWalker& walker) {
    std::vector<std::string> keys;
    while (auto entry = walker.next()) {
      keys.push_back(entry->relative_key);
    }
    return keys;
  }

  std::string test_dir_;
};

TEST_F(DirectoryWalkerTest, YieldsFilesInSortedOrder) {
  generateTestFile(test_dir_ + "/c.txt", 1);
  generateTestFile(test_dir_ + "/a.txt", 1);
  generateTestFile(test_dir_ + "/b.txt", 1);

  DirectoryWalker walker(test_dir_);
  EXPECT_EQ(collectKeys(walker), (std::vector<std::string>{"a.txt", "b.txt", "c.txt"}));
}

TEST_F(DirectoryWalkerTest, DescendsDepthFirst) {
  generateTestFile(test_dir_ + "/b.txt", 1);
  generateTestFile(test_dir_ + "/a/z.txt", 1);
  generateTestFile(test_dir_ + "/a/deep/x.txt", 1);
  generateTestFile(test_dir_ + "/c/y.txt", 1);

  DirectoryWalker walker(test_dir_);
  EXPECT_EQ(
    collectKeys(walker),
    (std::vector<std::string>{"a/deep/x.txt", "a/z.txt", "b.txt", "c/y.txt"})
  );
}

TEST_F(DirectoryWalkerTest, EntryCarriesAbsolutePath) {
  generateTestFile(test_dir_ + "/sub/file.bin", 3);

  DirectoryWalker walker(test_dir_);
  auto entry = walker.next();
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->local_path, test_dir_ + "/sub/file.bin");
  EXPECT_EQ(entry->relative_key, "sub/file.bin");
  EXPECT_FALSE(walker.next().has_value());
}

TEST_F(DirectoryWalkerTest, EmptyDirectoryYieldsNothing) {
  fs::create_directories(test_dir_ + "/empty/nested");

  DirectoryWalker walker(test_dir_);
  EXPECT_FALSE(walker.next().has_value());
  // Exhausted walk stays exhausted
  EXPECT_FALSE(walker.next().has_value());
}

TEST_F(DirectoryWalkerTest, HiddenEntriesSkippedByDefault) {
  generateTestFile(test_dir_ + "/.secret", 1);
  generateTestFile(test_dir_ + "/.git/config", 1);
  generateTestFile(test_dir_ + "/visible.txt", 1);

  DirectoryWalker walker(test_dir_);
  EXPECT_EQ(collectKeys(walker), (std::vector<std::string>{"visible.txt"}));

  WalkOptions options;
  options.include_hidden = true;
  DirectoryWalker with_hidden(test_dir_, options);
  EXPECT_EQ(
    collectKeys(with_hidden),
    (std::vector<std::string>{".git/config", ".secret", "visible.txt"})
  );
}

TEST_F(DirectoryWalkerTest, SymlinksAreNotFollowed) {
  std::string outside = createTempDir("ferry_walker_outside_");
  generateTestFile(outside + "/elsewhere.txt", 1);
  generateTestFile(test_dir_ + "/real.txt", 1);
  fs::create_symlink(test_dir_ + "/real.txt", test_dir_ + "/link.txt");
  fs::create_directory_symlink(outside, test_dir_ + "/linked_dir");
  // A cycle back to the root
  fs::create_directory_symlink(test_dir_, test_dir_ + "/loop");

  DirectoryWalker walker(test_dir_);
  EXPECT_EQ(collectKeys(walker), (std::vector<std::string>{"real.txt"}));

  cleanupTempDir(outside);
}

TEST_F(DirectoryWalkerTest, ExcludedPathsAreSkipped) {
  generateTestFile(test_dir_ + "/data.txt", 1);
  generateTestFile(test_dir_ + "/logs/transfer_log.csv", 1);
  generateTestFile(test_dir_ + "/logs/notes.txt", 1);
  generateTestFile(test_dir_ + "/skipme/a.txt", 1);

  WalkOptions options;
  options.excluded_paths = {test_dir_ + "/logs/transfer_log.csv", test_dir_ + "/skipme"};
  DirectoryWalker walker(test_dir_, options);
  EXPECT_EQ(collectKeys(walker), (std::vector<std::string>{"data.txt", "logs/notes.txt"}));
}

TEST_F(DirectoryWalkerTest, ExcludedPathNeedNotExist) {
  generateTestFile(test_dir_ + "/data.txt", 1);

  WalkOptions options;
  options.excluded_paths = {test_dir_ + "/logs/not_yet_created.csv"};
  DirectoryWalker walker(test_dir_, options);
  EXPECT_EQ(collectKeys(walker), (std::vector<std::string>{"data.txt"}));
}

TEST_F(DirectoryWalkerTest, ResetRestartsWalk) {
  generateTestFile(test_dir_ + "/a.txt", 1);
  generateTestFile(test_dir_ + "/b.txt", 1);

  DirectoryWalker walker(test_dir_);
  auto first = collectKeys(walker);
  walker.reset();
  EXPECT_EQ(collectKeys(walker), first);
}

TEST_F(DirectoryWalkerTest, RootIsCanonical) {
  fs::create_directories(test_dir_ + "/sub");
  DirectoryWalker walker(test_dir_ + "/sub/..");
  EXPECT_EQ(walker.root(), test_dir_);
}

TEST_F(DirectoryWalkerTest, MissingRootThrows) {
  EXPECT_THROW(DirectoryWalker(test_dir_ + "/does_not_exist"), SourceUnreadableError);
}

TEST_F(DirectoryWalkerTest, FileAsRootThrows) {
  generateTestFile(test_dir_ + "/file.txt", 1);
  try {
    DirectoryWalker walker(test_dir_ + "/file.txt");
    FAIL() << "Expected SourceUnreadableError";
  } catch (const SourceUnreadableError& e) {
    EXPECT_EQ(e.root(), test_dir_ + "/file.txt");
  }
}

TEST_F(DirectoryWalkerTest, UnlistableSubdirectoryIsSkipped) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "Permission checks do not apply to root";
  }
  generateTestFile(test_dir_ + "/a.txt", 1);
  generateTestFile(test_dir_ + "/locked/hidden_from_us.txt", 1);
  generateTestFile(test_dir_ + "/z.txt", 1);
  fs::permissions(test_dir_ + "/locked", fs::perms::none);

  DirectoryWalker walker(test_dir_);
  EXPECT_EQ(collectKeys(walker), (std::vector<std::string>{"a.txt", "z.txt"}));
  EXPECT_EQ(walker.skippedDirectories(), 1u);

  fs::permissions(test_dir_ + "/locked", fs::perms::owner_all);
}
