// Copyright 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "fsconform/util/fileops.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "fsconform/testing.h"
#include "fsconform/util/path.h"
#include "fsconform/util/status_matchers.h"
#include "fsconform/util/temp_file.h"

namespace fsconform::file_util {
namespace {

using ::testing::Eq;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Ne;
using ::testing::UnorderedElementsAre;

class FileOpsTest : public testing::Test {
 protected:
  void SetUp() override {
    FSCONFORM_ASSERT_OK_AND_ASSIGN(
        dir_, CreateTempDir(GetTestTempPath("fileops_test.")));
  }
  void TearDown() override {
    fileops::WalkTree(dir_, [](const std::string& path, const struct stat& st) {
      if (S_ISDIR(st.st_mode)) {
        chmod(path.c_str(), 0700);
      }
    });
    fileops::DeleteRecursively(dir_);
  }

  void Touch(const std::string& path) {
    int fd = open(path.c_str(), O_CREAT | O_WRONLY, 0644);
    ASSERT_THAT(fd, Ne(-1));
    close(fd);
  }

  std::string dir_;
};

TEST_F(FileOpsTest, FDCloserTest) {
  int fd = open("/dev/null", O_RDONLY);
  ASSERT_THAT(fd, Ne(-1));
  {
    fileops::FDCloser closer(fd);
    EXPECT_THAT(closer.is_valid(), IsTrue());
    EXPECT_THAT(closer.get(), Eq(fd));
  }
  EXPECT_THAT(fcntl(fd, F_GETFD), Eq(-1));

  fileops::FDCloser empty;
  EXPECT_THAT(empty.is_valid(), IsFalse());
  EXPECT_THAT(empty.Close(), IsFalse());
}

TEST_F(FileOpsTest, FDCloserMoveTest) {
  int fd = open("/dev/null", O_RDONLY);
  ASSERT_THAT(fd, Ne(-1));
  fileops::FDCloser first(fd);
  fileops::FDCloser second(std::move(first));
  EXPECT_THAT(first.is_valid(), IsFalse());
  EXPECT_THAT(second.get(), Eq(fd));
  EXPECT_THAT(second.Release(), Eq(fd));
  EXPECT_THAT(close(fd), Eq(0));
}

TEST_F(FileOpsTest, GetCWDTest) {
  const std::string cwd = fileops::GetCWD();
  EXPECT_THAT(file::IsAbsolutePath(cwd), IsTrue());
  EXPECT_THAT(fileops::Exists(cwd, true), IsTrue());
}

TEST_F(FileOpsTest, MakeAbsoluteTest) {
  EXPECT_THAT(fileops::MakeAbsolute("", "/base"), Eq(""));
  EXPECT_THAT(fileops::MakeAbsolute("/abs", "/base"), Eq("/abs"));
  EXPECT_THAT(fileops::MakeAbsolute("rel", "/base/"), Eq("/base/rel"));
  EXPECT_THAT(fileops::MakeAbsolute(".", "/base"), Eq("/base"));
  EXPECT_THAT(fileops::MakeAbsolute("rel", ""),
              Eq(fileops::GetCWD() + "/rel"));
}

TEST_F(FileOpsTest, BasenameTest) {
  EXPECT_THAT(fileops::Basename("/a/b/c"), Eq("c"));
  EXPECT_THAT(fileops::Basename("c"), Eq("c"));
  EXPECT_THAT(fileops::Basename("/a/b/"), Eq(""));
}

TEST_F(FileOpsTest, ExistsTest) {
  const std::string file = file::JoinPath(dir_, "file");
  const std::string dangling = file::JoinPath(dir_, "dangling");
  Touch(file);
  ASSERT_THAT(symlink("missing", dangling.c_str()), Eq(0));

  EXPECT_THAT(fileops::Exists(file, true), IsTrue());
  EXPECT_THAT(fileops::Exists(dangling, false), IsTrue());
  EXPECT_THAT(fileops::Exists(dangling, true), IsFalse());
  EXPECT_THAT(fileops::Exists(file::JoinPath(dir_, "none"), false), IsFalse());
}

TEST_F(FileOpsTest, ListDirectoryEntriesTest) {
  Touch(file::JoinPath(dir_, "a"));
  ASSERT_THAT(mkdir(file::JoinPath(dir_, "b").c_str(), 0755), Eq(0));

  std::vector<std::string> entries;
  std::string error;
  ASSERT_THAT(fileops::ListDirectoryEntries(dir_, &entries, &error), IsTrue());
  EXPECT_THAT(entries, UnorderedElementsAre("a", "b"));

  entries.clear();
  EXPECT_THAT(fileops::ListDirectoryEntries(file::JoinPath(dir_, "none"),
                                            &entries, &error),
              IsFalse());
  EXPECT_THAT(error, testing::HasSubstr("opendir"));
}

TEST_F(FileOpsTest, WalkTreeVisitsParentsFirst) {
  const std::string sub = file::JoinPath(dir_, "sub");
  ASSERT_THAT(mkdir(sub.c_str(), 0755), Eq(0));
  Touch(file::JoinPath(sub, "leaf"));
  ASSERT_THAT(chmod(sub.c_str(), 0), Eq(0));

  std::vector<std::string> visited;
  fileops::WalkTree(dir_, [&visited](const std::string& path,
                                     const struct stat& st) {
    visited.push_back(path);
    if (S_ISDIR(st.st_mode)) {
      chmod(path.c_str(), 0700);
    }
  });
  ASSERT_THAT(visited.size(), Eq(3));
  EXPECT_THAT(visited[0], Eq(dir_));
  EXPECT_THAT(visited[1], Eq(sub));
  EXPECT_THAT(visited[2], Eq(file::JoinPath(sub, "leaf")));
}

TEST_F(FileOpsTest, DeleteRecursivelyTest) {
  const std::string nested = file::JoinPath(dir_, "x/y/z");
  ASSERT_THAT(fileops::CreateDirRecursive(nested, 0755), IsTrue());
  Touch(file::JoinPath(nested, "file"));
  ASSERT_THAT(symlink("/", file::JoinPath(dir_, "x/root").c_str()), Eq(0));

  EXPECT_THAT(fileops::DeleteRecursively(file::JoinPath(dir_, "x")), IsTrue());
  EXPECT_THAT(fileops::Exists(file::JoinPath(dir_, "x"), false), IsFalse());
  EXPECT_THAT(fileops::Exists("/", false), IsTrue());
  // Already gone.
  EXPECT_THAT(fileops::DeleteRecursively(file::JoinPath(dir_, "x")), IsTrue());
}

TEST_F(FileOpsTest, CreateDirRecursiveTest) {
  const std::string nested = file::JoinPath(dir_, "a/b/c");
  EXPECT_THAT(fileops::CreateDirRecursive(nested, 0755), IsTrue());
  EXPECT_THAT(fileops::Exists(nested, true), IsTrue());
  // Existing segments are fine.
  EXPECT_THAT(fileops::CreateDirRecursive(nested, 0755), IsTrue());

  const std::string file = file::JoinPath(dir_, "file");
  Touch(file);
  EXPECT_THAT(fileops::CreateDirRecursive(file::JoinPath(file, "d"), 0755),
              IsFalse());
}

}  // namespace
}  // namespace fsconform::file_util
