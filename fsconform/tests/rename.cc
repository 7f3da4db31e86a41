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


// rename(2) conformance tests.

#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include "absl/status/status.h"
#include "fsconform/context.h"
#include "fsconform/expect.h"
#include "fsconform/file_builder.h"
#include "fsconform/guard.h"
#include "fsconform/test_case.h"
#include "fsconform/tests/common.h"
#include "fsconform/tests/groups.h"
#include "fsconform/time_assertions.h"
#include "fsconform/util/fileops.h"
#include "fsconform/util/path.h"

namespace fsconform::conformance {
namespace {

absl::Status PreserveMetadata(TestContext& ctx, FileType type) {
  FSCONFORM_ASSIGN_OR_RETURN(std::string old_path, ctx.Create(type));
  const std::string new_path = file::JoinPath(ctx.base_path(), "new");
  FSCONFORM_ASSIGN_OR_RETURN(struct stat old_st, Lstat(old_path));

  FSCONFORM_EXPECT_SYSCALL_OK(rename(old_path.c_str(), new_path.c_str()));
  FSCONFORM_EXPECT(!file_util::fileops::Exists(old_path, false));
  FSCONFORM_ASSIGN_OR_RETURN(struct stat new_st, Lstat(new_path));
  FSCONFORM_EXPECT_EQ(InvariantMetadata::FromStat(new_st).ToString(),
                      InvariantMetadata::FromStat(old_st).ToString());

  const std::string link_path = file::JoinPath(ctx.base_path(), "link");
  FSCONFORM_EXPECT_SYSCALL_OK(link(new_path.c_str(), link_path.c_str()));
  FSCONFORM_ASSIGN_OR_RETURN(struct stat link_st, Lstat(link_path));
  FSCONFORM_ASSIGN_OR_RETURN(new_st, Lstat(new_path));
  FSCONFORM_EXPECT_EQ(InvariantMetadata::FromStat(link_st).ToString(),
                      InvariantMetadata::FromStat(new_st).ToString());
  FSCONFORM_EXPECT_EQ(link_st.st_nlink, 2u);

  const std::string another_path = file::JoinPath(ctx.base_path(), "another");
  FSCONFORM_EXPECT_SYSCALL_OK(rename(new_path.c_str(), another_path.c_str()));
  FSCONFORM_EXPECT(!file_util::fileops::Exists(new_path, false));
  FSCONFORM_ASSIGN_OR_RETURN(struct stat another_st, Lstat(another_path));
  FSCONFORM_EXPECT_EQ(InvariantMetadata::FromStat(another_st).ToString(),
                      InvariantMetadata::FromStat(link_st).ToString());
  return absl::OkStatus();
}

absl::Status PreserveMetadataDir(TestContext& ctx) {
  FSCONFORM_ASSIGN_OR_RETURN(std::string old_path,
                             ctx.Create(FileType::kDir));
  const std::string new_path = file::JoinPath(ctx.base_path(), "new");
  FSCONFORM_ASSIGN_OR_RETURN(struct stat old_st, Lstat(old_path));

  FSCONFORM_EXPECT_SYSCALL_OK(rename(old_path.c_str(), new_path.c_str()));
  FSCONFORM_EXPECT(!file_util::fileops::Exists(old_path, false));
  FSCONFORM_ASSIGN_OR_RETURN(struct stat new_st, Lstat(new_path));
  FSCONFORM_EXPECT_EQ(InvariantMetadata::FromStat(new_st).ToString(),
                      InvariantMetadata::FromStat(old_st).ToString());
  return absl::OkStatus();
}

// Renaming a symlink moves the link itself and leaves its target alone.
absl::Status PreserveMetadataSymlink(TestContext& ctx) {
  FSCONFORM_ASSIGN_OR_RETURN(std::string target,
                             ctx.Create(FileType::kRegular));
  FSCONFORM_ASSIGN_OR_RETURN(struct stat target_st, Lstat(target));
  FSCONFORM_ASSIGN_OR_RETURN(
      std::string old_path,
      ctx.NewFile(FileType::kSymlink).Target(target).Create());
  FSCONFORM_ASSIGN_OR_RETURN(struct stat link_st, Lstat(old_path));

  const std::string new_path = file::JoinPath(ctx.base_path(), "sym_new_path");
  FSCONFORM_EXPECT_SYSCALL_OK(rename(old_path.c_str(), new_path.c_str()));
  FSCONFORM_EXPECT(!file_util::fileops::Exists(old_path, false));

  FSCONFORM_ASSIGN_OR_RETURN(struct stat followed_st, Stat(new_path));
  FSCONFORM_EXPECT_EQ(InvariantMetadata::FromStat(followed_st).ToString(),
                      InvariantMetadata::FromStat(target_st).ToString());
  FSCONFORM_ASSIGN_OR_RETURN(struct stat new_link_st, Lstat(new_path));
  FSCONFORM_EXPECT_EQ(InvariantMetadata::FromStat(new_link_st).ToString(),
                      InvariantMetadata::FromStat(link_st).ToString());
  return absl::OkStatus();
}

absl::Status UnchangedCtimeFailed(TestContext& ctx, FileType type) {
  FSCONFORM_ASSIGN_OR_RETURN(std::string path,
                             ctx.NewFile(type).Mode(0600).Create());
  const std::string other_path = ctx.GenPath();
  const AuthEntry& user = ctx.GetNewEntry();
  return ctx.AsUser(user, [&]() -> absl::Status {
    return ExpectSymlinkCtimeUnchanged(ctx, path, [&]() -> absl::Status {
      FSCONFORM_EXPECT_EQ(rename(path.c_str(), other_path.c_str()), -1);
      return absl::OkStatus();
    });
  });
}

absl::Status ChangedCtimeSuccess(TestContext& ctx, FileType type) {
  FSCONFORM_ASSIGN_OR_RETURN(std::string old_path, ctx.Create(type));
  const std::string new_path = file::JoinPath(ctx.base_path(), "new");
  return TimeAssertion::Changed()
      .Paths(old_path, new_path, kCtime)
      .NoFollow()
      .Execute(ctx, [&]() -> absl::Status {
        FSCONFORM_EXPECT_SYSCALL_OK(
            rename(old_path.c_str(), new_path.c_str()));
        return absl::OkStatus();
      });
}

absl::Status ToMultiplyLinked(TestContext& ctx, FileType type) {
  FSCONFORM_ASSIGN_OR_RETURN(std::string src, ctx.Create(type));
  FSCONFORM_ASSIGN_OR_RETURN(std::string dst, ctx.Create(type));
  const std::string dst_link = file::JoinPath(ctx.base_path(), "dst_link");
  FSCONFORM_EXPECT_SYSCALL_OK(link(dst.c_str(), dst_link.c_str()));
  FSCONFORM_ASSIGN_OR_RETURN(struct stat st, Lstat(dst_link));
  FSCONFORM_EXPECT_EQ(st.st_nlink, 2u);

  FSCONFORM_RETURN_IF_ERROR(
      ExpectCtimeChanged(ctx, dst_link, [&]() -> absl::Status {
        FSCONFORM_EXPECT_SYSCALL_OK(rename(src.c_str(), dst.c_str()));
        return absl::OkStatus();
      }));
  FSCONFORM_ASSIGN_OR_RETURN(st, Lstat(dst_link));
  FSCONFORM_EXPECT_EQ(st.st_nlink, 1u);
  return absl::OkStatus();
}

absl::Status CrossDevice(TestContext& ctx) {
  FSCONFORM_ASSIGN_OR_RETURN(std::string path,
                             ctx.Create(FileType::kRegular));
  const std::string other_fs_path =
      file::JoinPath(*ctx.secondary_fs(), RandomName(kRandomNameLength));
  FSCONFORM_EXPECT_ERRNO(link(path.c_str(), other_fs_path.c_str()), EXDEV);
  FSCONFORM_EXPECT_ERRNO(rename(path.c_str(), other_fs_path.c_str()), EXDEV);
  return absl::OkStatus();
}

}  // namespace

void RegisterRenameTests(TestRegistry& registry) {
  registry.Add("rename", "metadata",
               TestCase("preserve_metadata", PreserveMetadata)
                   .Doc("rename preserves file metadata")
                   .FileTypes(NonSymlinkTypes())
                   .ExcludeFileTypes({FileType::kDir}));
  registry.Add("rename", "metadata",
               TestCase("preserve_metadata_dir", PreserveMetadataDir)
                   .Doc("rename preserves directory metadata"));
  registry.Add("rename", "metadata",
               TestCase("preserve_metadata_symlink", PreserveMetadataSymlink)
                   .Doc("rename preserves symlink metadata"));
  registry.Add("rename", "metadata",
               TestCase("to_multiply_linked", ToMultiplyLinked)
                   .Doc("rename succeeds when the destination is multiply "
                        "linked")
                   .FileTypes(NonSymlinkTypes())
                   .ExcludeFileTypes({FileType::kDir}));
  registry.Add("rename", "times",
               TestCase("unchanged_ctime_failed", UnchangedCtimeFailed)
                   .Doc("rename does not update ctime if it fails")
                   .Root()
                   .Serialized());
  registry.Add("rename", "times",
               TestCase("changed_ctime_success", ChangedCtimeSuccess)
                   .Doc("rename updates ctime if it succeeds")
                   .RequireFeature(FEATURE_RENAME_CTIME));
  registry.Add("rename", "errno",
               TestCase("exdev", CrossDevice)
                   .Doc("link and rename return EXDEV across file systems")
                   .Guard(RequiresSecondaryFs()));
}

}  // namespace fsconform::conformance
