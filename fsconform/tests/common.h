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


// Helpers shared by the conformance test groups.

#ifndef FSCONFORM_TESTS_COMMON_H_
#define FSCONFORM_TESTS_COMMON_H_

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "fsconform/file_builder.h"

namespace fsconform::conformance {

// Permission bits including setuid, setgid and sticky.
inline constexpr mode_t kAllPerms = 07777;

// Every file type except symlinks, which most tests reach through another
// type instead.
std::vector<FileType> NonSymlinkTypes();

absl::StatusOr<struct stat> Stat(const std::string& path);
absl::StatusOr<struct stat> Lstat(const std::string& path);
absl::StatusOr<struct stat> Fstat(int fd);

// Fields of struct stat that neither a rename nor an additional hard link
// may change.
struct InvariantMetadata {
  dev_t dev;
  ino_t ino;
  mode_t mode;
  nlink_t nlink;
  uid_t uid;
  gid_t gid;
  dev_t rdev;
  off_t size;
  blksize_t blksize;
  blkcnt_t blocks;

  static InvariantMetadata FromStat(const struct stat& st);

  // Compared as strings by the tests so that a mismatch prints every field.
  std::string ToString() const;
};

}  // namespace fsconform::conformance

#endif  // FSCONFORM_TESTS_COMMON_H_
