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


#include "fsconform/tests/common.h"

#include <sys/stat.h>

#include <cerrno>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace fsconform::conformance {

std::vector<FileType> NonSymlinkTypes() {
  return {FileType::kRegular, FileType::kDir,  FileType::kFifo,
          FileType::kBlock,   FileType::kChar, FileType::kSocket};
}

absl::StatusOr<struct stat> Stat(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("stat(", path, ")"));
  }
  return st;
}

absl::StatusOr<struct stat> Lstat(const std::string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("lstat(", path, ")"));
  }
  return st;
}

absl::StatusOr<struct stat> Fstat(int fd) {
  struct stat st;
  if (fstat(fd, &st) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("fstat(", fd, ")"));
  }
  return st;
}

InvariantMetadata InvariantMetadata::FromStat(const struct stat& st) {
  return {st.st_dev,  st.st_ino,  st.st_mode, st.st_nlink,   st.st_uid,
          st.st_gid,  st.st_rdev, st.st_size, st.st_blksize, st.st_blocks};
}

std::string InvariantMetadata::ToString() const {
  return absl::StrFormat(
      "{dev=%d ino=%d mode=%o nlink=%d uid=%d gid=%d rdev=%d size=%d "
      "blksize=%d blocks=%d}",
      dev, ino, mode, nlink, uid, gid, rdev, size, blksize, blocks);
}

}  // namespace fsconform::conformance
