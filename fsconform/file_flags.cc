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

#include "fsconform/file_flags.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#ifdef __linux__
#include <linux/fs.h>
#include <sys/ioctl.h>
#endif

#include <cerrno>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "absl/types/span.h"
#include "fsconform/config.pb.h"
#include "fsconform/util/fileops.h"

namespace fsconform {
namespace {

#ifdef __linux__
constexpr int kLinuxManagedFlags =
    FS_IMMUTABLE_FL | FS_APPEND_FL | FS_NODUMP_FL;

absl::StatusOr<file_util::fileops::FDCloser> OpenForFlags(
    const std::string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("lstat(", path, ")"));
  }
  if (!S_ISREG(st.st_mode) && !S_ISDIR(st.st_mode)) {
    return absl::UnimplementedError(absl::StrCat(
        "file flags are only available on regular files and directories: ",
        path));
  }
  file_util::fileops::FDCloser fd(
      open(path.c_str(), O_RDONLY | O_NONBLOCK | O_NOFOLLOW | O_CLOEXEC));
  if (!fd.is_valid()) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  return fd;
}
#endif

}  // namespace

std::optional<HostFileFlags> FileFlagValue(FileFlag flag) {
  switch (flag) {
#if defined(__linux__)
    case FILE_FLAG_UF_NODUMP:
      return FS_NODUMP_FL;
    case FILE_FLAG_UF_IMMUTABLE:
    case FILE_FLAG_SF_IMMUTABLE:
      return FS_IMMUTABLE_FL;
    case FILE_FLAG_UF_APPEND:
    case FILE_FLAG_SF_APPEND:
      return FS_APPEND_FL;
#else
#define FSCONFORM_FILE_FLAG_CASE(name) \
  case FILE_FLAG_##name:               \
    return name;
#ifdef UF_SETTABLE
    FSCONFORM_FILE_FLAG_CASE(UF_SETTABLE)
#endif
#ifdef UF_NODUMP
    FSCONFORM_FILE_FLAG_CASE(UF_NODUMP)
#endif
#ifdef UF_IMMUTABLE
    FSCONFORM_FILE_FLAG_CASE(UF_IMMUTABLE)
#endif
#ifdef UF_APPEND
    FSCONFORM_FILE_FLAG_CASE(UF_APPEND)
#endif
#ifdef UF_OPAQUE
    FSCONFORM_FILE_FLAG_CASE(UF_OPAQUE)
#endif
#ifdef UF_NOUNLINK
    FSCONFORM_FILE_FLAG_CASE(UF_NOUNLINK)
#endif
#ifdef UF_HIDDEN
    FSCONFORM_FILE_FLAG_CASE(UF_HIDDEN)
#endif
#ifdef UF_OFFLINE
    FSCONFORM_FILE_FLAG_CASE(UF_OFFLINE)
#endif
#ifdef UF_READONLY
    FSCONFORM_FILE_FLAG_CASE(UF_READONLY)
#endif
#ifdef UF_SPARSE
    FSCONFORM_FILE_FLAG_CASE(UF_SPARSE)
#endif
#ifdef UF_SYSTEM
    FSCONFORM_FILE_FLAG_CASE(UF_SYSTEM)
#endif
#ifdef UF_REPARSE
    FSCONFORM_FILE_FLAG_CASE(UF_REPARSE)
#endif
#ifdef UF_ARCHIVE
    FSCONFORM_FILE_FLAG_CASE(UF_ARCHIVE)
#endif
#ifdef SF_SETTABLE
    FSCONFORM_FILE_FLAG_CASE(SF_SETTABLE)
#endif
#ifdef SF_ARCHIVED
    FSCONFORM_FILE_FLAG_CASE(SF_ARCHIVED)
#endif
#ifdef SF_IMMUTABLE
    FSCONFORM_FILE_FLAG_CASE(SF_IMMUTABLE)
#endif
#ifdef SF_APPEND
    FSCONFORM_FILE_FLAG_CASE(SF_APPEND)
#endif
#ifdef SF_NOUNLINK
    FSCONFORM_FILE_FLAG_CASE(SF_NOUNLINK)
#endif
#ifdef SF_SNAPSHOT
    FSCONFORM_FILE_FLAG_CASE(SF_SNAPSHOT)
#endif
#undef FSCONFORM_FILE_FLAG_CASE
#endif
    default:
      return std::nullopt;
  }
}

std::string FileFlagName(FileFlag flag) {
  return std::string(absl::StripPrefix(FileFlag_Name(flag), "FILE_FLAG_"));
}

absl::StatusOr<HostFileFlags> FileFlagsValue(
    absl::Span<const FileFlag> flags) {
  HostFileFlags value = 0;
  for (FileFlag flag : flags) {
    std::optional<HostFileFlags> bit = FileFlagValue(flag);
    if (!bit.has_value()) {
      return absl::UnimplementedError(
          absl::StrCat(FileFlagName(flag), " is not available on this host"));
    }
    value |= *bit;
  }
  return value;
}

bool HostHasFileFlags() {
#if defined(__linux__) || defined(UF_IMMUTABLE)
  return true;
#else
  return false;
#endif
}

absl::StatusOr<HostFileFlags> GetFileFlags(const std::string& path) {
#if defined(__linux__)
  auto fd = OpenForFlags(path);
  if (!fd.ok()) {
    return fd.status();
  }
  int flags = 0;
  if (ioctl(fd->get(), FS_IOC_GETFLAGS, &flags) == -1) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("FS_IOC_GETFLAGS(", path, ")"));
  }
  return static_cast<HostFileFlags>(flags & kLinuxManagedFlags);
#elif defined(UF_IMMUTABLE)
  struct stat st;
  if (lstat(path.c_str(), &st) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("lstat(", path, ")"));
  }
  return static_cast<HostFileFlags>(st.st_flags);
#else
  return absl::UnimplementedError("file flags are not supported");
#endif
}

absl::Status SetFileFlags(const std::string& path, HostFileFlags flags) {
#if defined(__linux__)
  if ((flags & ~static_cast<HostFileFlags>(kLinuxManagedFlags)) != 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("unsupported file flags 0x", absl::Hex(flags)));
  }
  auto fd = OpenForFlags(path);
  if (!fd.ok()) {
    return fd.status();
  }
  int current = 0;
  if (ioctl(fd->get(), FS_IOC_GETFLAGS, &current) == -1) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("FS_IOC_GETFLAGS(", path, ")"));
  }
  int updated = (current & ~kLinuxManagedFlags) | static_cast<int>(flags);
  if (ioctl(fd->get(), FS_IOC_SETFLAGS, &updated) == -1) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("FS_IOC_SETFLAGS(", path, ")"));
  }
  return absl::OkStatus();
#elif defined(UF_IMMUTABLE)
  if (lchflags(path.c_str(), flags) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("lchflags(", path, ")"));
  }
  return absl::OkStatus();
#else
  return absl::UnimplementedError("file flags are not supported");
#endif
}

absl::Status ClearFileFlags(const std::string& path) {
  return SetFileFlags(path, 0);
}

}  // namespace fsconform
