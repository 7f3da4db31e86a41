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

#include "fsconform/context.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/types/span.h"
#include "fsconform/config.h"
#include "fsconform/credentials.h"
#include "fsconform/file_builder.h"
#include "fsconform/file_flags.h"
#include "fsconform/identity_pool.h"
#include "fsconform/util/fileops.h"
#include "fsconform/util/path.h"
#include "fsconform/util/status_macros.h"
#include "fsconform/util/strerror.h"

namespace fsconform {
namespace {

namespace fileops = ::fsconform::file_util::fileops;

absl::StatusOr<size_t> PathConf(const std::string& path, int name,
                                absl::string_view what) {
  errno = 0;
  const auto value = pathconf(path.c_str(), name);
  if (value == -1) {
    if (errno == 0) {
      return absl::UnimplementedError(
          absl::StrCat(what, " has no limit for ", path));
    }
    return absl::ErrnoToStatus(
        errno, absl::StrCat("pathconf(", path, ", ", what, ")"));
  }
  return static_cast<size_t>(value);
}

// Makes path removable: clears file flags and grants the owner full access.
// Symlinks are never followed.
void Unlock(const std::string& path, const struct stat& st) {
  if (HostHasFileFlags() && !S_ISLNK(st.st_mode)) {
    absl::StatusOr<HostFileFlags> flags = GetFileFlags(path);
    if (flags.ok() && *flags != 0) {
      if (absl::Status status = ClearFileFlags(path); !status.ok()) {
        VLOG(1) << "Cannot clear file flags: " << status;
      }
    }
  }

  if ((st.st_mode & S_IRWXU) == S_IRWXU) {
    return;
  }
  const mode_t mode = (st.st_mode & 07777) | S_IRWXU;
  if (S_ISLNK(st.st_mode)) {
#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__APPLE__) || \
    defined(__DragonFly__)
    if (lchmod(path.c_str(), mode) == -1) {
      VLOG(1) << "lchmod(" << path << "): " << StrError(errno);
    }
#endif
    return;
  }
  if (chmod(path.c_str(), mode) == -1) {
    VLOG(1) << "chmod(" << path << "): " << StrError(errno);
  }
}

}  // namespace

TestContext::TestContext(const Config& config,
                         absl::Span<const AuthEntry> auth_entries,
                         std::string base_path)
    : config_(config),
      identities_(auth_entries),
      base_path_(std::move(base_path)) {}

TestContext::~TestContext() {
  // Entries other than directories only carry locks on platforms with file
  // flags.
  const bool unlock_all = HostHasFileFlags();
  fileops::WalkTree(base_path_, [unlock_all](const std::string& path,
                                             const struct stat& st) {
    if (unlock_all || S_ISDIR(st.st_mode)) {
      Unlock(path, st);
    }
  });
  if (!fileops::DeleteRecursively(base_path_)) {
    VLOG(1) << "Cannot remove " << base_path_;
  }
}

void TestContext::Nap() const { absl::SleepFor(config_.settings.naptime); }

std::string TestContext::GenPath() const {
  return file::JoinPath(base_path_, RandomName(kRandomNameLength));
}

FileBuilder TestContext::NewFile(FileType type) const {
  return FileBuilder(type, base_path_);
}

absl::StatusOr<std::string> TestContext::Create(FileType type) const {
  return NewFile(type).Create();
}

absl::StatusOr<std::pair<std::string, fileops::FDCloser>>
TestContext::CreateFile(int oflags, std::optional<mode_t> mode) const {
  FileBuilder builder = NewFile(FileType::kRegular);
  if (mode.has_value()) {
    builder.Mode(*mode);
  }
  return builder.Open(oflags);
}

absl::StatusOr<std::string> TestContext::CreateNameMax(FileType type) const {
  FSCONFORM_ASSIGN_OR_RETURN(size_t name_max,
                             PathConf(base_path_, _PC_NAME_MAX, "NAME_MAX"));
  return NewFile(type).Name(RandomName(name_max)).Create();
}

absl::StatusOr<std::string> TestContext::CreatePathMax(FileType type) const {
  FSCONFORM_ASSIGN_OR_RETURN(size_t name_max,
                             PathConf(base_path_, _PC_NAME_MAX, "NAME_MAX"));
  FSCONFORM_ASSIGN_OR_RETURN(size_t path_max,
                             PathConf(base_path_, _PC_PATH_MAX, "PATH_MAX"));
  // PATH_MAX counts the terminating NUL.
  const size_t target_len = path_max - 1;
  const size_t component_len = name_max / 2;
  if (component_len < 2 || base_path_.size() + 2 > target_len) {
    return absl::FailedPreconditionError(absl::StrCat(
        "cannot build a path of ", target_len, " characters below ",
        base_path_));
  }

  // Each intermediate directory adds "/" plus component_len - 1 characters.
  std::string path = base_path_;
  size_t remaining = target_len - path.size();
  while (remaining > component_len + 1) {
    absl::StrAppend(&path, "/", RandomName(component_len - 1));
    remaining -= component_len;
  }
  if (path.size() > base_path_.size() &&
      !fileops::CreateDirRecursive(path, 0755)) {
    return absl::ErrnoToStatus(errno, absl::StrCat("cannot create ", path));
  }
  absl::StrAppend(&path, "/", RandomName(remaining - 1));
  return NewFile(type).Name(path).Create();
}

absl::Status TestContext::AsUser(const AuthEntry& user,
                                 absl::Span<const gid_t> groups,
                                 absl::FunctionRef<absl::Status()> body) {
  std::vector<gid_t> new_groups(groups.begin(), groups.end());
  if (new_groups.empty()) {
    new_groups.push_back(user.gid);
  }
  FSCONFORM_ASSIGN_OR_RETURN(Credentials saved, Credentials::Capture());
  absl::Cleanup restore = [&saved] {
    absl::Status status = RestoreCredentials(saved);
    CHECK(status.ok()) << "Cannot restore credentials " << saved.ToString()
                       << ": " << status;
  };
  FSCONFORM_RETURN_IF_ERROR(
      SwitchCredentials(user.uid, new_groups.front(), new_groups));
  return body();
}

absl::Status TestContext::WithUmask(mode_t mask,
                                    absl::FunctionRef<absl::Status()> body) {
  const mode_t previous = umask(mask);
  absl::Cleanup restore = [previous] { umask(previous); };
  return body();
}

}  // namespace fsconform
