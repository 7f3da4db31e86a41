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

#include "fsconform/credentials.h"

#include <grp.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "fsconform/util/status_macros.h"

namespace fsconform {
namespace {

std::vector<gid_t> Sorted(std::vector<gid_t> groups) {
  std::sort(groups.begin(), groups.end());
  groups.erase(std::unique(groups.begin(), groups.end()), groups.end());
  return groups;
}

absl::Status SetGroups(absl::Span<const gid_t> groups) {
  if (setgroups(groups.size(), groups.data()) == -1) {
    return absl::ErrnoToStatus(
        errno, absl::StrCat("setgroups([", absl::StrJoin(groups, ","), "])"));
  }
  return absl::OkStatus();
}

absl::Status SetEffectiveGid(gid_t egid) {
  if (setegid(egid) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("setegid(", egid, ")"));
  }
  return absl::OkStatus();
}

absl::Status SetEffectiveUid(uid_t euid) {
  if (seteuid(euid) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("seteuid(", euid, ")"));
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<Credentials> Credentials::Capture() {
  Credentials credentials{geteuid(), getegid(), {}};
  const int count = getgroups(0, nullptr);
  if (count == -1) {
    return absl::ErrnoToStatus(errno, "getgroups()");
  }
  credentials.groups.resize(count);
  if (count > 0 && getgroups(count, credentials.groups.data()) == -1) {
    return absl::ErrnoToStatus(errno, "getgroups()");
  }
  return credentials;
}

bool Credentials::operator==(const Credentials& other) const {
  // getgroups(2) does not specify an order, and may or may not include the
  // effective gid.
  return euid == other.euid && egid == other.egid &&
         Sorted(groups) == Sorted(other.groups);
}

std::string Credentials::ToString() const {
  return absl::StrCat("euid=", euid, " egid=", egid, " groups=[",
                      absl::StrJoin(groups, ","), "]");
}

absl::Status SwitchCredentials(uid_t euid, gid_t egid,
                               absl::Span<const gid_t> groups) {
  FSCONFORM_RETURN_IF_ERROR(SetGroups(groups));
  FSCONFORM_RETURN_IF_ERROR(SetEffectiveGid(egid));
  return SetEffectiveUid(euid);
}

absl::Status RestoreCredentials(const Credentials& saved) {
  // Regain privileges before touching the groups.
  if (geteuid() != saved.euid) {
    FSCONFORM_RETURN_IF_ERROR(SetEffectiveUid(saved.euid));
  }
  if (getegid() != saved.egid) {
    FSCONFORM_RETURN_IF_ERROR(SetEffectiveGid(saved.egid));
  }
  FSCONFORM_ASSIGN_OR_RETURN(Credentials current, Credentials::Capture());
  if (Sorted(current.groups) != Sorted(saved.groups)) {
    FSCONFORM_RETURN_IF_ERROR(SetGroups(saved.groups));
  }
  return absl::OkStatus();
}

mode_t CurrentUmask() {
  const mode_t mask = umask(0);
  umask(mask);
  return mask;
}

absl::StatusOr<ProcessState> ProcessState::Capture() {
  FSCONFORM_ASSIGN_OR_RETURN(Credentials credentials, Credentials::Capture());
  return ProcessState{std::move(credentials), CurrentUmask()};
}

absl::Status ProcessState::Restore() const {
  FSCONFORM_RETURN_IF_ERROR(RestoreCredentials(credentials));
  umask(creation_mask);
  return absl::OkStatus();
}

std::string ProcessState::ToString() const {
  return absl::StrFormat("%s umask=%04o", credentials.ToString(),
                         creation_mask);
}

}  // namespace fsconform
