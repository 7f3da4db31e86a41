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

#include "fsconform/identity_pool.h"

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "fsconform/config.h"
#include "fsconform/util/status_macros.h"

namespace fsconform {
namespace {

constexpr size_t kDefaultBufferSize = 16 * 1024;
constexpr size_t kMaxBufferSize = 1024 * 1024;

size_t InitialBufferSize(int sysconf_name) {
  long size = sysconf(sysconf_name);  // NOLINT(runtime/int)
  return size > 0 ? static_cast<size_t>(size) : kDefaultBufferSize;
}

// Calls a getpwnam_r-style function, growing the buffer on ERANGE, and
// passes the entry to extract while the buffer backing it is alive. Returns
// NotFoundError if the database has no matching entry.
template <typename Entry, typename Key, typename Lookup, typename Extract>
auto LookupEntry(Key key, int sysconf_name, absl::string_view what,
                 Lookup lookup, Extract extract)
    -> absl::StatusOr<decltype(extract(std::declval<const Entry&>()))> {
  std::vector<char> buffer(InitialBufferSize(sysconf_name));
  for (;;) {
    Entry entry;
    Entry* result = nullptr;
    const int err = lookup(key, &entry, buffer.data(), buffer.size(), &result);
    if (err == ERANGE && buffer.size() < kMaxBufferSize) {
      buffer.resize(buffer.size() * 2);
      continue;
    }
    if (err != 0) {
      return absl::ErrnoToStatus(err, absl::StrCat("looking up ", what));
    }
    if (result == nullptr) {
      return absl::NotFoundError(absl::StrCat("No ", what, " found"));
    }
    return extract(entry);
  }
}

struct ResolvedUser {
  std::string name;
  uid_t uid;
  gid_t gid;
};

absl::StatusOr<ResolvedUser> LookupUser(const std::string& name) {
  return LookupEntry<passwd>(
      name.c_str(), _SC_GETPW_R_SIZE_MAX, absl::StrCat("user '", name, "'"),
      getpwnam_r, [](const passwd& pw) {
        return ResolvedUser{pw.pw_name, pw.pw_uid, pw.pw_gid};
      });
}

absl::StatusOr<std::string> LookupGroupName(gid_t gid) {
  return LookupEntry<group>(
      gid, _SC_GETGR_R_SIZE_MAX, absl::StrCat("group ", gid), getgrgid_r,
      [](const group& gr) { return std::string(gr.gr_name); });
}

absl::StatusOr<gid_t> LookupGroupId(const std::string& name) {
  return LookupEntry<group>(name.c_str(), _SC_GETGR_R_SIZE_MAX,
                            absl::StrCat("group '", name, "'"), getgrnam_r,
                            [](const group& gr) { return gr.gr_gid; });
}

}  // namespace

absl::StatusOr<std::vector<AuthEntry>> ResolveAuthEntries(
    absl::Span<const AuthNames> names) {
  if (names.size() != kIdentityPoolSize) {
    return absl::InvalidArgumentError(
        absl::StrCat("dummy_auth must list exactly ", kIdentityPoolSize,
                     " entries, got ", names.size()));
  }
  std::vector<AuthEntry> entries;
  entries.reserve(names.size());
  for (const AuthNames& name : names) {
    FSCONFORM_ASSIGN_OR_RETURN(ResolvedUser user, LookupUser(name.user));
    AuthEntry entry{user.name, user.uid, name.group, user.gid};
    if (name.group.empty()) {
      FSCONFORM_ASSIGN_OR_RETURN(entry.group_name, LookupGroupName(user.gid));
    } else {
      FSCONFORM_ASSIGN_OR_RETURN(gid_t gid, LookupGroupId(name.group));
      if (gid != user.gid) {
        return absl::InvalidArgumentError(absl::StrCat(
            "User '", name.user, "' is not part of group '", name.group, "'"));
      }
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

const AuthEntry& IdentityPool::GetNewEntry() {
  CHECK_LT(next_, entries_.size())
      << "Identity pool exhausted: a test asked for more than "
      << entries_.size() << " unprivileged identities";
  return entries_[next_++];
}

}  // namespace fsconform
