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

#ifndef FSCONFORM_IDENTITY_POOL_H_
#define FSCONFORM_IDENTITY_POOL_H_

#include <sys/types.h>

#include <cstddef>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "fsconform/config.h"

namespace fsconform {

// Number of unprivileged (user, group) pairs a run needs.
inline constexpr size_t kIdentityPoolSize = 3;

// A resolved account used by tests that act as an unprivileged user. The
// group is the user's primary group.
struct AuthEntry {
  std::string user_name;
  uid_t uid;
  std::string group_name;
  gid_t gid;
};

// Resolves the configured names against the user and group databases. Fails
// if a name is unknown, if a user's primary group is not the group named next
// to it, or if there are not exactly kIdentityPoolSize entries.
absl::StatusOr<std::vector<AuthEntry>> ResolveAuthEntries(
    absl::Span<const AuthNames> names);

// Hands out the entries of a pool in order, each at most once.
class IdentityPool {
 public:
  explicit IdentityPool(absl::Span<const AuthEntry> entries)
      : entries_(entries) {}

  IdentityPool(const IdentityPool&) = delete;
  IdentityPool& operator=(const IdentityPool&) = delete;

  // Returns the next unused entry. Running out of entries means a test asked
  // for more identities than a run provides, which is fatal.
  const AuthEntry& GetNewEntry();

  size_t remaining() const { return entries_.size() - next_; }

 private:
  absl::Span<const AuthEntry> entries_;
  size_t next_ = 0;
};

}  // namespace fsconform

#endif  // FSCONFORM_IDENTITY_POOL_H_
