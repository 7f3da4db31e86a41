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

#ifndef FSCONFORM_CONTEXT_H_
#define FSCONFORM_CONTEXT_H_

#include <sys/types.h>

#include <optional>
#include <string>
#include <utility>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "fsconform/config.h"
#include "fsconform/file_builder.h"
#include "fsconform/identity_pool.h"
#include "fsconform/util/fileops.h"

namespace fsconform {

// TestContext is what a test body sees: a private directory to work in, the
// run configuration, unprivileged identities and scoped switches of the
// process identity and umask.
//
// The context owns its directory. When it is destroyed, the whole tree below
// base_path() is unlocked (search and write permission for the owner, file
// flags cleared) from the top down and then removed. Teardown never fails;
// problems are logged at VLOG(1).
class TestContext {
 public:
  TestContext(const Config& config, absl::Span<const AuthEntry> auth_entries,
              std::string base_path);

  TestContext(const TestContext&) = delete;
  TestContext& operator=(const TestContext&) = delete;

  ~TestContext();

  const std::string& base_path() const { return base_path_; }
  const Config& config() const { return config_; }
  const FeaturesConfig& features_config() const { return config_.features; }
  const std::optional<std::string>& secondary_fs() const {
    return config_.features.secondary_fs;
  }

  // Each identity is handed out once per context. Asking for more than the
  // pool holds is fatal.
  const AuthEntry& GetNewEntry() { return identities_.GetNewEntry(); }
  uid_t GetNewUser() { return GetNewEntry().uid; }
  gid_t GetNewGroup() { return GetNewEntry().gid; }

  // Sleeps long enough for file system timestamps to change.
  void Nap() const;

  // Returns a random path directly below base_path(). Nothing is created.
  std::string GenPath() const;

  // Returns a builder for an entry with a random name below base_path().
  FileBuilder NewFile(FileType type) const;

  // Creates an entry with a random name and default mode.
  absl::StatusOr<std::string> Create(FileType type) const;

  // Creates a regular file and opens it with oflags.
  absl::StatusOr<std::pair<std::string, file_util::fileops::FDCloser>>
  CreateFile(int oflags, std::optional<mode_t> mode = std::nullopt) const;

  // Creates an entry whose name is exactly _PC_NAME_MAX characters long.
  absl::StatusOr<std::string> CreateNameMax(FileType type) const;

  // Creates an entry whose path is exactly _PC_PATH_MAX - 1 characters long,
  // along with the intermediate directories.
  absl::StatusOr<std::string> CreatePathMax(FileType type) const;

  // Runs body with the effective uid of user, the effective gid groups[0] and
  // the supplementary groups set to groups. If groups is empty, the user's
  // primary group is used. The previous identity is restored before this
  // returns, whatever body returned. Failure to restore is fatal.
  absl::Status AsUser(const AuthEntry& user, absl::Span<const gid_t> groups,
                      absl::FunctionRef<absl::Status()> body);
  absl::Status AsUser(const AuthEntry& user,
                      absl::FunctionRef<absl::Status()> body) {
    return AsUser(user, {}, body);
  }

  // Runs body with the file creation mask set to mask, then restores it.
  absl::Status WithUmask(mode_t mask, absl::FunctionRef<absl::Status()> body);

 private:
  const Config& config_;
  IdentityPool identities_;
  std::string base_path_;
};

}  // namespace fsconform

#endif  // FSCONFORM_CONTEXT_H_
