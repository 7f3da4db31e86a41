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

// Process-wide state that tests switch temporarily: effective identity and
// the file creation mask.

#ifndef FSCONFORM_CREDENTIALS_H_
#define FSCONFORM_CREDENTIALS_H_

#include <sys/types.h>

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"

namespace fsconform {

// Effective uid, effective gid and supplementary groups of the process.
struct Credentials {
  uid_t euid;
  gid_t egid;
  std::vector<gid_t> groups;

  static absl::StatusOr<Credentials> Capture();

  bool operator==(const Credentials& other) const;
  bool operator!=(const Credentials& other) const { return !(*this == other); }

  std::string ToString() const;
};

// Switches to the given credentials. Groups are changed first and the
// effective uid last, so that a switch from root keeps the privileges needed
// for each step.
absl::Status SwitchCredentials(uid_t euid, gid_t egid,
                               absl::Span<const gid_t> groups);

// Undoes a switch made by SwitchCredentials(), in reverse order.
absl::Status RestoreCredentials(const Credentials& saved);

// Credentials plus the file creation mask.
struct ProcessState {
  Credentials credentials;
  mode_t creation_mask;

  static absl::StatusOr<ProcessState> Capture();

  // Puts back every part of the state that differs from the current one.
  absl::Status Restore() const;

  bool operator==(const ProcessState& other) const {
    return credentials == other.credentials &&
           creation_mask == other.creation_mask;
  }
  bool operator!=(const ProcessState& other) const {
    return !(*this == other);
  }

  std::string ToString() const;
};

// Returns the current file creation mask without changing it.
mode_t CurrentUmask();

}  // namespace fsconform

#endif  // FSCONFORM_CREDENTIALS_H_
