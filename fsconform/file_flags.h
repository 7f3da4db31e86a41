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

// Host mapping of BSD file flags and no-follow accessors for them. On Linux
// the inode flags of FS_IOC_GETFLAGS/FS_IOC_SETFLAGS stand in for the closest
// BSD flags and only regular files and directories are supported.

#ifndef FSCONFORM_FILE_FLAGS_H_
#define FSCONFORM_FILE_FLAGS_H_

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "fsconform/config.pb.h"

namespace fsconform {

using HostFileFlags = unsigned long;  // NOLINT(runtime/int)

// Returns the host bit for flag, or nullopt if the host has no equivalent.
std::optional<HostFileFlags> FileFlagValue(FileFlag flag);

// Returns the BSD name of a flag, e.g. "UF_IMMUTABLE".
std::string FileFlagName(FileFlag flag);

// ORs the host bits of all flags. Fails if one of them has no host bit.
absl::StatusOr<HostFileFlags> FileFlagsValue(absl::Span<const FileFlag> flags);

// Whether this platform can read and change file flags at all.
bool HostHasFileFlags();

// Reads the flags of path without following a final symlink.
absl::StatusOr<HostFileFlags> GetFileFlags(const std::string& path);

// Replaces the flags of path without following a final symlink. On Linux,
// inode flags without a BSD counterpart are preserved.
absl::Status SetFileFlags(const std::string& path, HostFileFlags flags);

// Removes every flag that SetFileFlags() can set.
absl::Status ClearFileFlags(const std::string& path);

}  // namespace fsconform

#endif  // FSCONFORM_FILE_FLAGS_H_
