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

#ifndef FSCONFORM_FILE_BUILDER_H_
#define FSCONFORM_FILE_BUILDER_H_

#include <sys/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "fsconform/util/fileops.h"

namespace fsconform {

enum class FileType {
  kRegular,
  kDir,
  kFifo,
  kBlock,
  kChar,
  kSocket,
  kSymlink,
};

// Lower-case name of a file type, e.g. "regular". Used in test instance names.
absl::string_view FileTypeName(FileType type);

// Creating block and character devices requires root.
bool IsPrivileged(FileType type);

// All file types, in declaration order.
absl::Span<const FileType> AllFileTypes();

// Length of the random names generated for new entries.
inline constexpr size_t kRandomNameLength = 32;

// Returns a string of length alphanumeric ASCII characters.
std::string RandomName(size_t length);

// FileBuilder creates one filesystem entry of a given type. It uses a fluent
// interface: set the properties that matter for the test, then call Create()
// or Open().
//
//   FSCONFORM_ASSIGN_OR_RETURN(std::string path,
//                              FileBuilder(FileType::kDir, ctx.base_path())
//                                  .Mode(0700)
//                                  .Create());
//
// Unless Name() is called, the entry gets a random name of kRandomNameLength
// characters directly below the base path. The path is finalized exactly once;
// calling Create() or Open() again fails with FailedPreconditionError.
class FileBuilder final {
 public:
  FileBuilder(FileType type, std::string base_path)
      : type_(type), path_(std::move(base_path)) {}

  FileBuilder(FileBuilder&&) = default;
  FileBuilder& operator=(FileBuilder&&) = default;

  // Joins name to the base path. An absolute name replaces the base path.
  FileBuilder& Name(absl::string_view name);

  // Permission bits to create the entry with. The process umask still applies
  // except for sockets, which are chmod'ed after bind(). Defaults to 0755 for
  // directories and 0644 otherwise.
  FileBuilder& Mode(mode_t mode);

  // Target of a symlink. Defaults to "test".
  FileBuilder& Target(absl::string_view target);

  // Device number of a block or character device. Defaults to 0.
  FileBuilder& Device(dev_t device);

  // Creates the entry and returns its path.
  absl::StatusOr<std::string> Create();

  // Creates the entry and opens it with oflags. Regular files are created and
  // opened by a single open(O_CREAT | oflags) call.
  absl::StatusOr<std::pair<std::string, file_util::fileops::FDCloser>> Open(
      int oflags);

 private:
  absl::StatusOr<std::string> FinalPath();
  mode_t EffectiveMode() const;

  FileType type_;
  std::string path_;
  bool random_name_ = true;
  bool finalized_ = false;
  std::optional<mode_t> mode_;
  std::optional<std::string> target_;
  dev_t device_ = 0;
};

}  // namespace fsconform

#endif  // FSCONFORM_FILE_BUILDER_H_
