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

#ifndef FSCONFORM_UTIL_FILE_HELPERS_H_
#define FSCONFORM_UTIL_FILE_HELPERS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace fsconform::file {

// Reads the whole file at path into output.
absl::Status GetContents(absl::string_view path, std::string* output);

// Replaces the contents of the file at path, creating it if needed.
absl::Status SetContents(absl::string_view path, absl::string_view content);

}  // namespace fsconform::file

#endif  // FSCONFORM_UTIL_FILE_HELPERS_H_
