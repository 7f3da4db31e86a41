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

#ifndef FSCONFORM_UTIL_PATH_H_
#define FSCONFORM_UTIL_PATH_H_

#include <initializer_list>
#include <string>

#include "absl/strings/string_view.h"

namespace fsconform::file {

namespace internal {
// Not part of the public API.
std::string JoinPathImpl(std::initializer_list<absl::string_view> paths);
}  // namespace internal

// Joins multiple paths together with "/". Arguments must be convertible to
// absl::string_view.
template <typename... T>
inline std::string JoinPath(const T&... args) {
  return internal::JoinPathImpl({args...});
}

// Return true if path is absolute.
bool IsAbsolutePath(absl::string_view path);

}  // namespace fsconform::file

#endif  // FSCONFORM_UTIL_PATH_H_
