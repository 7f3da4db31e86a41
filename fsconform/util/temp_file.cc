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

#include "fsconform/util/temp_file.h"

#include <cerrno>
#include <cstdlib>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

namespace fsconform {

namespace {
constexpr absl::string_view kMktempSuffix = "XXXXXX";
}  // namespace

absl::StatusOr<std::string> CreateTempDir(absl::string_view prefix) {
  std::string name_template = absl::StrCat(prefix, kMktempSuffix);
  if (mkdtemp(&name_template[0]) == nullptr) {
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdtemp(", prefix, ")"));
  }
  return name_template;
}

}  // namespace fsconform
