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

#include "fsconform/testing.h"

#include <cstdlib>
#include <string>

#include "gtest/gtest.h"
#include "absl/strings/string_view.h"
#include "fsconform/util/path.h"

namespace fsconform {

std::string GetTestTempPath(absl::string_view name) {
  const char* test_tmpdir = getenv("TEST_TMPDIR");
  return file::JoinPath(test_tmpdir ? test_tmpdir : ::testing::TempDir(),
                        name);
}

}  // namespace fsconform
