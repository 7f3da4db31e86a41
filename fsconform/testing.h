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

#ifndef FSCONFORM_TESTING_H_
#define FSCONFORM_TESTING_H_

#include <unistd.h>

#include <string>

#include "gmock/gmock.h"  // IWYU pragma: keep
#include "gtest/gtest.h"  // IWYU pragma: keep
#include "absl/strings/string_view.h"
#include "fsconform/util/status_matchers.h"  // IWYU pragma: export

// Skips the current test unless the process runs with an effective uid of 0.
#define FSCONFORM_SKIP_UNLESS_ROOT                 \
  do {                                             \
    if (geteuid() != 0) {                          \
      GTEST_SKIP() << "requires root privileges";  \
    }                                              \
  } while (0)

namespace fsconform {

// Returns a writable path usable in tests. If the name argument is specified,
// returns a name under that path. This can then be used for creating temporary
// test files and/or directories.
std::string GetTestTempPath(absl::string_view name = {});

}  // namespace fsconform

#endif  // FSCONFORM_TESTING_H_
