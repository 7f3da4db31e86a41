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

// Decides which test instances run and which are skipped.

#ifndef FSCONFORM_GUARD_H_
#define FSCONFORM_GUARD_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "fsconform/config.h"
#include "fsconform/config.pb.h"
#include "fsconform/file_builder.h"
#include "fsconform/test_case.h"

namespace fsconform {

// One run of a test: the test itself and, for type-parameterized tests, the
// file type to run it with.
struct TestInstance {
  const RegisteredTest* test;
  std::optional<FileType> type;

  // "group::case::test" plus "::type" for type-parameterized tests.
  std::string FullName() const;
};

// Expands tests into instances, keeping registry order. A type-parameterized
// test yields one instance per applicable type, any other test exactly one.
std::vector<TestInstance> Instantiate(absl::Span<const RegisteredTest> tests);

// Checks whether an instance may run. Returns OK if it may, or a status whose
// message is the skip reason. The checks run in this order and the first
// failing one decides:
//   1. root privileges, if the test or its file type needs them,
//   2. required features ("requires features: a, b"),
//   3. the test's guards, in declaration order.
absl::Status EvaluateGuards(const TestInstance& instance, const Config& config,
                            absl::string_view sandbox_path, bool is_root);

// Guard: every flag in flags is enabled in the configuration.
GuardFn SupportsFileFlags(std::vector<FileFlag> flags);

// Guard: at least one flag in flags is enabled in the configuration.
GuardFn SupportsAnyFileFlag(std::vector<FileFlag> flags);

// Guard: a secondary filesystem is configured.
GuardFn RequiresSecondaryFs();

// Guard: the configuration allows remounting the filesystem under test.
GuardFn RequiresRemount();

}  // namespace fsconform

#endif  // FSCONFORM_GUARD_H_
