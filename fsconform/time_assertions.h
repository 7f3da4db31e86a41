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

#ifndef FSCONFORM_TIME_ASSERTIONS_H_
#define FSCONFORM_TIME_ASSERTIONS_H_

#include <string>
#include <vector>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "fsconform/context.h"

namespace fsconform {

// Bit set of timestamps to compare.
enum TimeField : unsigned {
  kAtime = 1 << 0,
  kCtime = 1 << 1,
  kMtime = 1 << 2,
};

// TimeAssertion checks that an operation changes, or leaves alone, selected
// timestamps of one or more paths. It stats every path, naps so that a change
// is observable, runs the operation, and stats again.
//
//   FSCONFORM_RETURN_IF_ERROR(
//       TimeAssertion::Changed()
//           .Path(dir, kCtime | kMtime)
//           .Execute(ctx, [&] { ... }));
class TimeAssertion {
 public:
  // Every compared path must have at least one selected timestamp changed.
  static TimeAssertion Changed() { return TimeAssertion(false); }
  // No selected timestamp may change.
  static TimeAssertion Unchanged() { return TimeAssertion(true); }

  // Compares path with itself.
  TimeAssertion& Path(std::string path, unsigned fields);
  // Compares before as it was prior to the operation with after as it is
  // afterwards, e.g. the two names of a renamed file.
  TimeAssertion& Paths(std::string before, std::string after, unsigned fields);
  // Use lstat(2) instead of stat(2).
  TimeAssertion& NoFollow();

  // Runs op between the two observations. A failure of op is returned as is.
  absl::Status Execute(const TestContext& ctx,
                       absl::FunctionRef<absl::Status()> op) const;

 private:
  struct Comparison {
    std::string before;
    std::string after;
    unsigned fields;
  };

  explicit TimeAssertion(bool equal) : equal_(equal) {}

  bool equal_;
  bool no_follow_ = false;
  std::vector<Comparison> comparisons_;
};

absl::Status ExpectCtimeChanged(const TestContext& ctx, const std::string& path,
                                absl::FunctionRef<absl::Status()> op);
absl::Status ExpectMtimeChanged(const TestContext& ctx, const std::string& path,
                                absl::FunctionRef<absl::Status()> op);
absl::Status ExpectCtimeUnchanged(const TestContext& ctx,
                                  const std::string& path,
                                  absl::FunctionRef<absl::Status()> op);
// Like ExpectCtimeUnchanged() but does not follow a final symlink.
absl::Status ExpectSymlinkCtimeUnchanged(const TestContext& ctx,
                                         const std::string& path,
                                         absl::FunctionRef<absl::Status()> op);

}  // namespace fsconform

#endif  // FSCONFORM_TIME_ASSERTIONS_H_
