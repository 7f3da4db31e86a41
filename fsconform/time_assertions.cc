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

#include "fsconform/time_assertions.h"

#include <sys/stat.h>

#include <cerrno>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "fsconform/context.h"
#include "fsconform/util/status_macros.h"

namespace fsconform {
namespace {

struct Timestamps {
  timespec atime;
  timespec ctime;
  timespec mtime;
};

bool Equal(const timespec& a, const timespec& b) {
  return a.tv_sec == b.tv_sec && a.tv_nsec == b.tv_nsec;
}

std::string Format(const timespec& ts) {
  return absl::StrFormat("%d.%09d", ts.tv_sec, ts.tv_nsec);
}

absl::StatusOr<Timestamps> GetTimestamps(const std::string& path,
                                         bool no_follow) {
  struct stat st;
  if ((no_follow ? lstat(path.c_str(), &st) : stat(path.c_str(), &st)) == -1) {
    return absl::ErrnoToStatus(
        errno, absl::StrCat(no_follow ? "lstat(" : "stat(", path, ")"));
  }
  return Timestamps{st.st_atim, st.st_ctim, st.st_mtim};
}

// Returns the names of the selected fields that differ, with their values.
std::string DescribeChanges(const Timestamps& before, const Timestamps& after,
                            unsigned fields, bool* any_changed) {
  std::string changes;
  *any_changed = false;
  auto compare = [&](TimeField field, const char* name, const timespec& b,
                     const timespec& a) {
    if ((fields & field) == 0) {
      return;
    }
    const bool changed = !Equal(b, a);
    *any_changed |= changed;
    absl::StrAppend(&changes, changes.empty() ? "" : ", ", name, " ",
                    Format(b), changed ? " -> " : " == ", Format(a));
  };
  compare(kAtime, "atime", before.atime, after.atime);
  compare(kCtime, "ctime", before.ctime, after.ctime);
  compare(kMtime, "mtime", before.mtime, after.mtime);
  return changes;
}

}  // namespace

TimeAssertion& TimeAssertion::Path(std::string path, unsigned fields) {
  std::string after = path;
  return Paths(std::move(path), std::move(after), fields);
}

TimeAssertion& TimeAssertion::Paths(std::string before, std::string after,
                                    unsigned fields) {
  comparisons_.push_back({std::move(before), std::move(after), fields});
  return *this;
}

TimeAssertion& TimeAssertion::NoFollow() {
  no_follow_ = true;
  return *this;
}

absl::Status TimeAssertion::Execute(
    const TestContext& ctx, absl::FunctionRef<absl::Status()> op) const {
  std::vector<Timestamps> before;
  before.reserve(comparisons_.size());
  for (const Comparison& comparison : comparisons_) {
    FSCONFORM_ASSIGN_OR_RETURN(Timestamps ts,
                               GetTimestamps(comparison.before, no_follow_));
    before.push_back(ts);
  }

  ctx.Nap();
  FSCONFORM_RETURN_IF_ERROR(op());

  for (size_t i = 0; i < comparisons_.size(); ++i) {
    const Comparison& comparison = comparisons_[i];
    FSCONFORM_ASSIGN_OR_RETURN(Timestamps after,
                               GetTimestamps(comparison.after, no_follow_));
    bool changed;
    const std::string changes =
        DescribeChanges(before[i], after, comparison.fields, &changed);
    if (equal_ && changed) {
      return absl::AbortedError(absl::StrCat(
          "Timestamps of ", comparison.after,
          " changed but shouldn't have: ", changes));
    }
    if (!equal_ && !changed) {
      return absl::AbortedError(
          absl::StrCat("Timestamps of ", comparison.after,
                       " did not change as expected: ", changes));
    }
  }
  return absl::OkStatus();
}

absl::Status ExpectCtimeChanged(const TestContext& ctx, const std::string& path,
                                absl::FunctionRef<absl::Status()> op) {
  return TimeAssertion::Changed().Path(path, kCtime).Execute(ctx, op);
}

absl::Status ExpectMtimeChanged(const TestContext& ctx, const std::string& path,
                                absl::FunctionRef<absl::Status()> op) {
  return TimeAssertion::Changed().Path(path, kMtime).Execute(ctx, op);
}

absl::Status ExpectCtimeUnchanged(const TestContext& ctx,
                                  const std::string& path,
                                  absl::FunctionRef<absl::Status()> op) {
  return TimeAssertion::Unchanged().Path(path, kCtime).Execute(ctx, op);
}

absl::Status ExpectSymlinkCtimeUnchanged(const TestContext& ctx,
                                         const std::string& path,
                                         absl::FunctionRef<absl::Status()> op) {
  return TimeAssertion::Unchanged()
      .Path(path, kCtime)
      .NoFollow()
      .Execute(ctx, op);
}

}  // namespace fsconform
