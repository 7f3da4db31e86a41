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

#include "fsconform/runner.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <ostream>
#include <string>
#include <utility>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "fsconform/config.h"
#include "fsconform/context.h"
#include "fsconform/credentials.h"
#include "fsconform/guard.h"
#include "fsconform/identity_pool.h"
#include "fsconform/util/fileops.h"
#include "fsconform/util/strerror.h"
#include "fsconform/util/temp_file.h"

namespace fsconform {
namespace {

namespace fileops = ::fsconform::file_util::fileops;

InstanceResult Failed(std::string detail) {
  return {Outcome::kFailed, std::move(detail)};
}

}  // namespace

std::string RunSummary::ToString() const {
  return absl::StrFormat("Tests: %d failed, %d skipped, %d passed, %d total",
                         failed, skipped, passed, total());
}

Runner::Runner(const Config& config, absl::Span<const AuthEntry> auth_entries,
               std::string run_dir, std::ostream& out, RunnerOptions options)
    : config_(config),
      auth_entries_(auth_entries),
      run_dir_(std::move(run_dir)),
      out_(out),
      options_(options) {}

InstanceResult Runner::RunInstance(const TestInstance& instance) {
  absl::StatusOr<std::string> dir = CreateTempDir(absl::StrCat(run_dir_, "/"));
  if (!dir.ok()) {
    return Failed(
        absl::StrCat("cannot create test directory: ", dir.status().message()));
  }
  if (chmod(dir->c_str(), 0755) == -1) {
    const std::string error = StrError(errno);
    fileops::DeleteRecursively(*dir);
    return Failed(absl::StrCat("chmod(", *dir, "): ", error));
  }

  if (absl::Status guard =
          EvaluateGuards(instance, config_, *dir, geteuid() == 0);
      !guard.ok()) {
    if (!fileops::DeleteRecursively(*dir)) {
      VLOG(1) << "Cannot remove " << *dir;
    }
    return {Outcome::kSkipped, std::string(guard.message())};
  }

  absl::StatusOr<ProcessState> before = ProcessState::Capture();
  if (!before.ok()) {
    fileops::DeleteRecursively(*dir);
    return Failed(absl::StrCat("cannot capture process state: ",
                               before.status().message()));
  }

  absl::Status status;
  {
    TestContext ctx(config_, auth_entries_, *dir);
    status = instance.test->test.Invoke(ctx, instance.type);

    // The context must be torn down with the original identity.
    absl::StatusOr<ProcessState> after = ProcessState::Capture();
    if (!after.ok() || *after != *before) {
      absl::Status restored = before->Restore();
      CHECK(restored.ok()) << "Cannot restore process state "
                           << before->ToString() << ": " << restored;
      const std::string leaked = absl::StrCat(
          "test left the process state changed: expected ", before->ToString(),
          ", got ",
          after.ok() ? after->ToString() : std::string(after.status().message()));
      status = status.ok()
                   ? absl::InternalError(leaked)
                   : absl::InternalError(
                         absl::StrCat(status.message(), "; ", leaked));
    }
  }

  if (!status.ok()) {
    return Failed(std::string(status.message()));
  }
  return {Outcome::kSuccess, ""};
}

RunSummary Runner::Run(absl::Span<const TestInstance> instances) {
  RunSummary summary;
  for (const TestInstance& instance : instances) {
    out_ << instance.FullName();
    const std::string& description = instance.test->test.description();
    if (options_.verbose && !description.empty()) {
      out_ << "\n\t" << description << "\t";
    }
    out_ << "\t" << std::flush;

    const InstanceResult result = RunInstance(instance);
    switch (result.outcome) {
      case Outcome::kSuccess:
        ++summary.passed;
        out_ << "success\n";
        break;
      case Outcome::kSkipped:
        ++summary.skipped;
        out_ << "skipped: " << result.detail << "\n";
        break;
      case Outcome::kFailed:
        ++summary.failed;
        out_ << "error: " << result.detail << "\n";
        break;
    }
    out_ << std::flush;
  }
  return summary;
}

}  // namespace fsconform
