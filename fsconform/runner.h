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

#ifndef FSCONFORM_RUNNER_H_
#define FSCONFORM_RUNNER_H_

#include <cstddef>
#include <ostream>
#include <string>

#include "absl/types/span.h"
#include "fsconform/config.h"
#include "fsconform/guard.h"
#include "fsconform/identity_pool.h"

namespace fsconform {

enum class Outcome {
  kSuccess,
  kSkipped,
  kFailed,
};

// Result of one test instance. detail holds the skip reason or the failure.
struct InstanceResult {
  Outcome outcome;
  std::string detail;
};

struct RunSummary {
  size_t failed = 0;
  size_t skipped = 0;
  size_t passed = 0;

  size_t total() const { return failed + skipped + passed; }

  // "Tests: 1 failed, 2 skipped, 3 passed, 6 total".
  std::string ToString() const;
};

struct RunnerOptions {
  // Print each test's description.
  bool verbose = false;
};

// Runner executes test instances one after the other. Every instance gets a
// fresh, empty directory of mode 0755 below run_dir and its own TestContext.
// A failing instance does not affect the following ones: its directory is
// always torn down, and if it left the process identity or umask changed,
// the previous state is put back and the instance counts as failed.
class Runner {
 public:
  Runner(const Config& config, absl::Span<const AuthEntry> auth_entries,
         std::string run_dir, std::ostream& out, RunnerOptions options = {});

  Runner(const Runner&) = delete;
  Runner& operator=(const Runner&) = delete;

  // Runs all instances and writes one line per instance:
  //   group::case::test[::type]<TAB>success
  //   group::case::test[::type]<TAB>skipped: <reason>
  //   group::case::test[::type]<TAB>error: <detail>
  RunSummary Run(absl::Span<const TestInstance> instances);

  // Runs a single instance without printing anything.
  InstanceResult RunInstance(const TestInstance& instance);

 private:
  const Config& config_;
  absl::Span<const AuthEntry> auth_entries_;
  std::string run_dir_;
  std::ostream& out_;
  RunnerOptions options_;
};

}  // namespace fsconform

#endif  // FSCONFORM_RUNNER_H_
