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


// Runs the filesystem conformance tests against the filesystem holding
// --path.
//
// Example usage:
//   fsconform
//     --config=/etc/fsconform.textproto
//     --path=/mnt/under_test
//     chmod:: mkdir::errno
//
// Must usually run as root: most tests switch to the unprivileged identities
// listed in the configuration.

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/check.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_format.h"
#include "fsconform/config.h"
#include "fsconform/features.h"
#include "fsconform/guard.h"
#include "fsconform/identity_pool.h"
#include "fsconform/runner.h"
#include "fsconform/test_case.h"
#include "fsconform/util/fileops.h"
#include "fsconform/util/path.h"
#include "fsconform/util/strerror.h"
#include "fsconform/util/temp_file.h"

ABSL_FLAG(std::string, config, "",
          "Configuration file (text format ConfigProto). Defaults are used "
          "when empty");
ABSL_FLAG(std::string, path, "",
          "Directory on the filesystem under test. The run directory is "
          "created below it. Defaults to the current working directory");
ABSL_FLAG(std::string, secondary_fs, "",
          "Directory on another filesystem, for cross-device tests. "
          "Overrides the configuration file");
ABSL_FLAG(bool, list_features, false,
          "Print the optional features and exit");
ABSL_FLAG(bool, exact, false,
          "Patterns must match full test names instead of substrings");
ABSL_FLAG(bool, verbose, false, "Print the description of each test");

namespace {

namespace fileops = ::fsconform::file_util::fileops;

void ListFeatures() {
  for (const fsconform::FeatureInfo& info : fsconform::AllFeatures()) {
    absl::PrintF("%s: %s\n", info.name, info.description);
  }
}

bool Matches(const std::string& name, const std::vector<std::string>& patterns,
             bool exact) {
  if (patterns.empty()) {
    return true;
  }
  for (const std::string& pattern : patterns) {
    if (exact ? name == pattern : absl::StrContains(name, pattern)) {
      return true;
    }
  }
  return false;
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string program_name = fileops::Basename(argv[0]);
  absl::SetProgramUsageMessage(
      absl::StrFormat("Filesystem conformance test suite.\n"
                      "Usage: %1$s [OPTION]... [PATTERN]...",
                      program_name));

  std::vector<std::string> patterns;
  {
    const std::vector<char*> parsed_argv = absl::ParseCommandLine(argc, argv);
    patterns.assign(parsed_argv.begin() + 1, parsed_argv.end());
  }
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  absl::InitializeLog();

  if (absl::GetFlag(FLAGS_list_features)) {
    ListFeatures();
    return EXIT_SUCCESS;
  }

  absl::StatusOr<fsconform::Config> config =
      fsconform::LoadConfig(absl::GetFlag(FLAGS_config));
  if (!config.ok()) {
    absl::FPrintF(stderr, "Cannot load configuration: %s\n",
                  config.status().ToString());
    return EXIT_FAILURE;
  }
  if (const std::string secondary_fs = absl::GetFlag(FLAGS_secondary_fs);
      !secondary_fs.empty()) {
    config->features.secondary_fs = fileops::MakeAbsolute(secondary_fs, "");
  }

  absl::StatusOr<std::vector<fsconform::AuthEntry>> auth_entries =
      fsconform::ResolveAuthEntries(config->dummy_auth);
  QCHECK_OK(auth_entries.status()) << "Invalid dummy_auth configuration";

  const std::string base =
      fileops::MakeAbsolute(absl::GetFlag(FLAGS_path), "");
  const std::string path = base.empty() ? fileops::GetCWD() : base;
  absl::StatusOr<std::string> run_dir =
      fsconform::CreateTempDir(fsconform::file::JoinPath(path, "fsconform."));
  if (!run_dir.ok()) {
    absl::FPrintF(stderr, "Cannot create run directory below %s: %s\n", path,
                  run_dir.status().ToString());
    return EXIT_FAILURE;
  }
  if (chmod(run_dir->c_str(), 0755) == -1) {
    absl::FPrintF(stderr, "chmod(%s): %s\n", *run_dir,
                  fsconform::StrError(errno));
    fileops::DeleteRecursively(*run_dir);
    return EXIT_FAILURE;
  }

  absl::StatusOr<fsconform::Capabilities> capabilities =
      fsconform::ProbeCapabilities(*run_dir);
  if (!capabilities.ok()) {
    absl::FPrintF(stderr, "Cannot probe %s: %s\n", *run_dir,
                  capabilities.status().ToString());
    fileops::DeleteRecursively(*run_dir);
    return EXIT_FAILURE;
  }
  config->features = fsconform::RestrictToCapabilities(
      std::move(config->features), *capabilities);

  // Tests compute expected modes with no mask applied unless they set one.
  umask(0);

  fsconform::TestRegistry registry;
  fsconform::RegisterAllTests(registry);
  std::vector<fsconform::TestInstance> instances;
  for (const fsconform::TestInstance& instance :
       fsconform::Instantiate(registry.tests())) {
    if (Matches(instance.FullName(), patterns, absl::GetFlag(FLAGS_exact))) {
      instances.push_back(instance);
    }
  }
  VLOG(1) << "Running " << instances.size() << " test instances in "
          << *run_dir;

  fsconform::Runner runner(*config, *auth_entries, *run_dir, std::cout,
                           {absl::GetFlag(FLAGS_verbose)});
  const fsconform::RunSummary summary = runner.Run(instances);
  std::cout << "\n" << summary.ToString() << std::endl;

  if (!fileops::DeleteRecursively(*run_dir)) {
    LOG(WARNING) << "Cannot remove run directory " << *run_dir;
  }
  return summary.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
