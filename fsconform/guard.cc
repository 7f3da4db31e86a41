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

#include "fsconform/guard.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "fsconform/config.h"
#include "fsconform/config.pb.h"
#include "fsconform/features.h"
#include "fsconform/file_builder.h"
#include "fsconform/file_flags.h"
#include "fsconform/test_case.h"
#include "fsconform/util/status_macros.h"

namespace fsconform {

std::string TestInstance::FullName() const {
  std::string name = test->FullName();
  if (type.has_value()) {
    absl::StrAppend(&name, "::", FileTypeName(*type));
  }
  return name;
}

std::vector<TestInstance> Instantiate(absl::Span<const RegisteredTest> tests) {
  std::vector<TestInstance> instances;
  for (const RegisteredTest& test : tests) {
    if (!test.test.is_type_parameterized()) {
      instances.push_back({&test, std::nullopt});
      continue;
    }
    for (FileType type : test.test.ApplicableFileTypes()) {
      instances.push_back({&test, type});
    }
  }
  return instances;
}

absl::Status EvaluateGuards(const TestInstance& instance, const Config& config,
                            absl::string_view sandbox_path, bool is_root) {
  const TestCase& test = instance.test->test;

  const bool needs_root = test.require_root() ||
                          (instance.type.has_value() &&
                           IsPrivileged(*instance.type));
  if (needs_root && !is_root) {
    return absl::PermissionDeniedError("requires root privileges");
  }

  std::vector<Feature> missing;
  for (Feature feature : test.required_features()) {
    if (!config.features.HasFeature(feature)) {
      missing.push_back(feature);
    }
  }
  if (!missing.empty()) {
    return absl::FailedPreconditionError(
        absl::StrCat("requires features: ", FeatureNames(missing)));
  }

  for (const GuardFn& guard : test.guards()) {
    FSCONFORM_RETURN_IF_ERROR(guard(config, sandbox_path));
  }
  return absl::OkStatus();
}

GuardFn SupportsFileFlags(std::vector<FileFlag> flags) {
  return [flags = std::move(flags)](const Config& config,
                                    absl::string_view) -> absl::Status {
    std::vector<std::string> unsupported;
    for (FileFlag flag : flags) {
      if (!config.features.HasFileFlag(flag)) {
        unsupported.push_back(FileFlagName(flag));
      }
    }
    if (!unsupported.empty()) {
      return absl::FailedPreconditionError(absl::StrCat(
          "file flags ", absl::StrJoin(unsupported, ", "), " aren't supported"));
    }
    return absl::OkStatus();
  };
}

GuardFn SupportsAnyFileFlag(std::vector<FileFlag> flags) {
  return [flags = std::move(flags)](const Config& config,
                                    absl::string_view) -> absl::Status {
    for (FileFlag flag : flags) {
      if (config.features.HasFileFlag(flag)) {
        return absl::OkStatus();
      }
    }
    return absl::FailedPreconditionError(
        "None of the flags used for this test are available in the "
        "configuration");
  };
}

GuardFn RequiresSecondaryFs() {
  return [](const Config& config, absl::string_view) -> absl::Status {
    if (!config.features.secondary_fs.has_value()) {
      return absl::FailedPreconditionError(
          "requires a secondary file system (secondary_fs)");
    }
    return absl::OkStatus();
  };
}

GuardFn RequiresRemount() {
  return [](const Config& config, absl::string_view) -> absl::Status {
    if (!config.settings.allow_remount) {
      return absl::FailedPreconditionError(
          "requires the file system to be remountable (allow_remount)");
    }
    return absl::OkStatus();
  };
}

}  // namespace fsconform
