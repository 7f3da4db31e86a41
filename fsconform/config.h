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

// In-memory form of the fsconform configuration file.

#ifndef FSCONFORM_CONFIG_H_
#define FSCONFORM_CONFIG_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "fsconform/config.pb.h"

namespace fsconform {

// Filesystem-specific features and flags which are enabled for the run.
struct FeaturesConfig {
  bool HasFeature(Feature feature) const { return features.contains(feature); }
  bool HasFileFlag(FileFlag flag) const { return file_flags.contains(flag); }

  absl::flat_hash_set<Feature> features;
  absl::flat_hash_set<FileFlag> file_flags;
  // Directory on another filesystem, used by cross-device tests.
  std::optional<std::string> secondary_fs;
};

struct SettingsConfig {
  // Delay inserted by TestContext::Nap() between operations whose timestamps
  // are compared.
  absl::Duration naptime = absl::Seconds(1);
  bool allow_remount = false;
};

// User and group names of one identity pool entry. An empty group stands for
// the user's primary group.
struct AuthNames {
  std::string user;
  std::string group;
};

struct Config {
  FeaturesConfig features;
  SettingsConfig settings;
  std::vector<AuthNames> dummy_auth;
};

// Names of the identity pool used when the configuration does not list one.
std::vector<AuthNames> DefaultAuthNames();

// Converts a parsed configuration file. Fields that are not set take their
// defaults.
absl::StatusOr<Config> ConfigFromProto(const ConfigProto& proto);

// Reads and parses a text-format ConfigProto. An empty path yields the
// default configuration.
absl::StatusOr<Config> LoadConfig(absl::string_view path);

}  // namespace fsconform

#endif  // FSCONFORM_CONFIG_H_
