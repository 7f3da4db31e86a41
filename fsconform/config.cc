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

#include "fsconform/config.h"

#include <cmath>
#include <string>
#include <vector>

#include "google/protobuf/text_format.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "fsconform/config.pb.h"
#include "fsconform/util/file_helpers.h"
#include "fsconform/util/status_macros.h"

namespace fsconform {

std::vector<AuthNames> DefaultAuthNames() {
  return {{"nobody", ""}, {"pjdfstest", ""}, {"tests", ""}};
}

absl::StatusOr<Config> ConfigFromProto(const ConfigProto& proto) {
  Config config;

  const FeaturesProto& features = proto.features();
  for (int feature : features.feature()) {
    if (feature == FEATURE_UNSPECIFIED) {
      return absl::InvalidArgumentError("feature must not be unspecified");
    }
    config.features.features.insert(static_cast<Feature>(feature));
  }
  for (int flag : features.file_flag()) {
    if (flag == FILE_FLAG_UNSPECIFIED) {
      return absl::InvalidArgumentError("file_flag must not be unspecified");
    }
    config.features.file_flags.insert(static_cast<FileFlag>(flag));
  }
  if (features.has_secondary_fs()) {
    config.features.secondary_fs = features.secondary_fs();
  }

  const double naptime = proto.settings().naptime();
  if (!std::isfinite(naptime) || naptime < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("naptime must be a non-negative number, got ", naptime));
  }
  config.settings.naptime = absl::Seconds(naptime);
  config.settings.allow_remount = proto.settings().allow_remount();

  if (proto.dummy_auth().entry().empty()) {
    config.dummy_auth = DefaultAuthNames();
  } else {
    for (const AuthEntryProto& entry : proto.dummy_auth().entry()) {
      if (entry.user().empty()) {
        return absl::InvalidArgumentError("dummy_auth entry without a user");
      }
      config.dummy_auth.push_back({entry.user(), entry.group()});
    }
  }
  return config;
}

absl::StatusOr<Config> LoadConfig(absl::string_view path) {
  ConfigProto proto;
  if (!path.empty()) {
    std::string contents;
    FSCONFORM_RETURN_IF_ERROR(file::GetContents(path, &contents));
    if (!google::protobuf::TextFormat::ParseFromString(contents, &proto)) {
      return absl::InvalidArgumentError(
          absl::StrCat("cannot parse configuration file ", path));
    }
  }
  return ConfigFromProto(proto);
}

}  // namespace fsconform
