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

// Optional filesystem features: their names, and which of them the host can
// exercise.

#ifndef FSCONFORM_FEATURES_H_
#define FSCONFORM_FEATURES_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "fsconform/config.h"
#include "fsconform/config.pb.h"

namespace fsconform {

struct FeatureInfo {
  Feature feature;
  absl::string_view name;
  absl::string_view description;
};

// All known features, in declaration order.
absl::Span<const FeatureInfo> AllFeatures();

// Returns the snake_case name of a feature, e.g. "posix_fallocate".
std::string FeatureName(Feature feature);

// Joins the names of features with ", ".
std::string FeatureNames(absl::Span<const Feature> features);

// Features the host was found to support.
class Capabilities {
 public:
  Capabilities() = default;

  bool Has(Feature feature) const { return available_.contains(feature); }
  void Set(Feature feature, bool available);

 private:
  absl::flat_hash_set<Feature> available_;
};

// Probes the host once, using scratch files created below dir.
absl::StatusOr<Capabilities> ProbeCapabilities(const std::string& dir);

// Drops configured features and file flags that the host cannot exercise.
// Every dropped entry is logged at WARNING.
FeaturesConfig RestrictToCapabilities(FeaturesConfig config,
                                      const Capabilities& capabilities);

}  // namespace fsconform

#endif  // FSCONFORM_FEATURES_H_
