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

#include "fsconform/test_case.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "fsconform/context.h"
#include "fsconform/file_builder.h"

namespace fsconform {

TestCase& TestCase::Doc(std::string description) {
  description_ = std::move(description);
  return *this;
}

TestCase& TestCase::Root() {
  require_root_ = true;
  return *this;
}

TestCase& TestCase::Serialized() {
  serialized_ = true;
  return *this;
}

TestCase& TestCase::RequireFeature(Feature feature) {
  required_features_.push_back(feature);
  return *this;
}

TestCase& TestCase::FileTypes(std::vector<FileType> types) {
  file_types_ = std::move(types);
  return *this;
}

TestCase& TestCase::ExcludeFileTypes(std::vector<FileType> types) {
  excluded_file_types_ = std::move(types);
  return *this;
}

TestCase& TestCase::Guard(GuardFn guard) {
  guards_.push_back(std::move(guard));
  return *this;
}

std::vector<FileType> TestCase::ApplicableFileTypes() const {
  if (!is_type_parameterized()) {
    return {};
  }
  std::vector<FileType> types;
  if (file_types_.empty()) {
    types.assign(AllFileTypes().begin(), AllFileTypes().end());
  } else {
    types = file_types_;
  }
  types.erase(std::remove_if(types.begin(), types.end(),
                             [this](FileType type) {
                               return std::find(excluded_file_types_.begin(),
                                                excluded_file_types_.end(),
                                                type) !=
                                      excluded_file_types_.end();
                             }),
              types.end());
  return types;
}

absl::Status TestCase::Invoke(TestContext& ctx,
                              std::optional<FileType> type) const {
  if (const auto* fn = std::get_if<FileTypeTestFn>(&fn_)) {
    if (!type.has_value()) {
      return absl::InvalidArgumentError(
          absl::StrCat(name_, " needs a file type"));
    }
    return (*fn)(ctx, *type);
  }
  if (type.has_value()) {
    return absl::InvalidArgumentError(
        absl::StrCat(name_, " does not take a file type"));
  }
  return std::get<TestFn>(fn_)(ctx);
}

std::string RegisteredTest::FullName() const {
  return absl::StrCat(group, "::", test_case, "::", test.name());
}

void TestRegistry::Add(absl::string_view group, absl::string_view test_case,
                       TestCase test) {
  tests_.push_back(
      {std::string(group), std::string(test_case), std::move(test)});
}

}  // namespace fsconform
