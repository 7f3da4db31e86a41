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
#include "fsconform/tests/groups.h"

namespace fsconform {

void RegisterAllTests(TestRegistry& registry) {
  conformance::RegisterChflagsTests(registry);
  conformance::RegisterChmodTests(registry);
  conformance::RegisterChownTests(registry);
  conformance::RegisterLinkTests(registry);
  conformance::RegisterMkdirTests(registry);
  conformance::RegisterPosixFallocateTests(registry);
  conformance::RegisterRenameTests(registry);
  conformance::RegisterUnlinkTests(registry);
  conformance::RegisterUtimensatTests(registry);
}

}  // namespace fsconform
