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


#include "fsconform/credentials.h"

#include <sys/stat.h>
#include <unistd.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "fsconform/testing.h"

namespace fsconform {
namespace {

using ::testing::Eq;
using ::testing::Ne;

TEST(CredentialsTest, GroupOrderDoesNotMatter) {
  const Credentials a{1000, 100, {5, 7, 100}};
  const Credentials b{1000, 100, {100, 7, 5, 7}};
  EXPECT_THAT(a, Eq(b));
  const Credentials c{1000, 100, {5}};
  EXPECT_THAT(a, Ne(c));
  const Credentials d{1001, 100, {5, 7, 100}};
  EXPECT_THAT(a, Ne(d));
}

TEST(CredentialsTest, ToString) {
  const Credentials credentials{1000, 100, {5, 7}};
  EXPECT_THAT(credentials.ToString(), Eq("euid=1000 egid=100 groups=[5,7]"));
  const ProcessState state{credentials, 022};
  EXPECT_THAT(state.ToString(),
              Eq("euid=1000 egid=100 groups=[5,7] umask=0022"));
}

TEST(CredentialsTest, CaptureMatchesProcess) {
  FSCONFORM_ASSERT_OK_AND_ASSIGN(Credentials credentials,
                                 Credentials::Capture());
  EXPECT_THAT(credentials.euid, Eq(geteuid()));
  EXPECT_THAT(credentials.egid, Eq(getegid()));
}

TEST(CurrentUmaskTest, DoesNotChangeMask) {
  const mode_t saved = umask(027);
  EXPECT_THAT(CurrentUmask(), Eq(027));
  EXPECT_THAT(CurrentUmask(), Eq(027));
  umask(saved);
}

TEST(ProcessStateTest, RestorePutsBackUmask) {
  const mode_t saved = umask(022);
  FSCONFORM_ASSERT_OK_AND_ASSIGN(ProcessState state, ProcessState::Capture());
  umask(077);
  FSCONFORM_ASSERT_OK_AND_ASSIGN(ProcessState changed,
                                 ProcessState::Capture());
  EXPECT_THAT(changed == state, Eq(false));

  FSCONFORM_ASSERT_OK(state.Restore());
  EXPECT_THAT(CurrentUmask(), Eq(022));
  FSCONFORM_ASSERT_OK_AND_ASSIGN(ProcessState restored,
                                 ProcessState::Capture());
  EXPECT_THAT(restored == state, Eq(true));
  umask(saved);
}

TEST(SwitchCredentialsTest, SwitchAndRestore) {
  FSCONFORM_SKIP_UNLESS_ROOT;
  constexpr uid_t kUid = 65534;
  constexpr gid_t kGid = 65534;
  FSCONFORM_ASSERT_OK_AND_ASSIGN(Credentials saved, Credentials::Capture());

  const gid_t groups[] = {kGid};
  FSCONFORM_ASSERT_OK(SwitchCredentials(kUid, kGid, groups));
  EXPECT_THAT(geteuid(), Eq(kUid));
  EXPECT_THAT(getegid(), Eq(kGid));

  FSCONFORM_ASSERT_OK(RestoreCredentials(saved));
  FSCONFORM_ASSERT_OK_AND_ASSIGN(Credentials restored, Credentials::Capture());
  EXPECT_THAT(restored, Eq(saved));
}

TEST(SwitchCredentialsTest, UnprivilegedSwitchFails) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "requires an unprivileged user";
  }
  const gid_t groups[] = {0};
  EXPECT_THAT(SwitchCredentials(0, 0, groups),
              StatusIs(absl::StatusCode::kPermissionDenied));
}

}  // namespace
}  // namespace fsconform
