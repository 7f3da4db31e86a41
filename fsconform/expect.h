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

// Assertions for conformance test bodies. Test bodies return absl::Status; a
// failed assertion returns early with an AbortedError naming the source
// location and the failed expression, which the runner reports as the
// failure detail.
//
//   absl::Status UnlinkRemovesFile(TestContext& ctx) {
//     FSCONFORM_ASSIGN_OR_RETURN(std::string path,
//                                ctx.Create(FileType::kRegular));
//     FSCONFORM_EXPECT_SYSCALL_OK(unlink(path.c_str()));
//     FSCONFORM_EXPECT_ERRNO(unlink(path.c_str()), ENOENT);
//     return absl::OkStatus();
//   }

#ifndef FSCONFORM_EXPECT_H_
#define FSCONFORM_EXPECT_H_

#include <cerrno>
#include <string>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "fsconform/util/fileops.h"
#include "fsconform/util/status_macros.h"  // IWYU pragma: export
#include "fsconform/util/strerror.h"

namespace fsconform::internal {

inline absl::Status ExpectFailure(absl::string_view file, int line,
                                  absl::string_view message) {
  return absl::AbortedError(absl::StrCat(file_util::fileops::Basename(file),
                                         ":", line, ": ", message));
}

inline std::string DescribeErrno(int err) {
  return absl::StrCat(ErrnoName(err), " (", StrError(err), ")");
}

}  // namespace fsconform::internal

// Fails unless cond is true.
#define FSCONFORM_EXPECT(cond)                                    \
  do {                                                            \
    if (ABSL_PREDICT_FALSE(!(cond))) {                            \
      return ::fsconform::internal::ExpectFailure(                \
          __FILE__, __LINE__, "expected " #cond);                 \
    }                                                             \
  } while (0)

// Fails unless a == b. Both values must be printable with absl::StrCat().
#define FSCONFORM_EXPECT_EQ(a, b)                                          \
  do {                                                                     \
    const auto& _fsconform_lhs = (a);                                      \
    const auto& _fsconform_rhs = (b);                                      \
    if (ABSL_PREDICT_FALSE(!(_fsconform_lhs == _fsconform_rhs))) {         \
      return ::fsconform::internal::ExpectFailure(                         \
          __FILE__, __LINE__,                                              \
          absl::StrCat("expected " #a " == " #b ", got ", _fsconform_lhs, \
                       " and ", _fsconform_rhs));                          \
    }                                                                      \
  } while (0)

// Fails unless a != b. Both values must be printable with absl::StrCat().
#define FSCONFORM_EXPECT_NE(a, b)                                          \
  do {                                                                     \
    const auto& _fsconform_lhs = (a);                                      \
    const auto& _fsconform_rhs = (b);                                      \
    if (ABSL_PREDICT_FALSE(_fsconform_lhs == _fsconform_rhs)) {            \
      return ::fsconform::internal::ExpectFailure(                         \
          __FILE__, __LINE__,                                              \
          absl::StrCat("expected " #a " != " #b ", both are ",             \
                       _fsconform_lhs));                                   \
    }                                                                      \
  } while (0)

// Fails if a syscall-style expression returns -1, reporting errno.
#define FSCONFORM_EXPECT_SYSCALL_OK(expr)                                 \
  do {                                                                    \
    if (ABSL_PREDICT_FALSE((expr) == -1)) {                               \
      const int _fsconform_errno = errno;                                 \
      return ::fsconform::internal::ExpectFailure(                        \
          __FILE__, __LINE__,                                             \
          absl::StrCat(#expr " failed with ",                             \
                       ::fsconform::internal::DescribeErrno(              \
                           _fsconform_errno)));                           \
    }                                                                     \
  } while (0)

// Fails unless a syscall-style expression returns -1 with errno set to err.
#define FSCONFORM_EXPECT_ERRNO(expr, err)                                 \
  do {                                                                    \
    errno = 0;                                                            \
    if (ABSL_PREDICT_FALSE((expr) != -1)) {                               \
      return ::fsconform::internal::ExpectFailure(                        \
          __FILE__, __LINE__,                                             \
          absl::StrCat(#expr " succeeded, expected ",                     \
                       ::fsconform::ErrnoName(err)));                     \
    }                                                                     \
    const int _fsconform_errno = errno;                                   \
    if (ABSL_PREDICT_FALSE(_fsconform_errno != (err))) {                  \
      return ::fsconform::internal::ExpectFailure(                        \
          __FILE__, __LINE__,                                             \
          absl::StrCat(#expr " failed with ",                             \
                       ::fsconform::internal::DescribeErrno(              \
                           _fsconform_errno),                             \
                       ", expected ", ::fsconform::ErrnoName(err)));      \
    }                                                                     \
  } while (0)

// Fails if a status-returning expression is not OK.
#define FSCONFORM_EXPECT_OK(expr)                                         \
  do {                                                                    \
    const absl::Status _fsconform_status = (expr);                        \
    if (ABSL_PREDICT_FALSE(!_fsconform_status.ok())) {                    \
      return ::fsconform::internal::ExpectFailure(                        \
          __FILE__, __LINE__,                                             \
          absl::StrCat(#expr ": ", _fsconform_status.ToString()));        \
    }                                                                     \
  } while (0)

#endif  // FSCONFORM_EXPECT_H_
