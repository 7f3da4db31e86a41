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

#include "fsconform/util/strerror.h"

#include <string.h>  // For strerror_r

#include <cerrno>
#include <cstddef>
#include <string>

#include "absl/base/attributes.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace fsconform {
namespace {

// Only one of these overloads is used in a given build, depending on whether
// strerror_r() returns char* (GNU) or int (XSI).
ABSL_ATTRIBUTE_UNUSED const char* StrErrorR(char* (*strerror_r)(int, char*,
                                                                size_t),
                                            int errnum, char* buf,
                                            size_t buflen) {
  return strerror_r(errnum, buf, buflen);
}

ABSL_ATTRIBUTE_UNUSED const char* StrErrorR(int (*strerror_r)(int, char*,
                                                              size_t),
                                            int errnum, char* buf,
                                            size_t buflen) {
  if (strerror_r(errnum, buf, buflen)) {
    *buf = '\0';
  }
  return buf;
}

}  // namespace

std::string StrError(int errnum) {
  const int saved_errno = errno;
  char buf[100];
  const char* str = StrErrorR(strerror_r, errnum, buf, sizeof(buf));
  if (*str == '\0') {
    absl::SNPrintF(buf, sizeof(buf), "Unknown error %d", errnum);
    str = buf;
  }
  errno = saved_errno;
  return str;
}

std::string ErrnoName(int errnum) {
  switch (errnum) {
#define FSCONFORM_ERRNO_CASE(e) \
  case e:                       \
    return #e;
    FSCONFORM_ERRNO_CASE(EPERM)
    FSCONFORM_ERRNO_CASE(ENOENT)
    FSCONFORM_ERRNO_CASE(EIO)
    FSCONFORM_ERRNO_CASE(ENXIO)
    FSCONFORM_ERRNO_CASE(E2BIG)
    FSCONFORM_ERRNO_CASE(EBADF)
    FSCONFORM_ERRNO_CASE(EAGAIN)
    FSCONFORM_ERRNO_CASE(ENOMEM)
    FSCONFORM_ERRNO_CASE(EACCES)
    FSCONFORM_ERRNO_CASE(EFAULT)
    FSCONFORM_ERRNO_CASE(EBUSY)
    FSCONFORM_ERRNO_CASE(EEXIST)
    FSCONFORM_ERRNO_CASE(EXDEV)
    FSCONFORM_ERRNO_CASE(ENODEV)
    FSCONFORM_ERRNO_CASE(ENOTDIR)
    FSCONFORM_ERRNO_CASE(EISDIR)
    FSCONFORM_ERRNO_CASE(EINVAL)
    FSCONFORM_ERRNO_CASE(ENFILE)
    FSCONFORM_ERRNO_CASE(EMFILE)
    FSCONFORM_ERRNO_CASE(ETXTBSY)
    FSCONFORM_ERRNO_CASE(EFBIG)
    FSCONFORM_ERRNO_CASE(ENOSPC)
    FSCONFORM_ERRNO_CASE(ESPIPE)
    FSCONFORM_ERRNO_CASE(EROFS)
    FSCONFORM_ERRNO_CASE(EMLINK)
    FSCONFORM_ERRNO_CASE(ENAMETOOLONG)
    FSCONFORM_ERRNO_CASE(ENOTEMPTY)
    FSCONFORM_ERRNO_CASE(ELOOP)
    FSCONFORM_ERRNO_CASE(ENOTSUP)
    FSCONFORM_ERRNO_CASE(EDQUOT)
#if EOPNOTSUPP != ENOTSUP
    FSCONFORM_ERRNO_CASE(EOPNOTSUPP)
#endif
#ifdef EFTYPE
    FSCONFORM_ERRNO_CASE(EFTYPE)
#endif
#undef FSCONFORM_ERRNO_CASE
    default:
      return absl::StrCat(errnum);
  }
}

}  // namespace fsconform
