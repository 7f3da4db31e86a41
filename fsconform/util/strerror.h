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

#ifndef FSCONFORM_UTIL_STRERROR_H_
#define FSCONFORM_UTIL_STRERROR_H_

#include <string>

namespace fsconform {

// Returns a human-readable string describing the given POSIX error code, or
// "Unknown error nnn" if it is not translatable. errno is left unchanged.
// This function is thread-safe.
std::string StrError(int errnum);

// Returns the symbolic name of an errno value, e.g. "EACCES". Unknown values
// are rendered as their decimal number.
std::string ErrnoName(int errnum);

}  // namespace fsconform

#endif  // FSCONFORM_UTIL_STRERROR_H_
