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

#ifndef FSCONFORM_UTIL_FILEOPS_H_
#define FSCONFORM_UTIL_FILEOPS_H_

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <utility>
#include <vector>

#include "absl/functional/function_ref.h"
#include "absl/strings/string_view.h"

namespace fsconform::file_util::fileops {

// RAII helper class to automatically close file descriptors.
class FDCloser {
 public:
  explicit FDCloser(int fd = kInvalidFd) : fd_{fd} {}
  FDCloser(const FDCloser&) = delete;
  FDCloser& operator=(const FDCloser&) = delete;
  FDCloser(FDCloser&& other) : fd_(other.Release()) {}
  FDCloser& operator=(FDCloser&& other) {
    std::swap(fd_, other.fd_);
    other.Close();
    return *this;
  }
  ~FDCloser();

  int get() const { return fd_; }
  bool is_valid() const { return fd_ != kInvalidFd; }
  bool Close();
  int Release();

 private:
  static constexpr int kInvalidFd = -1;

  int fd_;
};

// Returns the current working directory. On error, returns an empty string.
std::string GetCWD();

// Makes filename absolute with respect to base. An empty base stands for the
// current working directory. Returns an empty string on error.
std::string MakeAbsolute(const std::string& filename, const std::string& base);

// Returns a file's basename. A trailing slash yields an empty basename.
std::string Basename(absl::string_view path);

// Tests whether filename exists. If fully_resolve is true, symlinks are
// followed and a dangling symlink counts as missing.
bool Exists(const std::string& filename, bool fully_resolve);

// Reads a directory and fills entries with the basenames of all the files in
// it, "." and ".." excluded. On error, false is returned and error is set to a
// description of the error.
bool ListDirectoryEntries(const std::string& directory,
                          std::vector<std::string>* entries,
                          std::string* error);

// Visits `root` and everything below it without following symlinks. A
// directory is visited before its entries are listed, so `visit` may change
// its permissions to make it readable. Entries that cannot be stat'ed or
// directories that cannot be listed are skipped silently.
void WalkTree(const std::string& root,
              absl::FunctionRef<void(const std::string& path,
                                     const struct stat& st)>
                  visit);

// Deletes the specified file or directory, including any sub-directories.
// Children are always removed before their parent. Returns true if the path
// no longer exists afterwards.
bool DeleteRecursively(const std::string& filename);

// Recursively creates a directory, skipping segments that already exist.
bool CreateDirRecursive(const std::string& path, mode_t mode);

}  // namespace fsconform::file_util::fileops

#endif  // FSCONFORM_UTIL_FILEOPS_H_
