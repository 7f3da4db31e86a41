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

#include "fsconform/util/fileops.h"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "absl/strings/string_view.h"
#include "fsconform/util/path.h"
#include "fsconform/util/strerror.h"

namespace fsconform::file_util::fileops {

FDCloser::~FDCloser() { Close(); }

bool FDCloser::Close() {
  int fd = Release();
  if (fd == kInvalidFd) {
    return false;
  }
  return close(fd) == 0 || errno == EINTR;
}

int FDCloser::Release() {
  int ret = fd_;
  fd_ = kInvalidFd;
  return ret;
}

std::string GetCWD() {
  // Calling getcwd() with a nullptr buffer is a commonly implemented extension.
  std::unique_ptr<char, void (*)(char*)> cwd(getcwd(nullptr, 0),
                                             [](char* p) { free(p); });
  return cwd ? std::string(cwd.get()) : std::string();
}

std::string MakeAbsolute(const std::string& filename, const std::string& base) {
  if (filename.empty()) {
    return "";
  }
  if (file::IsAbsolutePath(filename)) {
    return filename;
  }
  std::string actual_base = base.empty() ? GetCWD() : base;
  if (actual_base.empty()) {
    return "";
  }
  actual_base = std::string(absl::StripSuffix(actual_base, "/"));
  if (filename == ".") {
    return actual_base.empty() ? "/" : actual_base;
  }
  return absl::StrCat(actual_base, "/", filename);
}

std::string Basename(absl::string_view path) {
  const auto last_slash = path.find_last_of('/');
  return std::string(last_slash == std::string::npos
                         ? path
                         : absl::ClippedSubstr(path, last_slash + 1));
}

bool Exists(const std::string& filename, bool fully_resolve) {
  struct stat st;
  return (fully_resolve ? stat(filename.c_str(), &st)
                        : lstat(filename.c_str(), &st)) != -1;
}

bool ListDirectoryEntries(const std::string& directory,
                          std::vector<std::string>* entries,
                          std::string* error) {
  errno = 0;
  std::unique_ptr<DIR, void (*)(DIR*)> dir{opendir(directory.c_str()),
                                           [](DIR* d) { closedir(d); }};
  if (!dir) {
    *error = absl::StrCat("opendir(", directory, "): ", StrError(errno));
    return false;
  }

  errno = 0;
  struct dirent* entry;
  while ((entry = readdir(dir.get())) != nullptr) {
    const absl::string_view name(entry->d_name);
    if (name != "." && name != "..") {
      entries->emplace_back(name);
    }
  }
  if (errno != 0) {
    *error = absl::StrCat("readdir(", directory, "): ", StrError(errno));
    return false;
  }
  return true;
}

void WalkTree(const std::string& root,
              absl::FunctionRef<void(const std::string& path,
                                     const struct stat& st)>
                  visit) {
  std::vector<std::string> pending = {root};
  while (!pending.empty()) {
    const std::string path = std::move(pending.back());
    pending.pop_back();

    struct stat st;
    if (lstat(path.c_str(), &st) == -1) {
      continue;
    }
    visit(path, st);
    if (!S_ISDIR(st.st_mode)) {
      continue;
    }

    std::vector<std::string> entries;
    std::string error;
    if (!ListDirectoryEntries(path, &entries, &error)) {
      continue;
    }
    for (const auto& entry : entries) {
      pending.push_back(file::JoinPath(path, entry));
    }
  }
}

bool DeleteRecursively(const std::string& filename) {
  struct stat st;
  if (lstat(filename.c_str(), &st) == -1) {
    return errno == ENOENT;
  }

  if (!S_ISDIR(st.st_mode)) {
    return unlink(filename.c_str()) == 0 || errno == ENOENT;
  }

  std::vector<std::string> entries;
  std::string error;
  if (!ListDirectoryEntries(filename, &entries, &error)) {
    return false;
  }
  bool ok = true;
  for (const auto& entry : entries) {
    ok = DeleteRecursively(file::JoinPath(filename, entry)) && ok;
  }
  if (!ok) {
    return false;
  }
  return rmdir(filename.c_str()) == 0 || errno == ENOENT;
}

bool CreateDirRecursive(const std::string& path, mode_t mode) {
  std::string current = file::IsAbsolutePath(path) ? "/" : "";
  for (absl::string_view part : absl::StrSplit(path, '/', absl::SkipEmpty())) {
    current = file::JoinPath(current, part);
    if (mkdir(current.c_str(), mode) == 0 || errno == EEXIST) {
      continue;
    }
    return false;
  }
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

}  // namespace fsconform::file_util::fileops
