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

#include "fsconform/file_builder.h"

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include "absl/random/distributions.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "fsconform/util/fileops.h"
#include "fsconform/util/path.h"
#include "fsconform/util/status_macros.h"

namespace fsconform {
namespace {

using ::fsconform::file_util::fileops::FDCloser;

constexpr FileType kAllFileTypes[] = {
    FileType::kRegular, FileType::kDir,    FileType::kFifo,
    FileType::kBlock,   FileType::kChar,   FileType::kSocket,
    FileType::kSymlink,
};

constexpr absl::string_view kAlphanumeric =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

absl::Status ErrnoStatus(absl::string_view call, absl::string_view path) {
  return absl::ErrnoToStatus(errno, absl::StrCat(call, "(", path, ")"));
}

absl::Status CreateSocket(const std::string& path) {
  sockaddr_un addr = {};
  addr.sun_family = AF_UNIX;
  if (path.size() >= sizeof(addr.sun_path)) {
    return absl::ErrnoToStatus(
        ENAMETOOLONG, absl::StrCat("socket path too long: ", path));
  }
  memcpy(addr.sun_path, path.c_str(), path.size() + 1);

  FDCloser fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd.is_valid()) {
    return ErrnoStatus("socket", path);
  }
  if (bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
    return ErrnoStatus("bind", path);
  }
  return absl::OkStatus();
}

}  // namespace

absl::string_view FileTypeName(FileType type) {
  switch (type) {
    case FileType::kRegular:
      return "regular";
    case FileType::kDir:
      return "dir";
    case FileType::kFifo:
      return "fifo";
    case FileType::kBlock:
      return "block";
    case FileType::kChar:
      return "char";
    case FileType::kSocket:
      return "socket";
    case FileType::kSymlink:
      return "symlink";
  }
  return "unknown";
}

bool IsPrivileged(FileType type) {
  return type == FileType::kBlock || type == FileType::kChar;
}

absl::Span<const FileType> AllFileTypes() { return kAllFileTypes; }

std::string RandomName(size_t length) {
  absl::BitGen gen;
  std::string name(length, '\0');
  for (char& c : name) {
    c = kAlphanumeric[absl::Uniform<size_t>(gen, 0, kAlphanumeric.size())];
  }
  return name;
}

FileBuilder& FileBuilder::Name(absl::string_view name) {
  path_ = file::IsAbsolutePath(name) ? std::string(name)
                                     : file::JoinPath(path_, name);
  random_name_ = false;
  return *this;
}

FileBuilder& FileBuilder::Mode(mode_t mode) {
  mode_ = mode;
  return *this;
}

FileBuilder& FileBuilder::Target(absl::string_view target) {
  target_ = std::string(target);
  return *this;
}

FileBuilder& FileBuilder::Device(dev_t device) {
  device_ = device;
  return *this;
}

absl::StatusOr<std::string> FileBuilder::FinalPath() {
  if (finalized_) {
    return absl::FailedPreconditionError(
        absl::StrCat("FileBuilder for ", path_, " was already used"));
  }
  finalized_ = true;
  if (random_name_) {
    path_ = file::JoinPath(path_, RandomName(kRandomNameLength));
  }
  return path_;
}

mode_t FileBuilder::EffectiveMode() const {
  if (mode_.has_value()) {
    return *mode_;
  }
  return type_ == FileType::kDir ? 0755 : 0644;
}

absl::StatusOr<std::string> FileBuilder::Create() {
  FSCONFORM_ASSIGN_OR_RETURN(std::string path, FinalPath());
  const mode_t mode = EffectiveMode();

  switch (type_) {
    case FileType::kRegular: {
      FDCloser fd(open(path.c_str(), O_CREAT | O_RDONLY | O_CLOEXEC, mode));
      if (!fd.is_valid()) {
        return ErrnoStatus("open", path);
      }
      break;
    }
    case FileType::kDir:
      if (mkdir(path.c_str(), mode) == -1) {
        return ErrnoStatus("mkdir", path);
      }
      break;
    case FileType::kFifo:
      if (mkfifo(path.c_str(), mode) == -1) {
        return ErrnoStatus("mkfifo", path);
      }
      break;
    case FileType::kBlock:
    case FileType::kChar: {
      const mode_t kind = type_ == FileType::kBlock ? S_IFBLK : S_IFCHR;
      if (mknod(path.c_str(), kind | mode, device_) == -1) {
        return ErrnoStatus("mknod", path);
      }
      break;
    }
    case FileType::kSocket:
      FSCONFORM_RETURN_IF_ERROR(CreateSocket(path));
      if (mode_.has_value() && chmod(path.c_str(), *mode_) == -1) {
        return ErrnoStatus("chmod", path);
      }
      break;
    case FileType::kSymlink:
      if (symlink(target_.value_or("test").c_str(), path.c_str()) == -1) {
        return ErrnoStatus("symlink", path);
      }
#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__APPLE__) || \
    defined(__DragonFly__)
      if (mode_.has_value() && lchmod(path.c_str(), *mode_) == -1) {
        return ErrnoStatus("lchmod", path);
      }
#endif
      break;
  }
  return path;
}

absl::StatusOr<std::pair<std::string, FDCloser>> FileBuilder::Open(
    int oflags) {
  std::string path;
  if (type_ == FileType::kRegular) {
    FSCONFORM_ASSIGN_OR_RETURN(path, FinalPath());
    FDCloser fd(open(path.c_str(), O_CREAT | oflags, EffectiveMode()));
    if (!fd.is_valid()) {
      return ErrnoStatus("open", path);
    }
    return std::make_pair(std::move(path), std::move(fd));
  }

  FSCONFORM_ASSIGN_OR_RETURN(path, Create());
  FDCloser fd(open(path.c_str(), oflags));
  if (!fd.is_valid()) {
    return ErrnoStatus("open", path);
  }
  return std::make_pair(std::move(path), std::move(fd));
}

}  // namespace fsconform
