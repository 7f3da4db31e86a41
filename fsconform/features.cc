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

#include "fsconform/features.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "fsconform/config.h"
#include "fsconform/config.pb.h"
#include "fsconform/file_flags.h"
#include "fsconform/util/fileops.h"
#include "fsconform/util/path.h"
#include "fsconform/util/status_macros.h"
#include "fsconform/util/strerror.h"
#include "fsconform/util/temp_file.h"

namespace fsconform {
namespace {

constexpr FeatureInfo kFeatures[] = {
    {FEATURE_CHFLAGS, "chflags", "The chflags(2) syscall is available"},
    {FEATURE_CHFLAGS_SF_SNAPSHOT, "chflags_sf_snapshot",
     "The SF_SNAPSHOT flag can be set with chflags(2)"},
    {FEATURE_NFSV4_ACLS, "nfsv4_acls",
     "NFSv4 style Access Control Lists are available"},
    {FEATURE_POSIX_FALLOCATE, "posix_fallocate",
     "The posix_fallocate(2) syscall is available"},
    {FEATURE_RENAME_CTIME, "rename_ctime",
     "rename(2) changes st_ctime on success (POSIX does not require it, but "
     "some file systems do it anyway)"},
    {FEATURE_STAT_ST_BIRTHTIME, "stat_st_birthtime",
     "struct stat contains an st_birthtime field"},
    {FEATURE_UTIME_NOW, "utime_now", "The UTIME_NOW constant is available"},
    {FEATURE_UTIMENSAT, "utimensat", "The utimensat(2) syscall is available"},
};

bool ProbeFileFlags(const std::string& file) {
  if (!HostHasFileFlags()) {
    return false;
  }
  absl::StatusOr<HostFileFlags> flags = GetFileFlags(file);
  if (!flags.ok()) {
    VLOG(1) << "file flags unavailable: " << flags.status();
    return false;
  }
  // Setting the flags we just read must be allowed for an unprivileged owner.
  absl::Status status = SetFileFlags(file, *flags);
  if (!status.ok()) {
    VLOG(1) << "file flags unavailable: " << status;
    return false;
  }
  return true;
}

bool ProbePosixFallocate(int fd) {
  // Returns an error number rather than setting errno.
  const int err = posix_fallocate(fd, 0, 1);
  if (err != 0) {
    VLOG(1) << "posix_fallocate unavailable: " << StrError(err);
  }
  return err == 0;
}

bool ProbeBirthTime(const std::string& file) {
#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__APPLE__) || \
    defined(__DragonFly__)
  return true;
#elif defined(STATX_BTIME)
  struct statx stx;
  if (statx(AT_FDCWD, file.c_str(), AT_SYMLINK_NOFOLLOW, STATX_BTIME, &stx) ==
      -1) {
    return false;
  }
  return (stx.stx_mask & STATX_BTIME) != 0;
#else
  return false;
#endif
}

bool ProbeNfsv4Acls(const std::string& dir) {
#ifdef _PC_ACL_NFS4
  return pathconf(dir.c_str(), _PC_ACL_NFS4) > 0;
#else
  return false;
#endif
}

}  // namespace

absl::Span<const FeatureInfo> AllFeatures() { return kFeatures; }

std::string FeatureName(Feature feature) {
  for (const FeatureInfo& info : kFeatures) {
    if (info.feature == feature) {
      return std::string(info.name);
    }
  }
  return absl::StrCat("feature_", static_cast<int>(feature));
}

std::string FeatureNames(absl::Span<const Feature> features) {
  return absl::StrJoin(features, ", ", [](std::string* out, Feature feature) {
    absl::StrAppend(out, FeatureName(feature));
  });
}

void Capabilities::Set(Feature feature, bool available) {
  if (available) {
    available_.insert(feature);
  } else {
    available_.erase(feature);
  }
}

absl::StatusOr<Capabilities> ProbeCapabilities(const std::string& dir) {
  FSCONFORM_ASSIGN_OR_RETURN(std::string scratch_dir,
                             CreateTempDir(file::JoinPath(dir, "probe.")));
  const std::string file = file::JoinPath(scratch_dir, "file");
  Capabilities capabilities;
  {
    file_util::fileops::FDCloser fd(
        open(file.c_str(), O_CREAT | O_EXCL | O_RDWR | O_CLOEXEC, 0644));
    if (!fd.is_valid()) {
      absl::Status status =
          absl::ErrnoToStatus(errno, absl::StrCat("open(", file, ")"));
      file_util::fileops::DeleteRecursively(scratch_dir);
      return status;
    }

    const bool flags = ProbeFileFlags(file);
    capabilities.Set(FEATURE_CHFLAGS, flags);
#ifdef SF_SNAPSHOT
    capabilities.Set(FEATURE_CHFLAGS_SF_SNAPSHOT, flags);
#endif
    capabilities.Set(FEATURE_NFSV4_ACLS, ProbeNfsv4Acls(scratch_dir));
    capabilities.Set(FEATURE_POSIX_FALLOCATE, ProbePosixFallocate(fd.get()));
    // Whether rename(2) touches ctime is a property of the filesystem that
    // only the configuration can state.
    capabilities.Set(FEATURE_RENAME_CTIME, true);
    capabilities.Set(FEATURE_STAT_ST_BIRTHTIME, ProbeBirthTime(file));
    capabilities.Set(FEATURE_UTIMENSAT,
                     utimensat(AT_FDCWD, file.c_str(), nullptr, 0) == 0);
#ifdef UTIME_NOW
    capabilities.Set(FEATURE_UTIME_NOW, capabilities.Has(FEATURE_UTIMENSAT));
#endif
  }
  if (!file_util::fileops::DeleteRecursively(scratch_dir)) {
    LOG(WARNING) << "Could not remove " << scratch_dir;
  }
  return capabilities;
}

FeaturesConfig RestrictToCapabilities(FeaturesConfig config,
                                      const Capabilities& capabilities) {
  for (const FeatureInfo& info : kFeatures) {
    if (config.HasFeature(info.feature) && !capabilities.Has(info.feature)) {
      LOG(WARNING) << "Feature " << info.name
                   << " is configured but not available on this host, "
                      "disabling it";
      config.features.erase(info.feature);
    }
  }

  std::vector<FileFlag> unavailable;
  for (FileFlag flag : config.file_flags) {
    if (!capabilities.Has(FEATURE_CHFLAGS) ||
        !FileFlagValue(flag).has_value()) {
      unavailable.push_back(flag);
    }
  }
  for (FileFlag flag : unavailable) {
    LOG(WARNING) << "File flag " << FileFlagName(flag)
                 << " is configured but not available on this host, "
                    "disabling it";
    config.file_flags.erase(flag);
  }
  return config;
}

}  // namespace fsconform
