// Copyright 2019 Google LLC
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

#include "agentbox/sandbox/mounts.h"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {
namespace {

namespace fileops = ::agentbox::file_util::fileops;

constexpr absl::string_view kSystemDirectories[] = {
    "/usr", "/lib", "/lib32", "/lib64", "/libx32", "/bin", "/sbin",
};

constexpr absl::string_view kSystemConfigPaths[] = {
    "/etc/alternatives",  "/etc/ca-certificates", "/etc/gai.conf",
    "/etc/host.conf",     "/etc/hosts",           "/etc/ld.so.cache",
    "/etc/ld.so.conf",    "/etc/ld.so.conf.d",    "/etc/localtime",
    "/etc/mime.types",    "/etc/nsswitch.conf",   "/etc/pki",
    "/etc/protocols",     "/etc/resolv.conf",     "/etc/services",
    "/etc/ssl",
};

int Depth(absl::string_view path) {
  return std::count(path.begin(), path.end(), '/');
}

absl::StatusOr<std::string> NormalizeInside(absl::string_view inside) {
  if (!file::IsAbsolutePath(inside)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Sandbox path must be absolute: ", inside));
  }
  std::string clean = file::CleanPath(inside);
  if (clean == "/") {
    return absl::InvalidArgumentError("Cannot mount over the sandbox root");
  }
  if (file::IsWithin(clean, "/proc")) {
    return absl::InvalidArgumentError(
        absl::StrCat("/proc is managed by the isolation layer: ", inside));
  }
  return clean;
}

}  // namespace

absl::Status Mounts::AddFileAt(absl::string_view outside,
                               absl::string_view inside, bool is_ro) {
  const std::string source(outside);
  struct stat64 st;
  if (stat64(source.c_str(), &st) != 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("stat(", outside, ")"));
  }
  if (S_ISDIR(st.st_mode)) {
    return absl::InvalidArgumentError(
        absl::StrCat(outside, " is a directory, not a file"));
  }
  AGENTBOX_ASSIGN_OR_RETURN(std::string target, NormalizeInside(inside));
  return Insert({EntryType::kFile, std::move(target), source, is_ro});
}

absl::Status Mounts::AddDirectoryAt(absl::string_view outside,
                                    absl::string_view inside, bool is_ro) {
  const std::string source(outside);
  if (!fileops::IsDirectory(source)) {
    return absl::NotFoundError(
        absl::StrCat(outside, " does not exist or is not a directory"));
  }
  AGENTBOX_ASSIGN_OR_RETURN(std::string target, NormalizeInside(inside));
  return Insert({EntryType::kDirectory, std::move(target), source, is_ro});
}

absl::Status Mounts::AddBindMount(const BindMount& mount) {
  if (fileops::IsDirectory(mount.source)) {
    return AddDirectoryAt(mount.source, mount.target, mount.read_only);
  }
  return AddFileAt(mount.source, mount.target, mount.read_only);
}

absl::Status Mounts::AddTmpfs(absl::string_view inside, size_t size) {
  AGENTBOX_ASSIGN_OR_RETURN(std::string target, NormalizeInside(inside));
  return Insert({EntryType::kTmpfs, std::move(target), "", false, size});
}

absl::Status Mounts::AddSymlink(absl::string_view inside,
                                absl::string_view link_target) {
  AGENTBOX_ASSIGN_OR_RETURN(std::string target, NormalizeInside(inside));
  return Insert(
      {EntryType::kSymlink, std::move(target), std::string(link_target)});
}

absl::Status Mounts::AddSystemDefaults() {
  for (absl::string_view dir : kSystemDirectories) {
    const std::string path(dir);
    if (!fileops::Exists(path, /*fully_resolve=*/true) || IsVisible(path)) {
      continue;
    }
    if (fileops::IsSymlink(path)) {
      AGENTBOX_RETURN_IF_ERROR(AddSymlink(path, fileops::ReadLink(path)));
    } else {
      AGENTBOX_RETURN_IF_ERROR(AddDirectoryAt(path, path));
    }
  }
  for (absl::string_view config : kSystemConfigPaths) {
    const std::string path(config);
    if (!fileops::Exists(path, /*fully_resolve=*/true) || IsVisible(path)) {
      continue;
    }
    AGENTBOX_RETURN_IF_ERROR(AddBindMount({path, path, /*read_only=*/true}));
  }
  return absl::OkStatus();
}

absl::Status Mounts::AddHostPathIfMissing(absl::string_view path) {
  if (IsVisible(path)) {
    return absl::OkStatus();
  }
  return AddBindMount({std::string(path), std::string(path), true});
}

absl::StatusOr<std::string> Mounts::ResolvePath(
    absl::string_view inside) const {
  const std::string clean = file::CleanPath(inside);
  const Entry* best = nullptr;
  for (const Entry& entry : entries_) {
    if (entry.type != EntryType::kDirectory && entry.type != EntryType::kFile) {
      continue;
    }
    if (file::IsWithin(clean, entry.inside) &&
        (best == nullptr || entry.inside.size() > best->inside.size())) {
      best = &entry;
    }
  }
  if (best == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("No bind mount covers sandbox path ", inside));
  }
  const std::string relative = *file::RelativeTo(clean, best->inside);
  return relative.empty() ? best->outside
                          : file::JoinPath(best->outside, relative);
}

bool Mounts::IsVisible(absl::string_view inside) const {
  const std::string clean = file::CleanPath(inside);
  return std::any_of(entries_.begin(), entries_.end(), [&](const Entry& e) {
    return file::IsWithin(clean, e.inside);
  });
}

std::vector<Mounts::Entry> Mounts::SortedEntries() const {
  std::vector<Entry> sorted = entries_;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Entry& a, const Entry& b) {
                     return Depth(a.inside) < Depth(b.inside);
                   });
  return sorted;
}

std::vector<BindMount> Mounts::GetBindMounts() const {
  std::vector<BindMount> binds;
  for (const Entry& entry : entries_) {
    if (entry.type == EntryType::kDirectory ||
        entry.type == EntryType::kFile) {
      binds.push_back({entry.outside, entry.inside, entry.read_only});
    }
  }
  return binds;
}

absl::Status Mounts::Insert(Entry entry) {
  for (const Entry& existing : entries_) {
    if (existing.inside == entry.inside) {
      return absl::AlreadyExistsError(
          absl::StrCat("Sandbox path already mounted: ", entry.inside));
    }
    // Nothing may be placed below a file or a symlink.
    if ((existing.type == EntryType::kFile ||
         existing.type == EntryType::kSymlink) &&
        file::IsWithin(entry.inside, existing.inside)) {
      return absl::InvalidArgumentError(
          absl::StrCat(entry.inside, " would be placed below ",
                       existing.inside, " which is not a directory"));
    }
  }
  entries_.push_back(std::move(entry));
  return absl::OkStatus();
}

}  // namespace agentbox
