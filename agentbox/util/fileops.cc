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

#include "agentbox/util/fileops.h"

#include <dirent.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <memory>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "agentbox/util/strerror.h"

namespace agentbox::file_util::fileops {

FDCloser::~FDCloser() { Close(); }

bool FDCloser::Close() {
  int fd = Release();
  if (fd == kCanonicalInvalidFd) {
    return false;
  }
  return close(fd) == 0 || errno == EINTR;
}

int FDCloser::Release() {
  int ret = fd_;
  fd_ = kCanonicalInvalidFd;
  return ret;
}

std::string Basename(absl::string_view path) {
  const auto last_slash = path.find_last_of('/');
  return std::string(last_slash == std::string::npos
                         ? path
                         : absl::ClippedSubstr(path, last_slash + 1));
}

std::string StripBasename(absl::string_view path) {
  const auto last_slash = path.find_last_of('/');
  if (last_slash == std::string::npos) {
    return "";
  }
  if (last_slash == 0) {
    return "/";
  }
  return std::string(path.substr(0, last_slash));
}

bool Exists(const std::string& filename, bool fully_resolve) {
  struct stat64 st;
  return (fully_resolve ? stat64(filename.c_str(), &st)
                        : lstat64(filename.c_str(), &st)) != -1;
}

bool IsDirectory(const std::string& path) {
  struct stat64 st;
  return stat64(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool IsSymlink(const std::string& path) {
  struct stat64 st;
  return lstat64(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
}

std::string ReadLink(const std::string& filename) {
  std::string result(PATH_MAX, '\0');
  const auto size = readlink(filename.c_str(), &result[0], PATH_MAX);
  if (size < 0) {
    return "";
  }
  result.resize(size);
  return result;
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
    const std::string name(entry->d_name);
    if (name != "." && name != "..") {
      entries->push_back(name);
    }
  }
  if (errno != 0) {
    *error = absl::StrCat("readdir(", directory, "): ", StrError(errno));
    return false;
  }
  return true;
}

absl::Status CreateDirectoryRecursively(const std::string& path, mode_t mode) {
  if (path.empty() || path == "/") {
    return absl::OkStatus();
  }
  if (IsDirectory(path)) {
    return absl::OkStatus();
  }
  const std::string parent = StripBasename(path);
  if (!parent.empty() && parent != path) {
    absl::Status status = CreateDirectoryRecursively(parent, mode);
    if (!status.ok()) {
      return status;
    }
  }
  if (mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
    return absl::InternalError(
        absl::StrCat("mkdir(", path, "): ", StrError(errno)));
  }
  if (!IsDirectory(path)) {
    return absl::FailedPreconditionError(
        absl::StrCat(path, " exists and is not a directory"));
  }
  return absl::OkStatus();
}

bool WriteToFD(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t result = TEMP_FAILURE_RETRY(write(fd, data, size));
    if (result <= 0) {
      return false;
    }
    size -= result;
    data += result;
  }
  return true;
}

absl::StatusOr<std::string> ReadAllFromFD(int fd) {
  std::string contents;
  char buffer[4096];
  for (;;) {
    ssize_t n = TEMP_FAILURE_RETRY(read(fd, buffer, sizeof(buffer)));
    if (n < 0) {
      return absl::InternalError(absl::StrCat("read(): ", StrError(errno)));
    }
    if (n == 0) {
      return contents;
    }
    contents.append(buffer, n);
  }
}

}  // namespace agentbox::file_util::fileops
