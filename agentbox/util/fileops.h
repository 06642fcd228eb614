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

#ifndef AGENTBOX_UTIL_FILEOPS_H_
#define AGENTBOX_UTIL_FILEOPS_H_

#include <sys/types.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace agentbox::file_util::fileops {

// RAII helper class to automatically close file descriptors.
class FDCloser {
 public:
  explicit FDCloser(int fd = kCanonicalInvalidFd) : fd_{fd} {}
  FDCloser(const FDCloser&) = delete;
  FDCloser& operator=(const FDCloser&) = delete;
  FDCloser(FDCloser&& other) : fd_(other.Release()) {}
  FDCloser& operator=(FDCloser&& other) {
    Swap(other);
    other.Close();
    return *this;
  }
  ~FDCloser();

  int get() const { return fd_; }
  bool Close();
  void Swap(FDCloser& other) { std::swap(fd_, other.fd_); }
  int Release();

 private:
  static constexpr int kCanonicalInvalidFd = -1;

  int fd_;
};

// Returns the last path component: Basename("/a/b.py") == "b.py".
std::string Basename(absl::string_view path);

// Returns everything before the last path component:
// StripBasename("/a/b.py") == "/a", StripBasename("/a") == "/".
std::string StripBasename(absl::string_view path);

// Tests whether filename exists. If fully_resolve is true, symlinks are
// followed and a dangling link counts as missing.
bool Exists(const std::string& filename, bool fully_resolve);

// Returns true if path names a directory (following symlinks).
bool IsDirectory(const std::string& path);

// Returns true if path is a symlink.
bool IsSymlink(const std::string& path);

// Returns the target of a symlink. Returns an empty string on failure.
std::string ReadLink(const std::string& filename);

// Fills entries with the basenames of all entries in directory, excluding "."
// and "..". On error, returns false and sets error to a description.
bool ListDirectoryEntries(const std::string& directory,
                          std::vector<std::string>* entries,
                          std::string* error);

// Creates path and all missing parents with the given mode. Succeeds if the
// directory already exists.
absl::Status CreateDirectoryRecursively(const std::string& path, mode_t mode);

// Writes data to a blocking file descriptor, retrying on short writes.
// Returns true on success.
bool WriteToFD(int fd, const char* data, size_t size);

// Reads from fd until end-of-file.
absl::StatusOr<std::string> ReadAllFromFD(int fd);

}  // namespace agentbox::file_util::fileops

#endif  // AGENTBOX_UTIL_FILEOPS_H_
