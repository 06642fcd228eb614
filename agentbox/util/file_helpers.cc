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

#include "agentbox/util/file_helpers.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/status_macros.h"

namespace agentbox::file {
namespace {

using ::agentbox::file_util::fileops::FDCloser;

absl::Status WriteFile(const std::string& path, absl::string_view content,
                       mode_t mode, bool sync) {
  FDCloser fd(open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                   mode));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  if (!file_util::fileops::WriteToFD(fd.get(), content.data(),
                                     content.size())) {
    return absl::ErrnoToStatus(errno, absl::StrCat("write(", path, ")"));
  }
  if (sync && fsync(fd.get()) != 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("fsync(", path, ")"));
  }
  if (!fd.Close()) {
    return absl::ErrnoToStatus(errno, absl::StrCat("close(", path, ")"));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status GetContents(absl::string_view path, std::string* output) {
  const std::string filename(path);
  FDCloser fd(open(filename.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  absl::StatusOr<std::string> contents =
      file_util::fileops::ReadAllFromFD(fd.get());
  if (!contents.ok()) {
    return absl::Status(contents.status().code(),
                        absl::StrCat(path, ": ", contents.status().message()));
  }
  *output = *std::move(contents);
  return absl::OkStatus();
}

absl::Status SetContents(absl::string_view path, absl::string_view content,
                         mode_t mode) {
  return WriteFile(std::string(path), content, mode, /*sync=*/false);
}

absl::Status SetContentsAtomically(absl::string_view path,
                                   absl::string_view content, mode_t mode) {
  const std::string target(path);
  const std::string temp = absl::StrCat(target, ".tmp.", getpid());
  absl::Status status = WriteFile(temp, content, mode, /*sync=*/true);
  if (status.ok() && rename(temp.c_str(), target.c_str()) != 0) {
    status = absl::ErrnoToStatus(errno, absl::StrCat("rename(", temp, ")"));
  }
  if (!status.ok()) {
    unlink(temp.c_str());
  }
  return status;
}

}  // namespace agentbox::file
