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

#include "agentbox/notebook/kernel.h"

#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "agentbox/util/file_helpers.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {

absl::StatusOr<std::string> InstallKernel(absl::string_view dir) {
  AGENTBOX_RETURN_IF_ERROR(
      file_util::fileops::CreateDirectoryRecursively(std::string(dir), 0755));
  const std::string path = file::JoinPath(dir, kKernelFileName);
  std::string existing;
  if (file::GetContents(path, &existing).ok() && existing == KernelSource()) {
    return path;
  }
  AGENTBOX_RETURN_IF_ERROR(
      file::SetContentsAtomically(path, KernelSource(), 0644));
  VLOG(1) << "Installed notebook kernel at " << path;
  return path;
}

}  // namespace agentbox
