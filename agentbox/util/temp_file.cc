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

#include "agentbox/util/temp_file.h"

#include <fcntl.h>
#include <stdlib.h>

#include <cerrno>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

namespace agentbox {
namespace {
constexpr absl::string_view kMktempSuffix = "XXXXXX";
}  // namespace

absl::StatusOr<std::pair<std::string, int>> CreateNamedTempFile(
    absl::string_view prefix) {
  std::string name_template = absl::StrCat(prefix, kMktempSuffix);
  int fd = mkostemp(&name_template[0], O_CLOEXEC);
  if (fd < 0) {
    return absl::ErrnoToStatus(errno, "mkostemp()");
  }
  return std::pair<std::string, int>{std::move(name_template), fd};
}

absl::StatusOr<std::string> CreateTempDir(absl::string_view prefix) {
  std::string name_template = absl::StrCat(prefix, kMktempSuffix);
  if (mkdtemp(&name_template[0]) == nullptr) {
    return absl::ErrnoToStatus(errno, "mkdtemp()");
  }
  return name_template;
}

}  // namespace agentbox
