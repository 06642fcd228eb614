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

#include "agentbox/testing.h"

#include <unistd.h>

#include <cstdlib>
#include <string>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "agentbox/sandbox/namespace_isolation.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/temp_file.h"

namespace agentbox {

std::string GetTestTempPath(absl::string_view name) {
  const char* test_tmpdir = getenv("TEST_TMPDIR");
  return file::JoinPath(test_tmpdir ? test_tmpdir : ".", name);
}

std::string CreateTestTempDir(absl::string_view prefix) {
  const std::string base = file_util::fileops::MakeAbsolute(
      GetTestTempPath(absl::StrCat(prefix, ".")), "");
  absl::StatusOr<std::string> dir = CreateTempDir(base);
  CHECK_OK(dir.status());
  return *dir;
}

std::string GetTestPython() {
  static const std::string* python = [] {
    const char* env = getenv("AGENTBOX_TEST_PYTHON");
    std::string candidate = env ? env : "/usr/bin/python3";
    if (access(candidate.c_str(), X_OK) != 0) {
      candidate.clear();
    }
    return new std::string(std::move(candidate));
  }();
  return *python;
}

bool NamespacesAvailableForTesting() {
  static const bool available = NamespaceIsolation::IsSupported();
  return available;
}

}  // namespace agentbox
