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

#ifndef AGENTBOX_TESTING_H_
#define AGENTBOX_TESTING_H_

#include <string>

#include "absl/strings/string_view.h"

// Skips the current test if the host cannot create user, mount, PID and
// network namespaces (for example inside a locked-down container).
#define SKIP_WITHOUT_NAMESPACES()                                    \
  do {                                                               \
    if (!::agentbox::NamespacesAvailableForTesting()) {              \
      GTEST_SKIP() << "Namespace isolation unavailable on this host"; \
    }                                                                \
  } while (0)

// Skips the current test if no usable Python 3 interpreter was found.
#define SKIP_WITHOUT_PYTHON()                                        \
  do {                                                               \
    if (::agentbox::GetTestPython().empty()) {                       \
      GTEST_SKIP() << "No python3 interpreter available";            \
    }                                                                \
  } while (0)

namespace agentbox {

// Returns a path below TEST_TMPDIR (or the current directory) for name.
std::string GetTestTempPath(absl::string_view name = "");

// Creates a fresh, uniquely named directory below the test temp path.
// Aborts the test binary on failure.
std::string CreateTestTempDir(absl::string_view prefix);

// Returns the Python 3 interpreter used by end-to-end tests, taken from
// AGENTBOX_TEST_PYTHON or /usr/bin/python3. Empty if neither is executable.
std::string GetTestPython();

// Runs the isolation capability probe once per test binary.
bool NamespacesAvailableForTesting();

}  // namespace agentbox

#endif  // AGENTBOX_TESTING_H_
