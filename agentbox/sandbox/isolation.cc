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

#include "agentbox/sandbox/isolation.h"

#include <memory>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "agentbox/sandbox/namespace_isolation.h"
#include "agentbox/sandbox/unsandboxed_isolation.h"

namespace agentbox {

bool AbslParseFlag(absl::string_view text, IsolationMode* mode,
                   std::string* error) {
  const std::string value = absl::AsciiStrToLower(text);
  if (value == "auto") {
    *mode = IsolationMode::kAuto;
  } else if (value == "namespaces") {
    *mode = IsolationMode::kNamespaces;
  } else if (value == "none") {
    *mode = IsolationMode::kNone;
  } else {
    *error = absl::StrCat("unknown isolation mode '", text,
                          "', expected one of: auto, namespaces, none");
    return false;
  }
  return true;
}

std::string AbslUnparseFlag(IsolationMode mode) {
  switch (mode) {
    case IsolationMode::kAuto:
      return "auto";
    case IsolationMode::kNamespaces:
      return "namespaces";
    case IsolationMode::kNone:
      return "none";
  }
  return "auto";
}

absl::StatusOr<std::unique_ptr<Isolation>> CreateIsolation(IsolationMode mode) {
  switch (mode) {
    case IsolationMode::kNamespaces:
      if (!NamespaceIsolation::IsSupported()) {
        return absl::FailedPreconditionError(
            "Namespace isolation is not available on this host (are "
            "unprivileged user namespaces enabled?)");
      }
      return std::make_unique<NamespaceIsolation>();
    case IsolationMode::kAuto:
      if (NamespaceIsolation::IsSupported()) {
        return std::make_unique<NamespaceIsolation>();
      }
      LOG(WARNING) << "Namespace isolation is not available on this host; "
                      "falling back to UNSANDBOXED execution";
      return std::make_unique<UnsandboxedIsolation>();
    case IsolationMode::kNone:
      LOG(WARNING) << "Isolation disabled; commands run UNSANDBOXED";
      return std::make_unique<UnsandboxedIsolation>();
  }
  return absl::InvalidArgumentError("Unknown isolation mode");
}

}  // namespace agentbox
