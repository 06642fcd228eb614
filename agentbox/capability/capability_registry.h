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

#ifndef AGENTBOX_CAPABILITY_CAPABILITY_REGISTRY_H_
#define AGENTBOX_CAPABILITY_CAPABILITY_REGISTRY_H_

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "agentbox/sandbox/isolation.h"
#include "agentbox/sandbox/mounts.h"

namespace agentbox {

// A developer-authored script library. On disk it is a directory holding a
// SKILL.md description and a scripts/ directory; inside sandboxes the scripts
// appear read-only at /capabilities/<name>/scripts.
struct Capability {
  std::string name;
  std::string description;
  // Host directory of the capability.
  std::string root;
  // Host path of scripts/; empty if the capability has no scripts.
  std::string scripts_dir;
  // Script names relative to scripts/, sorted.
  std::vector<std::string> scripts;
};

// Parses the YAML-style front matter of a SKILL.md file:
//   ---
//   name: my-capability
//   description: What it does.
//   ---
// Only flat "key: value" lines are understood. Keys are lower-cased.
std::map<std::string, std::string> ParseFrontMatter(absl::string_view text);

class CapabilityRegistry {
 public:
  static constexpr char kMountRoot[] = "/capabilities";

  CapabilityRegistry() = default;

  // Scans every root for capability directories. A missing root is an error;
  // malformed capabilities are skipped with a warning. When two roots define
  // the same name the first root wins.
  static absl::StatusOr<CapabilityRegistry> Discover(
      const std::vector<std::string>& roots);

  // Returns NotFound for unknown names.
  absl::StatusOr<const Capability*> Find(absl::string_view name) const;

  // All capabilities, sorted by name.
  std::vector<const Capability*> List() const;

  // Read-only mounts of every capability's scripts.
  std::vector<BindMount> GetBindMounts() const;

  // Builds the command that runs capability/script with args inside a
  // sandbox. .py scripts run through python, .sh scripts through /bin/bash,
  // anything else is executed directly. Script names must stay within the
  // capability's scripts directory.
  absl::StatusOr<Command> BuildInvocation(absl::string_view capability,
                                          absl::string_view script,
                                          const std::vector<std::string>& args,
                                          absl::string_view python) const;

  static std::string MountPointFor(absl::string_view name);

  bool empty() const { return capabilities_.empty(); }

 private:
  std::map<std::string, Capability, std::less<>> capabilities_;
};

}  // namespace agentbox

#endif  // AGENTBOX_CAPABILITY_CAPABILITY_REGISTRY_H_
