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

#include "agentbox/capability/capability_registry.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "agentbox/session/session.h"
#include "agentbox/util/file_helpers.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {
namespace {

namespace fileops = ::agentbox::file_util::fileops;

constexpr char kSkillFile[] = "SKILL.md";
constexpr char kScriptsDir[] = "scripts";

// Lists regular files below dir, recursively, as paths relative to dir.
void ListScripts(const std::string& dir, const std::string& prefix,
                 std::vector<std::string>* scripts) {
  std::vector<std::string> entries;
  std::string error;
  if (!fileops::ListDirectoryEntries(file::JoinPath(dir, prefix), &entries,
                                     &error)) {
    LOG(WARNING) << "Cannot list " << file::JoinPath(dir, prefix) << ": "
                 << error;
    return;
  }
  for (const std::string& entry : entries) {
    const std::string relative =
        prefix.empty() ? entry : file::JoinPath(prefix, entry);
    const std::string full = file::JoinPath(dir, relative);
    if (fileops::IsDirectory(full)) {
      ListScripts(dir, relative, scripts);
    } else {
      scripts->push_back(relative);
    }
  }
}

absl::StatusOr<Capability> LoadCapability(const std::string& dir) {
  std::string skill;
  AGENTBOX_RETURN_IF_ERROR(
      file::GetContents(file::JoinPath(dir, kSkillFile), &skill));
  std::map<std::string, std::string> front_matter = ParseFrontMatter(skill);

  Capability capability;
  capability.root = dir;
  capability.name = front_matter.count("name") ? front_matter["name"]
                                               : fileops::Basename(dir);
  capability.description = front_matter["description"];
  AGENTBOX_RETURN_IF_ERROR(ValidateSessionId("capability name",
                                             capability.name));
  const std::string scripts_dir = file::JoinPath(dir, kScriptsDir);
  if (fileops::IsDirectory(scripts_dir)) {
    capability.scripts_dir = scripts_dir;
    ListScripts(scripts_dir, "", &capability.scripts);
    std::sort(capability.scripts.begin(), capability.scripts.end());
  }
  return capability;
}

}  // namespace

std::map<std::string, std::string> ParseFrontMatter(absl::string_view text) {
  std::map<std::string, std::string> result;
  std::vector<absl::string_view> lines = absl::StrSplit(text, '\n');
  if (lines.empty() || absl::StripAsciiWhitespace(lines[0]) != "---") {
    return result;
  }
  for (size_t i = 1; i < lines.size(); ++i) {
    absl::string_view line = absl::StripAsciiWhitespace(lines[i]);
    if (line == "---") {
      break;
    }
    std::pair<absl::string_view, absl::string_view> kv =
        absl::StrSplit(line, absl::MaxSplits(':', 1));
    absl::string_view key = absl::StripAsciiWhitespace(kv.first);
    absl::string_view value = absl::StripAsciiWhitespace(kv.second);
    if (key.empty() || absl::StartsWith(key, "#")) {
      continue;
    }
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    result[absl::AsciiStrToLower(key)] = std::string(value);
  }
  return result;
}

absl::StatusOr<CapabilityRegistry> CapabilityRegistry::Discover(
    const std::vector<std::string>& roots) {
  CapabilityRegistry registry;
  for (const std::string& root : roots) {
    std::vector<std::string> entries;
    std::string error;
    if (!fileops::ListDirectoryEntries(root, &entries, &error)) {
      return absl::NotFoundError(
          absl::StrCat("Capability root ", root, ": ", error));
    }
    std::sort(entries.begin(), entries.end());
    for (const std::string& entry : entries) {
      const std::string dir = file::JoinPath(root, entry);
      if (!fileops::IsDirectory(dir) ||
          !fileops::Exists(file::JoinPath(dir, kSkillFile), true)) {
        continue;
      }
      absl::StatusOr<Capability> capability = LoadCapability(dir);
      if (!capability.ok()) {
        LOG(WARNING) << "Skipping capability " << dir << ": "
                     << capability.status();
        continue;
      }
      if (registry.capabilities_.count(capability->name)) {
        LOG(WARNING) << "Capability " << capability->name << " in " << dir
                     << " shadowed by "
                     << registry.capabilities_[capability->name].root;
        continue;
      }
      VLOG(1) << "Found capability " << capability->name << " ("
              << capability->scripts.size() << " scripts)";
      std::string name = capability->name;
      registry.capabilities_.emplace(std::move(name), *std::move(capability));
    }
  }
  return registry;
}

absl::StatusOr<const Capability*> CapabilityRegistry::Find(
    absl::string_view name) const {
  auto it = capabilities_.find(name);
  if (it == capabilities_.end()) {
    return absl::NotFoundError(absl::StrCat("Unknown capability: ", name));
  }
  return &it->second;
}

std::vector<const Capability*> CapabilityRegistry::List() const {
  std::vector<const Capability*> result;
  result.reserve(capabilities_.size());
  for (const auto& [name, capability] : capabilities_) {
    result.push_back(&capability);
  }
  return result;
}

std::string CapabilityRegistry::MountPointFor(absl::string_view name) {
  return file::JoinPath(kMountRoot, name, kScriptsDir);
}

std::vector<BindMount> CapabilityRegistry::GetBindMounts() const {
  std::vector<BindMount> mounts;
  for (const auto& [name, capability] : capabilities_) {
    if (!capability.scripts_dir.empty()) {
      mounts.push_back(
          {capability.scripts_dir, MountPointFor(name), /*read_only=*/true});
    }
  }
  return mounts;
}

absl::StatusOr<Command> CapabilityRegistry::BuildInvocation(
    absl::string_view capability_name, absl::string_view script,
    const std::vector<std::string>& args, absl::string_view python) const {
  AGENTBOX_ASSIGN_OR_RETURN(const Capability* capability,
                            Find(capability_name));
  if (script.empty() || file::IsAbsolutePath(script) ||
      file::CleanPath(script) != script) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid script name: ", script));
  }
  for (absl::string_view component : absl::StrSplit(script, '/')) {
    if (component == "..") {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid script name: ", script));
    }
  }
  if (std::find(capability->scripts.begin(), capability->scripts.end(),
                script) == capability->scripts.end()) {
    return absl::NotFoundError(absl::StrCat("Capability ", capability->name,
                                            " has no script ", script));
  }

  const std::string path =
      file::JoinPath(MountPointFor(capability->name), script);
  Command command;
  if (absl::EndsWith(script, ".py")) {
    command.argv = {std::string(python), path};
  } else if (absl::EndsWith(script, ".sh")) {
    command.argv = {"/bin/bash", path};
  } else {
    command.argv = {path};
  }
  command.argv.insert(command.argv.end(), args.begin(), args.end());
  command.env = {
      "PATH=/usr/local/bin:/usr/bin:/bin",
      absl::StrCat("HOME=", kWorkspaceMountPoint),
      "LANG=C.UTF-8",
      absl::StrCat("CAPABILITY_DIR=", MountPointFor(capability->name)),
  };
  command.working_dir = kWorkspaceMountPoint;
  return command;
}

}  // namespace agentbox
