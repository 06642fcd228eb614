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

#include "agentbox/util/path.h"

#include <deque>
#include <optional>
#include <string>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace agentbox::file {
namespace internal {

std::string JoinPathImpl(std::initializer_list<absl::string_view> paths) {
  std::string result;
  for (absl::string_view path : paths) {
    if (path.empty()) {
      continue;
    }
    if (result.empty()) {
      absl::StrAppend(&result, path);
    } else if (absl::EndsWith(result, "/")) {
      absl::StrAppend(&result, absl::StripPrefix(path, "/"));
    } else {
      absl::StrAppend(&result, "/", absl::StripPrefix(path, "/"));
    }
  }
  return result;
}

}  // namespace internal

bool IsAbsolutePath(absl::string_view path) {
  return !path.empty() && path[0] == '/';
}

std::string CleanPath(absl::string_view unclean_path) {
  int dotdot_num = 0;
  std::deque<absl::string_view> parts;
  for (absl::string_view part :
       absl::StrSplit(unclean_path, '/', absl::SkipEmpty())) {
    if (part == "..") {
      if (parts.empty()) {
        ++dotdot_num;
      } else {
        parts.pop_back();
      }
    } else if (part != ".") {
      parts.push_back(part);
    }
  }
  if (IsAbsolutePath(unclean_path)) {
    return absl::StrCat("/", absl::StrJoin(parts, "/"));
  }
  for (; dotdot_num; --dotdot_num) {
    parts.push_front("..");
  }
  return parts.empty() ? "." : absl::StrJoin(parts, "/");
}

bool IsWithin(absl::string_view path, absl::string_view root) {
  return RelativeTo(path, root).has_value();
}

std::optional<std::string> RelativeTo(absl::string_view path,
                                      absl::string_view root) {
  const std::string clean_path = CleanPath(path);
  const std::string clean_root = CleanPath(root);
  if (clean_path == clean_root) {
    return std::string();
  }
  const std::string prefix =
      clean_root == "/" ? clean_root : absl::StrCat(clean_root, "/");
  if (!absl::StartsWith(clean_path, prefix)) {
    return std::nullopt;
  }
  return clean_path.substr(prefix.size());
}

}  // namespace agentbox::file
