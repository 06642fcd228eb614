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

#ifndef AGENTBOX_UTIL_PATH_H_
#define AGENTBOX_UTIL_PATH_H_

#include <initializer_list>
#include <optional>
#include <string>

#include "absl/strings/string_view.h"

namespace agentbox::file {

namespace internal {
// Not part of the public API.
std::string JoinPathImpl(std::initializer_list<absl::string_view> paths);
}  // namespace internal

// Joins path components with "/", dropping empty components.
// Arguments must be convertible to absl::string_view.
template <typename... T>
inline std::string JoinPath(const T&... args) {
  return internal::JoinPathImpl({args...});
}

// Return true if path is absolute.
bool IsAbsolutePath(absl::string_view path);

// Collapses duplicate "/"s, resolves ".." and "." path elements and removes
// trailing "/". Pure string manipulation; ".." above the root of an absolute
// path is dropped.
std::string CleanPath(absl::string_view path);

// Returns true if the cleaned path equals root or lies below it. Compares
// whole components, so "/workspace2" is not within "/workspace".
bool IsWithin(absl::string_view path, absl::string_view root);

// Returns path relative to root ("" for root itself), or std::nullopt if path
// does not lie within root. Both are cleaned first.
std::optional<std::string> RelativeTo(absl::string_view path,
                                      absl::string_view root);

}  // namespace agentbox::file

#endif  // AGENTBOX_UTIL_PATH_H_
