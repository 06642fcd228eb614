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

#ifndef AGENTBOX_UTIL_FILE_HELPERS_H_
#define AGENTBOX_UTIL_FILE_HELPERS_H_

#include <sys/types.h>

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace agentbox::file {

// Reads the whole file into *output. Returns NotFound if path does not exist.
absl::Status GetContents(absl::string_view path, std::string* output);

// Replaces the contents of path, creating it with mode if needed.
absl::Status SetContents(absl::string_view path, absl::string_view content,
                         mode_t mode = 0644);

// Like SetContents(), but writes to a sibling temporary file, flushes it and
// renames it over path, so readers observe either the old or the new contents.
absl::Status SetContentsAtomically(absl::string_view path,
                                   absl::string_view content,
                                   mode_t mode = 0644);

}  // namespace agentbox::file

#endif  // AGENTBOX_UTIL_FILE_HELPERS_H_
