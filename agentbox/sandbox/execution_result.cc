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

#include "agentbox/sandbox/execution_result.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/time/time.h"

namespace agentbox {

std::string ExecutionResult::ToString() const {
  std::string result =
      timed_out ? std::string("TIMED OUT")
                : absl::StrCat("EXIT ", exit_code,
                               signal != 0 ? absl::StrCat(" (signal ", signal,
                                                          ")")
                                           : "");
  absl::StrAppend(&result, " after ", absl::FormatDuration(wall_time),
                  ", stdout: ", stdout_text.size(),
                  " bytes, stderr: ", stderr_text.size(), " bytes");
  if (output_truncated) {
    absl::StrAppend(&result, " (truncated)");
  }
  return result;
}

}  // namespace agentbox
