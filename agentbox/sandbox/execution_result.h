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

#ifndef AGENTBOX_SANDBOX_EXECUTION_RESULT_H_
#define AGENTBOX_SANDBOX_EXECUTION_RESULT_H_

#include <string>

#include "absl/time/time.h"

namespace agentbox {

// Outcome of running one command through an Isolation. Execution faults
// (non-zero exit, signals, timeouts) are reported here and never as an error
// status.
struct ExecutionResult {
  // Exit status of the command; 128 + signal number if it was killed by a
  // signal; -1 if it was terminated because of the timeout.
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  // Terminating signal, 0 if the command exited normally.
  int signal = 0;
  // Set when stdout or stderr exceeded the configured capture limit.
  bool output_truncated = false;
  absl::Duration wall_time;

  bool ok() const { return exit_code == 0 && !timed_out; }

  std::string ToString() const;
};

}  // namespace agentbox

#endif  // AGENTBOX_SANDBOX_EXECUTION_RESULT_H_
