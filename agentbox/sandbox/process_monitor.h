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

#ifndef AGENTBOX_SANDBOX_PROCESS_MONITOR_H_
#define AGENTBOX_SANDBOX_PROCESS_MONITOR_H_

#include <sys/types.h>

#include <cstddef>
#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/util/fileops.h"

namespace agentbox {

// Waits for a started sandboxee while collecting its stdout and stderr.
// pid must lead its own process group. On expiry of the deadline the whole
// group is killed with SIGKILL.
class ProcessMonitor {
 public:
  ProcessMonitor(pid_t pid, file_util::fileops::FDCloser stdout_fd,
                 file_util::fileops::FDCloser stderr_fd, size_t max_output);

  ProcessMonitor(const ProcessMonitor&) = delete;
  ProcessMonitor& operator=(const ProcessMonitor&) = delete;

  // Blocks until the process has exited and been reaped.
  absl::StatusOr<ExecutionResult> Wait(absl::Time start, absl::Time deadline);

  // Kills and reaps the process without collecting output. Used when setup
  // fails after the child was created.
  void Abort();

 private:
  // Reads what is available from fd_index. Returns false on EOF or error.
  bool Drain(int fd_index);
  void KillGroup();

  const pid_t pid_;
  file_util::fileops::FDCloser fds_[2];
  std::string* buffers_[2];
  const size_t max_output_;
  ExecutionResult result_;
};

}  // namespace agentbox

#endif  // AGENTBOX_SANDBOX_PROCESS_MONITOR_H_
