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

#include "agentbox/sandbox/process_monitor.h"

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace agentbox {
namespace {

// Upper bound on a single poll() so the child's state is rechecked regularly.
constexpr absl::Duration kPollSlice = absl::Milliseconds(50);
// How long output is still collected after the command itself exited, for
// descendants that escaped the process group.
constexpr absl::Duration kDrainGrace = absl::Milliseconds(200);

}  // namespace

ProcessMonitor::ProcessMonitor(pid_t pid, file_util::fileops::FDCloser stdout_fd,
                               file_util::fileops::FDCloser stderr_fd,
                               size_t max_output)
    : pid_(pid), max_output_(max_output) {
  fds_[0] = std::move(stdout_fd);
  fds_[1] = std::move(stderr_fd);
  buffers_[0] = &result_.stdout_text;
  buffers_[1] = &result_.stderr_text;
}

void ProcessMonitor::KillGroup() {
  // The sandboxee called setsid(), so its pid is also its process group id.
  kill(-pid_, SIGKILL);
  kill(pid_, SIGKILL);
}

void ProcessMonitor::Abort() {
  KillGroup();
  int status;
  TEMP_FAILURE_RETRY(waitpid(pid_, &status, __WALL));
}

bool ProcessMonitor::Drain(int fd_index) {
  char buffer[16 * 1024];
  ssize_t n = TEMP_FAILURE_RETRY(read(fds_[fd_index].get(), buffer,
                                      sizeof(buffer)));
  if (n <= 0) {
    fds_[fd_index].Close();
    return false;
  }
  std::string* out = buffers_[fd_index];
  const size_t room = out->size() < max_output_ ? max_output_ - out->size() : 0;
  out->append(buffer, std::min<size_t>(room, n));
  if (static_cast<size_t>(n) > room) {
    result_.output_truncated = true;
  }
  return true;
}

absl::StatusOr<ExecutionResult> ProcessMonitor::Wait(absl::Time start,
                                                     absl::Time deadline) {
  bool exited = false;
  int status = 0;
  absl::Time drain_deadline = absl::InfiniteFuture();

  for (;;) {
    if (!exited) {
      pid_t ret = TEMP_FAILURE_RETRY(waitpid(pid_, &status, WNOHANG | __WALL));
      if (ret == -1) {
        return absl::ErrnoToStatus(errno, absl::StrCat("waitpid(", pid_, ")"));
      }
      if (ret == pid_) {
        exited = true;
        // Background children of the command die with it.
        kill(-pid_, SIGKILL);
        drain_deadline = absl::Now() + kDrainGrace;
      }
    }
    const absl::Time now = absl::Now();
    if (!exited && now >= deadline) {
      VLOG(1) << "Deadline expired, killing process group " << pid_;
      result_.timed_out = true;
      KillGroup();
      if (TEMP_FAILURE_RETRY(waitpid(pid_, &status, __WALL)) == -1) {
        return absl::ErrnoToStatus(errno, absl::StrCat("waitpid(", pid_, ")"));
      }
      exited = true;
      drain_deadline = absl::Now() + kDrainGrace;
    }
    if (fds_[0].get() == -1 && fds_[1].get() == -1) {
      if (exited) {
        break;
      }
    } else if (exited && now >= drain_deadline) {
      break;
    }

    pollfd pfds[2] = {{fds_[0].get(), POLLIN, 0}, {fds_[1].get(), POLLIN, 0}};
    const absl::Time wake = std::min({now + kPollSlice, deadline,
                                      drain_deadline});
    const int timeout_ms = static_cast<int>(
        absl::ToInt64Milliseconds(std::max(wake - now, absl::ZeroDuration())));
    int ret = poll(pfds, 2, timeout_ms);
    if (ret == -1 && errno != EINTR) {
      return absl::ErrnoToStatus(errno, "poll()");
    }
    for (int i = 0; i < 2; ++i) {
      if (pfds[i].fd != -1 && pfds[i].revents != 0) {
        Drain(i);
      }
    }
  }

  result_.wall_time = absl::Now() - start;
  if (result_.timed_out) {
    result_.exit_code = -1;
  } else if (WIFSIGNALED(status)) {
    result_.signal = WTERMSIG(status);
    result_.exit_code = 128 + result_.signal;
  } else {
    result_.exit_code = WEXITSTATUS(status);
  }
  if (result_.output_truncated) {
    for (std::string* out : buffers_) {
      if (out->size() >= max_output_) {
        absl::StrAppend(out, "\n[output truncated after ", max_output_,
                        " bytes]\n");
      }
    }
  }
  return std::move(result_);
}

}  // namespace agentbox
