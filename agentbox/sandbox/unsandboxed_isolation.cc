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

#include "agentbox/sandbox/unsandboxed_isolation.h"

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "agentbox/gateway/gateway.h"
#include "agentbox/sandbox/process_monitor.h"
#include "agentbox/sandbox/util.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/status_macros.h"
#include "agentbox/util/strerror.h"

namespace agentbox {
namespace {

namespace fileops = ::agentbox::file_util::fileops;

constexpr char kDefaultPath[] = "/usr/local/bin:/usr/bin:/bin";

// Rewrites value if it is a sandbox path backed by a bind mount.
std::string Translate(const Mounts& mounts, const std::string& value) {
  if (!file::IsAbsolutePath(value)) {
    return value;
  }
  absl::StatusOr<std::string> host = mounts.ResolvePath(value);
  return host.ok() ? *std::move(host) : value;
}

std::vector<std::string> TranslateEnv(const Mounts& mounts,
                                      const std::vector<std::string>& env) {
  std::vector<std::string> result;
  result.reserve(env.size());
  for (const std::string& var : env) {
    if (absl::StartsWith(var, "PATH=") || !absl::StrContains(var, '=')) {
      result.push_back(var);
      continue;
    }
    std::pair<std::string, std::string> kv =
        absl::StrSplit(var, absl::MaxSplits('=', 1));
    result.push_back(absl::StrCat(kv.first, "=", Translate(mounts, kv.second)));
  }
  return result;
}

std::vector<std::string> ExecCandidates(const std::string& argv0,
                                        const std::vector<std::string>& env) {
  if (absl::StrContains(argv0, '/')) {
    return {argv0};
  }
  absl::string_view search_path = kDefaultPath;
  for (const std::string& var : env) {
    if (absl::StartsWith(var, "PATH=")) {
      search_path = absl::string_view(var).substr(5);
    }
  }
  std::vector<std::string> candidates;
  for (absl::string_view dir : absl::StrSplit(search_path, ':')) {
    if (!dir.empty()) {
      candidates.push_back(file::JoinPath(dir, argv0));
    }
  }
  return candidates;
}

}  // namespace

absl::StatusOr<std::string> UnsandboxedIsolation::PathForSandboxee(
    const Mounts& mounts, absl::string_view inside) const {
  return mounts.ResolvePath(inside);
}

absl::StatusOr<ExecutionResult> UnsandboxedIsolation::Run(
    const Command& command, const Mounts& mounts, const RunOptions& options) {
  if (command.argv.empty()) {
    return absl::InvalidArgumentError("Empty command");
  }
  LOG_FIRST_N(WARNING, 1)
      << "Running commands WITHOUT isolation; do not use in production";

  std::string working_dir = "/";
  if (!command.working_dir.empty() && command.working_dir != "/") {
    absl::StatusOr<std::string> resolved =
        mounts.ResolvePath(command.working_dir);
    if (!resolved.ok()) {
      return absl::FailedPreconditionError(
          absl::StrCat("Working directory is not backed by a host path: ",
                       command.working_dir));
    }
    working_dir = *std::move(resolved);
  }

  std::vector<std::string> argv;
  argv.reserve(command.argv.size());
  for (const std::string& arg : command.argv) {
    argv.push_back(Translate(mounts, arg));
  }
  std::vector<std::string> env = TranslateEnv(mounts, command.env);
  std::unique_ptr<GatewayListener> listener;
  if (options.gateway != nullptr) {
    AGENTBOX_ASSIGN_OR_RETURN(listener, options.gateway->ListenOnLoopback());
    for (const char* var : {"HTTP_PROXY", "HTTPS_PROXY", "http_proxy",
                            "https_proxy"}) {
      env.push_back(absl::StrCat(var, "=", listener->ProxyUrl()));
    }
  }
  const std::vector<std::string> candidates = ExecCandidates(argv[0], env);
  util::CharPtrArray argv_array(argv);
  util::CharPtrArray envp_array(env);

  int stdout_pipe[2];
  int stderr_pipe[2];
  int status_pair[2];
  if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
    return absl::ErrnoToStatus(errno, "pipe2()");
  }
  fileops::FDCloser stdout_read(stdout_pipe[0]);
  fileops::FDCloser stdout_write(stdout_pipe[1]);
  if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
    return absl::ErrnoToStatus(errno, "pipe2()");
  }
  fileops::FDCloser stderr_read(stderr_pipe[0]);
  fileops::FDCloser stderr_write(stderr_pipe[1]);
  if (socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, status_pair) ==
      -1) {
    return absl::ErrnoToStatus(errno, "socketpair()");
  }
  fileops::FDCloser status_parent(status_pair[0]);
  fileops::FDCloser status_child(status_pair[1]);
  fileops::FDCloser dev_null(
      TEMP_FAILURE_RETRY(open("/dev/null", O_RDONLY | O_CLOEXEC)));
  if (dev_null.get() == -1) {
    return absl::ErrnoToStatus(errno, "open(/dev/null)");
  }

  const absl::Time start = absl::Now();
  const pid_t pid = fork();
  if (pid == -1) {
    return absl::ErrnoToStatus(errno, "fork()");
  }
  if (pid == 0) {
    setpgid(0, 0);
    char message[512];
    char errno_buf[100];
    if (dup2(dev_null.get(), STDIN_FILENO) == -1 ||
        dup2(stdout_write.get(), STDOUT_FILENO) == -1 ||
        dup2(stderr_write.get(), STDERR_FILENO) == -1 ||
        chdir(working_dir.c_str()) == -1 ||
        !util::ApplyLimits(options.limits)) {
      absl::SNPrintF(message, sizeof(message), "child setup: %s",
                     RawStrError(errno, errno_buf, sizeof(errno_buf)));
      util::SendStatusMessage(status_child.get(), util::kStatusSetupFailed,
                              message);
      _exit(1);
    }
    int exec_errno = ENOENT;
    for (const std::string& candidate : candidates) {
      execve(candidate.c_str(), argv_array.data(), envp_array.data());
      if (errno != ENOENT) {
        exec_errno = errno;
      }
    }
    absl::SNPrintF(message, sizeof(message), "%s: %s", argv[0],
                   RawStrError(exec_errno, errno_buf, sizeof(errno_buf)));
    util::SendStatusMessage(status_child.get(), util::kStatusExecFailed,
                            message);
    _exit(127);
  }
  // Either this or the child's own call wins; both set the same group.
  setpgid(pid, pid);

  stdout_write.Close();
  stderr_write.Close();
  status_child.Close();
  dev_null.Close();

  ProcessMonitor monitor(pid, std::move(stdout_read), std::move(stderr_read),
                         options.max_output_bytes);
  const absl::Time deadline = start + options.timeout;
  std::string exec_error;
  for (;;) {
    absl::StatusOr<util::StatusMessage> message =
        util::ReceiveStatusMessage(status_parent.get(), deadline);
    if (!message.ok()) {
      // Still not exec'd at the deadline; the monitor kills it.
      if (absl::IsDeadlineExceeded(message.status())) {
        break;
      }
      monitor.Abort();
      return message.status();
    }
    if (message->tag == 0) {
      break;
    }
    if (message->tag == util::kStatusSetupFailed) {
      monitor.Abort();
      return absl::InternalError(
          absl::StrCat("Process setup failed: ", message->text));
    }
    exec_error = message->text;
  }

  AGENTBOX_ASSIGN_OR_RETURN(ExecutionResult result,
                            monitor.Wait(start, deadline));
  if (!exec_error.empty()) {
    result.stderr_text =
        absl::StrCat("agentbox: cannot execute ", exec_error, "\n",
                     result.stderr_text);
  }
  return result;
}

}  // namespace agentbox
