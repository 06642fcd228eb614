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

#include "agentbox/sandbox/namespace_isolation.h"

#include <fcntl.h>
#include <linux/close_range.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sched.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
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
#include "agentbox/util/raw_logging.h"
#include "agentbox/util/status_macros.h"
#include "agentbox/util/strerror.h"

namespace agentbox {
namespace {

namespace fileops = ::agentbox::file_util::fileops;

// User and group id of the sandboxee inside its user namespace.
constexpr int kSandboxeeId = 1000;
constexpr char kDefaultPath[] = "/usr/local/bin:/usr/bin:/bin";
constexpr char kRootTmpfsOptions[] = "mode=0755,size=16m";

constexpr const char* kDeviceNodes[] = {"null", "zero", "full", "random",
                                        "urandom"};
constexpr std::pair<const char*, const char*> kDeviceLinks[] = {
    {"fd", "/proc/self/fd"},
    {"stdin", "/proc/self/fd/0"},
    {"stdout", "/proc/self/fd/1"},
    {"stderr", "/proc/self/fd/2"},
};

// One filesystem operation performed by the child while building the root.
struct MountStep {
  enum Kind { kBind, kTmpfs, kSymlink, kProc, kProcBind };

  Kind kind;
  // Bind source or link target.
  std::string source;
  // Absolute host path below the root mount point.
  std::string target;
  // Directory that has to exist before target can be created.
  std::string target_parent;
  bool is_file = false;
  bool read_only = false;
  // Flags for the read-only remount of a bind, including the flags the
  // kernel locks on the source mount.
  unsigned long remount_flags = 0;
  std::string data;
};

// Everything the child needs, prepared before clone() so that the child
// never allocates.
struct ChildPlan {
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  int status_fd = -1;

  std::string setgroups = "deny";
  std::string uid_map;
  std::string gid_map;
  std::string root;
  std::vector<MountStep> steps;
  bool isolate_network = false;
  bool create_gateway_listener = false;
  std::string hostname;
  std::string working_dir;
  std::string argv0;
  std::vector<std::string> exec_candidates;
  std::unique_ptr<util::CharPtrArray> argv;
  std::unique_ptr<util::CharPtrArray> envp;
  int max_fd = 1024;
  Limits limits;
};

unsigned long GetMountFlagsFor(const std::string& path) {
  struct statvfs vfs;
  if (TEMP_FAILURE_RETRY(statvfs(path.c_str(), &vfs)) == -1) {
    PLOG(WARNING) << "statvfs(" << path << ")";
    return 0;
  }
  static constexpr std::pair<unsigned long, unsigned long> kFlagMap[] = {
      {ST_NOSUID, MS_NOSUID},   {ST_NODEV, MS_NODEV},
      {ST_NOEXEC, MS_NOEXEC},   {ST_NOATIME, MS_NOATIME},
      {ST_NODIRATIME, MS_NODIRATIME}, {ST_RELATIME, MS_RELATIME},
  };
  unsigned long flags = 0;
  for (const auto& [vfs_flag, mount_flag] : kFlagMap) {
    if (vfs.f_flag & vfs_flag) {
      flags |= mount_flag;
    }
  }
  return flags;
}

MountStep MakeStep(MountStep::Kind kind, absl::string_view root,
                   absl::string_view inside) {
  MountStep step;
  step.kind = kind;
  step.target = absl::StrCat(root, inside);
  step.target_parent = fileops::StripBasename(step.target);
  return step;
}

MountStep MakeBindStep(absl::string_view root, absl::string_view inside,
                       const std::string& source, bool is_file,
                       bool read_only) {
  MountStep step = MakeStep(MountStep::kBind, root, inside);
  step.source = source;
  step.is_file = is_file;
  step.read_only = read_only;
  if (read_only) {
    step.remount_flags = MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID |
                         GetMountFlagsFor(source);
  }
  return step;
}

std::vector<MountStep> BuildMountSteps(const Mounts& mounts,
                                       absl::string_view root,
                                       bool isolate_pid) {
  std::vector<MountStep> steps;
  for (const Mounts::Entry& entry : mounts.SortedEntries()) {
    switch (entry.type) {
      case Mounts::EntryType::kDirectory:
      case Mounts::EntryType::kFile:
        steps.push_back(MakeBindStep(root, entry.inside, entry.outside,
                                     entry.type == Mounts::EntryType::kFile,
                                     entry.read_only));
        break;
      case Mounts::EntryType::kTmpfs: {
        MountStep step = MakeStep(MountStep::kTmpfs, root, entry.inside);
        step.data = entry.tmpfs_size > 0
                        ? absl::StrCat("mode=1777,size=", entry.tmpfs_size)
                        : "mode=1777";
        steps.push_back(std::move(step));
        break;
      }
      case Mounts::EntryType::kSymlink: {
        MountStep step = MakeStep(MountStep::kSymlink, root, entry.inside);
        step.source = entry.outside;
        steps.push_back(std::move(step));
        break;
      }
    }
  }

  for (const char* node : kDeviceNodes) {
    const std::string source = absl::StrCat("/dev/", node);
    if (!fileops::Exists(source, /*fully_resolve=*/true)) {
      continue;
    }
    steps.push_back(MakeBindStep(root, source, source, /*is_file=*/true,
                                 /*read_only=*/false));
  }
  MountStep shm = MakeStep(MountStep::kTmpfs, root, "/dev/shm");
  shm.data = "mode=1777";
  steps.push_back(std::move(shm));
  for (const auto& [name, link] : kDeviceLinks) {
    MountStep step =
        MakeStep(MountStep::kSymlink, root, absl::StrCat("/dev/", name));
    step.source = link;
    steps.push_back(std::move(step));
  }

  MountStep proc = MakeStep(isolate_pid ? MountStep::kProc
                                        : MountStep::kProcBind,
                            root, "/proc");
  proc.source = "/proc";
  steps.push_back(std::move(proc));
  return steps;
}

std::vector<std::string> ExecCandidates(const Command& command) {
  const std::string& argv0 = command.argv.front();
  if (absl::StrContains(argv0, '/')) {
    return {argv0};
  }
  absl::string_view search_path = kDefaultPath;
  for (const std::string& var : command.env) {
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

int MaxFdForChild() {
  struct rlimit64 rlim;
  if (getrlimit64(RLIMIT_NOFILE, &rlim) == -1 ||
      rlim.rlim_cur == RLIM64_INFINITY) {
    return 1 << 16;
  }
  return static_cast<int>(std::min<rlim64_t>(rlim.rlim_cur, 1 << 20));
}

// Child-side helpers. Everything below runs between clone() and execve() and
// must not allocate memory or take locks.

[[noreturn]] void ReportAndExit(const ChildPlan& plan, char tag,
                                const char* what, int exit_code) {
  const int saved_errno = errno;
  char errno_buf[100];
  char message[512];
  absl::SNPrintF(message, sizeof(message), "%s: %s", what,
                 RawStrError(saved_errno, errno_buf, sizeof(errno_buf)));
  AGENTBOX_RAW_VLOG(1, "Sandbox child: %s", message);
  util::SendStatusMessage(plan.status_fd, tag, message);
  _exit(exit_code);
}

[[noreturn]] void SetupFailed(const ChildPlan& plan, const char* what) {
  ReportAndExit(plan, util::kStatusSetupFailed, what, 1);
}

void CreateMountPoint(const ChildPlan& plan, const MountStep& step) {
  if (!util::CreateDirRecursive(step.target_parent.c_str(), 0755)) {
    SetupFailed(plan, step.target_parent.c_str());
  }
  if (step.kind == MountStep::kSymlink) {
    return;
  }
  if (!step.is_file) {
    if (mkdir(step.target.c_str(), 0755) == -1 && errno != EEXIST) {
      SetupFailed(plan, step.target.c_str());
    }
    return;
  }
  int fd = TEMP_FAILURE_RETRY(
      open(step.target.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644));
  if (fd == -1) {
    SetupFailed(plan, step.target.c_str());
  }
  close(fd);
}

void PerformMountStep(const ChildPlan& plan, const MountStep& step) {
  CreateMountPoint(plan, step);
  switch (step.kind) {
    case MountStep::kBind:
      if (mount(step.source.c_str(), step.target.c_str(), nullptr,
                MS_BIND | MS_REC, nullptr) == -1) {
        SetupFailed(plan, step.source.c_str());
      }
      if (step.read_only && mount("", step.target.c_str(), nullptr,
                                  step.remount_flags, nullptr) == -1) {
        SetupFailed(plan, step.target.c_str());
      }
      break;
    case MountStep::kTmpfs:
      if (mount("tmpfs", step.target.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                step.data.c_str()) == -1) {
        SetupFailed(plan, step.target.c_str());
      }
      break;
    case MountStep::kSymlink:
      if (symlink(step.source.c_str(), step.target.c_str()) == -1 &&
          errno != EEXIST) {
        SetupFailed(plan, step.target.c_str());
      }
      break;
    case MountStep::kProc:
      // Fails where the host /proc has masked parts, e.g. in some containers.
      // Python and the shell work without it.
      if (mount("proc", step.target.c_str(), "proc",
                MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) == -1) {
        AGENTBOX_RAW_PLOG(WARNING, "Could not mount a fresh /proc");
      }
      break;
    case MountStep::kProcBind:
      if (mount(step.source.c_str(), step.target.c_str(), nullptr,
                MS_BIND | MS_REC, nullptr) == -1) {
        SetupFailed(plan, "/proc");
      }
      break;
  }
}

void BringUpLoopback(const ChildPlan& plan) {
  int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd == -1) {
    SetupFailed(plan, "socket(AF_INET)");
  }
  ifreq ifr{};
  strncpy(ifr.ifr_name, "lo", IFNAMSIZ - 1);
  if (ioctl(fd, SIOCGIFFLAGS, &ifr) == -1) {
    SetupFailed(plan, "ioctl(SIOCGIFFLAGS)");
  }
  ifr.ifr_flags |= IFF_UP | IFF_RUNNING;
  if (ioctl(fd, SIOCSIFFLAGS, &ifr) == -1) {
    SetupFailed(plan, "ioctl(SIOCSIFFLAGS)");
  }
  close(fd);
}

// Creates the gateway's listening socket inside the network namespace and
// hands it to the host over the status channel.
void SendGatewayListener(const ChildPlan& plan) {
  int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd == -1) {
    SetupFailed(plan, "socket(AF_INET)");
  }
  int one = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(kGatewayPort);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
    SetupFailed(plan, "bind(gateway)");
  }
  if (listen(fd, SOMAXCONN) == -1) {
    SetupFailed(plan, "listen(gateway)");
  }
  if (!util::SendStatusMessage(plan.status_fd, util::kStatusGatewayListener,
                               nullptr, fd)) {
    SetupFailed(plan, "sending gateway listener");
  }
  close(fd);
}

[[noreturn]] void RunChild(const ChildPlan& plan) {
  if (dup2(plan.stdin_fd, STDIN_FILENO) == -1 ||
      dup2(plan.stdout_fd, STDOUT_FILENO) == -1 ||
      dup2(plan.stderr_fd, STDERR_FILENO) == -1) {
    SetupFailed(plan, "dup2()");
  }
  if (syscall(SYS_close_range, 3, ~0U, CLOSE_RANGE_CLOEXEC) == -1) {
    for (int fd = 3; fd < plan.max_fd; ++fd) {
      fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
  }

  if (!util::WriteStringToFile("/proc/self/setgroups",
                               plan.setgroups.c_str())) {
    SetupFailed(plan, "/proc/self/setgroups");
  }
  if (!util::WriteStringToFile("/proc/self/uid_map", plan.uid_map.c_str())) {
    SetupFailed(plan, "/proc/self/uid_map");
  }
  if (!util::WriteStringToFile("/proc/self/gid_map", plan.gid_map.c_str())) {
    SetupFailed(plan, "/proc/self/gid_map");
  }

  // Keep our mounts from propagating back to the host.
  if (mount("", "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1) {
    SetupFailed(plan, "making / private");
  }
  const char* root = plan.root.c_str();
  if (mount("tmpfs", root, "tmpfs", MS_NOSUID | MS_NODEV,
            kRootTmpfsOptions) == -1) {
    SetupFailed(plan, root);
  }
  for (const MountStep& step : plan.steps) {
    PerformMountStep(plan, step);
  }
  if (mount("", root, nullptr, MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV,
            nullptr) == -1) {
    SetupFailed(plan, "remounting the root read-only");
  }

  if (chdir(root) == -1) {
    SetupFailed(plan, root);
  }
  if (syscall(SYS_pivot_root, ".", ".") == -1) {
    SetupFailed(plan, "pivot_root()");
  }
  if (umount2(".", MNT_DETACH) == -1) {
    SetupFailed(plan, "detaching the old root");
  }
  if (chdir("/") == -1) {
    SetupFailed(plan, "chdir(/)");
  }

  if (sethostname(plan.hostname.data(), plan.hostname.size()) == -1) {
    SetupFailed(plan, "sethostname()");
  }
  if (plan.isolate_network) {
    BringUpLoopback(plan);
  }
  if (plan.create_gateway_listener) {
    SendGatewayListener(plan);
  }

  if (chdir(plan.working_dir.c_str()) == -1) {
    ReportAndExit(plan, util::kStatusExecFailed, plan.working_dir.c_str(),
                  127);
  }
  if (setsid() == -1) {
    SetupFailed(plan, "setsid()");
  }
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) {
    SetupFailed(plan, "prctl(PR_SET_PDEATHSIG)");
  }
  if (!util::ApplyLimits(plan.limits)) {
    SetupFailed(plan, "setrlimit()");
  }

  int exec_errno = ENOENT;
  for (const std::string& candidate : plan.exec_candidates) {
    execve(candidate.c_str(), plan.argv->data(), plan.envp->data());
    if (errno != ENOENT) {
      exec_errno = errno;
    }
  }
  errno = exec_errno;
  ReportAndExit(plan, util::kStatusExecFailed, plan.argv0.c_str(), 127);
}

ExecutionResult TimedOutBeforeStart(absl::Time start) {
  ExecutionResult result;
  result.exit_code = -1;
  result.timed_out = true;
  result.wall_time = absl::Now() - start;
  return result;
}

}  // namespace

bool NamespaceIsolation::IsSupported() {
  static const bool supported = [] {
    Mounts mounts;
    if (absl::Status status = mounts.AddSystemDefaults(); !status.ok()) {
      LOG(WARNING) << "Namespace probe: " << status;
      return false;
    }
    RunOptions options;
    options.isolate_network = true;
    options.isolate_pid = true;
    options.timeout = absl::Seconds(10);
    NamespaceIsolation isolation;
    absl::StatusOr<ExecutionResult> result =
        isolation.Run(Command{{"true"}, {}, "/"}, mounts, options);
    if (!result.ok()) {
      LOG(WARNING) << "Namespace probe failed: " << result.status();
      return false;
    }
    if (!result->ok()) {
      LOG(WARNING) << "Namespace probe failed: " << result->ToString();
      return false;
    }
    VLOG(1) << "Namespace isolation is available";
    return true;
  }();
  return supported;
}

absl::StatusOr<std::string> NamespaceIsolation::PathForSandboxee(
    const Mounts& mounts, absl::string_view inside) const {
  if (!file::IsAbsolutePath(inside)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Sandbox path must be absolute: ", inside));
  }
  return file::CleanPath(inside);
}

absl::StatusOr<ExecutionResult> NamespaceIsolation::Run(
    const Command& command, const Mounts& mounts, const RunOptions& options) {
  if (command.argv.empty()) {
    return absl::InvalidArgumentError("Empty command");
  }
  AGENTBOX_RETURN_IF_ERROR(fileops::CreateDirectoryRecursively(
      std::string(kRootMountPoint), 0755));

  // Advisory proxy for sandboxes that share the host network.
  std::unique_ptr<GatewayListener> listener;
  std::vector<std::string> env = command.env;
  if (options.gateway != nullptr) {
    std::string proxy_url;
    if (options.isolate_network) {
      proxy_url = absl::StrCat("http://127.0.0.1:", kGatewayPort);
    } else {
      AGENTBOX_ASSIGN_OR_RETURN(listener, options.gateway->ListenOnLoopback());
      proxy_url = listener->ProxyUrl();
    }
    for (const char* var : {"HTTP_PROXY", "HTTPS_PROXY", "http_proxy",
                            "https_proxy"}) {
      env.push_back(absl::StrCat(var, "=", proxy_url));
    }
  }

  ChildPlan plan;
  plan.uid_map = absl::StrFormat("%d %d 1\n", kSandboxeeId, getuid());
  plan.gid_map = absl::StrFormat("%d %d 1\n", kSandboxeeId, getgid());
  plan.root = std::string(kRootMountPoint);
  plan.steps = BuildMountSteps(mounts, plan.root, options.isolate_pid);
  plan.isolate_network = options.isolate_network;
  plan.create_gateway_listener =
      options.gateway != nullptr && options.isolate_network;
  plan.hostname = std::string(kHostname);
  plan.working_dir = command.working_dir.empty() ? "/" : command.working_dir;
  plan.argv0 = command.argv.front();
  plan.exec_candidates = ExecCandidates(command);
  plan.argv = std::make_unique<util::CharPtrArray>(command.argv);
  plan.envp = std::make_unique<util::CharPtrArray>(env);
  plan.max_fd = MaxFdForChild();
  plan.limits = options.limits;

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
  plan.stdin_fd = dev_null.get();
  plan.stdout_fd = stdout_write.get();
  plan.stderr_fd = stderr_write.get();
  plan.status_fd = status_child.get();

  int clone_flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS |
                    SIGCHLD;
  if (options.isolate_pid) {
    clone_flags |= CLONE_NEWPID;
  }
  if (options.isolate_network) {
    clone_flags |= CLONE_NEWNET;
  }

  // Reads the environment once so that the child does not have to.
  raw_logging_internal::VLogIsOn(1);

  const absl::Time start = absl::Now();
  const pid_t pid = util::ForkWithFlags(clone_flags);
  if (pid == -1) {
    return absl::ErrnoToStatus(errno, "clone()");
  }
  if (pid == 0) {
    RunChild(plan);
  }

  stdout_write.Close();
  stderr_write.Close();
  status_child.Close();
  dev_null.Close();
  VLOG(2) << "Started sandboxee " << pid << ": " << plan.argv0;

  ProcessMonitor monitor(pid, std::move(stdout_read), std::move(stderr_read),
                         options.max_output_bytes);
  const absl::Time deadline = start + options.timeout;
  std::string exec_error;
  for (;;) {
    absl::StatusOr<util::StatusMessage> message =
        util::ReceiveStatusMessage(status_parent.get(), deadline);
    if (absl::IsDeadlineExceeded(message.status())) {
      monitor.Abort();
      return TimedOutBeforeStart(start);
    }
    if (!message.ok()) {
      monitor.Abort();
      return message.status();
    }
    if (message->tag == 0) {
      break;
    }
    if (message->tag == util::kStatusSetupFailed) {
      monitor.Abort();
      return absl::InternalError(
          absl::StrCat("Sandbox setup failed: ", message->text));
    }
    if (message->tag == util::kStatusExecFailed) {
      exec_error = message->text;
    } else if (message->tag == util::kStatusGatewayListener) {
      if (options.gateway == nullptr || message->fd.get() == -1) {
        monitor.Abort();
        return absl::InternalError("Unexpected gateway listener");
      }
      absl::StatusOr<std::unique_ptr<GatewayListener>> served =
          options.gateway->Serve(std::move(message->fd));
      if (!served.ok()) {
        monitor.Abort();
        return served.status();
      }
      listener = *std::move(served);
    } else {
      monitor.Abort();
      return absl::InternalError(
          absl::StrCat("Unknown sandbox status message: ",
                       static_cast<int>(message->tag)));
    }
  }

  AGENTBOX_ASSIGN_OR_RETURN(ExecutionResult result,
                            monitor.Wait(start, deadline));
  if (!exec_error.empty()) {
    result.stderr_text =
        absl::StrCat("agentbox: cannot execute ", exec_error, "\n",
                     result.stderr_text);
  }
  VLOG(2) << "Sandboxee " << pid << " finished: " << result.ToString();
  return result;
}

}  // namespace agentbox
