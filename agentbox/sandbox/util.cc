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

#include "agentbox/sandbox/util.h"

#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <sched.h>
#include <setjmp.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_join.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "agentbox/util/raw_logging.h"

namespace agentbox::util {
namespace {

constexpr size_t kMaxStatusMessage = 2048;
constexpr size_t kCloneStackSize = 64 * 1024;

bool ApplyRlimit(int resource, rlimit64 limit) {
  rlimit64 current;
  if (getrlimit64(resource, &current) == -1) {
    return false;
  }
  if (limit.rlim_max > current.rlim_max) {
    limit.rlim_max = current.rlim_max;
  }
  if (limit.rlim_cur > limit.rlim_max) {
    limit.rlim_cur = limit.rlim_max;
  }
  return setrlimit64(resource, &limit) == 0;
}

int ChildFunc(void* arg) {
  auto* env_ptr = reinterpret_cast<jmp_buf*>(arg);
  // Restore the old stack.
  longjmp(*env_ptr, 1);
}

// The clone()d child starts on a small temporary stack and immediately jumps
// back to the stack of ForkWithFlags(), like a forked process would.
// The temporary stack must stay close to the real one to keep ASAN quiet.
ABSL_ATTRIBUTE_NO_SANITIZE_ADDRESS
ABSL_ATTRIBUTE_NOINLINE
pid_t CloneAndJump(int flags, jmp_buf* env_ptr) {
  uint8_t stack_buf[kCloneStackSize] ABSL_CACHELINE_ALIGNED;
  // Stack grows down.
  void* stack = stack_buf + sizeof(stack_buf);
  int r = clone(&ChildFunc, stack, flags, env_ptr, nullptr, nullptr, nullptr);
  if (r == -1) {
    AGENTBOX_RAW_PLOG(ERROR, "clone()");
  }
  return r;
}

}  // namespace

CharPtrArray::CharPtrArray(const std::vector<std::string>& vec)
    : content_(absl::StrJoin(vec, absl::string_view("\0", 1))) {
  size_t offset = 0;
  array_.reserve(vec.size() + 1);
  for (const std::string& str : vec) {
    array_.push_back(content_.data() + offset);
    offset += str.size() + 1;
  }
  array_.push_back(nullptr);
}

pid_t ForkWithFlags(int flags) {
  const int unsupported_flags = CLONE_CHILD_CLEARTID | CLONE_CHILD_SETTID |
                                CLONE_PARENT_SETTID | CLONE_SETTLS | CLONE_VM;
  if (flags & unsupported_flags) {
    AGENTBOX_RAW_LOG(ERROR, "ForkWithFlags used with unsupported flag");
    errno = EINVAL;
    return -1;
  }

  jmp_buf env;
  if (setjmp(env) == 0) {
    return CloneAndJump(flags, &env);
  }

  // Child.
  return 0;
}

bool SendStatusMessage(int fd, char tag, const char* text, int pass_fd) {
  char buffer[kMaxStatusMessage];
  buffer[0] = tag;
  size_t len = 1;
  if (text != nullptr) {
    size_t text_len = strnlen(text, sizeof(buffer) - 1);
    memcpy(buffer + 1, text, text_len);
    len += text_len;
  }
  iovec iov = {buffer, len};
  msghdr msg{};
  msg.msg_iov = &iov;
  msg.msg_iovlen = 1;
  alignas(cmsghdr) char cmsg_buf[CMSG_SPACE(sizeof(int))];
  if (pass_fd >= 0) {
    memset(cmsg_buf, 0, sizeof(cmsg_buf));
    msg.msg_control = cmsg_buf;
    msg.msg_controllen = sizeof(cmsg_buf);
    cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
    cmsg->cmsg_level = SOL_SOCKET;
    cmsg->cmsg_type = SCM_RIGHTS;
    cmsg->cmsg_len = CMSG_LEN(sizeof(int));
    memcpy(CMSG_DATA(cmsg), &pass_fd, sizeof(int));
  }
  return TEMP_FAILURE_RETRY(sendmsg(fd, &msg, MSG_NOSIGNAL)) ==
         static_cast<ssize_t>(len);
}

absl::StatusOr<StatusMessage> ReceiveStatusMessage(int fd,
                                                   absl::Time deadline) {
  pollfd pfd = {fd, POLLIN, 0};
  for (;;) {
    const absl::Duration remaining = deadline - absl::Now();
    if (remaining <= absl::ZeroDuration()) {
      return absl::DeadlineExceededError(
          "Timed out waiting for the sandbox to start");
    }
    int ret = poll(&pfd, 1, absl::ToInt64Milliseconds(remaining) + 1);
    if (ret > 0) {
      break;
    }
    if (ret == -1 && errno != EINTR) {
      return absl::ErrnoToStatus(errno, "poll() on status channel");
    }
  }

  char buffer[kMaxStatusMessage];
  iovec iov = {buffer, sizeof(buffer)};
  msghdr msg{};
  msg.msg_iov = &iov;
  msg.msg_iovlen = 1;
  alignas(cmsghdr) char cmsg_buf[CMSG_SPACE(sizeof(int))];
  msg.msg_control = cmsg_buf;
  msg.msg_controllen = sizeof(cmsg_buf);
  ssize_t len = TEMP_FAILURE_RETRY(recvmsg(fd, &msg, MSG_CMSG_CLOEXEC));
  if (len < 0) {
    return absl::ErrnoToStatus(errno, "recvmsg() on status channel");
  }
  StatusMessage message;
  if (len == 0) {
    return message;
  }
  for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg); cmsg != nullptr;
       cmsg = CMSG_NXTHDR(&msg, cmsg)) {
    if (cmsg->cmsg_level == SOL_SOCKET && cmsg->cmsg_type == SCM_RIGHTS) {
      int passed;
      memcpy(&passed, CMSG_DATA(cmsg), sizeof(int));
      message.fd = file_util::fileops::FDCloser(passed);
    }
  }
  message.tag = buffer[0];
  message.text.assign(buffer + 1, len - 1);
  return message;
}

bool WriteStringToFile(const char* path, const char* text) {
  int fd = TEMP_FAILURE_RETRY(open(path, O_WRONLY | O_CLOEXEC));
  if (fd == -1) {
    return false;
  }
  const size_t len = strlen(text);
  const bool ok = TEMP_FAILURE_RETRY(write(fd, text, len)) ==
                  static_cast<ssize_t>(len);
  const int saved_errno = errno;
  close(fd);
  errno = saved_errno;
  return ok;
}

bool CreateDirRecursive(const char* path, mode_t mode) {
  char buffer[PATH_MAX];
  const size_t len = strnlen(path, sizeof(buffer));
  if (len == sizeof(buffer)) {
    errno = ENAMETOOLONG;
    return false;
  }
  memcpy(buffer, path, len + 1);
  for (size_t i = 1; i <= len; ++i) {
    if (buffer[i] != '/' && buffer[i] != '\0') {
      continue;
    }
    const char saved = buffer[i];
    buffer[i] = '\0';
    if (mkdir(buffer, mode) != 0 && errno != EEXIST) {
      return false;
    }
    buffer[i] = saved;
  }
  return true;
}

bool ApplyLimits(const Limits& limits) {
  return ApplyRlimit(RLIMIT_AS, limits.rlimit_as()) &&
         ApplyRlimit(RLIMIT_CPU, limits.rlimit_cpu()) &&
         ApplyRlimit(RLIMIT_FSIZE, limits.rlimit_fsize()) &&
         ApplyRlimit(RLIMIT_NOFILE, limits.rlimit_nofile()) &&
         ApplyRlimit(RLIMIT_NPROC, limits.rlimit_nproc()) &&
         ApplyRlimit(RLIMIT_CORE, limits.rlimit_core());
}

}  // namespace agentbox::util
