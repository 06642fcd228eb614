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

// Low-level process helpers shared by the isolation strategies.

#ifndef AGENTBOX_SANDBOX_UTIL_H_
#define AGENTBOX_SANDBOX_UTIL_H_

#include <sys/types.h>

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "agentbox/sandbox/limits.h"
#include "agentbox/util/fileops.h"

namespace agentbox::util {

// Owns a NULL-terminated array of C strings, for execve() and friends. Build
// it before forking; the child only reads it.
class CharPtrArray {
 public:
  explicit CharPtrArray(const std::vector<std::string>& vec);

  CharPtrArray(const CharPtrArray&) = delete;
  CharPtrArray& operator=(const CharPtrArray&) = delete;

  char* const* data() const { return const_cast<char* const*>(array_.data()); }
  size_t size() const { return array_.size() - 1; }

 private:
  std::string content_;
  std::vector<const char*> array_;
};

// Fork based on clone(), so that namespace flags can be passed. The child runs
// on the caller's stack, like after fork(), but without glibc's atfork
// handlers: it must not allocate memory or take locks.
pid_t ForkWithFlags(int flags);

// Message tags sent by a child over its status channel before execve().
inline constexpr char kStatusGatewayListener = 'L';
inline constexpr char kStatusSetupFailed = 'E';
inline constexpr char kStatusExecFailed = 'X';

// Sends one message, optionally passing pass_fd along. Async-signal-safe and
// allocation-free. Returns false on failure.
bool SendStatusMessage(int fd, char tag, const char* text, int pass_fd = -1);

struct StatusMessage {
  // 0 when the peer closed its end, which for a close-on-exec channel means
  // execve() succeeded.
  char tag = 0;
  std::string text;
  file_util::fileops::FDCloser fd;
};

// Receives one message, waiting at most until deadline.
absl::StatusOr<StatusMessage> ReceiveStatusMessage(int fd, absl::Time deadline);

// Writes text to path with a single open/write/close, without allocating.
// Returns false on failure with errno set.
bool WriteStringToFile(const char* path, const char* text);

// Creates path and its missing parents. Allocation-free; path must be shorter
// than PATH_MAX.
bool CreateDirRecursive(const char* path, mode_t mode);

// Applies limits to the calling process, clamping each one to the current
// hard limit. Allocation-free. Returns false on failure with errno set.
bool ApplyLimits(const Limits& limits);

}  // namespace agentbox::util

#endif  // AGENTBOX_SANDBOX_UTIL_H_
