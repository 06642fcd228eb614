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

// Resource limits applied to every sandboxed process before execve().

#ifndef AGENTBOX_SANDBOX_LIMITS_H_
#define AGENTBOX_SANDBOX_LIMITS_H_

#include <sys/resource.h>

#include <cstdint>

namespace agentbox {

class Limits {
 public:
  Limits() = default;

  // rlimits getters/setters.
  //
  // Use RLIM64_INFINITY for unlimited values. Values above the caller's own
  // hard limit are clamped to it when applied.
  const rlimit64& rlimit_as() const { return rlimit_as_; }
  Limits& set_rlimit_as(uint64_t value) {
    rlimit_as_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_cpu() const { return rlimit_cpu_; }
  Limits& set_rlimit_cpu(uint64_t value) {
    rlimit_cpu_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_fsize() const { return rlimit_fsize_; }
  Limits& set_rlimit_fsize(uint64_t value) {
    rlimit_fsize_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_nofile() const { return rlimit_nofile_; }
  Limits& set_rlimit_nofile(uint64_t value) {
    rlimit_nofile_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_nproc() const { return rlimit_nproc_; }
  Limits& set_rlimit_nproc(uint64_t value) {
    rlimit_nproc_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_core() const { return rlimit_core_; }
  Limits& set_rlimit_core(uint64_t value) {
    rlimit_core_ = MakeRlimit64(value);
    return *this;
  }

 private:
  static constexpr rlimit64 MakeRlimit64(uint64_t value) {
    return {value, value};
  }

  // Address space of a process. The interpreter and its numeric libraries
  // reserve far more than they touch, so this is a coarse memory cap.
  rlimit64 rlimit_as_ = MakeRlimit64(4ULL << 30 /* 4GiB */);

  // CPU time, measured in seconds. With several threads this may trigger
  // before the wall-clock timeout.
  rlimit64 rlimit_cpu_ = MakeRlimit64(600 /* seconds */);

  // Largest file the process may write.
  rlimit64 rlimit_fsize_ = MakeRlimit64(1ULL << 30 /* 1GiB */);

  // Number of open file descriptors.
  rlimit64 rlimit_nofile_ = MakeRlimit64(1024);

  // Processes and threads of the sandboxee's user.
  rlimit64 rlimit_nproc_ = MakeRlimit64(512);

  // Core dumps are disabled.
  rlimit64 rlimit_core_ = MakeRlimit64(0);
};

}  // namespace agentbox

#endif  // AGENTBOX_SANDBOX_LIMITS_H_
