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

#ifndef AGENTBOX_UTIL_THREAD_H_
#define AGENTBOX_UTIL_THREAD_H_

#include <pthread.h>

#include <string>
#include <thread>
#include <utility>

#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"

namespace agentbox {

// Thin wrapper around std::thread that names the OS thread after name_prefix
// (truncated to the 15 characters the kernel keeps), which makes worker
// threads easy to tell apart in ps and debuggers.
class Thread {
 public:
  static void StartDetachedThread(absl::AnyInvocable<void() &&> functor,
                                  absl::string_view name_prefix = "") {
    Thread(std::move(functor), name_prefix).thread_.detach();
  }

  Thread() = default;

  Thread(const Thread&) = delete;
  Thread& operator=(const Thread&) = delete;

  Thread(Thread&&) = default;
  Thread& operator=(Thread&&) = default;

  explicit Thread(absl::AnyInvocable<void() &&> functor,
                  absl::string_view name_prefix = "") {
    thread_ = std::thread(std::move(functor));
    SetName(name_prefix);
  }

  template <class CL>
  Thread(CL* ptr, void (CL::*ptr_to_member)(),
         absl::string_view name_prefix = "") {
    thread_ = std::thread(ptr_to_member, ptr);
    SetName(name_prefix);
  }

  pthread_t handle() { return thread_.native_handle(); }

  void Join() { thread_.join(); }

  bool IsJoinable() { return thread_.joinable(); }

 private:
  void SetName(absl::string_view name_prefix) {
    if (name_prefix.empty()) {
      return;
    }
    const std::string name(name_prefix.substr(0, 15));
    pthread_setname_np(thread_.native_handle(), name.c_str());
  }

  std::thread thread_;
};

}  // namespace agentbox

#endif  // AGENTBOX_UTIL_THREAD_H_
