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

#ifndef AGENTBOX_SESSION_ENVIRONMENT_H_
#define AGENTBOX_SESSION_ENVIRONMENT_H_

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "agentbox/gateway/allow_list.h"
#include "agentbox/gateway/gateway.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/sandbox/isolation.h"
#include "agentbox/sandbox/limits.h"
#include "agentbox/sandbox/mounts.h"
#include "agentbox/session/session.pb.h"

namespace agentbox {

// The disposable half of a session: an isolation strategy bound to a fixed
// filesystem view and a fixed network mode. Commands run in fresh processes,
// so an environment holds no process state of its own; replacing it changes
// how future commands are confined, never what the workspace contains.
class Environment {
 public:
  // allow_list is required for NETWORK_MODE_RESTRICTED. isolation and
  // allow_list must outlive the environment.
  static absl::StatusOr<std::unique_ptr<Environment>> Create(
      std::string id, NetworkMode mode, Isolation* isolation, Mounts mounts,
      const AllowList* allow_list, const Limits& limits = Limits());

  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;

  // Runs command under this environment's network mode. Returns an error only
  // for infrastructure failures; those also mark the environment broken.
  absl::StatusOr<ExecutionResult> Run(const Command& command,
                                      absl::Duration timeout,
                                      size_t max_output_bytes);

  // False once the environment was shut down, marked broken, or one of its
  // writable mount sources disappeared from the host.
  bool IsAlive() const;
  void MarkBroken() { broken_ = true; }
  void Shutdown();

  const std::string& id() const { return id_; }
  NetworkMode mode() const { return mode_; }
  const Mounts& mounts() const { return mounts_; }
  Isolation* isolation() const { return isolation_; }

  // Zero for environments without a gateway.
  GatewayStats gateway_stats() const;

 private:
  Environment(std::string id, NetworkMode mode, Isolation* isolation,
              Mounts mounts, std::unique_ptr<Gateway> gateway,
              const Limits& limits);

  const std::string id_;
  const NetworkMode mode_;
  Isolation* isolation_;
  const Mounts mounts_;
  std::unique_ptr<Gateway> gateway_;
  const Limits limits_;
  std::atomic<bool> broken_{false};
  std::atomic<bool> shut_down_{false};
};

}  // namespace agentbox

#endif  // AGENTBOX_SESSION_ENVIRONMENT_H_
