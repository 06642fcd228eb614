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

#ifndef AGENTBOX_SANDBOX_NAMESPACE_ISOLATION_H_
#define AGENTBOX_SANDBOX_NAMESPACE_ISOLATION_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/sandbox/isolation.h"
#include "agentbox/sandbox/mounts.h"

namespace agentbox {

// Runs every command in fresh user, mount, IPC and UTS namespaces, plus PID
// and network namespaces as requested by RunOptions. The root filesystem is
// an empty tmpfs populated only from Mounts, remounted read-only before the
// command starts. No privileges are required beyond unprivileged user
// namespaces.
class NamespaceIsolation : public Isolation {
 public:
  // Directory on the host used as the mount point for sandbox roots. Every
  // sandbox mounts its own tmpfs here in a private mount namespace.
  static constexpr absl::string_view kRootMountPoint = "/tmp/.agentbox_root";

  // Hostname reported inside the sandbox.
  static constexpr absl::string_view kHostname = "agentbox";

  // Returns whether namespaces can be created on this host. The result of the
  // first call is cached for the lifetime of the process.
  static bool IsSupported();

  absl::StatusOr<ExecutionResult> Run(const Command& command,
                                      const Mounts& mounts,
                                      const RunOptions& options) override;

  absl::StatusOr<std::string> PathForSandboxee(
      const Mounts& mounts, absl::string_view inside) const override;

  bool IsSecure() const override { return true; }

  absl::string_view Name() const override { return "namespaces"; }
};

}  // namespace agentbox

#endif  // AGENTBOX_SANDBOX_NAMESPACE_ISOLATION_H_
