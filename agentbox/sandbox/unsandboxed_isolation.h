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

#ifndef AGENTBOX_SANDBOX_UNSANDBOXED_ISOLATION_H_
#define AGENTBOX_SANDBOX_UNSANDBOXED_ISOLATION_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/sandbox/isolation.h"
#include "agentbox/sandbox/mounts.h"

namespace agentbox {

// Development fallback for hosts without user namespaces. Commands run as
// ordinary child processes with the host's filesystem and network; sandbox
// paths in arguments, environment values and the working directory are
// rewritten to their bind sources. Offers no protection whatsoever.
class UnsandboxedIsolation : public Isolation {
 public:
  absl::StatusOr<ExecutionResult> Run(const Command& command,
                                      const Mounts& mounts,
                                      const RunOptions& options) override;

  // Returns the host path backing inside.
  absl::StatusOr<std::string> PathForSandboxee(
      const Mounts& mounts, absl::string_view inside) const override;

  bool IsSecure() const override { return false; }

  absl::string_view Name() const override { return "unsandboxed"; }
};

}  // namespace agentbox

#endif  // AGENTBOX_SANDBOX_UNSANDBOXED_ISOLATION_H_
