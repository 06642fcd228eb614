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

// The isolation primitive: runs one command in a separate process with a
// restricted filesystem, network and process view. Stateless; knows nothing
// about sessions.

#ifndef AGENTBOX_SANDBOX_ISOLATION_H_
#define AGENTBOX_SANDBOX_ISOLATION_H_

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/sandbox/limits.h"
#include "agentbox/sandbox/mounts.h"

namespace agentbox {

class Gateway;

// A command line. All paths are as seen from inside the sandbox.
struct Command {
  std::vector<std::string> argv;
  // KEY=VALUE pairs; the sandboxed process sees nothing else of the host
  // environment.
  std::vector<std::string> env;
  std::string working_dir = "/";
};

struct RunOptions {
  bool isolate_network = true;
  bool isolate_pid = true;
  absl::Duration timeout = absl::Seconds(30);
  // When set (and the network is isolated), the only route out of the sandbox
  // is this gateway, announced through the *_PROXY environment variables.
  Gateway* gateway = nullptr;
  // Per-stream capture limit for stdout and stderr.
  size_t max_output_bytes = 8 << 20;
  Limits limits;
};

// How the process-wide isolation strategy is chosen.
enum class IsolationMode {
  // Namespaces if the host supports them, otherwise the unsandboxed fallback
  // with a warning.
  kAuto,
  // Namespaces or nothing: refuse to start without them.
  kNamespaces,
  // Unsandboxed fallback. Development only.
  kNone,
};

bool AbslParseFlag(absl::string_view text, IsolationMode* mode,
                   std::string* error);
std::string AbslUnparseFlag(IsolationMode mode);

class Isolation {
 public:
  virtual ~Isolation() = default;

  // Runs command with exactly the filesystem view described by mounts.
  // Blocks until the command exits or options.timeout expires, in which case
  // the whole process tree is killed and ExecutionResult::timed_out is set.
  // Returns an error status only when the sandbox itself could not be set up.
  // Thread-safe.
  virtual absl::StatusOr<ExecutionResult> Run(const Command& command,
                                              const Mounts& mounts,
                                              const RunOptions& options) = 0;

  // Returns the path under which the sandboxed process sees inside. Callers
  // use it for paths written into files the process reads.
  virtual absl::StatusOr<std::string> PathForSandboxee(
      const Mounts& mounts, absl::string_view inside) const = 0;

  // False for strategies that do not actually isolate anything.
  virtual bool IsSecure() const = 0;

  virtual absl::string_view Name() const = 0;
};

// Picks the strategy for this process. The namespace capability is probed
// once and the result cached.
absl::StatusOr<std::unique_ptr<Isolation>> CreateIsolation(IsolationMode mode);

}  // namespace agentbox

#endif  // AGENTBOX_SANDBOX_ISOLATION_H_
