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

#ifndef AGENTBOX_SERVICE_H_
#define AGENTBOX_SERVICE_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "agentbox/capability/capability_registry.h"
#include "agentbox/gateway/allow_list.h"
#include "agentbox/gateway/endpoint_selector.h"
#include "agentbox/notebook/cell_runner.h"
#include "agentbox/notebook/notebook.pb.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/sandbox/isolation.h"
#include "agentbox/sandbox/limits.h"
#include "agentbox/session/network_governor.h"
#include "agentbox/session/session.pb.h"
#include "agentbox/session/session_manager.h"
#include "agentbox/util/thread.h"

namespace agentbox {

struct ServiceOptions {
  // Fills every field from the --agentbox_* flags.
  static ServiceOptions FromFlags();

  std::string root = "/var/lib/agentbox";
  std::string python = "/usr/bin/python3";
  std::vector<std::string> capability_roots;
  // Empty: RESTRICTED sessions reach nothing.
  std::string allow_list_path;
  // Empty: default governor table.
  std::string sensitivity_policy;
  IsolationMode isolation = IsolationMode::kAuto;
  absl::Duration cell_timeout = absl::Seconds(30);
  absl::Duration idle_timeout = absl::Hours(1);
  // Zero disables the background reaper; CleanupIdle() still works.
  absl::Duration reap_interval = absl::Minutes(1);
  int max_cells = 500;
  size_t max_output_bytes = 8 << 20;
  size_t inline_output_limit = 64 << 10;
  std::vector<std::string> tool_endpoints;
  Limits limits;
};

struct SessionRef {
  std::string tenant_id;
  std::string session_id;
};

// A cell submitted with ExecutionService::ExecuteAsync(). The cell runs on its
// own thread; destroying the handle waits for it.
class PendingCell {
 public:
  PendingCell(const PendingCell&) = delete;
  PendingCell& operator=(const PendingCell&) = delete;

  ~PendingCell();

  bool IsDone() const { return done_.HasBeenNotified(); }

  // Blocks until the cell finished. May be called only once.
  absl::StatusOr<Cell> AwaitResult();

 private:
  friend class ExecutionService;

  PendingCell() = default;

  absl::Notification done_;
  absl::StatusOr<Cell> result_ = absl::UnknownError("Not finished");
  Thread thread_;
};

// Entry point for the agent runtime. Composes isolation, sessions, the
// network governor, the gateway, notebooks and capabilities. Callers only
// see session references, cells and execution results; environments, mounts
// and network modes stay internal.
//
// Thread-safe. Calls for the same session are serialized; calls for
// different sessions run concurrently.
class ExecutionService {
 public:
  static absl::StatusOr<std::unique_ptr<ExecutionService>> Create(
      ServiceOptions options);

  // Same, with a caller-provided isolation strategy.
  static absl::StatusOr<std::unique_ptr<ExecutionService>> Create(
      ServiceOptions options, std::unique_ptr<Isolation> isolation);

  ExecutionService(const ExecutionService&) = delete;
  ExecutionService& operator=(const ExecutionService&) = delete;

  ~ExecutionService();

  // Appends source to the session's notebook and runs it. A zero timeout
  // means the configured default.
  absl::StatusOr<Cell> Execute(const SessionRef& ref, absl::string_view source,
                               absl::Duration timeout = absl::ZeroDuration());

  // Runs Execute() on a separate thread. The service must outlive the
  // returned handle.
  std::unique_ptr<PendingCell> ExecuteAsync(
      const SessionRef& ref, std::string source,
      absl::Duration timeout = absl::ZeroDuration());

  // Runs an existing cell's source again as a new cell.
  absl::StatusOr<Cell> RerunCell(const SessionRef& ref,
                                 absl::string_view cell_id,
                                 absl::Duration timeout = absl::ZeroDuration());

  // Runs a shell command line in the session's sandbox, in /workspace.
  absl::StatusOr<ExecutionResult> RunCommand(
      const SessionRef& ref, absl::string_view command_line,
      absl::Duration timeout = absl::ZeroDuration());

  absl::StatusOr<ExecutionResult> InvokeCapability(
      const SessionRef& ref, absl::string_view capability,
      absl::string_view script, const std::vector<std::string>& args,
      absl::Duration timeout = absl::ZeroDuration());

  // Records that the session was exposed to data of level. Monotonic: lower
  // levels than already recorded are no-ops. Returns the recorded level.
  absl::StatusOr<DataSensitivity> MarkSensitivity(
      const SessionRef& ref, DataSensitivity level,
      absl::string_view dataset = "");

  absl::StatusOr<Notebook> GetNotebook(const SessionRef& ref);

  // The notebook as a Jupyter (.ipynb) document.
  absl::StatusOr<std::string> ExportNotebook(const SessionRef& ref);

  absl::Status DeleteCell(const SessionRef& ref, absl::string_view cell_id);
  absl::Status ClearNotebook(const SessionRef& ref);

  absl::Status CloseSession(const SessionRef& ref);
  int CleanupIdle(absl::Duration threshold);

  // Address of the tool server deployment the session may use.
  absl::StatusOr<std::string> ResolveToolEndpoint(const SessionRef& ref,
                                                  absl::string_view tool);

  std::vector<const Capability*> ListCapabilities() const;

  // Durable record of the session, for inspection.
  absl::StatusOr<SessionRecord> GetSessionRecord(const SessionRef& ref);

  const Isolation& isolation() const { return *isolation_; }

 private:
  ExecutionService(ServiceOptions options,
                   std::unique_ptr<Isolation> isolation);

  absl::Status Init();
  absl::Duration TimeoutOrDefault(absl::Duration timeout) const;
  absl::StatusOr<std::shared_ptr<Session>> GetSession(const SessionRef& ref);

  const ServiceOptions options_;
  std::unique_ptr<Isolation> isolation_;
  NetworkGovernor governor_;
  AllowList allow_list_;
  CapabilityRegistry capabilities_;
  EndpointSelector endpoints_;
  std::unique_ptr<SessionManager> sessions_;
  std::unique_ptr<CellRunner> runner_;
};

}  // namespace agentbox

#endif  // AGENTBOX_SERVICE_H_
