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

#include "agentbox/service.h"

#include <sys/resource.h>

#include <climits>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "agentbox/flags.h"
#include "agentbox/notebook/ipynb.h"
#include "agentbox/notebook/kernel.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {
namespace {

namespace fileops = ::agentbox::file_util::fileops;

// Host directories an interpreter needs besides the system defaults: the
// installation prefix of the configured path and of its resolved target.
std::vector<std::string> InterpreterPrefixes(const std::string& python) {
  std::vector<std::string> prefixes;
  auto add_prefix = [&prefixes](const std::string& binary) {
    std::string prefix = fileops::StripBasename(fileops::StripBasename(binary));
    if (prefix.empty() || prefix == "/") {
      return;
    }
    for (const std::string& existing : prefixes) {
      if (existing == prefix) {
        return;
      }
    }
    prefixes.push_back(std::move(prefix));
  };
  add_prefix(python);
  char resolved[PATH_MAX];
  if (realpath(python.c_str(), resolved) != nullptr) {
    add_prefix(resolved);
  } else {
    PLOG(WARNING) << "realpath(" << python << ")";
  }
  return prefixes;
}

// Zero on the command line means no limit.
uint64_t RlimitFromFlag(uint64_t value) {
  return value == 0 ? RLIM64_INFINITY : value;
}

}  // namespace

ServiceOptions ServiceOptions::FromFlags() {
  ServiceOptions options;
  options.root = absl::GetFlag(FLAGS_agentbox_root);
  options.python = absl::GetFlag(FLAGS_agentbox_python);
  options.capability_roots = absl::GetFlag(FLAGS_agentbox_capability_roots);
  options.allow_list_path = absl::GetFlag(FLAGS_agentbox_gateway_allowlist);
  options.sensitivity_policy = absl::GetFlag(FLAGS_agentbox_sensitivity_policy);
  options.isolation = absl::GetFlag(FLAGS_agentbox_isolation);
  options.cell_timeout = absl::GetFlag(FLAGS_agentbox_cell_timeout);
  options.idle_timeout = absl::GetFlag(FLAGS_agentbox_session_idle_timeout);
  options.max_cells = absl::GetFlag(FLAGS_agentbox_max_cells);
  options.max_output_bytes = absl::GetFlag(FLAGS_agentbox_max_output_bytes);
  options.inline_output_limit =
      absl::GetFlag(FLAGS_agentbox_inline_output_limit);
  options.tool_endpoints = absl::GetFlag(FLAGS_agentbox_tool_endpoints);
  options.limits
      .set_rlimit_as(RlimitFromFlag(absl::GetFlag(FLAGS_agentbox_rlimit_as)))
      .set_rlimit_cpu(RlimitFromFlag(absl::GetFlag(FLAGS_agentbox_rlimit_cpu)))
      .set_rlimit_fsize(
          RlimitFromFlag(absl::GetFlag(FLAGS_agentbox_rlimit_fsize)))
      .set_rlimit_nofile(
          RlimitFromFlag(absl::GetFlag(FLAGS_agentbox_rlimit_nofile)))
      .set_rlimit_nproc(
          RlimitFromFlag(absl::GetFlag(FLAGS_agentbox_rlimit_nproc)));
  return options;
}

PendingCell::~PendingCell() {
  if (thread_.IsJoinable()) {
    thread_.Join();
  }
}

absl::StatusOr<Cell> PendingCell::AwaitResult() {
  done_.WaitForNotification();
  if (thread_.IsJoinable()) {
    thread_.Join();
  }
  return std::move(result_);
}

absl::StatusOr<std::unique_ptr<ExecutionService>> ExecutionService::Create(
    ServiceOptions options) {
  AGENTBOX_ASSIGN_OR_RETURN(std::unique_ptr<Isolation> isolation,
                            CreateIsolation(options.isolation));
  return Create(std::move(options), std::move(isolation));
}

absl::StatusOr<std::unique_ptr<ExecutionService>> ExecutionService::Create(
    ServiceOptions options, std::unique_ptr<Isolation> isolation) {
  if (isolation == nullptr) {
    return absl::InvalidArgumentError("No isolation strategy");
  }
  if (options.cell_timeout <= absl::ZeroDuration()) {
    return absl::InvalidArgumentError("The cell timeout must be positive");
  }
  auto service = absl::WrapUnique(
      new ExecutionService(std::move(options), std::move(isolation)));
  AGENTBOX_RETURN_IF_ERROR(service->Init());
  return service;
}

ExecutionService::ExecutionService(ServiceOptions options,
                                   std::unique_ptr<Isolation> isolation)
    : options_(std::move(options)), isolation_(std::move(isolation)) {}

ExecutionService::~ExecutionService() {
  // The runner refers to the manager.
  runner_.reset();
  sessions_.reset();
}

absl::Status ExecutionService::Init() {
  if (!options_.sensitivity_policy.empty()) {
    AGENTBOX_ASSIGN_OR_RETURN(
        governor_, NetworkGovernor::FromSpec(options_.sensitivity_policy));
  }
  VLOG(1) << "Network policy: " << governor_.DebugString();

  if (!options_.allow_list_path.empty()) {
    AGENTBOX_ASSIGN_OR_RETURN(
        allow_list_, AllowList::LoadFromFile(options_.allow_list_path));
    LOG(INFO) << "Loaded " << allow_list_.size()
              << " allowed destination(s) from " << options_.allow_list_path;
  }

  if (!options_.capability_roots.empty()) {
    AGENTBOX_ASSIGN_OR_RETURN(
        capabilities_, CapabilityRegistry::Discover(options_.capability_roots));
  }
  AGENTBOX_ASSIGN_OR_RETURN(endpoints_,
                            EndpointSelector::Parse(options_.tool_endpoints));

  AGENTBOX_ASSIGN_OR_RETURN(
      const std::string kernel,
      InstallKernel(file::JoinPath(options_.root, "kernel")));

  SessionManagerOptions manager_options;
  manager_options.root = options_.root;
  manager_options.isolation = isolation_.get();
  manager_options.governor = &governor_;
  manager_options.allow_list = &allow_list_;
  manager_options.shared_mounts.push_back(
      BindMount{fileops::StripBasename(kernel), kKernelMountPoint,
                /*read_only=*/true});
  for (BindMount& bind : capabilities_.GetBindMounts()) {
    manager_options.shared_mounts.push_back(std::move(bind));
  }
  manager_options.host_paths = InterpreterPrefixes(options_.python);
  manager_options.idle_timeout = options_.idle_timeout;
  manager_options.reap_interval = options_.reap_interval;
  manager_options.limits = options_.limits;
  AGENTBOX_ASSIGN_OR_RETURN(sessions_,
                            SessionManager::Create(std::move(manager_options)));

  CellRunnerOptions runner_options;
  runner_options.python = options_.python;
  runner_options.inline_output_limit = options_.inline_output_limit;
  runner_options.max_output_bytes = options_.max_output_bytes;
  runner_options.max_cells = options_.max_cells;
  runner_ = std::make_unique<CellRunner>(sessions_.get(),
                                         std::move(runner_options));

  LOG(INFO) << "Execution service ready: root " << options_.root
            << ", isolation " << isolation_->Name() << ", "
            << capabilities_.List().size() << " capabilit(y/ies)";
  return absl::OkStatus();
}

absl::Duration ExecutionService::TimeoutOrDefault(
    absl::Duration timeout) const {
  return timeout > absl::ZeroDuration() ? timeout : options_.cell_timeout;
}

absl::StatusOr<std::shared_ptr<Session>> ExecutionService::GetSession(
    const SessionRef& ref) {
  return sessions_->GetOrCreate(ref.tenant_id, ref.session_id);
}

absl::StatusOr<Cell> ExecutionService::Execute(const SessionRef& ref,
                                               absl::string_view source,
                                               absl::Duration timeout) {
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_RETURN_IF_ERROR(session->CheckOpen());
  return runner_->Execute(*session, source, TimeoutOrDefault(timeout));
}

std::unique_ptr<PendingCell> ExecutionService::ExecuteAsync(
    const SessionRef& ref, std::string source, absl::Duration timeout) {
  auto pending = absl::WrapUnique(new PendingCell());
  PendingCell* raw = pending.get();
  raw->thread_ = Thread(
      [this, raw, ref, source = std::move(source), timeout]() {
        raw->result_ = Execute(ref, source, timeout);
        raw->done_.Notify();
      },
      "cell");
  return pending;
}

absl::StatusOr<Cell> ExecutionService::RerunCell(const SessionRef& ref,
                                                 absl::string_view cell_id,
                                                 absl::Duration timeout) {
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_RETURN_IF_ERROR(session->CheckOpen());
  return runner_->Rerun(*session, cell_id, TimeoutOrDefault(timeout));
}

absl::StatusOr<ExecutionResult> ExecutionService::RunCommand(
    const SessionRef& ref, absl::string_view command_line,
    absl::Duration timeout) {
  if (command_line.empty()) {
    return absl::InvalidArgumentError("Empty command line");
  }
  Command command;
  command.argv = {"/bin/sh", "-c", std::string(command_line)};
  command.env = {"PATH=/usr/local/bin:/usr/bin:/bin",
                 absl::StrCat("HOME=", kWorkspaceMountPoint), "LANG=C.UTF-8",
                 "TMPDIR=/tmp"};
  command.working_dir = kWorkspaceMountPoint;

  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_RETURN_IF_ERROR(session->CheckOpen());
  return sessions_->RunInSession(*session, command, TimeoutOrDefault(timeout),
                                 options_.max_output_bytes);
}

absl::StatusOr<ExecutionResult> ExecutionService::InvokeCapability(
    const SessionRef& ref, absl::string_view capability,
    absl::string_view script, const std::vector<std::string>& args,
    absl::Duration timeout) {
  AGENTBOX_ASSIGN_OR_RETURN(
      const Command command,
      capabilities_.BuildInvocation(capability, script, args,
                                    options_.python));
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_RETURN_IF_ERROR(session->CheckOpen());
  VLOG(1) << "Session " << session->key().ToString() << " invokes "
          << capability << "/" << script;
  return sessions_->RunInSession(*session, command, TimeoutOrDefault(timeout),
                                 options_.max_output_bytes);
}

absl::StatusOr<DataSensitivity> ExecutionService::MarkSensitivity(
    const SessionRef& ref, DataSensitivity level, absl::string_view dataset) {
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  return sessions_->MarkSensitivity(*session, level, dataset);
}

absl::StatusOr<Notebook> ExecutionService::GetNotebook(const SessionRef& ref) {
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_RETURN_IF_ERROR(session->CheckOpen());
  return runner_->Load(*session);
}

absl::StatusOr<std::string> ExecutionService::ExportNotebook(
    const SessionRef& ref) {
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_RETURN_IF_ERROR(session->CheckOpen());
  AGENTBOX_ASSIGN_OR_RETURN(const Notebook notebook, runner_->Load(*session));
  return ExportIpynb(notebook, session->paths().workspace);
}

absl::Status ExecutionService::DeleteCell(const SessionRef& ref,
                                          absl::string_view cell_id) {
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_RETURN_IF_ERROR(session->CheckOpen());
  return runner_->DeleteCell(*session, cell_id);
}

absl::Status ExecutionService::ClearNotebook(const SessionRef& ref) {
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_RETURN_IF_ERROR(session->CheckOpen());
  return runner_->Clear(*session);
}

absl::Status ExecutionService::CloseSession(const SessionRef& ref) {
  return sessions_->CloseSession(ref.tenant_id, ref.session_id);
}

int ExecutionService::CleanupIdle(absl::Duration threshold) {
  return sessions_->CleanupIdle(threshold);
}

absl::StatusOr<std::string> ExecutionService::ResolveToolEndpoint(
    const SessionRef& ref, absl::string_view tool) {
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  return endpoints_.Select(tool, sessions_->RequiredMode(*session));
}

std::vector<const Capability*> ExecutionService::ListCapabilities() const {
  return capabilities_.List();
}

absl::StatusOr<SessionRecord> ExecutionService::GetSessionRecord(
    const SessionRef& ref) {
  AGENTBOX_ASSIGN_OR_RETURN(std::shared_ptr<Session> session, GetSession(ref));
  return session->record();
}

}  // namespace agentbox
