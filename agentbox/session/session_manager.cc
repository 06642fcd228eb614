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

#include "agentbox/session/session_manager.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "agentbox/session/network_governor.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/proto_helper.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {

namespace fileops = ::agentbox::file_util::fileops;

absl::StatusOr<std::unique_ptr<SessionManager>> SessionManager::Create(
    SessionManagerOptions options) {
  if (options.root.empty()) {
    return absl::InvalidArgumentError("No storage root configured");
  }
  if (options.isolation == nullptr || options.governor == nullptr) {
    return absl::InvalidArgumentError(
        "SessionManager needs an isolation strategy and a governor");
  }
  AGENTBOX_RETURN_IF_ERROR(fileops::CreateDirectoryRecursively(
      file::JoinPath(options.root, "sessions"), 0700));
  return absl::WrapUnique(new SessionManager(std::move(options)));
}

SessionManager::SessionManager(SessionManagerOptions options)
    : options_(std::move(options)) {
  if (options_.reap_interval > absl::ZeroDuration()) {
    reaper_ = Thread(this, &SessionManager::ReaperLoop, "idle-reaper");
  }
}

SessionManager::~SessionManager() {
  stop_reaper_.Notify();
  if (reaper_.IsJoinable()) {
    reaper_.Join();
  }
}

void SessionManager::ReaperLoop() {
  while (!stop_reaper_.WaitForNotificationWithTimeout(
      options_.reap_interval)) {
    if (int destroyed = CleanupIdle(options_.idle_timeout); destroyed > 0) {
      LOG(INFO) << "Destroyed " << destroyed << " idle environment(s)";
    }
  }
}

absl::StatusOr<Mounts> SessionManager::BuildMounts(
    const SessionPaths& paths) const {
  Mounts mounts;
  AGENTBOX_RETURN_IF_ERROR(mounts.AddSystemDefaults());
  AGENTBOX_RETURN_IF_ERROR(
      mounts.AddDirectoryAt(paths.workspace, kWorkspaceMountPoint,
                            /*is_ro=*/false));
  AGENTBOX_RETURN_IF_ERROR(
      mounts.AddDirectoryAt(paths.state, kStateMountPoint, /*is_ro=*/false));
  for (const BindMount& bind : options_.shared_mounts) {
    AGENTBOX_RETURN_IF_ERROR(mounts.AddBindMount(bind));
  }
  for (const std::string& path : options_.host_paths) {
    AGENTBOX_RETURN_IF_ERROR(mounts.AddHostPathIfMissing(path));
  }
  AGENTBOX_RETURN_IF_ERROR(mounts.AddTmpfs("/tmp", options_.tmp_size));
  return mounts;
}

absl::StatusOr<std::shared_ptr<Session>> SessionManager::GetOrCreate(
    absl::string_view tenant_id, absl::string_view session_id) {
  AGENTBOX_RETURN_IF_ERROR(ValidateSessionId("tenant id", tenant_id));
  AGENTBOX_RETURN_IF_ERROR(ValidateSessionId("session id", session_id));
  SessionKey key{std::string(tenant_id), std::string(session_id)};

  absl::MutexLock lock(&mu_);
  if (auto it = sessions_.find(key); it != sessions_.end()) {
    it->second->Touch();
    return it->second;
  }

  SessionPaths paths = SessionPaths::For(options_.root, key);
  AGENTBOX_RETURN_IF_ERROR(
      fileops::CreateDirectoryRecursively(paths.workspace, 0700));
  AGENTBOX_RETURN_IF_ERROR(
      fileops::CreateDirectoryRecursively(paths.state, 0700));

  SessionRecord record;
  absl::Status loaded = ReadProtoFromJsonFile(paths.record, &record);
  const bool is_new = absl::IsNotFound(loaded);
  if (is_new) {
    record.set_tenant_id(key.tenant_id);
    record.set_session_id(key.session_id);
    record.set_sensitivity(SENSITIVITY_PUBLIC);
    record.set_network_mode(NETWORK_MODE_FULL);
    *record.mutable_created_at() = EncodeTime(absl::Now());
  } else if (!loaded.ok()) {
    return loaded;
  }
  AGENTBOX_ASSIGN_OR_RETURN(Mounts mounts, BuildMounts(paths));

  auto session = std::make_shared<Session>(key, std::move(paths),
                                           std::move(mounts), record);
  if (is_new) {
    AGENTBOX_RETURN_IF_ERROR(session->UpdateRecord([](SessionRecord&) {}));
    VLOG(1) << "Created session " << key.ToString();
  } else {
    VLOG(1) << "Loaded session " << key.ToString() << " ("
            << SensitivityName(record.sensitivity()) << ", "
            << NetworkModeName(record.network_mode()) << ")";
  }
  sessions_.emplace(std::move(key), session);
  return session;
}

NetworkMode SessionManager::RequiredMode(const Session& session) const {
  const SessionRecord record = session.record();
  return options_.governor->Evaluate(record.sensitivity(),
                                     record.network_mode());
}

absl::StatusOr<std::unique_ptr<Environment>> SessionManager::BuildEnvironment(
    Session& session, NetworkMode mode) {
  int64_t generation = 0;
  AGENTBOX_RETURN_IF_ERROR(session.UpdateRecord([&](SessionRecord& record) {
    generation = record.environment_generation() + 1;
    record.set_environment_generation(generation);
  }));
  return Environment::Create(
      absl::StrCat("env-", session.key().tenant_id, "-",
                   session.key().session_id, "-", generation),
      mode, options_.isolation, session.mounts(), options_.allow_list,
      options_.limits);
}

absl::StatusOr<Environment*> SessionManager::AcquireEnvironment(
    Session& session) {
  AGENTBOX_RETURN_IF_ERROR(session.CheckOpen());
  session.Touch();

  // Ratchet first, so a failed tighten still leaves the stricter mode on
  // record and the next access retries it.
  const NetworkMode required = RequiredMode(session);
  if (required != session.network_mode()) {
    LOG(INFO) << "Session " << session.key().ToString()
              << " network mode is now " << NetworkModeName(required);
    AGENTBOX_RETURN_IF_ERROR(session.UpdateRecord(
        [required](SessionRecord& record) {
          record.set_network_mode(
              StricterMode(record.network_mode(), required));
        }));
  }

  Environment* current = session.environment();
  if (current == nullptr) {
    absl::StatusOr<std::unique_ptr<Environment>> created =
        BuildEnvironment(session, required);
    if (!created.ok()) {
      return absl::UnavailableError(
          absl::StrCat("Could not create an environment for session ",
                       session.key().ToString(), ": ",
                       created.status().message()));
    }
    session.ReplaceEnvironment(*std::move(created));
    return session.environment();
  }

  if (StricterMode(current->mode(), required) != current->mode()) {
    // Construct the new environment before giving up the old one.
    absl::StatusOr<std::unique_ptr<Environment>> tightened =
        BuildEnvironment(session, required);
    if (!tightened.ok()) {
      LOG(WARNING) << "Tightening session " << session.key().ToString()
                   << " to " << NetworkModeName(required)
                   << " failed, keeping " << current->id()
                   << " suspended: " << tightened.status();
      return absl::UnavailableError(absl::StrCat(
          "Session ", session.key().ToString(), " must move to network mode ",
          NetworkModeName(required),
          " but its environment could not be rebuilt: ",
          tightened.status().message()));
    }
    LOG(INFO) << "Tightened session " << session.key().ToString() << ": "
              << current->id() << " (" << NetworkModeName(current->mode())
              << ") -> " << (*tightened)->id() << " ("
              << NetworkModeName(required) << ")";
    session.ReplaceEnvironment(*std::move(tightened))->Shutdown();
    return session.environment();
  }

  if (!current->IsAlive()) {
    LOG(WARNING) << "Environment " << current->id() << " of session "
                 << session.key().ToString() << " is dead, recovering";
    absl::StatusOr<std::unique_ptr<Environment>> recovered =
        BuildEnvironment(session, required);
    if (!recovered.ok()) {
      return absl::UnavailableError(absl::StrCat(
          "Could not recover the environment of session ",
          session.key().ToString(), ": ", recovered.status().message()));
    }
    session.ReplaceEnvironment(*std::move(recovered))->Shutdown();
  }
  return session.environment();
}

absl::StatusOr<ExecutionResult> SessionManager::RunInSession(
    Session& session, const Command& command, absl::Duration timeout,
    size_t max_output_bytes) {
  AGENTBOX_ASSIGN_OR_RETURN(Environment * environment,
                            AcquireEnvironment(session));
  absl::StatusOr<ExecutionResult> result =
      environment->Run(command, timeout, max_output_bytes);
  if (result.ok()) {
    session.Touch();
    return result;
  }
  environment->MarkBroken();
  AGENTBOX_ASSIGN_OR_RETURN(environment, AcquireEnvironment(session));
  result = environment->Run(command, timeout, max_output_bytes);
  session.Touch();
  return result;
}

absl::StatusOr<DataSensitivity> SessionManager::MarkSensitivity(
    Session& session, DataSensitivity level, absl::string_view dataset) {
  if (!DataSensitivity_IsValid(level)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid sensitivity level ", static_cast<int>(level)));
  }
  DataSensitivity result = level;
  AGENTBOX_RETURN_IF_ERROR(session.UpdateRecord([&](SessionRecord& record) {
    result = HigherSensitivity(record.sensitivity(), level);
    record.set_sensitivity(result);
    if (!dataset.empty()) {
      DatasetMark* mark = record.add_datasets();
      mark->set_name(std::string(dataset));
      mark->set_sensitivity(level);
      *mark->mutable_marked_at() = EncodeTime(absl::Now());
    }
  }));
  VLOG(1) << "Session " << session.key().ToString() << " sensitivity "
          << SensitivityName(result);
  return result;
}

absl::Status SessionManager::CloseSession(absl::string_view tenant_id,
                                          absl::string_view session_id) {
  SessionKey key{std::string(tenant_id), std::string(session_id)};
  std::shared_ptr<Session> session;
  {
    absl::MutexLock lock(&mu_);
    auto it = sessions_.find(key);
    if (it != sessions_.end()) {
      session = it->second;
    }
  }
  if (session == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("No open session ", key.ToString()));
  }

  // The session stays registered until it is closed, so GetOrCreate cannot
  // hand out a second Session for the same key while a command still runs.
  absl::MutexLock session_lock(&session->mu());
  if (!session->CheckOpen().ok()) {
    return absl::NotFoundError(
        absl::StrCat("No open session ", key.ToString()));
  }
  session->MarkClosed();
  if (std::unique_ptr<Environment> environment =
          session->ReplaceEnvironment(nullptr)) {
    environment->Shutdown();
  }
  {
    absl::MutexLock lock(&mu_);
    auto it = sessions_.find(key);
    if (it != sessions_.end() && it->second == session) {
      sessions_.erase(it);
    }
  }
  VLOG(1) << "Closed session " << key.ToString();
  return absl::OkStatus();
}

int SessionManager::CleanupIdle(absl::Duration threshold) {
  std::vector<std::shared_ptr<Session>> sessions;
  {
    absl::MutexLock lock(&mu_);
    sessions.reserve(sessions_.size());
    for (const auto& [key, session] : sessions_) {
      sessions.push_back(session);
    }
  }
  const absl::Time cutoff = absl::Now() - threshold;
  int destroyed = 0;
  for (const std::shared_ptr<Session>& session : sessions) {
    if (session->last_activity() > cutoff) {
      continue;
    }
    // A session holding its lock is busy, hence not idle.
    if (!session->mu().TryLock()) {
      continue;
    }
    if (std::unique_ptr<Environment> environment =
            session->ReplaceEnvironment(nullptr)) {
      VLOG(1) << "Destroying idle environment " << environment->id();
      environment->Shutdown();
      ++destroyed;
    }
    session->mu().Unlock();
  }
  return destroyed;
}

std::vector<SessionKey> SessionManager::ListSessions() const {
  absl::MutexLock lock(&mu_);
  std::vector<SessionKey> keys;
  keys.reserve(sessions_.size());
  for (const auto& [key, session] : sessions_) {
    keys.push_back(key);
  }
  return keys;
}

}  // namespace agentbox
