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

#ifndef AGENTBOX_SESSION_SESSION_MANAGER_H_
#define AGENTBOX_SESSION_SESSION_MANAGER_H_

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "agentbox/gateway/allow_list.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/sandbox/isolation.h"
#include "agentbox/sandbox/limits.h"
#include "agentbox/sandbox/mounts.h"
#include "agentbox/session/environment.h"
#include "agentbox/session/network_governor.h"
#include "agentbox/session/session.h"
#include "agentbox/session/session.pb.h"
#include "agentbox/util/thread.h"

namespace agentbox {

struct SessionManagerOptions {
  // Storage root; sessions live below <root>/sessions.
  std::string root;
  // Not owned; must outlive the manager.
  Isolation* isolation = nullptr;
  const NetworkGovernor* governor = nullptr;
  // May be null, in which case sessions that require NETWORK_MODE_RESTRICTED
  // cannot get an environment.
  const AllowList* allow_list = nullptr;
  // Additional read-only mounts every session gets (kernel, capabilities).
  std::vector<BindMount> shared_mounts;
  // Host paths made visible at the same location if the system defaults do
  // not already cover them, e.g. the interpreter's installation prefix.
  std::vector<std::string> host_paths;
  // Resource limits of every sandboxed process.
  Limits limits;
  // Size of the private /tmp of each sandbox.
  size_t tmp_size = 256 << 20;
  // Environments unused for this long are destroyed by the reaper.
  absl::Duration idle_timeout = absl::Hours(1);
  // Reaper period; zero disables the background thread.
  absl::Duration reap_interval = absl::ZeroDuration();
};

// Owns the (tenant, session) -> Session mapping. Sessions are created lazily
// on first use; their environments are built on first access, tightened when
// the governor demands a stricter network mode, recreated when found dead and
// destroyed when idle. Workspaces are never deleted.
class SessionManager {
 public:
  static absl::StatusOr<std::unique_ptr<SessionManager>> Create(
      SessionManagerOptions options);

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // Stops the reaper thread.
  virtual ~SessionManager();

  // Returns the session, loading its record from disk or creating its
  // directory tree as needed. Does not build an environment.
  absl::StatusOr<std::shared_ptr<Session>> GetOrCreate(
      absl::string_view tenant_id, absl::string_view session_id)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Returns an environment that satisfies the session's required network
  // mode. Evaluates the governor, persists the ratcheted mode, and builds,
  // tightens or recovers the environment as needed. If tightening fails the
  // old environment is kept but not returned; the next call retries.
  absl::StatusOr<Environment*> AcquireEnvironment(Session& session)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu());

  // Runs command in the session's environment. An infrastructure failure
  // marks the environment broken, recovers it and retries once.
  absl::StatusOr<ExecutionResult> RunInSession(Session& session,
                                               const Command& command,
                                               absl::Duration timeout,
                                               size_t max_output_bytes)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu());

  // Raises the session's recorded sensitivity to at least level and returns
  // the resulting sensitivity. Lower levels are no-ops. dataset, if not
  // empty, is recorded as the source of the mark. The network mode follows
  // on the next access to the session.
  absl::StatusOr<DataSensitivity> MarkSensitivity(Session& session,
                                                  DataSensitivity level,
                                                  absl::string_view dataset);

  // Mode the session has to run in right now.
  NetworkMode RequiredMode(const Session& session) const;

  // Destroys the session's environment and forgets the session. The
  // workspace stays on disk. Waits for a running command to finish; callers
  // still holding the session afterwards get FailedPrecondition from it.
  // Takes the session's mu() before mu_.
  absl::Status CloseSession(absl::string_view tenant_id,
                            absl::string_view session_id)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Destroys the environments of sessions idle for longer than threshold.
  // Busy sessions are skipped. Returns the number of environments destroyed.
  int CleanupIdle(absl::Duration threshold) ABSL_LOCKS_EXCLUDED(mu_);

  std::vector<SessionKey> ListSessions() const ABSL_LOCKS_EXCLUDED(mu_);

  const SessionManagerOptions& options() const { return options_; }

 protected:
  explicit SessionManager(SessionManagerOptions options);

  // Builds a new environment for session in mode.
  virtual absl::StatusOr<std::unique_ptr<Environment>> BuildEnvironment(
      Session& session, NetworkMode mode);

 private:
  absl::StatusOr<Mounts> BuildMounts(const SessionPaths& paths) const;
  void ReaperLoop();

  const SessionManagerOptions options_;

  mutable absl::Mutex mu_;
  absl::flat_hash_map<SessionKey, std::shared_ptr<Session>> sessions_
      ABSL_GUARDED_BY(mu_);

  absl::Notification stop_reaper_;
  Thread reaper_;
};

}  // namespace agentbox

#endif  // AGENTBOX_SESSION_SESSION_MANAGER_H_
