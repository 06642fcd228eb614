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

#ifndef AGENTBOX_SESSION_SESSION_H_
#define AGENTBOX_SESSION_SESSION_H_

#include <memory>
#include <string>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "agentbox/sandbox/mounts.h"
#include "agentbox/session/environment.h"
#include "agentbox/session/session.pb.h"

namespace agentbox {

// Returns InvalidArgument unless id is 1-128 characters from [A-Za-z0-9._-]
// and not "." or "..". kind names the id in the error message.
absl::Status ValidateSessionId(absl::string_view kind, absl::string_view id);

struct SessionKey {
  std::string tenant_id;
  std::string session_id;

  std::string ToString() const {
    return tenant_id + "/" + session_id;
  }

  template <typename H>
  friend H AbslHashValue(H h, const SessionKey& key) {
    return H::combine(std::move(h), key.tenant_id, key.session_id);
  }

  friend bool operator==(const SessionKey& a, const SessionKey& b) {
    return a.tenant_id == b.tenant_id && a.session_id == b.session_id;
  }
};

// Host paths of one session's durable state.
struct SessionPaths {
  static SessionPaths For(absl::string_view root, const SessionKey& key);

  std::string dir;
  std::string workspace;
  std::string state;
  std::string record;
  std::string notebook;
};

// Sandbox paths every session environment sees.
inline constexpr char kWorkspaceMountPoint[] = "/workspace";
inline constexpr char kStateMountPoint[] = "/agentbox/state";

// One (tenant, session) pair. The durable part (workspace, record, notebook)
// lives on disk below paths(); the environment is disposable and owned here
// but managed by SessionManager.
class Session {
 public:
  Session(SessionKey key, SessionPaths paths, Mounts mounts,
          SessionRecord record);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const SessionKey& key() const { return key_; }
  const SessionPaths& paths() const { return paths_; }
  const Mounts& mounts() const { return mounts_; }

  // Held for the whole duration of anything that runs code in the session or
  // changes its environment. Cells therefore execute strictly in order.
  absl::Mutex& mu() ABSL_LOCK_RETURNED(mu_) { return mu_; }

  Environment* environment() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    return environment_.get();
  }
  std::unique_ptr<Environment> ReplaceEnvironment(
      std::unique_ptr<Environment> environment)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    std::swap(environment_, environment);
    return environment;
  }

  // Set by SessionManager::CloseSession. A closed session runs nothing; a
  // caller that still holds it has to look the session up again.
  void MarkClosed() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) { closed_ = true; }
  absl::Status CheckOpen() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  // A copy of the durable record.
  SessionRecord record() const ABSL_LOCKS_EXCLUDED(record_mu_);
  DataSensitivity sensitivity() const ABSL_LOCKS_EXCLUDED(record_mu_);
  NetworkMode network_mode() const ABSL_LOCKS_EXCLUDED(record_mu_);

  // Applies update to the record and persists it. The in-memory record is
  // left unchanged if persisting fails.
  template <typename Fn>
  absl::Status UpdateRecord(Fn update) ABSL_LOCKS_EXCLUDED(record_mu_) {
    absl::MutexLock lock(&record_mu_);
    SessionRecord updated = record_;
    update(updated);
    absl::Status status = PersistLocked(updated);
    if (status.ok()) {
      record_ = std::move(updated);
    }
    return status;
  }

  absl::Time last_activity() const ABSL_LOCKS_EXCLUDED(record_mu_);
  void Touch() ABSL_LOCKS_EXCLUDED(record_mu_);

 private:
  absl::Status PersistLocked(const SessionRecord& record)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(record_mu_);

  const SessionKey key_;
  const SessionPaths paths_;
  const Mounts mounts_;

  absl::Mutex mu_;
  std::unique_ptr<Environment> environment_ ABSL_GUARDED_BY(mu_);
  bool closed_ ABSL_GUARDED_BY(mu_) = false;

  // Acquired after mu_ when both are needed.
  mutable absl::Mutex record_mu_;
  SessionRecord record_ ABSL_GUARDED_BY(record_mu_);
  absl::Time last_activity_ ABSL_GUARDED_BY(record_mu_);
};

}  // namespace agentbox

#endif  // AGENTBOX_SESSION_SESSION_H_
