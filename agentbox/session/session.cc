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

#include "agentbox/session/session.h"

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "agentbox/util/path.h"
#include "agentbox/util/proto_helper.h"

namespace agentbox {

constexpr size_t kMaxIdLength = 128;

absl::Status ValidateSessionId(absl::string_view kind, absl::string_view id) {
  if (id.empty() || id.size() > kMaxIdLength) {
    return absl::InvalidArgumentError(absl::StrCat(
        kind, " must be 1 to ", kMaxIdLength, " characters long"));
  }
  if (id == "." || id == "..") {
    return absl::InvalidArgumentError(absl::StrCat("Invalid ", kind, ": ", id));
  }
  for (char c : id) {
    if (!absl::ascii_isalnum(c) && c != '.' && c != '_' && c != '-') {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid character in ", kind, " '", id,
                       "'; allowed: A-Z a-z 0-9 . _ -"));
    }
  }
  return absl::OkStatus();
}

SessionPaths SessionPaths::For(absl::string_view root, const SessionKey& key) {
  SessionPaths paths;
  paths.dir = file::JoinPath(root, "sessions", key.tenant_id, key.session_id);
  paths.workspace = file::JoinPath(paths.dir, "workspace");
  paths.state = file::JoinPath(paths.dir, "state");
  paths.record = file::JoinPath(paths.dir, "session.json");
  paths.notebook = file::JoinPath(paths.dir, "notebook.json");
  return paths;
}

Session::Session(SessionKey key, SessionPaths paths, Mounts mounts,
                 SessionRecord record)
    : key_(std::move(key)),
      paths_(std::move(paths)),
      mounts_(std::move(mounts)),
      record_(std::move(record)),
      last_activity_(absl::Now()) {}

SessionRecord Session::record() const {
  absl::MutexLock lock(&record_mu_);
  return record_;
}

DataSensitivity Session::sensitivity() const {
  absl::MutexLock lock(&record_mu_);
  return record_.sensitivity();
}

NetworkMode Session::network_mode() const {
  absl::MutexLock lock(&record_mu_);
  return record_.network_mode();
}

absl::Time Session::last_activity() const {
  absl::MutexLock lock(&record_mu_);
  return last_activity_;
}

void Session::Touch() {
  absl::MutexLock lock(&record_mu_);
  last_activity_ = absl::Now();
}

absl::Status Session::CheckOpen() const {
  if (closed_) {
    return absl::FailedPreconditionError(
        absl::StrCat("Session ", key_.ToString(), " was closed"));
  }
  return absl::OkStatus();
}

absl::Status Session::PersistLocked(const SessionRecord& record) {
  SessionRecord copy = record;
  *copy.mutable_last_activity() = EncodeTime(last_activity_);
  return WriteProtoToJsonFile(paths_.record, copy);
}

}  // namespace agentbox
