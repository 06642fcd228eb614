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

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "agentbox/gateway/allow_list.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/sandbox/isolation.h"
#include "agentbox/sandbox/unsandboxed_isolation.h"
#include "agentbox/session/environment.h"
#include "agentbox/session/network_governor.h"
#include "agentbox/session/session.h"
#include "agentbox/session/session.pb.h"
#include "agentbox/testing.h"
#include "agentbox/util/file_helpers.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/status_matchers.h"
#include "agentbox/util/thread.h"

namespace agentbox {
namespace {

namespace fileops = ::agentbox::file_util::fileops;

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsFalse;
using ::testing::IsNull;
using ::testing::IsTrue;
using ::testing::Ne;
using ::testing::NotNull;
using ::testing::StrEq;

Command Shell(const std::string& script) {
  Command command;
  command.argv = {"/bin/sh", "-c", script};
  command.env = {"PATH=/usr/bin:/bin"};
  command.working_dir = kWorkspaceMountPoint;
  return command;
}

// Fails BuildEnvironment on request.
class FlakySessionManager : public SessionManager {
 public:
  explicit FlakySessionManager(SessionManagerOptions options)
      : SessionManager(std::move(options)) {}

  void set_fail_builds(bool fail) { fail_builds_ = fail; }

 protected:
  absl::StatusOr<std::unique_ptr<Environment>> BuildEnvironment(
      Session& session, NetworkMode mode) override {
    if (fail_builds_) {
      return absl::ResourceExhaustedError("no capacity");
    }
    return SessionManager::BuildEnvironment(session, mode);
  }

 private:
  bool fail_builds_ = false;
};

class SessionManagerTest : public testing::Test {
 protected:
  void SetUp() override {
    ASSERT_THAT(allow_list_.AllowHost("pypi.org", 443), IsOk());
    options_.root = CreateTestTempDir("session_manager_test");
    options_.isolation = &isolation_;
    options_.governor = &governor_;
    options_.allow_list = &allow_list_;
    options_.tmp_size = 1 << 20;
  }

  std::unique_ptr<SessionManager> CreateManager() {
    absl::StatusOr<std::unique_ptr<SessionManager>> manager =
        SessionManager::Create(options_);
    EXPECT_THAT(manager, IsOk());
    return manager.ok() ? *std::move(manager) : nullptr;
  }

  UnsandboxedIsolation isolation_;
  NetworkGovernor governor_;
  AllowList allow_list_;
  SessionManagerOptions options_;
};

TEST_F(SessionManagerTest, CreateRequiresRootAndCollaborators) {
  SessionManagerOptions options = options_;
  options.root.clear();
  EXPECT_THAT(SessionManager::Create(options),
              StatusIs(absl::StatusCode::kInvalidArgument));
  options = options_;
  options.isolation = nullptr;
  EXPECT_THAT(SessionManager::Create(options),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(SessionManagerTest, GetOrCreateLaysOutSession) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  EXPECT_THAT(fileops::IsDirectory(session->paths().workspace), IsTrue());
  EXPECT_THAT(fileops::IsDirectory(session->paths().state), IsTrue());
  EXPECT_THAT(fileops::Exists(session->paths().record, false), IsTrue());
  EXPECT_THAT(session->paths().dir,
              StrEq(file::JoinPath(options_.root, "sessions", "acme", "s1")));

  SessionRecord record = session->record();
  EXPECT_THAT(record.tenant_id(), StrEq("acme"));
  EXPECT_THAT(record.session_id(), StrEq("s1"));
  EXPECT_THAT(record.sensitivity(), Eq(SENSITIVITY_PUBLIC));
  EXPECT_THAT(record.network_mode(), Eq(NETWORK_MODE_FULL));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> again,
                                manager->GetOrCreate("acme", "s1"));
  EXPECT_THAT(again.get(), Eq(session.get()));
  EXPECT_THAT(manager->ListSessions().size(), Eq(1));
}

TEST_F(SessionManagerTest, RejectsInvalidIds) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  EXPECT_THAT(manager->GetOrCreate("acme", ".."),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(manager->GetOrCreate("", "s1"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(manager->GetOrCreate("acme", "a/b"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(SessionManagerTest, RunsCommandsAgainstWorkspace) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      ExecutionResult result,
      manager->RunInSession(*session,
                            Shell("echo 42 > /workspace/answer.txt && "
                                  "cat /workspace/answer.txt"),
                            absl::Seconds(30), 1 << 20));
  EXPECT_THAT(result.exit_code, Eq(0)) << result.stderr_text;
  EXPECT_THAT(result.stdout_text, StrEq("42\n"));

  std::string contents;
  ASSERT_THAT(file::GetContents(
                  file::JoinPath(session->paths().workspace, "answer.txt"),
                  &contents),
              IsOk());
  EXPECT_THAT(contents, StrEq("42\n"));
}

TEST_F(SessionManagerTest, NetworkModeOnlyTightens) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  absl::MutexLock lock(&session->mu());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(Environment * environment,
                                manager->AcquireEnvironment(*session));
  EXPECT_THAT(environment->mode(), Eq(NETWORK_MODE_FULL));

  EXPECT_THAT(manager->MarkSensitivity(*session, SENSITIVITY_CONFIDENTIAL,
                                       "customers.csv"),
              IsOkAndHolds(SENSITIVITY_CONFIDENTIAL));
  // Takes effect on the next access.
  EXPECT_THAT(session->network_mode(), Eq(NETWORK_MODE_FULL));
  EXPECT_THAT(manager->RequiredMode(*session), Eq(NETWORK_MODE_RESTRICTED));

  const std::string full_id = environment->id();
  AGENTBOX_ASSERT_OK_AND_ASSIGN(environment,
                                manager->AcquireEnvironment(*session));
  EXPECT_THAT(environment->mode(), Eq(NETWORK_MODE_RESTRICTED));
  EXPECT_THAT(environment->id(), Ne(full_id));
  EXPECT_THAT(session->network_mode(), Eq(NETWORK_MODE_RESTRICTED));

  // Lower marks never loosen anything.
  EXPECT_THAT(manager->MarkSensitivity(*session, SENSITIVITY_PUBLIC, ""),
              IsOkAndHolds(SENSITIVITY_CONFIDENTIAL));
  AGENTBOX_ASSERT_OK_AND_ASSIGN(environment,
                                manager->AcquireEnvironment(*session));
  EXPECT_THAT(environment->mode(), Eq(NETWORK_MODE_RESTRICTED));

  EXPECT_THAT(manager->MarkSensitivity(*session, SENSITIVITY_SECRET, "keys"),
              IsOkAndHolds(SENSITIVITY_SECRET));
  AGENTBOX_ASSERT_OK_AND_ASSIGN(environment,
                                manager->AcquireEnvironment(*session));
  EXPECT_THAT(environment->mode(), Eq(NETWORK_MODE_NONE));

  SessionRecord record = session->record();
  ASSERT_THAT(record.datasets_size(), Eq(2));
  EXPECT_THAT(record.datasets(0).name(), StrEq("customers.csv"));
  EXPECT_THAT(record.datasets(1).sensitivity(), Eq(SENSITIVITY_SECRET));
  EXPECT_THAT(record.environment_generation(), Eq(3));
}

TEST_F(SessionManagerTest, RejectsInvalidSensitivity) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  EXPECT_THAT(manager->MarkSensitivity(
                  *session, static_cast<DataSensitivity>(42), ""),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(SessionManagerTest, RatchetSurvivesRestart) {
  {
    std::unique_ptr<SessionManager> manager = CreateManager();
    ASSERT_THAT(manager, NotNull());
    AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                  manager->GetOrCreate("acme", "s1"));
    ASSERT_THAT(
        manager->MarkSensitivity(*session, SENSITIVITY_CONFIDENTIAL, ""),
        IsOk());
    absl::MutexLock lock(&session->mu());
    ASSERT_THAT(manager->AcquireEnvironment(*session), IsOk());
  }

  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  EXPECT_THAT(session->sensitivity(), Eq(SENSITIVITY_CONFIDENTIAL));
  EXPECT_THAT(session->network_mode(), Eq(NETWORK_MODE_RESTRICTED));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(Environment * environment,
                                manager->AcquireEnvironment(*session));
  EXPECT_THAT(environment->mode(), Eq(NETWORK_MODE_RESTRICTED));
}

TEST_F(SessionManagerTest, RestrictedModeNeedsAllowList) {
  options_.allow_list = nullptr;
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  ASSERT_THAT(manager->MarkSensitivity(*session, SENSITIVITY_CONFIDENTIAL, ""),
              IsOk());
  absl::MutexLock lock(&session->mu());
  EXPECT_THAT(manager->AcquireEnvironment(*session),
              StatusIs(absl::StatusCode::kUnavailable,
                       HasSubstr("allow-list")));
}

TEST_F(SessionManagerTest, FailedTighteningSuspendsSession) {
  FlakySessionManager manager(options_);
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager.GetOrCreate("acme", "s1"));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(Environment * original,
                                manager.AcquireEnvironment(*session));
  const std::string original_id = original->id();

  ASSERT_THAT(manager.MarkSensitivity(*session, SENSITIVITY_SECRET, ""),
              IsOk());
  manager.set_fail_builds(true);
  EXPECT_THAT(manager.AcquireEnvironment(*session),
              StatusIs(absl::StatusCode::kUnavailable,
                       HasSubstr("no capacity")));
  // The stricter mode is on record and the old environment is kept, but it
  // is not handed out.
  EXPECT_THAT(session->network_mode(), Eq(NETWORK_MODE_NONE));
  ASSERT_THAT(session->environment(), NotNull());
  EXPECT_THAT(session->environment()->id(), StrEq(original_id));
  EXPECT_THAT(manager.RunInSession(*session, Shell("true"), absl::Seconds(5),
                                   1 << 10),
              StatusIs(absl::StatusCode::kUnavailable));

  manager.set_fail_builds(false);
  AGENTBOX_ASSERT_OK_AND_ASSIGN(Environment * tightened,
                                manager.AcquireEnvironment(*session));
  EXPECT_THAT(tightened->mode(), Eq(NETWORK_MODE_NONE));
  EXPECT_THAT(tightened->id(), Ne(original_id));
}

TEST_F(SessionManagerTest, RecoversDeadEnvironment) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  absl::MutexLock lock(&session->mu());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(Environment * environment,
                                manager->AcquireEnvironment(*session));
  const std::string dead_id = environment->id();
  environment->MarkBroken();
  EXPECT_THAT(environment->IsAlive(), IsFalse());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(environment,
                                manager->AcquireEnvironment(*session));
  EXPECT_THAT(environment->id(), Ne(dead_id));
  EXPECT_THAT(environment->IsAlive(), IsTrue());
}

TEST_F(SessionManagerTest, CloseSessionKeepsWorkspace) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  const std::string file =
      file::JoinPath(session->paths().workspace, "keep.txt");
  ASSERT_THAT(file::SetContents(file, "kept"), IsOk());
  {
    absl::MutexLock lock(&session->mu());
    ASSERT_THAT(manager->AcquireEnvironment(*session), IsOk());
  }

  EXPECT_THAT(manager->CloseSession("acme", "s1"), IsOk());
  EXPECT_THAT(manager->CloseSession("acme", "s1"),
              StatusIs(absl::StatusCode::kNotFound));
  EXPECT_THAT(manager->ListSessions(), testing::IsEmpty());
  EXPECT_THAT(fileops::Exists(file, false), IsTrue());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> reopened,
                                manager->GetOrCreate("acme", "s1"));
  EXPECT_THAT(reopened.get(), Ne(session.get()));
  std::string contents;
  ASSERT_THAT(file::GetContents(file, &contents), IsOk());
  EXPECT_THAT(contents, StrEq("kept"));
}

TEST_F(SessionManagerTest, CloseSessionWaitsForBusySession) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));

  // Stands in for a command running in the session.
  session->mu().Lock();
  absl::Notification closed;
  absl::Status close_status;
  Thread closer(
      [&manager, &closed, &close_status]() {
        close_status = manager->CloseSession("acme", "s1");
        closed.Notify();
      },
      "closer");
  absl::SleepFor(absl::Milliseconds(50));
  EXPECT_THAT(closed.HasBeenNotified(), IsFalse());
  // Still registered, so nobody gets a second Session for the same key.
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> same,
                                manager->GetOrCreate("acme", "s1"));
  EXPECT_THAT(same.get(), Eq(session.get()));
  session->mu().Unlock();
  closer.Join();
  EXPECT_THAT(close_status, IsOk());

  {
    absl::MutexLock lock(&session->mu());
    EXPECT_THAT(manager->AcquireEnvironment(*session),
                StatusIs(absl::StatusCode::kFailedPrecondition));
    EXPECT_THAT(session->environment(), IsNull());
  }
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> reopened,
                                manager->GetOrCreate("acme", "s1"));
  EXPECT_THAT(reopened.get(), Ne(session.get()));
  absl::MutexLock lock(&reopened->mu());
  EXPECT_THAT(manager->AcquireEnvironment(*reopened), IsOk());
}

TEST_F(SessionManagerTest, WorkspaceSurvivesTightening) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  absl::MutexLock lock(&session->mu());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      ExecutionResult written,
      manager->RunInSession(*session,
                            Shell("echo findings > /workspace/notes.txt && "
                                  "mkdir -p /workspace/out && "
                                  "echo 1 > /workspace/out/part.csv"),
                            absl::Seconds(30), 1 << 20));
  EXPECT_THAT(written.exit_code, Eq(0)) << written.stderr_text;
  Environment* before = session->environment();
  ASSERT_THAT(before, NotNull());
  EXPECT_THAT(before->mode(), Eq(NETWORK_MODE_FULL));
  const std::string full_id = before->id();

  EXPECT_THAT(manager->MarkSensitivity(*session, SENSITIVITY_SECRET, "keys"),
              IsOkAndHolds(SENSITIVITY_SECRET));
  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      ExecutionResult read,
      manager->RunInSession(*session,
                            Shell("cat /workspace/notes.txt "
                                  "/workspace/out/part.csv"),
                            absl::Seconds(30), 1 << 20));
  EXPECT_THAT(read.exit_code, Eq(0)) << read.stderr_text;
  EXPECT_THAT(read.stdout_text, StrEq("findings\n1\n"));

  Environment* after = session->environment();
  ASSERT_THAT(after, NotNull());
  EXPECT_THAT(after->mode(), Eq(NETWORK_MODE_NONE));
  EXPECT_THAT(after->id(), Ne(full_id));
}

TEST_F(SessionManagerTest, CleanupIdleDestroysOnlyIdleEnvironments) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  {
    absl::MutexLock lock(&session->mu());
    ASSERT_THAT(manager->AcquireEnvironment(*session), IsOk());
  }
  EXPECT_THAT(manager->CleanupIdle(absl::Hours(1)), Eq(0));

  absl::SleepFor(absl::Milliseconds(20));
  EXPECT_THAT(manager->CleanupIdle(absl::Milliseconds(10)), Eq(1));
  {
    absl::MutexLock lock(&session->mu());
    EXPECT_THAT(session->environment(), IsNull());
  }
  // The session itself stays open and gets a fresh environment on demand.
  EXPECT_THAT(manager->ListSessions().size(), Eq(1));
  absl::MutexLock lock(&session->mu());
  EXPECT_THAT(manager->AcquireEnvironment(*session), IsOk());
}

TEST_F(SessionManagerTest, CleanupIdleSkipsBusySessions) {
  std::unique_ptr<SessionManager> manager = CreateManager();
  ASSERT_THAT(manager, NotNull());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::shared_ptr<Session> session,
                                manager->GetOrCreate("acme", "s1"));
  absl::MutexLock lock(&session->mu());
  ASSERT_THAT(manager->AcquireEnvironment(*session), IsOk());
  absl::SleepFor(absl::Milliseconds(20));
  EXPECT_THAT(manager->CleanupIdle(absl::Milliseconds(10)), Eq(0));
  EXPECT_THAT(session->environment(), NotNull());
}

}  // namespace
}  // namespace agentbox
