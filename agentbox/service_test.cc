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

#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "agentbox/notebook/notebook.h"
#include "agentbox/notebook/notebook.pb.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/sandbox/unsandboxed_isolation.h"
#include "agentbox/session/session.pb.h"
#include "agentbox/testing.h"
#include "agentbox/util/file_helpers.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/status_matchers.h"

namespace agentbox {
namespace {

namespace fileops = ::agentbox::file_util::fileops;

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Not;
using ::testing::SizeIs;
using ::testing::StrEq;

// Concatenated text of all outputs of cell called name.
std::string OutputText(const Cell& cell, const std::string& name) {
  std::string text;
  for (const Output& output : cell.outputs()) {
    if (output.name() == name) {
      absl::StrAppend(&text, output.text());
    }
  }
  return text;
}

bool HasRemediation(const Cell& cell) {
  for (const Output& output : cell.outputs()) {
    if (output.remediation()) {
      return true;
    }
  }
  return false;
}

class ExecutionServiceTest : public testing::Test {
 protected:
  void SetUp() override {
    base_ = CreateTestTempDir("service_test");
    options_.root = file::JoinPath(base_, "root");
    options_.python = GetTestPython();
    options_.reap_interval = absl::ZeroDuration();
    options_.cell_timeout = absl::Seconds(60);
    options_.tool_endpoints = {
        "search=http://search.open:8080|http://search.isolated:8080"};
  }

  // Sessions run unsandboxed so the tests also work where user namespaces
  // are disabled.
  std::unique_ptr<ExecutionService> CreateService() {
    absl::StatusOr<std::unique_ptr<ExecutionService>> service =
        ExecutionService::Create(options_,
                                 std::make_unique<UnsandboxedIsolation>());
    EXPECT_THAT(service, IsOk());
    return service.ok() ? *std::move(service) : nullptr;
  }

  std::string base_;
  ServiceOptions options_;
  const SessionRef ref_{"acme", "analysis"};
};

TEST_F(ExecutionServiceTest, RejectsInvalidOptions) {
  options_.cell_timeout = absl::ZeroDuration();
  EXPECT_THAT(ExecutionService::Create(options_,
                                       std::make_unique<UnsandboxedIsolation>()),
              StatusIs(absl::StatusCode::kInvalidArgument));
  options_.cell_timeout = absl::Seconds(1);
  EXPECT_THAT(ExecutionService::Create(options_, nullptr),
              StatusIs(absl::StatusCode::kInvalidArgument));
  options_.sensitivity_policy = "SECRET=FULL";
  EXPECT_THAT(ExecutionService::Create(options_,
                                       std::make_unique<UnsandboxedIsolation>()),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(ExecutionServiceTest, VariablesPersistAcrossCells) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell first, service->Execute(ref_, "x = 5"));
  EXPECT_THAT(first.state(), Eq(CELL_STATE_COMPLETED));
  EXPECT_THAT(first.id(), StrEq("cell-1"));
  EXPECT_THAT(first.execution_count(), Eq(1));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell second,
                                service->Execute(ref_, "print(x + 1)"));
  EXPECT_THAT(second.state(), Eq(CELL_STATE_COMPLETED));
  EXPECT_THAT(OutputText(second, "stdout"), StrEq("6\n"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell third, service->Execute(ref_, "def f(n):\n    return 2 * n\n"));
  EXPECT_THAT(third.state(), Eq(CELL_STATE_COMPLETED));
  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell fourth, service->Execute(ref_, "f(10)"));
  EXPECT_THAT(OutputText(fourth, "result"), StrEq("20"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(Notebook notebook, service->GetNotebook(ref_));
  EXPECT_THAT(notebook.cells(), SizeIs(4));
  EXPECT_THAT(notebook.execution_counter(), Eq(4));
}

TEST_F(ExecutionServiceTest, ExceptionsMarkCellAsError) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell failed,
                                service->Execute(ref_, "y = 1\n1 / 0"));
  EXPECT_THAT(failed.state(), Eq(CELL_STATE_ERROR));
  EXPECT_THAT(OutputText(failed, "ZeroDivisionError"),
              HasSubstr("division by zero"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell syntax, service->Execute(ref_, "def ("));
  EXPECT_THAT(syntax.state(), Eq(CELL_STATE_ERROR));
  EXPECT_THAT(OutputText(syntax, "SyntaxError"), Not(IsEmpty()));
}

TEST_F(ExecutionServiceTest, FailedCellKeepsDeclarationsThatRan) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell failed,
      service->Execute(ref_, "import json\n"
                             "def f(n):\n    return 2 * n\n"
                             "y = 3\n"
                             "raise ValueError('boom')\n"
                             "def never():\n    return 0\n"));
  EXPECT_THAT(failed.state(), Eq(CELL_STATE_ERROR));
  EXPECT_THAT(OutputText(failed, "ValueError"), HasSubstr("boom"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell next,
      service->Execute(ref_, "print(y, f(2), json.dumps([1]), "
                             "'never' in globals())"));
  EXPECT_THAT(next.state(), Eq(CELL_STATE_COMPLETED)) << next.DebugString();
  EXPECT_THAT(OutputText(next, "stdout"), StrEq("3 4 [1] False\n"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(Notebook notebook, service->GetNotebook(ref_));
  ASSERT_THAT(notebook.declarations().definitions(), SizeIs(1));
  EXPECT_THAT(notebook.declarations().definitions(0).name(), StrEq("f"));
  EXPECT_THAT(notebook.declarations().imports(),
              testing::ElementsAre("import json"));
}

TEST_F(ExecutionServiceTest, TimeoutKeepsPreviousVariables) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  ASSERT_THAT(service->Execute(ref_, "x = 5"), IsOk());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell looping,
      service->Execute(ref_, "x = 7\nwhile True:\n    pass\n",
                       absl::Seconds(2)));
  EXPECT_THAT(looping.state(), Eq(CELL_STATE_TIMED_OUT));
  EXPECT_THAT(OutputText(looping, "TimeoutError"), HasSubstr("terminated"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell after, service->Execute(ref_, "x"));
  EXPECT_THAT(after.state(), Eq(CELL_STATE_COMPLETED));
  EXPECT_THAT(OutputText(after, "result"), StrEq("5"));
}

TEST_F(ExecutionServiceTest, UnserializableValuesGetRemediation) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell cell, service->Execute(ref_, "handle = open('data.txt', 'w')\n"
                                        "count = 3\n"));
  EXPECT_THAT(cell.state(), Eq(CELL_STATE_COMPLETED));
  EXPECT_THAT(HasRemediation(cell), IsTrue());
  EXPECT_THAT(OutputText(cell, "note"), HasSubstr("open file handle"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell next, service->Execute(ref_, "print(count, 'handle' in globals())"));
  EXPECT_THAT(OutputText(next, "stdout"), StrEq("3 False\n"));
}

TEST_F(ExecutionServiceTest, WorkbooksAreReloadedFromWorkspace) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell imported,
                                service->Execute(ref_, "import openpyxl"));
  if (imported.state() != CELL_STATE_COMPLETED) {
    GTEST_SKIP() << "openpyxl is not installed";
  }

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell create,
      service->Execute(ref_, "wb = openpyxl.Workbook()\n"
                             "ws = wb.active\n"
                             "ws.title = 'data'\n"
                             "ws['A1'] = 42\n"
                             "other = wb.create_sheet('other')\n"));
  EXPECT_THAT(create.state(), Eq(CELL_STATE_COMPLETED)) << create.DebugString();
  EXPECT_THAT(HasRemediation(create), IsFalse()) << create.DebugString();

  const std::string references =
      file::JoinPath(options_.root, "sessions", "acme", "analysis",
                     "workspace", kReferenceDir);
  EXPECT_THAT(
      fileops::Exists(file::JoinPath(references, "wb-cell-2.xlsx"), false),
      IsTrue());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell read, service->Execute(ref_, "print(type(wb).__name__, "
                                        "ws['A1'].value, ws.title, "
                                        "ws.parent is wb, other.title)"));
  EXPECT_THAT(read.state(), Eq(CELL_STATE_COMPLETED)) << read.DebugString();
  EXPECT_THAT(OutputText(read, "stdout"),
              StrEq("Workbook 42 data True other\n"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell again, service->Execute(ref_, "print(wb['data']['A1'].value)"));
  EXPECT_THAT(OutputText(again, "stdout"), StrEq("42\n"));
  // Only the files of the last two snapshots are kept.
  EXPECT_THAT(
      fileops::Exists(file::JoinPath(references, "wb-cell-2.xlsx"), false),
      IsFalse());
  EXPECT_THAT(
      fileops::Exists(file::JoinPath(references, "wb-cell-4.xlsx"), false),
      IsTrue());
}

TEST_F(ExecutionServiceTest, ReadOnlyWorkbooksGetRemediation) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell create,
      service->Execute(ref_, "import openpyxl\n"
                             "openpyxl.Workbook().save('book.xlsx')\n"));
  if (create.state() != CELL_STATE_COMPLETED) {
    GTEST_SKIP() << "openpyxl is not installed";
  }

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell cell,
      service->Execute(ref_, "book = openpyxl.load_workbook('book.xlsx', "
                             "read_only=True)\n"));
  EXPECT_THAT(cell.state(), Eq(CELL_STATE_COMPLETED)) << cell.DebugString();
  EXPECT_THAT(HasRemediation(cell), IsTrue());
  EXPECT_THAT(OutputText(cell, "note"), HasSubstr("read-only"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell next, service->Execute(ref_, "print('book' in globals())"));
  EXPECT_THAT(OutputText(next, "stdout"), StrEq("False\n"));
}

TEST_F(ExecutionServiceTest, RerunDeleteAndClear) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  ASSERT_THAT(service->Execute(ref_, "n = 1"), IsOk());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell bump,
                                service->Execute(ref_, "n += 1\nprint(n)"));
  EXPECT_THAT(OutputText(bump, "stdout"), StrEq("2\n"));
  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell again,
                                service->RerunCell(ref_, bump.id()));
  EXPECT_THAT(again.id(), StrEq("cell-3"));
  EXPECT_THAT(OutputText(again, "stdout"), StrEq("3\n"));
  EXPECT_THAT(service->RerunCell(ref_, "cell-99"),
              StatusIs(absl::StatusCode::kNotFound));

  ASSERT_THAT(service->DeleteCell(ref_, "cell-1"), IsOk());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(Notebook notebook, service->GetNotebook(ref_));
  EXPECT_THAT(notebook.cells(), SizeIs(2));

  ASSERT_THAT(service->ClearNotebook(ref_), IsOk());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Cell fresh, service->Execute(ref_, "print('n' in globals())"));
  EXPECT_THAT(OutputText(fresh, "stdout"), StrEq("False\n"));
}

TEST_F(ExecutionServiceTest, ExecuteAsync) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  std::unique_ptr<PendingCell> pending =
      service->ExecuteAsync(ref_, "print(sum(range(10)))");
  AGENTBOX_ASSERT_OK_AND_ASSIGN(Cell cell, pending->AwaitResult());
  EXPECT_THAT(pending->IsDone(), IsTrue());
  EXPECT_THAT(OutputText(cell, "stdout"), StrEq("45\n"));
}

TEST_F(ExecutionServiceTest, RunCommandSharesWorkspace) {
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      ExecutionResult result,
      service->RunCommand(ref_, "echo report > summary.txt && cat summary.txt"));
  EXPECT_THAT(result.exit_code, Eq(0)) << result.stderr_text;
  EXPECT_THAT(result.stdout_text, StrEq("report\n"));
  EXPECT_THAT(fileops::Exists(file::JoinPath(options_.root, "sessions", "acme",
                                             "analysis", "workspace",
                                             "summary.txt"),
                              false),
              IsTrue());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(ExecutionResult failed,
                                service->RunCommand(ref_, "exit 3"));
  EXPECT_THAT(failed.exit_code, Eq(3));
  EXPECT_THAT(service->RunCommand(ref_, ""),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(ExecutionServiceTest, SensitivityDrivesToolEndpoint) {
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  EXPECT_THAT(service->ResolveToolEndpoint(ref_, "search"),
              IsOkAndHolds("http://search.open:8080"));
  EXPECT_THAT(service->MarkSensitivity(ref_, SENSITIVITY_CONFIDENTIAL,
                                       "payroll"),
              IsOkAndHolds(SENSITIVITY_CONFIDENTIAL));
  EXPECT_THAT(service->ResolveToolEndpoint(ref_, "search"),
              IsOkAndHolds("http://search.isolated:8080"));
  EXPECT_THAT(service->MarkSensitivity(ref_, SENSITIVITY_INTERNAL),
              IsOkAndHolds(SENSITIVITY_CONFIDENTIAL));
  EXPECT_THAT(service->ResolveToolEndpoint(ref_, "unknown"),
              StatusIs(absl::StatusCode::kNotFound));

  // Other sessions are unaffected.
  EXPECT_THAT(service->ResolveToolEndpoint({"acme", "other"}, "search"),
              IsOkAndHolds("http://search.open:8080"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(SessionRecord record,
                                service->GetSessionRecord(ref_));
  EXPECT_THAT(record.sensitivity(), Eq(SENSITIVITY_CONFIDENTIAL));
  ASSERT_THAT(record.datasets(), SizeIs(1));
  EXPECT_THAT(record.datasets(0).name(), StrEq("payroll"));
}

TEST_F(ExecutionServiceTest, InvokesCapabilityScripts) {
  const std::string capability = file::JoinPath(base_, "capabilities", "greet");
  ASSERT_THAT(fileops::CreateDirectoryRecursively(
                  file::JoinPath(capability, "scripts"), 0755),
              IsOk());
  ASSERT_THAT(file::SetContents(file::JoinPath(capability, "SKILL.md"),
                                "---\nname: greet\ndescription: Greets.\n---\n"),
              IsOk());
  ASSERT_THAT(file::SetContents(file::JoinPath(capability, "scripts", "hi.sh"),
                                "echo \"hello $1\"\n"),
              IsOk());
  options_.capability_roots = {file::JoinPath(base_, "capabilities")};
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  ASSERT_THAT(service->ListCapabilities(), SizeIs(1));
  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      ExecutionResult result,
      service->InvokeCapability(ref_, "greet", "hi.sh", {"world"}));
  EXPECT_THAT(result.exit_code, Eq(0)) << result.stderr_text;
  EXPECT_THAT(result.stdout_text, StrEq("hello world\n"));
  EXPECT_THAT(service->InvokeCapability(ref_, "greet", "../SKILL.md", {}),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(ExecutionServiceTest, ExportNotebook) {
  SKIP_WITHOUT_PYTHON();
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  ASSERT_THAT(service->Execute(ref_, "print('hi')"), IsOk());
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::string ipynb,
                                service->ExportNotebook(ref_));
  EXPECT_THAT(ipynb, HasSubstr("\"nbformat\": 4"));
  EXPECT_THAT(ipynb, HasSubstr("print('hi')"));
  EXPECT_THAT(ipynb, HasSubstr("\"output_type\": \"stream\""));
}

TEST_F(ExecutionServiceTest, CloseSessionAndCleanup) {
  std::unique_ptr<ExecutionService> service = CreateService();
  ASSERT_THAT(service, testing::NotNull());

  ASSERT_THAT(service->RunCommand(ref_, "true"), IsOk());
  EXPECT_THAT(service->CleanupIdle(absl::Hours(1)), Eq(0));
  EXPECT_THAT(service->CloseSession(ref_), IsOk());
  EXPECT_THAT(service->CloseSession(ref_),
              StatusIs(absl::StatusCode::kNotFound));
  EXPECT_THAT(service->isolation().IsSecure(), IsFalse());
}

}  // namespace
}  // namespace agentbox
