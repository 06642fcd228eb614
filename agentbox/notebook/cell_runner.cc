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

#include "agentbox/notebook/cell_runner.h"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "agentbox/notebook/kernel.h"
#include "agentbox/sandbox/isolation.h"
#include "agentbox/util/path.h"
#include "agentbox/util/proto_helper.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {
namespace {

// Names below the session's state directory.
constexpr char kRequestFile[] = "request.json";
constexpr char kReportFile[] = "report.json";
constexpr char kSnapshotFile[] = "snapshot.pkl";
constexpr char kPendingSnapshotFile[] = "snapshot.next.pkl";

void AddOutput(Cell& cell, Output::Kind kind, absl::string_view name,
               absl::string_view text) {
  Output* output = cell.add_outputs();
  output->set_kind(kind);
  output->set_name(std::string(name));
  output->set_text(std::string(text));
  output->set_mime_type("text/plain");
  output->set_size_bytes(text.size());
}

void RemoveIfExists(const std::string& path) {
  if (unlink(path.c_str()) == -1 && errno != ENOENT) {
    PLOG(WARNING) << "unlink(" << path << ")";
  }
}

}  // namespace

CellRunner::CellRunner(SessionManager* manager, CellRunnerOptions options)
    : manager_(manager), options_(std::move(options)) {}

NotebookStore CellRunner::StoreFor(const Session& session) const {
  return NotebookStore(session.paths().notebook, session.key().tenant_id,
                       session.key().session_id);
}

absl::StatusOr<Notebook> CellRunner::Load(const Session& session) const {
  return StoreFor(session).Load();
}

absl::StatusOr<Cell> CellRunner::Execute(Session& session,
                                         absl::string_view source,
                                         absl::Duration timeout) {
  return AppendAndRun(session, source, timeout);
}

absl::StatusOr<Cell> CellRunner::Rerun(Session& session,
                                       absl::string_view cell_id,
                                       absl::Duration timeout) {
  AGENTBOX_ASSIGN_OR_RETURN(Notebook notebook, Load(session));
  const Cell* cell = FindCell(&notebook, cell_id);
  if (cell == nullptr) {
    return absl::NotFoundError(absl::StrCat("No cell ", cell_id));
  }
  const std::string source = cell->source();
  return AppendAndRun(session, source, timeout);
}

absl::StatusOr<Cell> CellRunner::AppendAndRun(Session& session,
                                              absl::string_view source,
                                              absl::Duration timeout) {
  const NotebookStore store = StoreFor(session);
  AGENTBOX_ASSIGN_OR_RETURN(Notebook notebook, store.Load());
  // Cells of this session only run under its lock, so a RUNNING cell is left
  // over from a process that died mid-cell.
  for (Cell& stale : *notebook.mutable_cells()) {
    if (stale.state() == CELL_STATE_RUNNING) {
      AddOutput(stale, Output::KIND_ERROR, "Interrupted",
                "The service stopped while this cell was running.");
      TransitionCell(&stale, CELL_STATE_ERROR).IgnoreError();
    }
  }
  AGENTBOX_ASSIGN_OR_RETURN(Cell * cell,
                            AppendCell(&notebook, source, options_.max_cells));
  AGENTBOX_RETURN_IF_ERROR(TransitionCell(cell, CELL_STATE_RUNNING));
  AGENTBOX_RETURN_IF_ERROR(store.Save(notebook));

  const absl::Status status = RunCell(session, notebook, *cell, timeout);
  // The cell is in a terminal state now; record it even if running failed.
  const absl::Status saved = store.Save(notebook);
  AGENTBOX_RETURN_IF_ERROR(status);
  AGENTBOX_RETURN_IF_ERROR(saved);
  return *cell;
}

absl::StatusOr<ExecutionResult> CellRunner::LaunchKernel(
    Session& session, const Notebook& notebook, const Cell& cell,
    absl::Duration timeout) {
  const Mounts& mounts = session.mounts();
  const Isolation* isolation = manager_->options().isolation;
  auto state_path = [&](absl::string_view name) {
    return isolation->PathForSandboxee(mounts,
                                       file::JoinPath(kStateMountPoint, name));
  };

  KernelRequest request;
  request.set_source(cell.source());
  *request.mutable_declarations() = notebook.declarations();
  if (!notebook.snapshot().empty()) {
    AGENTBOX_ASSIGN_OR_RETURN(*request.mutable_snapshot_in(),
                              state_path(notebook.snapshot()));
  }
  AGENTBOX_ASSIGN_OR_RETURN(*request.mutable_snapshot_out(),
                            state_path(kPendingSnapshotFile));
  AGENTBOX_ASSIGN_OR_RETURN(*request.mutable_report_path(),
                            state_path(kReportFile));
  AGENTBOX_ASSIGN_OR_RETURN(
      *request.mutable_output_dir(),
      isolation->PathForSandboxee(
          mounts, file::JoinPath(kWorkspaceMountPoint, kOutputDir)));
  request.set_output_reference_prefix(absl::StrCat(kOutputDir, "/"));
  AGENTBOX_ASSIGN_OR_RETURN(
      *request.mutable_reference_dir(),
      isolation->PathForSandboxee(
          mounts, file::JoinPath(kWorkspaceMountPoint, kReferenceDir)));
  request.set_output_tag(cell.id());
  request.set_inline_limit(options_.inline_output_limit);

  const SessionPaths& paths = session.paths();
  RemoveIfExists(file::JoinPath(paths.state, kReportFile));
  RemoveIfExists(file::JoinPath(paths.state, kPendingSnapshotFile));
  AGENTBOX_RETURN_IF_ERROR(WriteProtoToJsonFile(
      file::JoinPath(paths.state, kRequestFile), request));

  Command command;
  command.argv = {options_.python,
                  file::JoinPath(kKernelMountPoint, kKernelFileName),
                  file::JoinPath(kStateMountPoint, kRequestFile)};
  command.env = {
      "PATH=/usr/local/bin:/usr/bin:/bin",
      absl::StrCat("HOME=", kWorkspaceMountPoint),
      "LANG=C.UTF-8",
      "MPLBACKEND=Agg",
      "PYTHONDONTWRITEBYTECODE=1",
      "PYTHONUNBUFFERED=1",
      "TMPDIR=/tmp",
  };
  command.working_dir = kWorkspaceMountPoint;
  return manager_->RunInSession(session, command, timeout,
                                options_.max_output_bytes);
}

absl::Status CellRunner::RunCell(Session& session, Notebook& notebook,
                                 Cell& cell, absl::Duration timeout) {
  const absl::Time start = absl::Now();
  notebook.set_execution_counter(notebook.execution_counter() + 1);
  cell.set_execution_count(notebook.execution_counter());
  *cell.mutable_executed_at() = EncodeTime(start);

  absl::StatusOr<ExecutionResult> result =
      LaunchKernel(session, notebook, cell, timeout);
  *cell.mutable_execution_time() = EncodeDuration(absl::Now() - start);
  const std::string pending =
      file::JoinPath(session.paths().state, kPendingSnapshotFile);

  if (!result.ok()) {
    AddOutput(cell, Output::KIND_ERROR, "EnvironmentError",
              absl::StrCat("The cell could not be run: ",
                           result.status().message()));
    TransitionCell(&cell, CELL_STATE_ERROR).IgnoreError();
    return result.status();
  }
  cell.set_exit_code(result->exit_code);

  if (result->timed_out) {
    RemoveIfExists(pending);
    AddOutput(cell, Output::KIND_ERROR, "TimeoutError",
              absl::StrCat("The cell did not finish within ",
                           absl::FormatDuration(timeout),
                           " and was terminated. Variables keep the values "
                           "they had before this cell."));
    return TransitionCell(&cell, CELL_STATE_TIMED_OUT);
  }

  KernelReport report;
  if (absl::Status status = ReadProtoFromJsonFile(
          file::JoinPath(session.paths().state, kReportFile), &report);
      !status.ok()) {
    LOG(WARNING) << "Cell " << cell.id() << " of session "
                 << session.key().ToString()
                 << " produced no report: " << status << "; "
                 << result->ToString();
    RemoveIfExists(pending);
    std::string text = absl::StrCat(
        "The interpreter exited with status ", result->exit_code,
        " before the cell finished. Variables keep the values they had "
        "before this cell.");
    if (!result->stderr_text.empty()) {
      absl::StrAppend(&text, "\n", result->stderr_text);
    }
    AddOutput(cell, Output::KIND_ERROR, "KernelError", text);
    return TransitionCell(&cell, CELL_STATE_ERROR);
  }

  for (Output& output : *report.mutable_outputs()) {
    // The report is written by the sandboxee and may point anywhere.
    if (!output.reference().empty() &&
        !IsOutputReference(output.reference())) {
      LOG(WARNING) << "Cell " << cell.id() << " of session "
                   << session.key().ToString()
                   << " reported an output outside " << kOutputDir << ": "
                   << output.reference();
      output.clear_reference();
    }
    *cell.add_outputs() = std::move(output);
  }
  if (!result->stdout_text.empty()) {
    AddOutput(cell, Output::KIND_TEXT, "stdout", result->stdout_text);
  }
  if (!result->stderr_text.empty()) {
    AddOutput(cell, Output::KIND_TEXT, "stderr", result->stderr_text);
  }
  if (!report.dropped().empty()) {
    LOG(WARNING) << "Cell " << cell.id() << " of session "
                 << session.key().ToString() << " dropped unserializable "
                 << "values: " << absl::StrJoin(report.dropped(), ", ");
  }

  if (report.snapshot_written()) {
    const std::string committed =
        file::JoinPath(session.paths().state, kSnapshotFile);
    if (rename(pending.c_str(), committed.c_str()) == -1) {
      const absl::Status status = absl::ErrnoToStatus(
          errno, absl::StrCat("rename(", pending, ", ", committed, ")"));
      AddOutput(cell, Output::KIND_ERROR, "EnvironmentError",
                absl::StrCat("The namespace could not be saved: ",
                             status.message()));
      TransitionCell(&cell, CELL_STATE_ERROR).IgnoreError();
      return status;
    }
    notebook.set_snapshot(kSnapshotFile);
  }

  // Declarations travel with the namespace: a failed cell whose namespace
  // was kept also keeps the imports and definitions that ran before the error.
  if (report.snapshot_written() || report.completed()) {
    MergeDeclarations(notebook.mutable_declarations(), report.declarations());
  }
  return TransitionCell(&cell, report.completed() ? CELL_STATE_COMPLETED
                                                  : CELL_STATE_ERROR);
}

absl::Status CellRunner::DeleteCell(Session& session,
                                    absl::string_view cell_id) {
  const NotebookStore store = StoreFor(session);
  AGENTBOX_ASSIGN_OR_RETURN(Notebook notebook, store.Load());
  AGENTBOX_RETURN_IF_ERROR(::agentbox::DeleteCell(&notebook, cell_id));
  return store.Save(notebook);
}

absl::Status CellRunner::Clear(Session& session) {
  const NotebookStore store = StoreFor(session);
  AGENTBOX_ASSIGN_OR_RETURN(Notebook notebook, store.Load());
  ClearNotebook(&notebook);
  AGENTBOX_RETURN_IF_ERROR(store.Save(notebook));
  RemoveIfExists(file::JoinPath(session.paths().state, kSnapshotFile));
  return absl::OkStatus();
}

}  // namespace agentbox
