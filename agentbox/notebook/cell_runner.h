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

#ifndef AGENTBOX_NOTEBOOK_CELL_RUNNER_H_
#define AGENTBOX_NOTEBOOK_CELL_RUNNER_H_

#include <cstddef>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/notebook/notebook.h"
#include "agentbox/notebook/notebook.pb.h"
#include "agentbox/session/session.h"
#include "agentbox/session/session_manager.h"

namespace agentbox {

struct CellRunnerOptions {
  // Interpreter path, as seen inside the sandbox.
  std::string python = "/usr/bin/python3";
  // Outputs larger than this are stored below the workspace and only
  // referenced from the notebook.
  size_t inline_output_limit = 64 << 10;
  size_t max_output_bytes = 8 << 20;
  int max_cells = 500;
};

// Executes notebook cells in a session's environment. The illusion of one
// long-lived interpreter is kept by replaying the notebook's declarations and
// restoring a pickled namespace snapshot in every fresh sandbox process.
//
// All methods that take a Session require the caller to hold session.mu().
class CellRunner {
 public:
  // manager must outlive the runner.
  CellRunner(SessionManager* manager, CellRunnerOptions options);

  // Appends source as a new cell, runs it and persists the notebook. Faults
  // inside the cell are reported through the returned cell's state and
  // outputs; an error status means the cell could not be run at all.
  absl::StatusOr<Cell> Execute(Session& session, absl::string_view source,
                               absl::Duration timeout)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu());

  // Runs the source of an existing cell again as a new cell.
  absl::StatusOr<Cell> Rerun(Session& session, absl::string_view cell_id,
                             absl::Duration timeout)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu());

  absl::Status DeleteCell(Session& session, absl::string_view cell_id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu());

  // Removes all cells, declarations and the namespace snapshot.
  absl::Status Clear(Session& session)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu());

  absl::StatusOr<Notebook> Load(const Session& session) const;

 private:
  NotebookStore StoreFor(const Session& session) const;

  absl::StatusOr<Cell> AppendAndRun(Session& session, absl::string_view source,
                                    absl::Duration timeout)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu());

  // Writes the kernel request for cell and runs the kernel.
  absl::StatusOr<ExecutionResult> LaunchKernel(Session& session,
                                               const Notebook& notebook,
                                               const Cell& cell,
                                               absl::Duration timeout)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu());

  // Runs cell, which must be RUNNING, and records the outcome in notebook.
  absl::Status RunCell(Session& session, Notebook& notebook, Cell& cell,
                       absl::Duration timeout)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu());

  SessionManager* manager_;
  const CellRunnerOptions options_;
};

}  // namespace agentbox

#endif  // AGENTBOX_NOTEBOOK_CELL_RUNNER_H_
