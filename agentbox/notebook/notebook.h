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

#ifndef AGENTBOX_NOTEBOOK_NOTEBOOK_H_
#define AGENTBOX_NOTEBOOK_NOTEBOOK_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "agentbox/notebook/notebook.pb.h"

namespace agentbox {

// Workspace-relative directory the kernel stores large outputs in.
inline constexpr char kOutputDir[] = ".agentbox/outputs";
// Workspace-relative directory of files that stand in for namespace values.
inline constexpr char kReferenceDir[] = ".agentbox/references";

// "COMPLETED", "TIMED_OUT", ...
std::string CellStateName(CellState state);

bool IsTerminal(CellState state);

// Moves cell to state. Only IDLE -> RUNNING and RUNNING -> terminal are
// allowed.
absl::Status TransitionCell(Cell* cell, CellState state);

// Appends a new IDLE cell. Fails with FailedPrecondition once the notebook
// holds max_cells cells (no limit if max_cells <= 0).
absl::StatusOr<Cell*> AppendCell(Notebook* notebook, absl::string_view source,
                                 int max_cells);

// Returns true if reference is a clean relative path below kOutputDir, the
// only place an output may point to.
bool IsOutputReference(absl::string_view reference);

Cell* FindCell(Notebook* notebook, absl::string_view cell_id);

// Removes the cell and renumbers the remaining ones. The namespace and the
// declaration set are left alone.
absl::Status DeleteCell(Notebook* notebook, absl::string_view cell_id);

// Drops all cells and the accumulated state; the next cell starts from an
// empty namespace.
void ClearNotebook(Notebook* notebook);

// Adds the declarations of from to into. Imports are deduplicated by their
// text; a definition replaces an earlier one of the same name in place so
// the set always reflects the latest version.
void MergeDeclarations(DeclarationSet* into, const DeclarationSet& from);

// Persists a notebook as JSON.
class NotebookStore {
 public:
  NotebookStore(std::string path, std::string tenant_id,
                std::string session_id);

  // Returns an empty notebook if none was saved yet.
  absl::StatusOr<Notebook> Load() const;

  // Stamps updated_at and replaces the stored notebook atomically.
  absl::Status Save(Notebook& notebook) const;

 private:
  const std::string path_;
  const std::string tenant_id_;
  const std::string session_id_;
};

}  // namespace agentbox

#endif  // AGENTBOX_NOTEBOOK_NOTEBOOK_H_
