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

#include "agentbox/notebook/notebook.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/time/clock.h"
#include "agentbox/util/path.h"
#include "agentbox/util/proto_helper.h"

namespace agentbox {

std::string CellStateName(CellState state) {
  return std::string(
      absl::StripPrefix(CellState_Name(state), "CELL_STATE_"));
}

bool IsTerminal(CellState state) {
  return state == CELL_STATE_COMPLETED || state == CELL_STATE_ERROR ||
         state == CELL_STATE_TIMED_OUT;
}

absl::Status TransitionCell(Cell* cell, CellState state) {
  const bool allowed =
      (cell->state() == CELL_STATE_IDLE && state == CELL_STATE_RUNNING) ||
      (cell->state() == CELL_STATE_RUNNING && IsTerminal(state));
  if (!allowed) {
    return absl::FailedPreconditionError(
        absl::StrCat("Cell ", cell->id(), " cannot move from ",
                     CellStateName(cell->state()), " to ",
                     CellStateName(state)));
  }
  cell->set_state(state);
  return absl::OkStatus();
}

bool IsOutputReference(absl::string_view reference) {
  if (reference.empty() || file::IsAbsolutePath(reference) ||
      file::CleanPath(reference) != reference) {
    return false;
  }
  const std::optional<std::string> relative =
      file::RelativeTo(reference, kOutputDir);
  return relative.has_value() && !relative->empty();
}

absl::StatusOr<Cell*> AppendCell(Notebook* notebook, absl::string_view source,
                                 int max_cells) {
  if (max_cells > 0 && notebook->cells_size() >= max_cells) {
    return absl::FailedPreconditionError(
        absl::StrCat("Notebook is full (", max_cells,
                     " cells); delete cells or clear the notebook"));
  }
  Cell* cell = notebook->add_cells();
  notebook->set_next_cell_id(notebook->next_cell_id() + 1);
  cell->set_id(absl::StrCat("cell-", notebook->next_cell_id()));
  cell->set_index(notebook->cells_size() - 1);
  cell->set_source(std::string(source));
  cell->set_state(CELL_STATE_IDLE);
  *cell->mutable_created_at() = EncodeTime(absl::Now());
  return cell;
}

Cell* FindCell(Notebook* notebook, absl::string_view cell_id) {
  for (Cell& cell : *notebook->mutable_cells()) {
    if (cell.id() == cell_id) {
      return &cell;
    }
  }
  return nullptr;
}

absl::Status DeleteCell(Notebook* notebook, absl::string_view cell_id) {
  auto* cells = notebook->mutable_cells();
  auto it = std::find_if(cells->begin(), cells->end(), [&](const Cell& cell) {
    return cell.id() == cell_id;
  });
  if (it == cells->end()) {
    return absl::NotFoundError(absl::StrCat("No cell ", cell_id));
  }
  if (it->state() == CELL_STATE_RUNNING) {
    return absl::FailedPreconditionError(
        absl::StrCat("Cell ", cell_id, " is running"));
  }
  cells->erase(it);
  for (int i = 0; i < cells->size(); ++i) {
    cells->Mutable(i)->set_index(i);
  }
  return absl::OkStatus();
}

void ClearNotebook(Notebook* notebook) {
  notebook->clear_cells();
  notebook->clear_declarations();
  notebook->clear_snapshot();
  notebook->set_execution_counter(0);
}

void MergeDeclarations(DeclarationSet* into, const DeclarationSet& from) {
  for (const std::string& statement : from.imports()) {
    if (std::find(into->imports().begin(), into->imports().end(),
                  statement) == into->imports().end()) {
      into->add_imports(statement);
    }
  }
  for (const Definition& definition : from.definitions()) {
    auto* definitions = into->mutable_definitions();
    auto it = std::find_if(definitions->begin(), definitions->end(),
                           [&](const Definition& existing) {
                             return existing.name() == definition.name();
                           });
    if (it != definitions->end()) {
      *it = definition;
    } else {
      *into->add_definitions() = definition;
    }
  }
}

NotebookStore::NotebookStore(std::string path, std::string tenant_id,
                             std::string session_id)
    : path_(std::move(path)),
      tenant_id_(std::move(tenant_id)),
      session_id_(std::move(session_id)) {}

absl::StatusOr<Notebook> NotebookStore::Load() const {
  Notebook notebook;
  absl::Status status = ReadProtoFromJsonFile(path_, &notebook);
  if (absl::IsNotFound(status)) {
    notebook.set_tenant_id(tenant_id_);
    notebook.set_session_id(session_id_);
    *notebook.mutable_created_at() = EncodeTime(absl::Now());
    return notebook;
  }
  if (!status.ok()) {
    return status;
  }
  return notebook;
}

absl::Status NotebookStore::Save(Notebook& notebook) const {
  *notebook.mutable_updated_at() = EncodeTime(absl::Now());
  return WriteProtoToJsonFile(path_, notebook);
}

}  // namespace agentbox
