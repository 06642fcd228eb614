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

#include "agentbox/notebook/ipynb.h"

#include <cerrno>
#include <climits>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/struct.pb.h"
#include "agentbox/notebook/notebook.h"
#include "agentbox/util/file_helpers.h"
#include "agentbox/util/path.h"
#include "agentbox/util/proto_helper.h"

namespace agentbox {
namespace {

using ::google::protobuf::ListValue;
using ::google::protobuf::Struct;
using ::google::protobuf::Value;

Value JsonString(absl::string_view text) {
  Value value;
  value.set_string_value(std::string(text));
  return value;
}

Value JsonNumber(double number) {
  Value value;
  value.set_number_value(number);
  return value;
}

Value JsonNull() {
  Value value;
  value.set_null_value(google::protobuf::NULL_VALUE);
  return value;
}

// Jupyter stores multi-line text as a list of lines that keep their "\n".
Value MultilineValue(absl::string_view text) {
  Value value;
  ListValue* list = value.mutable_list_value();
  std::vector<absl::string_view> lines = absl::StrSplit(text, '\n');
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i + 1 < lines.size()) {
      *list->add_values() = JsonString(absl::StrCat(lines[i], "\n"));
    } else if (!lines[i].empty()) {
      *list->add_values() = JsonString(lines[i]);
    }
  }
  return value;
}

Struct& FieldStruct(Struct& parent, absl::string_view key) {
  return *(*parent.mutable_fields())[std::string(key)].mutable_struct_value();
}

void Set(Struct& parent, absl::string_view key, Value value) {
  (*parent.mutable_fields())[std::string(key)] = std::move(value);
}

Value ExecutionCount(const Cell& cell) {
  return cell.execution_count() > 0 ? JsonNumber(cell.execution_count())
                                    : JsonNull();
}

// Reads a file the notebook refers to. The reference was produced inside the
// sandbox, so it must not lead out of workspace_dir, not even via symlinks.
absl::StatusOr<std::string> ReadWorkspaceFile(absl::string_view workspace_dir,
                                              absl::string_view reference) {
  const std::string path = file::JoinPath(workspace_dir, reference);
  if (file::IsAbsolutePath(reference) || !file::IsWithin(path, workspace_dir)) {
    return absl::PermissionDeniedError(
        absl::StrCat(reference, " is outside the workspace"));
  }
  char resolved_root[PATH_MAX];
  char resolved[PATH_MAX];
  if (realpath(std::string(workspace_dir).c_str(), resolved_root) == nullptr ||
      realpath(path.c_str(), resolved) == nullptr) {
    return absl::ErrnoToStatus(errno, absl::StrCat("realpath(", path, ")"));
  }
  if (!file::IsWithin(resolved, resolved_root)) {
    return absl::PermissionDeniedError(
        absl::StrCat(reference, " resolves outside the workspace"));
  }
  std::string contents;
  if (absl::Status status = file::GetContents(resolved, &contents);
      !status.ok()) {
    return status;
  }
  return contents;
}

Value ConvertOutput(const Cell& cell, const Output& output,
                    absl::string_view workspace_dir) {
  Value value;
  Struct& out = *value.mutable_struct_value();
  switch (output.kind()) {
    case Output::KIND_TEXT:
      if (output.name() == "result") {
        Set(out, "output_type", JsonString("execute_result"));
        Set(FieldStruct(out, "data"), "text/plain",
            MultilineValue(output.text()));
        FieldStruct(out, "metadata");
        Set(out, "execution_count", ExecutionCount(cell));
      } else {
        Set(out, "output_type", JsonString("stream"));
        Set(out, "name", JsonString(output.name() == "stdout" ? "stdout"
                                                               : "stderr"));
        Set(out, "text", MultilineValue(output.text()));
      }
      break;
    case Output::KIND_ERROR: {
      Set(out, "output_type", JsonString("error"));
      Set(out, "ename", JsonString(output.name()));
      std::vector<absl::string_view> lines =
          absl::StrSplit(output.text(), '\n', absl::SkipEmpty());
      Set(out, "evalue", JsonString(lines.empty() ? "" : lines.back()));
      Value traceback;
      traceback.mutable_list_value();
      for (absl::string_view line : lines) {
        *traceback.mutable_list_value()->add_values() = JsonString(line);
      }
      Set(out, "traceback", std::move(traceback));
      break;
    }
    case Output::KIND_IMAGE: {
      Set(out, "output_type", JsonString("display_data"));
      Struct& data = FieldStruct(out, "data");
      Set(data, "text/plain", MultilineValue(output.text()));
      std::string image;
      if (!output.reference().empty()) {
        absl::StatusOr<std::string> contents =
            ReadWorkspaceFile(workspace_dir, output.reference());
        if (contents.ok()) {
          image = *std::move(contents);
        } else {
          LOG(WARNING) << "Not embedding image " << output.reference() << ": "
                       << contents.status();
        }
      }
      if (!image.empty()) {
        Set(data, output.mime_type().empty() ? "image/png"
                                             : output.mime_type(),
            JsonString(absl::Base64Escape(image)));
      }
      Struct& metadata = FieldStruct(out, "metadata");
      if (output.width() > 0 && output.height() > 0) {
        Struct& size = FieldStruct(metadata, "image/png");
        Set(size, "width", JsonNumber(output.width()));
        Set(size, "height", JsonNumber(output.height()));
      }
      break;
    }
    case Output::KIND_STRUCTURED_TABLE:
    case Output::KIND_MARKUP:
    default: {
      Set(out, "output_type", JsonString("execute_result"));
      Struct& data = FieldStruct(out, "data");
      Set(data, "text/plain", MultilineValue(output.text()));
      if (output.kind() == Output::KIND_MARKUP && !output.mime_type().empty()) {
        Set(data, output.mime_type(), MultilineValue(output.text()));
      }
      FieldStruct(out, "metadata");
      Set(out, "execution_count", ExecutionCount(cell));
      break;
    }
  }
  return value;
}

}  // namespace

absl::StatusOr<std::string> ExportIpynb(const Notebook& notebook,
                                        absl::string_view workspace_dir) {
  Struct document;
  Set(document, "nbformat", JsonNumber(4));
  Set(document, "nbformat_minor", JsonNumber(5));

  Struct& metadata = FieldStruct(document, "metadata");
  Struct& kernelspec = FieldStruct(metadata, "kernelspec");
  Set(kernelspec, "name", JsonString("python3"));
  Set(kernelspec, "display_name", JsonString("Python 3"));
  Set(kernelspec, "language", JsonString("python"));
  Set(FieldStruct(metadata, "language_info"), "name", JsonString("python"));
  Struct& origin = FieldStruct(metadata, "agentbox");
  Set(origin, "tenant_id", JsonString(notebook.tenant_id()));
  Set(origin, "session_id", JsonString(notebook.session_id()));

  Value cells;
  ListValue* cell_list = cells.mutable_list_value();
  for (const Cell& cell : notebook.cells()) {
    Struct& entry = *cell_list->add_values()->mutable_struct_value();
    Set(entry, "cell_type", JsonString("code"));
    Set(entry, "id", JsonString(cell.id()));
    Set(FieldStruct(FieldStruct(entry, "metadata"), "agentbox"), "state",
        JsonString(CellStateName(cell.state())));
    Set(entry, "execution_count", ExecutionCount(cell));
    Set(entry, "source", MultilineValue(cell.source()));
    Value outputs;
    ListValue* output_list = outputs.mutable_list_value();
    for (const Output& output : cell.outputs()) {
      *output_list->add_values() = ConvertOutput(cell, output, workspace_dir);
    }
    Set(entry, "outputs", std::move(outputs));
  }
  Set(document, "cells", std::move(cells));
  return SerializeProtoToJson(document);
}

}  // namespace agentbox
