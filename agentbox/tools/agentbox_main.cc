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

// A command-line front end for the execution service.
//
//   agentbox --session=s1 exec 'x = 5'
//   agentbox --session=s1 exec 'print(x + 1)'
//   agentbox --session=s1 run -- 'ls -la'
//   agentbox --session=s1 mark CONFIDENTIAL customers.csv
//   agentbox --session=s1 capability pdf extract.py report.pdf
//   agentbox --session=s1 export > notebook.ipynb

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/time/time.h"
#include "agentbox/flags.h"
#include "agentbox/notebook/notebook.h"
#include "agentbox/notebook/notebook.pb.h"
#include "agentbox/sandbox/execution_result.h"
#include "agentbox/sandbox/namespace_isolation.h"
#include "agentbox/service.h"
#include "agentbox/session/network_governor.h"
#include "agentbox/util/fileops.h"

ABSL_FLAG(std::string, tenant, "default", "Tenant the session belongs to");
ABSL_FLAG(std::string, session, "default", "Session to operate on");
ABSL_FLAG(absl::Duration, timeout, absl::ZeroDuration(),
          "Wall-clock limit for exec, run and capability; zero means "
          "--agentbox_cell_timeout");
ABSL_FLAG(bool, verbose_outputs, false,
          "Print output metadata (kind, MIME type, references) for exec");

namespace {

constexpr char kUsage[] =
    "Runs agent code in isolated, stateful sessions.\n"
    "Usage: %1$s [OPTION]... COMMAND [ARGS]...\n"
    "Commands:\n"
    "  exec SOURCE|-             run a notebook cell (- reads stdin)\n"
    "  rerun CELL_ID             run an existing cell again\n"
    "  run -- COMMAND_LINE       run a shell command in the sandbox\n"
    "  mark LEVEL [DATASET]      record exposure to sensitive data\n"
    "  capability NAME SCRIPT [ARGS]...\n"
    "                            invoke a capability script\n"
    "  capabilities              list installed capabilities\n"
    "  notebook                  print the notebook cells\n"
    "  export                    print the notebook as .ipynb\n"
    "  status                    print the session record\n"
    "  close                     destroy the session's environment\n"
    "  cleanup                   destroy idle environments\n"
    "  probe                     report whether namespaces are available\n";

void PrintOutputs(const agentbox::Cell& cell) {
  const bool verbose = absl::GetFlag(FLAGS_verbose_outputs);
  for (const agentbox::Output& output : cell.outputs()) {
    if (verbose) {
      absl::PrintF("--- %s %s %s%s\n", agentbox::Output::Kind_Name(output.kind()),
                   output.name(), output.mime_type(),
                   output.reference().empty()
                       ? ""
                       : absl::StrCat(" -> ", output.reference()));
    }
    switch (output.kind()) {
      case agentbox::Output::KIND_ERROR:
        absl::FPrintF(stderr, "%s: %s\n", output.name(), output.text());
        break;
      case agentbox::Output::KIND_IMAGE:
        absl::PrintF("[image %dx%d: %s]\n", output.width(), output.height(),
                     output.reference());
        break;
      default:
        if (output.name() == "stderr") {
          absl::FPrintF(stderr, "%s", output.text());
        } else {
          absl::PrintF("%s", output.text());
          if (!output.text().empty() && output.text().back() != '\n') {
            absl::PrintF("\n");
          }
        }
        break;
    }
  }
}

int CellExitCode(const agentbox::Cell& cell) {
  absl::FPrintF(stderr, "[%s %s]\n", cell.id(),
                agentbox::CellStateName(cell.state()));
  return cell.state() == agentbox::CELL_STATE_COMPLETED ? EXIT_SUCCESS
                                                        : EXIT_FAILURE;
}

int PrintResult(const agentbox::ExecutionResult& result) {
  absl::PrintF("%s", result.stdout_text);
  absl::FPrintF(stderr, "%s", result.stderr_text);
  VLOG(1) << result.ToString();
  if (result.timed_out) {
    absl::FPrintF(stderr, "Timed out after %s\n",
                  absl::FormatDuration(result.wall_time));
    return EXIT_FAILURE;
  }
  return result.exit_code;
}

int Fail(const absl::Status& status) {
  absl::FPrintF(stderr, "%s\n", status.ToString());
  return EXIT_FAILURE;
}

int Main(const std::vector<std::string>& args) {
  const std::string& command = args[0];
  if (command == "probe") {
    const bool supported = agentbox::NamespaceIsolation::IsSupported();
    absl::PrintF("namespaces: %s\n", supported ? "available" : "unavailable");
    return supported ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  absl::StatusOr<std::unique_ptr<agentbox::ExecutionService>> service =
      agentbox::ExecutionService::Create(agentbox::ServiceOptions::FromFlags());
  if (!service.ok()) {
    return Fail(service.status());
  }
  const agentbox::SessionRef ref{absl::GetFlag(FLAGS_tenant),
                                 absl::GetFlag(FLAGS_session)};
  const absl::Duration timeout = absl::GetFlag(FLAGS_timeout);

  if (command == "exec" && args.size() == 2) {
    std::string source = args[1];
    if (source == "-") {
      source.assign(std::istreambuf_iterator<char>(std::cin),
                    std::istreambuf_iterator<char>());
    }
    absl::StatusOr<agentbox::Cell> cell =
        (*service)->Execute(ref, source, timeout);
    if (!cell.ok()) {
      return Fail(cell.status());
    }
    PrintOutputs(*cell);
    return CellExitCode(*cell);
  }
  if (command == "rerun" && args.size() == 2) {
    absl::StatusOr<agentbox::Cell> cell =
        (*service)->RerunCell(ref, args[1], timeout);
    if (!cell.ok()) {
      return Fail(cell.status());
    }
    PrintOutputs(*cell);
    return CellExitCode(*cell);
  }
  if (command == "run" && args.size() >= 2) {
    const std::vector<std::string> words(args.begin() + 1, args.end());
    absl::StatusOr<agentbox::ExecutionResult> result =
        (*service)->RunCommand(ref, absl::StrJoin(words, " "), timeout);
    if (!result.ok()) {
      return Fail(result.status());
    }
    return PrintResult(*result);
  }
  if (command == "mark" && (args.size() == 2 || args.size() == 3)) {
    absl::StatusOr<agentbox::DataSensitivity> level =
        agentbox::ParseSensitivity(args[1]);
    if (!level.ok()) {
      return Fail(level.status());
    }
    absl::StatusOr<agentbox::DataSensitivity> recorded =
        (*service)->MarkSensitivity(ref, *level,
                                    args.size() == 3 ? args[2] : "");
    if (!recorded.ok()) {
      return Fail(recorded.status());
    }
    absl::PrintF("sensitivity: %s\n", agentbox::SensitivityName(*recorded));
    return EXIT_SUCCESS;
  }
  if (command == "capability" && args.size() >= 3) {
    const std::vector<std::string> script_args(args.begin() + 3, args.end());
    absl::StatusOr<agentbox::ExecutionResult> result =
        (*service)->InvokeCapability(ref, args[1], args[2], script_args,
                                     timeout);
    if (!result.ok()) {
      return Fail(result.status());
    }
    return PrintResult(*result);
  }
  if (command == "capabilities") {
    for (const agentbox::Capability* capability :
         (*service)->ListCapabilities()) {
      absl::PrintF("%s\t%s\n", capability->name, capability->description);
      for (const std::string& script : capability->scripts) {
        absl::PrintF("  %s\n", script);
      }
    }
    return EXIT_SUCCESS;
  }
  if (command == "notebook") {
    absl::StatusOr<agentbox::Notebook> notebook = (*service)->GetNotebook(ref);
    if (!notebook.ok()) {
      return Fail(notebook.status());
    }
    for (const agentbox::Cell& cell : notebook->cells()) {
      absl::PrintF("[%s] %s\n%s\n", cell.id(),
                   agentbox::CellStateName(cell.state()), cell.source());
    }
    return EXIT_SUCCESS;
  }
  if (command == "export") {
    absl::StatusOr<std::string> ipynb = (*service)->ExportNotebook(ref);
    if (!ipynb.ok()) {
      return Fail(ipynb.status());
    }
    absl::PrintF("%s", *ipynb);
    return EXIT_SUCCESS;
  }
  if (command == "status") {
    absl::StatusOr<agentbox::SessionRecord> record =
        (*service)->GetSessionRecord(ref);
    if (!record.ok()) {
      return Fail(record.status());
    }
    absl::PrintF("session: %s/%s\nsensitivity: %s\nnetwork: %s\n",
                 record->tenant_id(), record->session_id(),
                 agentbox::SensitivityName(record->sensitivity()),
                 agentbox::NetworkModeName(record->network_mode()));
    for (const agentbox::DatasetMark& mark : record->datasets()) {
      absl::PrintF("dataset: %s (%s)\n", mark.name(),
                   agentbox::SensitivityName(mark.sensitivity()));
    }
    return EXIT_SUCCESS;
  }
  if (command == "close") {
    if (absl::Status status = (*service)->CloseSession(ref); !status.ok()) {
      return Fail(status);
    }
    return EXIT_SUCCESS;
  }
  if (command == "cleanup") {
    const int destroyed = (*service)->CleanupIdle(
        absl::GetFlag(FLAGS_agentbox_session_idle_timeout));
    absl::PrintF("destroyed %d idle environment(s)\n", destroyed);
    return EXIT_SUCCESS;
  }

  absl::FPrintF(stderr, "Unknown command or wrong arguments: %s\n",
                absl::StrJoin(args, " "));
  return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string program_name =
      agentbox::file_util::fileops::Basename(argv[0]);
  absl::SetProgramUsageMessage(absl::StrFormat(kUsage, program_name));

  std::vector<std::string> args;
  {
    const std::vector<char*> parsed_argv = absl::ParseCommandLine(argc, argv);
    args.assign(parsed_argv.begin() + 1, parsed_argv.end());
  }
  absl::InitializeLog();

  if (args.empty()) {
    absl::FPrintF(stderr, "Missing command\n");
    return EXIT_FAILURE;
  }
  return Main(args);
}
