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

#include "agentbox/flags.h"

#include <cstdint>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/time/time.h"
#include "agentbox/sandbox/isolation.h"

// agentbox:storage
ABSL_FLAG(std::string, agentbox_root, "/var/lib/agentbox",
          "Directory holding session workspaces, notebooks and the kernel");

// agentbox:sandbox
ABSL_FLAG(agentbox::IsolationMode, agentbox_isolation,
          agentbox::IsolationMode::kAuto,
          "How to isolate executed code: 'namespaces' (refuse to run without "
          "them), 'auto' (namespaces, or an unsandboxed fallback with a "
          "warning), or 'none' (development only)");
ABSL_FLAG(std::string, agentbox_python, "/usr/bin/python3",
          "Python interpreter used for notebook cells and .py capabilities");
ABSL_FLAG(int64_t, agentbox_max_output_bytes, 8 << 20,
          "Maximum captured stdout/stderr per command and stream");
ABSL_FLAG(uint64_t, agentbox_rlimit_as, 4ULL << 30,
          "RLIMIT_AS of sandboxed processes in bytes (0 for no limit)");
ABSL_FLAG(uint64_t, agentbox_rlimit_cpu, 600,
          "RLIMIT_CPU of sandboxed processes in seconds (0 for no limit)");
ABSL_FLAG(uint64_t, agentbox_rlimit_fsize, 1ULL << 30,
          "Largest file a sandboxed process may write, in bytes (0 for no "
          "limit)");
ABSL_FLAG(uint64_t, agentbox_rlimit_nofile, 1024,
          "RLIMIT_NOFILE of sandboxed processes (0 for no limit)");
ABSL_FLAG(uint64_t, agentbox_rlimit_nproc, 512,
          "RLIMIT_NPROC of sandboxed processes (0 for no limit)");

// agentbox:notebook
ABSL_FLAG(absl::Duration, agentbox_cell_timeout, absl::Seconds(30),
          "Default wall-clock limit for a cell or command");
ABSL_FLAG(int32_t, agentbox_max_cells, 500,
          "Maximum number of cells per notebook (0 for no limit)");
ABSL_FLAG(int64_t, agentbox_inline_output_limit, 64 << 10,
          "Outputs larger than this are stored in the workspace and "
          "referenced from the notebook");

// agentbox:session
ABSL_FLAG(absl::Duration, agentbox_session_idle_timeout, absl::Hours(1),
          "Environments unused for this long are destroyed; workspaces stay");
ABSL_FLAG(std::string, agentbox_sensitivity_policy, "",
          "Network mode per sensitivity level, e.g. "
          "'PUBLIC=FULL,INTERNAL=FULL,CONFIDENTIAL=RESTRICTED,SECRET=NONE'. "
          "Levels not mentioned keep that default");

// agentbox:gateway
ABSL_FLAG(std::string, agentbox_gateway_allowlist, "",
          "File listing the destinations reachable in RESTRICTED mode, one "
          "per line; empty allows nothing");
ABSL_FLAG(std::vector<std::string>, agentbox_tool_endpoints, {},
          "Tool servers deployed twice, as name=open_address|isolated_address");

// agentbox:capability
ABSL_FLAG(std::vector<std::string>, agentbox_capability_roots, {},
          "Directories containing capability libraries (SKILL.md + scripts/)");
