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

#ifndef AGENTBOX_FLAGS_H_
#define AGENTBOX_FLAGS_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/flags/declare.h"
#include "absl/time/time.h"
#include "agentbox/sandbox/isolation.h"

// agentbox:storage
ABSL_DECLARE_FLAG(std::string, agentbox_root);

// agentbox:sandbox
ABSL_DECLARE_FLAG(agentbox::IsolationMode, agentbox_isolation);
ABSL_DECLARE_FLAG(std::string, agentbox_python);
ABSL_DECLARE_FLAG(int64_t, agentbox_max_output_bytes);
ABSL_DECLARE_FLAG(uint64_t, agentbox_rlimit_as);
ABSL_DECLARE_FLAG(uint64_t, agentbox_rlimit_cpu);
ABSL_DECLARE_FLAG(uint64_t, agentbox_rlimit_fsize);
ABSL_DECLARE_FLAG(uint64_t, agentbox_rlimit_nofile);
ABSL_DECLARE_FLAG(uint64_t, agentbox_rlimit_nproc);

// agentbox:notebook
ABSL_DECLARE_FLAG(absl::Duration, agentbox_cell_timeout);
ABSL_DECLARE_FLAG(int32_t, agentbox_max_cells);
ABSL_DECLARE_FLAG(int64_t, agentbox_inline_output_limit);

// agentbox:session
ABSL_DECLARE_FLAG(absl::Duration, agentbox_session_idle_timeout);
ABSL_DECLARE_FLAG(std::string, agentbox_sensitivity_policy);

// agentbox:gateway
ABSL_DECLARE_FLAG(std::string, agentbox_gateway_allowlist);
ABSL_DECLARE_FLAG(std::vector<std::string>, agentbox_tool_endpoints);

// agentbox:capability
ABSL_DECLARE_FLAG(std::vector<std::string>, agentbox_capability_roots);

#endif  // AGENTBOX_FLAGS_H_
