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

#ifndef AGENTBOX_NOTEBOOK_KERNEL_H_
#define AGENTBOX_NOTEBOOK_KERNEL_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace agentbox {

inline constexpr char kKernelFileName[] = "agentbox_kernel.py";

// Sandbox directory the kernel is mounted at, read-only.
inline constexpr char kKernelMountPoint[] = "/agentbox/kernel";

// Source of the Python program that executes one cell inside the sandbox.
// Embedded at build time.
absl::string_view KernelSource();

// Writes the kernel to <dir>/agentbox_kernel.py unless an identical copy is
// already there. Returns the file's path.
absl::StatusOr<std::string> InstallKernel(absl::string_view dir);

}  // namespace agentbox

#endif  // AGENTBOX_NOTEBOOK_KERNEL_H_
