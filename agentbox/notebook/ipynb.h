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

#ifndef AGENTBOX_NOTEBOOK_IPYNB_H_
#define AGENTBOX_NOTEBOOK_IPYNB_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "agentbox/notebook/notebook.pb.h"

namespace agentbox {

// Renders notebook as a Jupyter notebook document (nbformat 4.5). Images
// stored out-of-band are read from workspace_dir and embedded as base64; a
// missing image degrades to its text placeholder.
absl::StatusOr<std::string> ExportIpynb(const Notebook& notebook,
                                        absl::string_view workspace_dir);

}  // namespace agentbox

#endif  // AGENTBOX_NOTEBOOK_IPYNB_H_
