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

#ifndef AGENTBOX_GATEWAY_ENDPOINT_SELECTOR_H_
#define AGENTBOX_GATEWAY_ENDPOINT_SELECTOR_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "agentbox/session/session.pb.h"

namespace agentbox {

// Addresses of two deployments of the same tool server: one reachable on the
// unrestricted network, one reachable only through the isolated network.
struct ToolEndpoint {
  std::string open_address;
  std::string isolated_address;
};

// Picks which deployment of a tool server a session may talk to, based on
// the session's network mode. The served logic is identical in both.
class EndpointSelector {
 public:
  EndpointSelector() = default;

  // Parses entries of the form "name=open_address|isolated_address". Either
  // address may be empty.
  static absl::StatusOr<EndpointSelector> Parse(
      const std::vector<std::string>& entries);

  absl::Status Register(absl::string_view name, ToolEndpoint endpoint);

  // FULL sessions get the open instance; all stricter modes get the isolated
  // one. Never falls back to the open instance for a restricted session.
  absl::StatusOr<std::string> Select(absl::string_view name,
                                     NetworkMode mode) const;

  bool empty() const { return endpoints_.empty(); }

 private:
  absl::flat_hash_map<std::string, ToolEndpoint> endpoints_;
};

}  // namespace agentbox

#endif  // AGENTBOX_GATEWAY_ENDPOINT_SELECTOR_H_
