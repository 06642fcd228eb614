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

#include "agentbox/gateway/endpoint_selector.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "agentbox/session/network_governor.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {

absl::StatusOr<EndpointSelector> EndpointSelector::Parse(
    const std::vector<std::string>& entries) {
  EndpointSelector selector;
  for (absl::string_view entry : entries) {
    entry = absl::StripAsciiWhitespace(entry);
    if (entry.empty()) {
      continue;
    }
    std::vector<absl::string_view> name_and_addresses =
        absl::StrSplit(entry, absl::MaxSplits('=', 1));
    if (name_and_addresses.size() != 2) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Expected name=open_address|isolated_address, got '", entry, "'"));
    }
    std::vector<std::string> addresses =
        absl::StrSplit(name_and_addresses[1], absl::MaxSplits('|', 1));
    ToolEndpoint endpoint;
    endpoint.open_address = addresses[0];
    if (addresses.size() > 1) {
      endpoint.isolated_address = addresses[1];
    }
    AGENTBOX_RETURN_IF_ERROR(
        selector.Register(name_and_addresses[0], std::move(endpoint)));
  }
  return selector;
}

absl::Status EndpointSelector::Register(absl::string_view name,
                                        ToolEndpoint endpoint) {
  if (name.empty()) {
    return absl::InvalidArgumentError("Tool endpoint name must not be empty");
  }
  if (endpoint.open_address.empty() && endpoint.isolated_address.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Tool endpoint '", name, "' has no address"));
  }
  if (!endpoints_.emplace(std::string(name), std::move(endpoint)).second) {
    return absl::AlreadyExistsError(
        absl::StrCat("Tool endpoint '", name, "' registered twice"));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> EndpointSelector::Select(absl::string_view name,
                                                     NetworkMode mode) const {
  auto it = endpoints_.find(name);
  if (it == endpoints_.end()) {
    return absl::NotFoundError(absl::StrCat("Unknown tool endpoint: ", name));
  }
  const std::string& address = mode == NETWORK_MODE_FULL
                                   ? it->second.open_address
                                   : it->second.isolated_address;
  if (address.empty()) {
    return absl::FailedPreconditionError(
        absl::StrCat("Tool '", name, "' has no instance reachable in ",
                     NetworkModeName(mode), " mode"));
  }
  return address;
}

}  // namespace agentbox
