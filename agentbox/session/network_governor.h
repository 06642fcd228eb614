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

#ifndef AGENTBOX_SESSION_NETWORK_GOVERNOR_H_
#define AGENTBOX_SESSION_NETWORK_GOVERNOR_H_

#include <array>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "agentbox/session/session.pb.h"

namespace agentbox {

// Short names without the proto prefix: "PUBLIC", "RESTRICTED", ...
std::string SensitivityName(DataSensitivity sensitivity);
std::string NetworkModeName(NetworkMode mode);

// Case-insensitive, accepts both the short and the full proto name.
absl::StatusOr<DataSensitivity> ParseSensitivity(absl::string_view name);
absl::StatusOr<NetworkMode> ParseNetworkMode(absl::string_view name);

inline NetworkMode StricterMode(NetworkMode a, NetworkMode b) {
  return a > b ? a : b;
}

inline DataSensitivity HigherSensitivity(DataSensitivity a,
                                         DataSensitivity b) {
  return a > b ? a : b;
}

// Maps data sensitivity to the network mode a session must run in. Holds no
// per-session state; the current mode is always passed in by the caller.
class NetworkGovernor {
 public:
  // PUBLIC and INTERNAL run with full network access, CONFIDENTIAL through
  // the gateway and SECRET without any network.
  NetworkGovernor();

  // Parses a comma-separated table such as
  //   "PUBLIC=FULL,INTERNAL=FULL,CONFIDENTIAL=RESTRICTED,SECRET=NONE".
  // Levels not mentioned keep their default mapping. The resulting table must
  // be monotonic: a higher sensitivity never maps to a looser mode.
  static absl::StatusOr<NetworkGovernor> FromSpec(absl::string_view spec);

  NetworkMode RequiredMode(DataSensitivity sensitivity) const;

  // Returns the mode the session has to run in from now on: the stricter of
  // the mode its sensitivity requires and the mode it is already in.
  NetworkMode Evaluate(DataSensitivity sensitivity, NetworkMode current) const;

  std::string DebugString() const;

 private:
  std::array<NetworkMode, 4> table_;
};

}  // namespace agentbox

#endif  // AGENTBOX_SESSION_NETWORK_GOVERNOR_H_
