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

#include "agentbox/session/network_governor.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {
namespace {

constexpr absl::string_view kSensitivityPrefix = "SENSITIVITY_";
constexpr absl::string_view kNetworkModePrefix = "NETWORK_MODE_";

template <typename Enum>
absl::StatusOr<Enum> ParseEnum(absl::string_view name,
                               absl::string_view prefix,
                               bool (*parse)(absl::string_view, Enum*),
                               absl::string_view what) {
  std::string upper = absl::AsciiStrToUpper(absl::StripAsciiWhitespace(name));
  Enum value;
  if (parse(upper, &value) || parse(absl::StrCat(prefix, upper), &value)) {
    return value;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown ", what, ": '", name, "'"));
}

}  // namespace

std::string SensitivityName(DataSensitivity sensitivity) {
  return std::string(
      absl::StripPrefix(DataSensitivity_Name(sensitivity), kSensitivityPrefix));
}

std::string NetworkModeName(NetworkMode mode) {
  return std::string(
      absl::StripPrefix(NetworkMode_Name(mode), kNetworkModePrefix));
}

absl::StatusOr<DataSensitivity> ParseSensitivity(absl::string_view name) {
  return ParseEnum<DataSensitivity>(
      name, kSensitivityPrefix,
      [](absl::string_view n, DataSensitivity* v) {
        return DataSensitivity_Parse(std::string(n), v);
      },
      "sensitivity");
}

absl::StatusOr<NetworkMode> ParseNetworkMode(absl::string_view name) {
  return ParseEnum<NetworkMode>(
      name, kNetworkModePrefix,
      [](absl::string_view n, NetworkMode* v) {
        return NetworkMode_Parse(std::string(n), v);
      },
      "network mode");
}

NetworkGovernor::NetworkGovernor()
    : table_{NETWORK_MODE_FULL, NETWORK_MODE_FULL, NETWORK_MODE_RESTRICTED,
             NETWORK_MODE_NONE} {}

absl::StatusOr<NetworkGovernor> NetworkGovernor::FromSpec(
    absl::string_view spec) {
  NetworkGovernor governor;
  for (absl::string_view entry :
       absl::StrSplit(spec, ',', absl::SkipWhitespace())) {
    std::vector<absl::string_view> parts =
        absl::StrSplit(entry, absl::MaxSplits('=', 1));
    if (parts.size() != 2) {
      return absl::InvalidArgumentError(
          absl::StrCat("Expected LEVEL=MODE, got '", entry, "'"));
    }
    AGENTBOX_ASSIGN_OR_RETURN(DataSensitivity sensitivity,
                              ParseSensitivity(parts[0]));
    AGENTBOX_ASSIGN_OR_RETURN(NetworkMode mode, ParseNetworkMode(parts[1]));
    governor.table_[sensitivity] = mode;
  }
  for (size_t i = 1; i < governor.table_.size(); ++i) {
    if (governor.table_[i] < governor.table_[i - 1]) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Sensitivity policy is not monotonic: ",
          SensitivityName(static_cast<DataSensitivity>(i)), " maps to ",
          NetworkModeName(governor.table_[i]), " which is looser than ",
          NetworkModeName(governor.table_[i - 1])));
    }
  }
  return governor;
}

NetworkMode NetworkGovernor::RequiredMode(DataSensitivity sensitivity) const {
  // Unknown values read from a newer record are treated as the highest level.
  if (sensitivity < SENSITIVITY_PUBLIC || sensitivity > SENSITIVITY_SECRET) {
    return table_[SENSITIVITY_SECRET];
  }
  return table_[sensitivity];
}

NetworkMode NetworkGovernor::Evaluate(DataSensitivity sensitivity,
                                      NetworkMode current) const {
  return StricterMode(RequiredMode(sensitivity), current);
}

std::string NetworkGovernor::DebugString() const {
  std::vector<std::string> entries;
  for (size_t i = 0; i < table_.size(); ++i) {
    entries.push_back(
        absl::StrCat(SensitivityName(static_cast<DataSensitivity>(i)), "=",
                     NetworkModeName(table_[i])));
  }
  return absl::StrJoin(entries, ",");
}

}  // namespace agentbox
