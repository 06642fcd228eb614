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

#include "agentbox/session/environment.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "agentbox/session/network_governor.h"
#include "agentbox/util/fileops.h"

namespace agentbox {

namespace fileops = ::agentbox::file_util::fileops;

absl::StatusOr<std::unique_ptr<Environment>> Environment::Create(
    std::string id, NetworkMode mode, Isolation* isolation, Mounts mounts,
    const AllowList* allow_list, const Limits& limits) {
  if (isolation == nullptr) {
    return absl::InvalidArgumentError("No isolation strategy");
  }
  for (const BindMount& bind : mounts.GetBindMounts()) {
    if (!fileops::Exists(bind.source, /*fully_resolve=*/true)) {
      return absl::UnavailableError(
          absl::StrCat("Mount source ", bind.source, " for ", bind.target,
                       " does not exist"));
    }
  }
  std::unique_ptr<Gateway> gateway;
  if (mode == NETWORK_MODE_RESTRICTED) {
    if (allow_list == nullptr) {
      return absl::FailedPreconditionError(
          "Restricted network mode requires a gateway allow-list");
    }
    gateway = std::make_unique<Gateway>(allow_list);
  }
  if (!isolation->IsSecure() && mode != NETWORK_MODE_FULL) {
    LOG(WARNING) << "Environment " << id << " should run with network mode "
                 << NetworkModeName(mode) << " but " << isolation->Name()
                 << " isolation cannot enforce it";
  }
  VLOG(1) << "Created environment " << id << " (" << NetworkModeName(mode)
          << ", " << isolation->Name() << ")";
  return absl::WrapUnique(new Environment(std::move(id), mode, isolation,
                                          std::move(mounts),
                                          std::move(gateway), limits));
}

Environment::Environment(std::string id, NetworkMode mode,
                         Isolation* isolation, Mounts mounts,
                         std::unique_ptr<Gateway> gateway,
                         const Limits& limits)
    : id_(std::move(id)),
      mode_(mode),
      isolation_(isolation),
      mounts_(std::move(mounts)),
      gateway_(std::move(gateway)),
      limits_(limits) {}

absl::StatusOr<ExecutionResult> Environment::Run(const Command& command,
                                                 absl::Duration timeout,
                                                 size_t max_output_bytes) {
  if (shut_down_) {
    return absl::FailedPreconditionError(
        absl::StrCat("Environment ", id_, " was shut down"));
  }
  RunOptions options;
  options.isolate_network = mode_ != NETWORK_MODE_FULL;
  options.isolate_pid = true;
  options.timeout = timeout;
  options.gateway = gateway_.get();
  options.max_output_bytes = max_output_bytes;
  options.limits = limits_;
  absl::StatusOr<ExecutionResult> result =
      isolation_->Run(command, mounts_, options);
  if (!result.ok()) {
    LOG(WARNING) << "Environment " << id_ << " failed: " << result.status();
    MarkBroken();
  }
  return result;
}

bool Environment::IsAlive() const {
  if (broken_ || shut_down_) {
    return false;
  }
  for (const BindMount& bind : mounts_.GetBindMounts()) {
    if (!bind.read_only && !fileops::Exists(bind.source, true)) {
      return false;
    }
  }
  return true;
}

void Environment::Shutdown() {
  if (!shut_down_.exchange(true)) {
    VLOG(1) << "Shut down environment " << id_;
  }
}

GatewayStats Environment::gateway_stats() const {
  return gateway_ ? gateway_->stats() : GatewayStats{};
}

}  // namespace agentbox
