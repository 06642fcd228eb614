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

// Selective-connectivity gateway: an allow-list HTTP forward proxy bridging a
// sandbox without external routes to the host network.

#ifndef AGENTBOX_GATEWAY_GATEWAY_H_
#define AGENTBOX_GATEWAY_GATEWAY_H_

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "agentbox/gateway/allow_list.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/thread.h"

namespace agentbox {

// Port the gateway listens on inside a network-isolated sandbox.
inline constexpr uint16_t kGatewayPort = 3128;

// Connections one listener serves at the same time. Further clients get
// 503 Service Unavailable.
inline constexpr int kDefaultMaxGatewayClients = 64;

struct GatewayStats {
  int64_t allowed = 0;
  int64_t denied = 0;
  int64_t failed = 0;
};

class GatewayListener;

// One Gateway exists per restricted environment. It holds no sockets itself;
// each sandboxed command gets a GatewayListener that serves proxy clients for
// the duration of that command.
class Gateway {
 public:
  // allow_list must outlive the gateway.
  explicit Gateway(const AllowList* allow_list,
                   absl::Duration connect_timeout = absl::Seconds(10),
                   int max_clients = kDefaultMaxGatewayClients);

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;

  // Starts accepting proxy clients on listener, a socket already in the
  // listening state. Clients are served until the returned handle is
  // destroyed.
  absl::StatusOr<std::unique_ptr<GatewayListener>> Serve(
      file_util::fileops::FDCloser listener);

  // Creates a listener on an ephemeral host loopback port. Used when the
  // sandbox shares the host network and the proxy is only advisory.
  absl::StatusOr<std::unique_ptr<GatewayListener>> ListenOnLoopback();

  GatewayStats stats() const;

 private:
  friend class GatewayListener;

  // Serves a single client connection. Returns when either side closes or
  // stop_fd becomes readable.
  void HandleClient(file_util::fileops::FDCloser client, int stop_fd);

  const AllowList* allow_list_;
  const absl::Duration connect_timeout_;
  const int max_clients_;
  std::atomic<int64_t> allowed_{0};
  std::atomic<int64_t> denied_{0};
  std::atomic<int64_t> failed_{0};
};

class GatewayListener {
 public:
  GatewayListener(const GatewayListener&) = delete;
  GatewayListener& operator=(const GatewayListener&) = delete;

  // Stops accepting, tears down open tunnels and joins all threads.
  ~GatewayListener();

  uint16_t port() const { return port_; }

  // Value for HTTP_PROXY/HTTPS_PROXY as seen from the client side.
  std::string ProxyUrl() const;

  // Number of client connections still being served.
  int active_clients() ABSL_LOCKS_EXCLUDED(mu_);

 private:
  friend class Gateway;

  struct Client {
    Thread thread;
    std::shared_ptr<absl::Notification> done;
  };

  GatewayListener(Gateway* gateway, file_util::fileops::FDCloser listener,
                  file_util::fileops::FDCloser stop_event, uint16_t port);

  void AcceptLoop();

  // Joins the threads of clients that have disconnected.
  void ReapFinishedClients() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  Gateway* gateway_;
  file_util::fileops::FDCloser listener_;
  file_util::fileops::FDCloser stop_event_;
  const uint16_t port_;
  Thread accept_thread_;
  absl::Mutex mu_;
  std::list<Client> clients_ ABSL_GUARDED_BY(mu_);
};

}  // namespace agentbox

#endif  // AGENTBOX_GATEWAY_GATEWAY_H_
