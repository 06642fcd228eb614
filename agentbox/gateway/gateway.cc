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

#include "agentbox/gateway/gateway.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "agentbox/gateway/http_request.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/status_macros.h"
#include "agentbox/util/strerror.h"

namespace agentbox {
namespace {

using ::agentbox::file_util::fileops::FDCloser;

constexpr size_t kMaxHeaderSize = 16 * 1024;
constexpr absl::Duration kHeaderTimeout = absl::Seconds(30);
constexpr char kTunnelEstablished[] =
    "HTTP/1.1 200 Connection Established\r\n\r\n";

int ToPollTimeout(absl::Duration d) {
  if (d <= absl::ZeroDuration()) {
    return 0;
  }
  return static_cast<int>(absl::ToInt64Milliseconds(d)) + 1;
}

// Waits until fd is readable. Returns false on timeout or when stop_fd
// becomes readable.
bool WaitReadable(int fd, int stop_fd, absl::Time deadline) {
  for (;;) {
    pollfd fds[] = {{fd, POLLIN, 0}, {stop_fd, POLLIN, 0}};
    int ret = poll(fds, 2, ToPollTimeout(deadline - absl::Now()));
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return ret > 0 && fds[1].revents == 0 && fds[0].revents != 0;
  }
}

absl::StatusOr<std::string> ReadRequestHead(int fd, int stop_fd,
                                            std::string* leftover) {
  const absl::Time deadline = absl::Now() + kHeaderTimeout;
  std::string buffer;
  char chunk[4096];
  for (;;) {
    if (!WaitReadable(fd, stop_fd, deadline)) {
      return absl::DeadlineExceededError("Timed out reading request");
    }
    ssize_t n = TEMP_FAILURE_RETRY(read(fd, chunk, sizeof(chunk)));
    if (n <= 0) {
      return absl::UnavailableError("Client closed before sending request");
    }
    buffer.append(chunk, n);
    if (size_t end = FindHeaderEnd(buffer); end != std::string::npos) {
      *leftover = buffer.substr(end);
      buffer.resize(end);
      return buffer;
    }
    if (buffer.size() > kMaxHeaderSize) {
      return absl::InvalidArgumentError("Request header too large");
    }
  }
}

void SendToClient(int fd, absl::string_view data) {
  if (!file_util::fileops::WriteToFD(fd, data.data(), data.size())) {
    VLOG(1) << "Writing to gateway client failed: " << StrError(errno);
  }
}

absl::StatusOr<std::vector<sockaddr_storage>> Resolve(const std::string& host,
                                                      uint16_t port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const std::string service = absl::StrCat(port);
  if (int err = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
      err != 0) {
    return absl::UnavailableError(
        absl::StrCat("Cannot resolve ", host, ": ", gai_strerror(err)));
  }
  std::vector<sockaddr_storage> addresses;
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    sockaddr_storage storage{};
    memcpy(&storage, ai->ai_addr, ai->ai_addrlen);
    addresses.push_back(storage);
  }
  freeaddrinfo(result);
  return addresses;
}

absl::StatusOr<FDCloser> ConnectWithTimeout(const sockaddr_storage& addr,
                                            absl::Duration timeout) {
  FDCloser fd(socket(addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK,
                     0));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, "socket()");
  }
  const socklen_t len = addr.ss_family == AF_INET ? sizeof(sockaddr_in)
                                                  : sizeof(sockaddr_in6);
  if (connect(fd.get(), reinterpret_cast<const sockaddr*>(&addr), len) != 0) {
    if (errno != EINPROGRESS) {
      return absl::ErrnoToStatus(errno, "connect()");
    }
    pollfd pfd = {fd.get(), POLLOUT, 0};
    int ret = TEMP_FAILURE_RETRY(poll(&pfd, 1, ToPollTimeout(timeout)));
    if (ret == 0) {
      return absl::DeadlineExceededError("connect() timed out");
    }
    int error = 0;
    socklen_t error_len = sizeof(error);
    if (ret < 0 ||
        getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &error, &error_len) != 0) {
      return absl::ErrnoToStatus(errno, "poll()");
    }
    if (error != 0) {
      return absl::ErrnoToStatus(error, "connect()");
    }
  }
  // Relaying uses blocking writes.
  int flags = fcntl(fd.get(), F_GETFL);
  if (flags == -1 || fcntl(fd.get(), F_SETFL, flags & ~O_NONBLOCK) == -1) {
    return absl::ErrnoToStatus(errno, "fcntl()");
  }
  return fd;
}

// Copies bytes in both directions until both sides have closed or stop_fd
// becomes readable.
void Relay(int client, int upstream, int stop_fd) {
  bool client_open = true;
  bool upstream_open = true;
  char buffer[16 * 1024];
  while (client_open || upstream_open) {
    pollfd fds[] = {{client_open ? client : -1, POLLIN, 0},
                    {upstream_open ? upstream : -1, POLLIN, 0},
                    {stop_fd, POLLIN, 0}};
    if (poll(fds, 3, -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    if (fds[2].revents != 0) {
      return;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      const int from = i == 0 ? client : upstream;
      const int to = i == 0 ? upstream : client;
      ssize_t n = TEMP_FAILURE_RETRY(read(from, buffer, sizeof(buffer)));
      if (n <= 0 || !file_util::fileops::WriteToFD(to, buffer, n)) {
        (i == 0 ? client_open : upstream_open) = false;
        shutdown(to, SHUT_WR);
        if (n < 0) {
          return;
        }
      }
    }
  }
}

}  // namespace

Gateway::Gateway(const AllowList* allow_list, absl::Duration connect_timeout,
                 int max_clients)
    : allow_list_(allow_list),
      connect_timeout_(connect_timeout),
      max_clients_(max_clients) {}

absl::StatusOr<std::unique_ptr<GatewayListener>> Gateway::Serve(
    FDCloser listener) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (getsockname(listener.get(), reinterpret_cast<sockaddr*>(&addr), &len) !=
      0) {
    return absl::ErrnoToStatus(errno, "getsockname()");
  }
  const uint16_t port =
      ntohs(addr.ss_family == AF_INET6
                ? reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port
                : reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
  FDCloser stop_event(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK));
  if (stop_event.get() == -1) {
    return absl::ErrnoToStatus(errno, "eventfd()");
  }
  return std::unique_ptr<GatewayListener>(new GatewayListener(
      this, std::move(listener), std::move(stop_event), port));
}

absl::StatusOr<std::unique_ptr<GatewayListener>> Gateway::ListenOnLoopback() {
  FDCloser fd(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, "socket()");
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      listen(fd.get(), SOMAXCONN) != 0) {
    return absl::ErrnoToStatus(errno, "binding gateway listener");
  }
  return Serve(std::move(fd));
}

GatewayStats Gateway::stats() const {
  GatewayStats stats;
  stats.allowed = allowed_.load(std::memory_order_relaxed);
  stats.denied = denied_.load(std::memory_order_relaxed);
  stats.failed = failed_.load(std::memory_order_relaxed);
  return stats;
}

void Gateway::HandleClient(FDCloser client, int stop_fd) {
  std::string leftover;
  absl::StatusOr<std::string> head =
      ReadRequestHead(client.get(), stop_fd, &leftover);
  if (!head.ok()) {
    VLOG(1) << "Dropping gateway client: " << head.status();
    return;
  }
  absl::StatusOr<ProxyRequest> request = ParseProxyRequest(*head);
  if (!request.ok()) {
    SendToClient(client.get(),
                 MakeErrorResponse(400, "Bad Request",
                                   absl::StrCat(request.status().message(),
                                                "\n")));
    return;
  }
  const std::string destination =
      absl::StrCat(request->host, ":", request->port);

  const bool allowed_by_name =
      allow_list_->IsHostnameAllowed(request->host, request->port);
  // Names that match no entry are only resolved when address ranges could
  // still admit them, so denied names never reach the resolver.
  absl::StatusOr<std::vector<sockaddr_storage>> addresses =
      absl::NotFoundError("Not resolved");
  if (allowed_by_name || allow_list_->has_address_entries()) {
    addresses = Resolve(request->host, request->port);
  }
  if (!allowed_by_name && addresses.ok()) {
    std::vector<sockaddr_storage> permitted;
    for (const sockaddr_storage& addr : *addresses) {
      if (allow_list_->IsAddressAllowed(
              reinterpret_cast<const sockaddr*>(&addr))) {
        permitted.push_back(addr);
      }
    }
    *addresses = std::move(permitted);
  }
  if (!allowed_by_name && (!addresses.ok() || addresses->empty())) {
    denied_.fetch_add(1, std::memory_order_relaxed);
    LOG(WARNING) << "Gateway denied " << request->method << " to "
                 << destination;
    SendToClient(client.get(),
                 MakeErrorResponse(403, "Forbidden",
                                   absl::StrCat("agentbox gateway: ",
                                                destination,
                                                " is not on the allow-list\n")));
    return;
  }

  absl::StatusOr<FDCloser> upstream =
      addresses.ok() ? absl::StatusOr<FDCloser>(
                           absl::UnavailableError("No addresses"))
                     : absl::StatusOr<FDCloser>(addresses.status());
  if (addresses.ok()) {
    for (const sockaddr_storage& addr : *addresses) {
      upstream = ConnectWithTimeout(addr, connect_timeout_);
      if (upstream.ok()) {
        break;
      }
    }
  }
  if (!upstream.ok()) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    LOG(WARNING) << "Gateway could not reach " << destination << ": "
                 << upstream.status();
    SendToClient(client.get(),
                 MakeErrorResponse(502, "Bad Gateway",
                                   absl::StrCat(upstream.status().message(),
                                                "\n")));
    return;
  }

  allowed_.fetch_add(1, std::memory_order_relaxed);
  VLOG(1) << "Gateway forwarding " << request->method << " to " << destination;
  if (request->is_tunnel) {
    SendToClient(client.get(), kTunnelEstablished);
  } else {
    leftover.insert(0, request->upstream_head);
  }
  if (!leftover.empty() &&
      !file_util::fileops::WriteToFD(upstream->get(), leftover.data(),
                                     leftover.size())) {
    return;
  }
  Relay(client.get(), upstream->get(), stop_fd);
}

GatewayListener::GatewayListener(Gateway* gateway, FDCloser listener,
                                 FDCloser stop_event, uint16_t port)
    : gateway_(gateway),
      listener_(std::move(listener)),
      stop_event_(std::move(stop_event)),
      port_(port) {
  accept_thread_ = Thread(this, &GatewayListener::AcceptLoop, "gw-accept");
}

GatewayListener::~GatewayListener() {
  const uint64_t one = 1;
  if (write(stop_event_.get(), &one, sizeof(one)) != sizeof(one)) {
    PLOG(ERROR) << "Signalling gateway shutdown";
  }
  if (accept_thread_.IsJoinable()) {
    accept_thread_.Join();
  }
  absl::MutexLock lock(&mu_);
  for (Client& client : clients_) {
    client.thread.Join();
  }
}

std::string GatewayListener::ProxyUrl() const {
  return absl::StrCat("http://127.0.0.1:", port_);
}

int GatewayListener::active_clients() {
  absl::MutexLock lock(&mu_);
  ReapFinishedClients();
  return static_cast<int>(clients_.size());
}

void GatewayListener::ReapFinishedClients() {
  for (auto it = clients_.begin(); it != clients_.end();) {
    if (it->done->HasBeenNotified()) {
      it->thread.Join();
      it = clients_.erase(it);
    } else {
      ++it;
    }
  }
}

void GatewayListener::AcceptLoop() {
  for (;;) {
    pollfd fds[] = {{listener_.get(), POLLIN, 0},
                    {stop_event_.get(), POLLIN, 0}};
    if (poll(fds, 2, -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      PLOG(ERROR) << "poll() on gateway listener";
      return;
    }
    if (fds[1].revents != 0) {
      return;
    }
    FDCloser client(accept4(listener_.get(), nullptr, nullptr, SOCK_CLOEXEC));
    if (client.get() == -1) {
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      PLOG(ERROR) << "accept4() on gateway listener";
      return;
    }
    absl::MutexLock lock(&mu_);
    ReapFinishedClients();
    if (clients_.size() >= static_cast<size_t>(gateway_->max_clients_)) {
      LOG(WARNING) << "Gateway on port " << port_ << " already serves "
                   << clients_.size() << " clients, rejecting another";
      SendToClient(client.get(),
                   MakeErrorResponse(503, "Service Unavailable",
                                     "agentbox gateway: too many open "
                                     "connections\n"));
      continue;
    }
    auto done = std::make_shared<absl::Notification>();
    clients_.push_back(Client{
        Thread(
            [gateway = gateway_, client = std::move(client),
             stop_fd = stop_event_.get(), done]() mutable {
              gateway->HandleClient(std::move(client), stop_fd);
              done->Notify();
            },
            "gw-client"),
        done});
  }
}

}  // namespace agentbox
