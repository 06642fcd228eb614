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
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/functional/any_invocable.h"
#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "agentbox/gateway/allow_list.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/status_matchers.h"
#include "agentbox/util/thread.h"

namespace agentbox {
namespace {

using ::agentbox::file_util::fileops::FDCloser;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsTrue;
using ::testing::Not;
using ::testing::StartsWith;
using ::testing::StrEq;

// A loopback TCP server that hands its first connection to a handler.
class TestUpstream {
 public:
  explicit TestUpstream(absl::AnyInvocable<void(int) &&> handler) {
    listener_ = FDCloser(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    CHECK_NE(listener_.get(), -1);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    CHECK_EQ(bind(listener_.get(), reinterpret_cast<sockaddr*>(&addr),
                  sizeof(addr)),
             0);
    CHECK_EQ(listen(listener_.get(), 1), 0);
    socklen_t len = sizeof(addr);
    CHECK_EQ(getsockname(listener_.get(), reinterpret_cast<sockaddr*>(&addr),
                         &len),
             0);
    port_ = ntohs(addr.sin_port);
    thread_ = Thread(
        [this, handler = std::move(handler)]() mutable {
          FDCloser client(accept4(listener_.get(), nullptr, nullptr,
                                  SOCK_CLOEXEC));
          if (client.get() != -1) {
            std::move(handler)(client.get());
          }
        },
        "upstream");
  }

  ~TestUpstream() {
    shutdown(listener_.get(), SHUT_RDWR);
    thread_.Join();
  }

  uint16_t port() const { return port_; }

 private:
  FDCloser listener_;
  uint16_t port_ = 0;
  Thread thread_;
};

FDCloser ConnectToLoopback(uint16_t port) {
  FDCloser fd(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  CHECK_NE(fd.get(), -1);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);
  CHECK_EQ(connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)),
           0);
  return fd;
}

void Send(int fd, absl::string_view data) {
  CHECK(file_util::fileops::WriteToFD(fd, data.data(), data.size()));
}

// Reads exactly n bytes, or less if the peer closes first.
std::string ReadN(int fd, size_t n) {
  std::string result;
  char buffer[1024];
  while (result.size() < n) {
    ssize_t r = read(fd, buffer, std::min(sizeof(buffer), n - result.size()));
    if (r <= 0) {
      break;
    }
    result.append(buffer, r);
  }
  return result;
}

std::string ReadToEnd(int fd) {
  absl::StatusOr<std::string> contents =
      file_util::fileops::ReadAllFromFD(fd);
  CHECK_OK(contents.status());
  return *contents;
}

constexpr char kEstablished[] = "HTTP/1.1 200 Connection Established\r\n\r\n";

TEST(GatewayTest, TunnelsToAllowedDestination) {
  TestUpstream upstream([](int fd) {
    const std::string ping = ReadN(fd, 4);
    Send(fd, absl::StrCat("pong:", ping));
  });
  AllowList allow_list;
  ASSERT_THAT(allow_list.AllowIPv4("127.0.0.1", upstream.port()), IsOk());
  Gateway gateway(&allow_list);
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::unique_ptr<GatewayListener> listener,
                                gateway.ListenOnLoopback());
  EXPECT_THAT(listener->ProxyUrl(),
              StrEq(absl::StrCat("http://127.0.0.1:", listener->port())));

  FDCloser client = ConnectToLoopback(listener->port());
  Send(client.get(), absl::StrCat("CONNECT 127.0.0.1:", upstream.port(),
                                  " HTTP/1.1\r\n\r\n"));
  EXPECT_THAT(ReadN(client.get(), sizeof(kEstablished) - 1),
              StrEq(kEstablished));
  Send(client.get(), "ping");
  EXPECT_THAT(ReadN(client.get(), 9), StrEq("pong:ping"));

  EXPECT_THAT(gateway.stats().allowed, Eq(1));
  EXPECT_THAT(gateway.stats().denied, Eq(0));
}

TEST(GatewayTest, ForwardsPlainHttpInOriginForm) {
  std::string received;
  {
    TestUpstream upstream([&received](int fd) {
      std::string head;
      char c;
      while (head.find("\r\n\r\n") == std::string::npos &&
             read(fd, &c, 1) == 1) {
        head.push_back(c);
      }
      received = head;
      Send(fd, "HTTP/1.0 200 OK\r\nContent-Length: 5\r\n\r\nhello");
      shutdown(fd, SHUT_WR);
    });
    AllowList allow_list;
    ASSERT_THAT(allow_list.AllowIPv4("127.0.0.0/8"), IsOk());
    Gateway gateway(&allow_list);
    AGENTBOX_ASSERT_OK_AND_ASSIGN(std::unique_ptr<GatewayListener> listener,
                                  gateway.ListenOnLoopback());

    FDCloser client = ConnectToLoopback(listener->port());
    Send(client.get(),
         absl::StrCat("GET http://127.0.0.1:", upstream.port(),
                      "/simple/ HTTP/1.1\r\nHost: 127.0.0.1\r\n"
                      "Proxy-Connection: keep-alive\r\n\r\n"));
    shutdown(client.get(), SHUT_WR);
    const std::string response = ReadToEnd(client.get());
    EXPECT_THAT(response, StartsWith("HTTP/1.0 200 OK"));
    EXPECT_THAT(response, HasSubstr("hello"));
  }
  EXPECT_THAT(received, StartsWith("GET /simple/ HTTP/1.1\r\n"));
  EXPECT_THAT(received, HasSubstr("Connection: close\r\n"));
  EXPECT_THAT(received, Not(HasSubstr("Proxy-Connection")));
}

TEST(GatewayTest, DeniesDestinationsNotOnTheList) {
  AllowList allow_list;
  ASSERT_THAT(allow_list.AllowIPv4("127.0.0.1", 1), IsOk());
  Gateway gateway(&allow_list);
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::unique_ptr<GatewayListener> listener,
                                gateway.ListenOnLoopback());

  FDCloser client = ConnectToLoopback(listener->port());
  Send(client.get(), "CONNECT 127.0.0.2:443 HTTP/1.1\r\n\r\n");
  const std::string response = ReadToEnd(client.get());
  EXPECT_THAT(response, StartsWith("HTTP/1.1 403 Forbidden"));
  EXPECT_THAT(response, HasSubstr("127.0.0.2:443 is not on the allow-list"));
  EXPECT_THAT(gateway.stats().denied, Eq(1));
  EXPECT_THAT(gateway.stats().allowed, Eq(0));
}

TEST(GatewayTest, DeniedNamesAreNotResolved) {
  AllowList allow_list;
  ASSERT_THAT(allow_list.AllowHost("pypi.org"), IsOk());
  Gateway gateway(&allow_list);
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::unique_ptr<GatewayListener> listener,
                                gateway.ListenOnLoopback());

  // .invalid never resolves; a 403 (not a 502) shows no lookup happened.
  FDCloser client = ConnectToLoopback(listener->port());
  Send(client.get(), "CONNECT exfiltrate.invalid:443 HTTP/1.1\r\n\r\n");
  EXPECT_THAT(ReadToEnd(client.get()), StartsWith("HTTP/1.1 403 Forbidden"));
  EXPECT_THAT(gateway.stats().failed, Eq(0));
}

TEST(GatewayTest, MalformedRequestGetsBadRequest) {
  AllowList allow_list;
  Gateway gateway(&allow_list);
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::unique_ptr<GatewayListener> listener,
                                gateway.ListenOnLoopback());

  FDCloser client = ConnectToLoopback(listener->port());
  Send(client.get(), "HELLO\r\n\r\n");
  EXPECT_THAT(ReadToEnd(client.get()), StartsWith("HTTP/1.1 400 Bad Request"));
}

// Polls until the listener serves exactly n clients.
bool WaitForActiveClients(GatewayListener& listener, int n) {
  const absl::Time deadline = absl::Now() + absl::Seconds(10);
  while (listener.active_clients() != n) {
    if (absl::Now() > deadline) {
      return false;
    }
    absl::SleepFor(absl::Milliseconds(10));
  }
  return true;
}

TEST(GatewayTest, FinishedClientsAreJoined) {
  AllowList allow_list;
  Gateway gateway(&allow_list);
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::unique_ptr<GatewayListener> listener,
                                gateway.ListenOnLoopback());

  for (int i = 0; i < 3 * kDefaultMaxGatewayClients; ++i) {
    FDCloser client = ConnectToLoopback(listener->port());
    Send(client.get(), "CONNECT 127.0.0.2:443 HTTP/1.1\r\n\r\n");
    ASSERT_THAT(ReadToEnd(client.get()), StartsWith("HTTP/1.1 403 Forbidden"));
  }
  EXPECT_THAT(WaitForActiveClients(*listener, 0), IsTrue());
  EXPECT_THAT(gateway.stats().denied, Eq(3 * kDefaultMaxGatewayClients));
}

TEST(GatewayTest, RejectsClientsOverTheLimit) {
  AllowList allow_list;
  Gateway gateway(&allow_list, absl::Seconds(10), /*max_clients=*/2);
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::unique_ptr<GatewayListener> listener,
                                gateway.ListenOnLoopback());

  // Idle clients that never finish their request.
  FDCloser first = ConnectToLoopback(listener->port());
  FDCloser second = ConnectToLoopback(listener->port());
  ASSERT_THAT(WaitForActiveClients(*listener, 2), IsTrue());

  FDCloser rejected = ConnectToLoopback(listener->port());
  EXPECT_THAT(ReadToEnd(rejected.get()),
              StartsWith("HTTP/1.1 503 Service Unavailable"));
  EXPECT_THAT(listener->active_clients(), Eq(2));

  ASSERT_THAT(first.Close(), IsTrue());
  ASSERT_THAT(WaitForActiveClients(*listener, 1), IsTrue());
  FDCloser admitted = ConnectToLoopback(listener->port());
  Send(admitted.get(), "CONNECT 127.0.0.2:443 HTTP/1.1\r\n\r\n");
  EXPECT_THAT(ReadToEnd(admitted.get()), StartsWith("HTTP/1.1 403 Forbidden"));
}

TEST(GatewayTest, UnreachableAllowedDestinationIsBadGateway) {
  // Bind and close to find a loopback port nobody listens on.
  uint16_t port;
  {
    TestUpstream unused([](int) {});
    port = unused.port();
    FDCloser poke = ConnectToLoopback(port);
  }
  AllowList allow_list;
  ASSERT_THAT(allow_list.AllowIPv4("127.0.0.1"), IsOk());
  Gateway gateway(&allow_list, absl::Seconds(2));
  AGENTBOX_ASSERT_OK_AND_ASSIGN(std::unique_ptr<GatewayListener> listener,
                                gateway.ListenOnLoopback());

  FDCloser client = ConnectToLoopback(listener->port());
  Send(client.get(),
       absl::StrCat("CONNECT 127.0.0.1:", port, " HTTP/1.1\r\n\r\n"));
  EXPECT_THAT(ReadToEnd(client.get()), StartsWith("HTTP/1.1 502 Bad Gateway"));
  EXPECT_THAT(gateway.stats().failed, Eq(1));
}

}  // namespace
}  // namespace agentbox
