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

#ifndef AGENTBOX_GATEWAY_ALLOW_LIST_H_
#define AGENTBOX_GATEWAY_ALLOW_LIST_H_

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace agentbox {

// Converts a sockaddr_in or sockaddr_in6 structure into "addr:port" form.
absl::StatusOr<std::string> AddrToString(const struct sockaddr* saddr);

// Platform-level list of destinations the gateway forwards to. Built once at
// startup from a static file and never modified afterwards, so it can be
// shared across sessions without locking.
//
// Textual entries (one per line in the file, '#' starts a comment):
//   pypi.org              exact host name, any port
//   pypi.org:443          exact host name, single port
//   *.example.com         any subdomain of example.com (not the apex)
//   10.0.0.0/8            IPv4 address, IP/cidr or IP/mask, optional :port
//   [2001:db8::]/32:443   IPv6 in brackets when a port follows
//   2001:db8::1           IPv6 without brackets, any port
// A port of 0 means all ports.
class AllowList {
 public:
  AllowList() = default;

  static absl::StatusOr<AllowList> Parse(absl::string_view contents);
  static absl::StatusOr<AllowList> LoadFromFile(const std::string& path);

  // Adds one textual entry in the syntax described above.
  absl::Status AddEntry(absl::string_view entry);

  // pattern is a host name or "*.suffix" wildcard.
  absl::Status AllowHost(absl::string_view pattern, uint16_t port = 0);
  // ip_and_mask should have one of following formats: IP, IP/mask, IP/cidr.
  absl::Status AllowIPv4(const std::string& ip_and_mask, uint16_t port = 0);
  // ip_and_mask should have following format: IP or IP/cidr.
  absl::Status AllowIPv6(const std::string& ip_and_mask, uint16_t port = 0);

  // Checks a destination by name. Literal IP addresses are checked against
  // the address entries.
  bool IsHostnameAllowed(absl::string_view host, uint16_t port) const;

  // Checks a resolved destination (address and port) against the address
  // entries only.
  bool IsAddressAllowed(const struct sockaddr* saddr) const;

  bool empty() const {
    return hosts_.empty() && allowed_ipv4_.empty() && allowed_ipv6_.empty();
  }
  bool has_address_entries() const {
    return !allowed_ipv4_.empty() || !allowed_ipv6_.empty();
  }
  size_t size() const {
    return hosts_.size() + allowed_ipv4_.size() + allowed_ipv6_.size();
  }

 private:
  struct HostEntry {
    std::string name;  // Lower case, without trailing dot.
    bool wildcard;     // Matches strict subdomains of name.
    uint16_t port;
  };
  struct IPv4Entry {
    in_addr_t ip;
    in_addr_t mask;
    uint16_t port;  // Network byte order.
  };
  struct IPv6Entry {
    in6_addr ip;
    in6_addr mask;
    uint16_t port;  // Network byte order.
  };

  bool IsIPv4Allowed(const struct sockaddr_in* saddr) const;
  bool IsIPv6Allowed(const struct sockaddr_in6* saddr) const;

  std::vector<HostEntry> hosts_;
  std::vector<IPv4Entry> allowed_ipv4_;
  std::vector<IPv6Entry> allowed_ipv6_;
};

}  // namespace agentbox

#endif  // AGENTBOX_GATEWAY_ALLOW_LIST_H_
