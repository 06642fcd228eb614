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

#include "agentbox/gateway/allow_list.h"

#include <arpa/inet.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "agentbox/util/file_helpers.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {
namespace {

absl::Status IPStringToAddr(const std::string& ip, int address_family,
                            void* addr) {
  if (int err = inet_pton(address_family, ip.c_str(), addr); err == 0) {
    return absl::InvalidArgumentError(absl::StrCat("Invalid address: ", ip));
  } else if (err == -1) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("inet_pton() failed for ", ip));
  }
  return absl::OkStatus();
}

// Splits "IP", "IP/mask" or "IP/cidr". cidr is 0 if absent; mask is set only
// for the dotted form.
absl::Status ParseIpAndMask(absl::string_view ip_and_mask, std::string* ip,
                            std::string* mask, uint32_t* cidr) {
  *cidr = 0;
  std::vector<std::string> parts =
      absl::StrSplit(ip_and_mask, absl::MaxSplits('/', 1));
  *ip = parts[0];
  if (parts.size() == 1) {
    return absl::OkStatus();
  }
  const std::string& mask_or_cidr = parts[1];
  if (absl::StrContains(mask_or_cidr, '.')) {
    if (mask == nullptr) {
      return absl::InvalidArgumentError(
          absl::StrCat("Mask not supported for ", ip_and_mask));
    }
    *mask = mask_or_cidr;
    return absl::OkStatus();
  }
  if (!absl::SimpleAtoi(mask_or_cidr, cidr) || *cidr == 0) {
    return absl::InvalidArgumentError(
        absl::StrCat(mask_or_cidr, " is not a correct cidr"));
  }
  return absl::OkStatus();
}

absl::Status CidrToIn6Addr(uint32_t cidr, in6_addr* addr) {
  if (cidr > 128) {
    return absl::InvalidArgumentError(
        absl::StrCat(cidr, " is not a correct cidr"));
  }
  memset(addr, 0, sizeof(*addr));
  int i = 0;
  for (; cidr >= 8; cidr -= 8) {
    addr->s6_addr[i++] = 0xff;
  }
  if (cidr) {
    addr->s6_addr[i] = static_cast<uint8_t>(0xff << (8 - cidr));
  }
  return absl::OkStatus();
}

absl::Status CidrToInAddr(uint32_t cidr, in_addr* addr) {
  if (cidr > 32) {
    return absl::InvalidArgumentError(
        absl::StrCat(cidr, " is not a correct cidr"));
  }
  addr->s_addr =
      htonl(cidr == 0 ? 0 : static_cast<uint32_t>(0xffffffffu << (32 - cidr)));
  return absl::OkStatus();
}

bool IsIPv4MaskCorrect(in_addr_t m) {
  m = ntohl(m);
  if (m == 0) {
    return false;
  }
  m = ~m + 1;
  return !(m & (m - 1));
}

absl::StatusOr<uint16_t> ParsePort(absl::string_view port) {
  uint32_t value;
  if (!absl::SimpleAtoi(port, &value) || value == 0 || value > 65535) {
    return absl::InvalidArgumentError(absl::StrCat("Invalid port: ", port));
  }
  return static_cast<uint16_t>(value);
}

std::string NormalizeHost(absl::string_view host) {
  return absl::AsciiStrToLower(absl::StripSuffix(host, "."));
}

bool IsValidHostPattern(absl::string_view name) {
  if (name.empty() || name.size() > 253) {
    return false;
  }
  for (absl::string_view label : absl::StrSplit(name, '.')) {
    if (label.empty() || label.size() > 63) {
      return false;
    }
    for (char c : label) {
      if (!absl::ascii_isalnum(c) && c != '-' && c != '_') {
        return false;
      }
    }
  }
  return true;
}

bool LooksLikeIPv4(absl::string_view text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](char c) {
           return absl::ascii_isdigit(c) || c == '.' || c == '/';
         });
}

}  // namespace

absl::StatusOr<std::string> AddrToString(const struct sockaddr* saddr) {
  char addr[INET6_ADDRSTRLEN];
  switch (saddr->sa_family) {
    case AF_INET: {
      auto* in = reinterpret_cast<const struct sockaddr_in*>(saddr);
      if (!inet_ntop(AF_INET, &in->sin_addr, addr, sizeof(addr))) {
        return absl::InternalError("Cannot convert sockaddr_in to string");
      }
      return absl::StrCat(addr, ":", ntohs(in->sin_port));
    }
    case AF_INET6: {
      auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(saddr);
      if (!inet_ntop(AF_INET6, &in6->sin6_addr, addr, sizeof(addr))) {
        return absl::InternalError("Cannot convert sockaddr_in6 to string");
      }
      return absl::StrCat("[", addr, "]:", ntohs(in6->sin6_port));
    }
    default:
      return absl::InternalError(
          absl::StrCat("Unexpected sa_family value: ", saddr->sa_family));
  }
}

absl::StatusOr<AllowList> AllowList::Parse(absl::string_view contents) {
  AllowList list;
  int line_number = 0;
  for (absl::string_view line : absl::StrSplit(contents, '\n')) {
    ++line_number;
    if (auto hash = line.find('#'); hash != absl::string_view::npos) {
      line = line.substr(0, hash);
    }
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) {
      continue;
    }
    if (absl::Status status = list.AddEntry(line); !status.ok()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "allow-list line ", line_number, ": ", status.message()));
    }
  }
  return list;
}

absl::StatusOr<AllowList> AllowList::LoadFromFile(const std::string& path) {
  std::string contents;
  AGENTBOX_RETURN_IF_ERROR(file::GetContents(path, &contents));
  AGENTBOX_ASSIGN_OR_RETURN(AllowList list, Parse(contents));
  LOG(INFO) << "Loaded " << list.size() << " gateway allow-list entries from "
            << path;
  return list;
}

absl::Status AllowList::AddEntry(absl::string_view entry) {
  uint16_t port = 0;
  if (absl::ConsumePrefix(&entry, "[")) {
    const auto close = entry.find(']');
    if (close == absl::string_view::npos) {
      return absl::InvalidArgumentError("Unterminated '[' in entry");
    }
    absl::string_view rest = entry.substr(close + 1);
    std::string address(entry.substr(0, close));
    // "[addr]/cidr" keeps the prefix length outside the brackets.
    if (absl::ConsumePrefix(&rest, "/")) {
      const auto colon = rest.find(':');
      absl::StrAppend(&address, "/", rest.substr(0, colon));
      rest = colon == absl::string_view::npos ? absl::string_view()
                                              : rest.substr(colon);
    }
    if (absl::ConsumePrefix(&rest, ":")) {
      AGENTBOX_ASSIGN_OR_RETURN(port, ParsePort(rest));
    } else if (!rest.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Unexpected trailing text: ", rest));
    }
    return AllowIPv6(address, port);
  }
  // Two or more colons without brackets: a bare IPv6 address or range.
  if (std::count(entry.begin(), entry.end(), ':') > 1) {
    return AllowIPv6(std::string(entry));
  }
  if (const auto colon = entry.find(':'); colon != absl::string_view::npos) {
    AGENTBOX_ASSIGN_OR_RETURN(port, ParsePort(entry.substr(colon + 1)));
    entry = entry.substr(0, colon);
  }
  if (LooksLikeIPv4(entry)) {
    return AllowIPv4(std::string(entry), port);
  }
  return AllowHost(entry, port);
}

absl::Status AllowList::AllowHost(absl::string_view pattern, uint16_t port) {
  const bool wildcard = absl::ConsumePrefix(&pattern, "*.");
  std::string name = NormalizeHost(pattern);
  if (!IsValidHostPattern(name)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid host name: ", pattern));
  }
  hosts_.push_back({std::move(name), wildcard, port});
  return absl::OkStatus();
}

absl::Status AllowList::AllowIPv4(const std::string& ip_and_mask,
                                  uint16_t port) {
  std::string ip, mask;
  uint32_t cidr;
  AGENTBOX_RETURN_IF_ERROR(ParseIpAndMask(ip_and_mask, &ip, &mask, &cidr));

  in_addr m{};
  if (!mask.empty()) {
    AGENTBOX_RETURN_IF_ERROR(IPStringToAddr(mask, AF_INET, &m));
    if (!IsIPv4MaskCorrect(m.s_addr)) {
      return absl::InvalidArgumentError(
          absl::StrCat(mask, " is not a correct mask"));
    }
  } else {
    AGENTBOX_RETURN_IF_ERROR(CidrToInAddr(cidr ? cidr : 32, &m));
  }
  in_addr addr{};
  AGENTBOX_RETURN_IF_ERROR(IPStringToAddr(ip, AF_INET, &addr));
  allowed_ipv4_.push_back({addr.s_addr, m.s_addr, htons(port)});
  return absl::OkStatus();
}

absl::Status AllowList::AllowIPv6(const std::string& ip_and_mask,
                                  uint16_t port) {
  std::string ip;
  uint32_t cidr;
  AGENTBOX_RETURN_IF_ERROR(ParseIpAndMask(ip_and_mask, &ip, nullptr, &cidr));
  in6_addr addr{};
  AGENTBOX_RETURN_IF_ERROR(IPStringToAddr(ip, AF_INET6, &addr));
  in6_addr m;
  AGENTBOX_RETURN_IF_ERROR(CidrToIn6Addr(cidr ? cidr : 128, &m));
  allowed_ipv6_.push_back({addr, m, htons(port)});
  return absl::OkStatus();
}

bool AllowList::IsHostnameAllowed(absl::string_view host, uint16_t port) const {
  const std::string name = NormalizeHost(host);
  // Literal addresses are only matched by address entries.
  struct sockaddr_in in {};
  if (inet_pton(AF_INET, name.c_str(), &in.sin_addr) == 1) {
    in.sin_family = AF_INET;
    in.sin_port = htons(port);
    return IsIPv4Allowed(&in);
  }
  struct sockaddr_in6 in6 {};
  if (inet_pton(AF_INET6, name.c_str(), &in6.sin6_addr) == 1) {
    in6.sin6_family = AF_INET6;
    in6.sin6_port = htons(port);
    return IsIPv6Allowed(&in6);
  }
  return std::any_of(hosts_.begin(), hosts_.end(), [&](const HostEntry& e) {
    if (e.port != 0 && e.port != port) {
      return false;
    }
    if (!e.wildcard) {
      return name == e.name;
    }
    return name.size() > e.name.size() &&
           absl::EndsWith(name, e.name) &&
           name[name.size() - e.name.size() - 1] == '.';
  });
}

bool AllowList::IsAddressAllowed(const struct sockaddr* saddr) const {
  switch (saddr->sa_family) {
    case AF_INET:
      return IsIPv4Allowed(reinterpret_cast<const struct sockaddr_in*>(saddr));
    case AF_INET6:
      return IsIPv6Allowed(reinterpret_cast<const struct sockaddr_in6*>(saddr));
    default:
      LOG(WARNING) << "Unexpected sa_family value: " << saddr->sa_family;
      return false;
  }
}

bool AllowList::IsIPv6Allowed(const struct sockaddr_in6* saddr) const {
  return std::any_of(
      allowed_ipv6_.begin(), allowed_ipv6_.end(), [saddr](const IPv6Entry& e) {
        for (int i = 0; i < 16; i++) {
          if ((e.ip.s6_addr[i] & e.mask.s6_addr[i]) !=
              (saddr->sin6_addr.s6_addr[i] & e.mask.s6_addr[i])) {
            return false;
          }
        }
        return !e.port || e.port == saddr->sin6_port;
      });
}

bool AllowList::IsIPv4Allowed(const struct sockaddr_in* saddr) const {
  return std::any_of(
      allowed_ipv4_.begin(), allowed_ipv4_.end(), [saddr](const IPv4Entry& e) {
        return (e.ip & e.mask) == (saddr->sin_addr.s_addr & e.mask) &&
               (!e.port || e.port == saddr->sin_port);
      });
}

}  // namespace agentbox
