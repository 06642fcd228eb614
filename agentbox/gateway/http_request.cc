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

#include "agentbox/gateway/http_request.h"

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {
namespace {

constexpr absl::string_view kHeaderTerminator = "\r\n\r\n";

// Splits "host:port", "[v6]:port" or a bare host into its parts.
absl::Status SplitHostPort(absl::string_view authority, uint16_t default_port,
                           std::string* host, uint16_t* port) {
  absl::string_view port_text;
  if (absl::ConsumePrefix(&authority, "[")) {
    const auto close = authority.find(']');
    if (close == absl::string_view::npos) {
      return absl::InvalidArgumentError("Unterminated IPv6 literal");
    }
    *host = std::string(authority.substr(0, close));
    absl::string_view rest = authority.substr(close + 1);
    if (absl::ConsumePrefix(&rest, ":")) {
      port_text = rest;
    } else if (!rest.empty()) {
      return absl::InvalidArgumentError("Malformed authority");
    }
  } else {
    const auto colon = authority.rfind(':');
    *host = std::string(authority.substr(0, colon));
    if (colon != absl::string_view::npos) {
      port_text = authority.substr(colon + 1);
    }
  }
  if (host->empty()) {
    return absl::InvalidArgumentError("Missing host");
  }
  if (port_text.empty()) {
    if (default_port == 0) {
      return absl::InvalidArgumentError("Missing port");
    }
    *port = default_port;
    return absl::OkStatus();
  }
  uint32_t value;
  if (!absl::SimpleAtoi(port_text, &value) || value == 0 || value > 65535) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid port: ", port_text));
  }
  *port = static_cast<uint16_t>(value);
  return absl::OkStatus();
}

bool IsHopByHopHeader(absl::string_view name) {
  return absl::EqualsIgnoreCase(name, "proxy-connection") ||
         absl::EqualsIgnoreCase(name, "proxy-authorization") ||
         absl::EqualsIgnoreCase(name, "connection") ||
         absl::EqualsIgnoreCase(name, "keep-alive");
}

}  // namespace

size_t FindHeaderEnd(absl::string_view buffer) {
  const size_t pos = buffer.find(kHeaderTerminator);
  return pos == absl::string_view::npos ? pos : pos + kHeaderTerminator.size();
}

absl::StatusOr<ProxyRequest> ParseProxyRequest(absl::string_view head) {
  head = absl::StripSuffix(head, kHeaderTerminator);
  std::vector<absl::string_view> lines = absl::StrSplit(head, "\r\n");
  std::vector<absl::string_view> request_line =
      absl::StrSplit(lines[0], ' ', absl::SkipEmpty());
  if (request_line.size() != 3 ||
      !absl::StartsWith(request_line[2], "HTTP/1.")) {
    return absl::InvalidArgumentError(
        absl::StrCat("Malformed request line: ", lines[0]));
  }

  ProxyRequest request;
  request.method = std::string(request_line[0]);
  absl::string_view target = request_line[1];

  if (request.method == "CONNECT") {
    request.is_tunnel = true;
    AGENTBOX_RETURN_IF_ERROR(
        SplitHostPort(target, /*default_port=*/0, &request.host,
                      &request.port));
    return request;
  }

  // Forward proxies only receive absolute-form targets; https:// URIs have
  // to go through CONNECT.
  if (!absl::ConsumePrefix(&target, "http://")) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unsupported request target: ", target));
  }
  const auto slash = target.find('/');
  absl::string_view authority = target.substr(0, slash);
  absl::string_view path =
      slash == absl::string_view::npos ? "/" : target.substr(slash);
  // Userinfo is never forwarded.
  if (auto at = authority.rfind('@'); at != absl::string_view::npos) {
    authority = authority.substr(at + 1);
  }
  AGENTBOX_RETURN_IF_ERROR(
      SplitHostPort(authority, /*default_port=*/80, &request.host,
                    &request.port));

  absl::StrAppend(&request.upstream_head, request.method, " ", path, " ",
                  request_line[2], "\r\n");
  for (size_t i = 1; i < lines.size(); ++i) {
    absl::string_view name = lines[i].substr(0, lines[i].find(':'));
    if (IsHopByHopHeader(absl::StripAsciiWhitespace(name))) {
      continue;
    }
    absl::StrAppend(&request.upstream_head, lines[i], "\r\n");
  }
  absl::StrAppend(&request.upstream_head, "Connection: close\r\n\r\n");
  return request;
}

std::string MakeErrorResponse(int code, absl::string_view reason,
                              absl::string_view body) {
  return absl::StrCat("HTTP/1.1 ", code, " ", reason,
                      "\r\nContent-Type: text/plain\r\nContent-Length: ",
                      body.size(), "\r\nConnection: close\r\n\r\n", body);
}

}  // namespace agentbox
