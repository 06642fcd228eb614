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

#ifndef AGENTBOX_GATEWAY_HTTP_REQUEST_H_
#define AGENTBOX_GATEWAY_HTTP_REQUEST_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace agentbox {

// A request received by the gateway from a sandboxed HTTP client configured
// to use it as a forward proxy.
struct ProxyRequest {
  std::string method;
  std::string host;  // Without brackets for IPv6 literals.
  uint16_t port = 0;
  // CONNECT requests open an opaque tunnel. All other methods carry an
  // absolute-form URI and are forwarded as a single origin-form request.
  bool is_tunnel = false;
  // Request line and headers to send upstream for non-tunnel requests,
  // terminated by an empty line.
  std::string upstream_head;
};

// Returns the offset just past the "\r\n\r\n" that terminates the header
// block in buffer, or npos if the block is incomplete.
size_t FindHeaderEnd(absl::string_view buffer);

// Parses a complete header block (as delimited by FindHeaderEnd).
absl::StatusOr<ProxyRequest> ParseProxyRequest(absl::string_view head);

// Builds a minimal response with a plain text body and "Connection: close".
std::string MakeErrorResponse(int code, absl::string_view reason,
                              absl::string_view body);

}  // namespace agentbox

#endif  // AGENTBOX_GATEWAY_HTTP_REQUEST_H_
