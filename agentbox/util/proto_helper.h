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

// Helpers for persisting protocol buffers as JSON documents.

#ifndef AGENTBOX_UTIL_PROTO_HELPER_H_
#define AGENTBOX_UTIL_PROTO_HELPER_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "google/protobuf/duration.pb.h"
#include "google/protobuf/message.h"
#include "google/protobuf/timestamp.pb.h"

namespace agentbox {

// Renders message as indented JSON with the original proto field names.
absl::StatusOr<std::string> SerializeProtoToJson(
    const google::protobuf::Message& message);

absl::Status DeserializeProtoFromJson(absl::string_view json,
                                      google::protobuf::Message* message);

// Returns NotFound if path does not exist.
absl::Status ReadProtoFromJsonFile(absl::string_view path,
                                   google::protobuf::Message* message);

// Replaces path atomically.
absl::Status WriteProtoToJsonFile(absl::string_view path,
                                  const google::protobuf::Message& message);

google::protobuf::Timestamp EncodeTime(absl::Time time);
absl::Time DecodeTime(const google::protobuf::Timestamp& timestamp);

google::protobuf::Duration EncodeDuration(absl::Duration duration);
absl::Duration DecodeDuration(const google::protobuf::Duration& duration);

}  // namespace agentbox

#endif  // AGENTBOX_UTIL_PROTO_HELPER_H_
