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

#include "agentbox/util/proto_helper.h"

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "google/protobuf/util/json_util.h"
#include "agentbox/util/file_helpers.h"
#include "agentbox/util/status_macros.h"

namespace agentbox {

absl::StatusOr<std::string> SerializeProtoToJson(
    const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return absl::InternalError(absl::StrCat("Serializing ",
                                            message.GetTypeName(), ": ",
                                            status.ToString()));
  }
  return json;
}

absl::Status DeserializeProtoFromJson(absl::string_view json,
                                      google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(
      std::string(json), message, options);
  if (!status.ok()) {
    return absl::InternalError(absl::StrCat("Parsing ", message->GetTypeName(),
                                            ": ", status.ToString()));
  }
  return absl::OkStatus();
}

absl::Status ReadProtoFromJsonFile(absl::string_view path,
                                   google::protobuf::Message* message) {
  std::string json;
  AGENTBOX_RETURN_IF_ERROR(file::GetContents(path, &json));
  absl::Status status = DeserializeProtoFromJson(json, message);
  if (!status.ok()) {
    return absl::InternalError(
        absl::StrCat("Corrupt file ", path, ": ", status.message()));
  }
  return absl::OkStatus();
}

absl::Status WriteProtoToJsonFile(absl::string_view path,
                                  const google::protobuf::Message& message) {
  AGENTBOX_ASSIGN_OR_RETURN(std::string json, SerializeProtoToJson(message));
  return file::SetContentsAtomically(path, json, 0600);
}

google::protobuf::Timestamp EncodeTime(absl::Time time) {
  const int64_t nanos = absl::ToUnixNanos(time);
  google::protobuf::Timestamp timestamp;
  timestamp.set_seconds(nanos / 1000000000);
  timestamp.set_nanos(static_cast<int32_t>(nanos % 1000000000));
  if (timestamp.nanos() < 0) {
    timestamp.set_seconds(timestamp.seconds() - 1);
    timestamp.set_nanos(timestamp.nanos() + 1000000000);
  }
  return timestamp;
}

absl::Time DecodeTime(const google::protobuf::Timestamp& timestamp) {
  return absl::FromUnixSeconds(timestamp.seconds()) +
         absl::Nanoseconds(timestamp.nanos());
}

google::protobuf::Duration EncodeDuration(absl::Duration duration) {
  const int64_t nanos = absl::ToInt64Nanoseconds(duration);
  google::protobuf::Duration result;
  result.set_seconds(nanos / 1000000000);
  result.set_nanos(static_cast<int32_t>(nanos % 1000000000));
  return result;
}

absl::Duration DecodeDuration(const google::protobuf::Duration& duration) {
  return absl::Seconds(duration.seconds()) +
         absl::Nanoseconds(duration.nanos());
}

}  // namespace agentbox
