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

#include "agentbox/session/network_governor.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "agentbox/session/session.pb.h"
#include "agentbox/util/status_matchers.h"

namespace agentbox {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::StrEq;

TEST(NetworkGovernorTest, DefaultPolicy) {
  NetworkGovernor governor;
  EXPECT_THAT(governor.RequiredMode(SENSITIVITY_PUBLIC), Eq(NETWORK_MODE_FULL));
  EXPECT_THAT(governor.RequiredMode(SENSITIVITY_INTERNAL),
              Eq(NETWORK_MODE_FULL));
  EXPECT_THAT(governor.RequiredMode(SENSITIVITY_CONFIDENTIAL),
              Eq(NETWORK_MODE_RESTRICTED));
  EXPECT_THAT(governor.RequiredMode(SENSITIVITY_SECRET), Eq(NETWORK_MODE_NONE));
}

TEST(NetworkGovernorTest, EvaluateNeverLoosens) {
  NetworkGovernor governor;
  EXPECT_THAT(governor.Evaluate(SENSITIVITY_PUBLIC, NETWORK_MODE_FULL),
              Eq(NETWORK_MODE_FULL));
  EXPECT_THAT(governor.Evaluate(SENSITIVITY_CONFIDENTIAL, NETWORK_MODE_FULL),
              Eq(NETWORK_MODE_RESTRICTED));
  EXPECT_THAT(governor.Evaluate(SENSITIVITY_PUBLIC, NETWORK_MODE_NONE),
              Eq(NETWORK_MODE_NONE));
  EXPECT_THAT(governor.Evaluate(SENSITIVITY_CONFIDENTIAL, NETWORK_MODE_NONE),
              Eq(NETWORK_MODE_NONE));
}

TEST(NetworkGovernorTest, ParsesPolicy) {
  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      NetworkGovernor governor,
      NetworkGovernor::FromSpec("internal=restricted, CONFIDENTIAL=NONE"));
  EXPECT_THAT(governor.RequiredMode(SENSITIVITY_PUBLIC), Eq(NETWORK_MODE_FULL));
  EXPECT_THAT(governor.RequiredMode(SENSITIVITY_INTERNAL),
              Eq(NETWORK_MODE_RESTRICTED));
  EXPECT_THAT(governor.RequiredMode(SENSITIVITY_CONFIDENTIAL),
              Eq(NETWORK_MODE_NONE));
  EXPECT_THAT(governor.RequiredMode(SENSITIVITY_SECRET), Eq(NETWORK_MODE_NONE));
}

TEST(NetworkGovernorTest, RejectsNonMonotonicPolicy) {
  EXPECT_THAT(NetworkGovernor::FromSpec("SECRET=FULL"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not monotonic")));
}

TEST(NetworkGovernorTest, RejectsMalformedPolicy) {
  EXPECT_THAT(NetworkGovernor::FromSpec("SECRET"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(NetworkGovernor::FromSpec("TOPSECRET=NONE"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(NetworkGovernor::FromSpec("PUBLIC=OFFLINE"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(NetworkGovernorTest, Names) {
  EXPECT_THAT(SensitivityName(SENSITIVITY_CONFIDENTIAL),
              StrEq("CONFIDENTIAL"));
  EXPECT_THAT(NetworkModeName(NETWORK_MODE_RESTRICTED), StrEq("RESTRICTED"));
  EXPECT_THAT(ParseSensitivity("secret"), IsOkAndHolds(SENSITIVITY_SECRET));
  EXPECT_THAT(ParseSensitivity("SENSITIVITY_INTERNAL"),
              IsOkAndHolds(SENSITIVITY_INTERNAL));
  EXPECT_THAT(ParseNetworkMode("none"), IsOkAndHolds(NETWORK_MODE_NONE));
}

TEST(NetworkGovernorTest, StricterAndHigher) {
  EXPECT_THAT(StricterMode(NETWORK_MODE_RESTRICTED, NETWORK_MODE_FULL),
              Eq(NETWORK_MODE_RESTRICTED));
  EXPECT_THAT(HigherSensitivity(SENSITIVITY_SECRET, SENSITIVITY_INTERNAL),
              Eq(SENSITIVITY_SECRET));
}

}  // namespace
}  // namespace agentbox
