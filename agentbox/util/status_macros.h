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

// Status propagation helpers used throughout agentbox.

#ifndef AGENTBOX_UTIL_STATUS_MACROS_H_
#define AGENTBOX_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

// Internal helper for concatenating macro values.
#define AGENTBOX_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define AGENTBOX_MACROS_IMPL_CONCAT(x, y) AGENTBOX_MACROS_IMPL_CONCAT_INNER_(x, y)

// Evaluates expr, which must yield an absl::Status, and returns it from the
// enclosing function if it is not OK.
#define AGENTBOX_RETURN_IF_ERROR(expr) \
  AGENTBOX_RETURN_IF_ERROR_IMPL(       \
      AGENTBOX_MACROS_IMPL_CONCAT(_agentbox_status, __LINE__), expr)

#define AGENTBOX_RETURN_IF_ERROR_IMPL(status, expr) \
  do {                                              \
    const auto status = (expr);                     \
    if (ABSL_PREDICT_FALSE(!status.ok())) {         \
      return status;                                \
    }                                               \
  } while (0)

// Evaluates rexpr, which must yield an absl::StatusOr<T>. On success moves the
// value into lhs, otherwise returns the error status from the enclosing
// function.
#define AGENTBOX_ASSIGN_OR_RETURN(lhs, rexpr) \
  AGENTBOX_ASSIGN_OR_RETURN_IMPL(             \
      AGENTBOX_MACROS_IMPL_CONCAT(_agentbox_statusor, __LINE__), lhs, rexpr)

#define AGENTBOX_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                   \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                  \
    return statusor.status();                                \
  }                                                          \
  lhs = std::move(statusor).value()

#endif  // AGENTBOX_UTIL_STATUS_MACROS_H_
