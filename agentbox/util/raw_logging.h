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

// Allocation-free logging for code that runs in a freshly cloned child process
// before execve(). Regular LOG() may take locks held by other threads of the
// parent at clone() time and must not be used there.
//
// Usage:
//   AGENTBOX_RAW_LOG(ERROR, "mount(%s) failed", target);
// prints a line like
//   [namespace_isolation.cc : 123] RAW: mount(/workspace) failed
// straight to fd 2.

#ifndef AGENTBOX_UTIL_RAW_LOGGING_H_
#define AGENTBOX_UTIL_RAW_LOGGING_H_

#include <cerrno>
#include <cstddef>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/base/optimization.h"
#include "absl/strings/str_format.h"
#include "agentbox/util/strerror.h"

#define AGENTBOX_RAW_LOG(severity, ...)                                       \
  do {                                                                        \
    constexpr const char* agentbox_raw_logging_internal_basename =            \
        ::agentbox::raw_logging_internal::Basename(__FILE__,                  \
                                                   sizeof(__FILE__) - 1);     \
    ::agentbox::raw_logging_internal::RawLog(                                 \
        AGENTBOX_RAW_LOGGING_INTERNAL_##severity,                             \
        agentbox_raw_logging_internal_basename, __LINE__, __VA_ARGS__);       \
  } while (0)

// Like CHECK(condition) but built on AGENTBOX_RAW_LOG. Takes a fixed message
// so that no arguments are evaluated on the success path.
#define AGENTBOX_RAW_CHECK(condition, message)                             \
  do {                                                                     \
    if (ABSL_PREDICT_FALSE(!(condition))) {                                \
      AGENTBOX_RAW_LOG(FATAL, "Check %s failed: %s", #condition, message); \
    }                                                                      \
  } while (0)

#define AGENTBOX_RAW_LOGGING_INTERNAL_INFO ::absl::LogSeverity::kInfo
#define AGENTBOX_RAW_LOGGING_INTERNAL_WARNING ::absl::LogSeverity::kWarning
#define AGENTBOX_RAW_LOGGING_INTERNAL_ERROR ::absl::LogSeverity::kError
#define AGENTBOX_RAW_LOGGING_INTERNAL_FATAL ::absl::LogSeverity::kFatal

// Like AGENTBOX_RAW_LOG(), but appends the current errno and its description.
#define AGENTBOX_RAW_PLOG(severity, format, ...)                            \
  do {                                                                      \
    const int agentbox_raw_plog_errno = errno;                              \
    char agentbox_raw_plog_errno_buffer[100];                               \
    const char* agentbox_raw_plog_errno_str = ::agentbox::RawStrError(      \
        agentbox_raw_plog_errno, agentbox_raw_plog_errno_buffer,            \
        sizeof(agentbox_raw_plog_errno_buffer));                            \
    char agentbox_raw_plog_buffer                                           \
        [::agentbox::raw_logging_internal::kLogBufSize];                    \
    absl::SNPrintF(agentbox_raw_plog_buffer,                                \
                   sizeof(agentbox_raw_plog_buffer), (format),              \
                   ##__VA_ARGS__);                                          \
    AGENTBOX_RAW_LOG(severity, "%s: %s [%d]", agentbox_raw_plog_buffer,     \
                     agentbox_raw_plog_errno_str, agentbox_raw_plog_errno); \
  } while (0)

// Logs at INFO if the verbosity set through AGENTBOX_VLOG_LEVEL is at least
// verbose_level.
#define AGENTBOX_RAW_VLOG(verbose_level, format, ...)                   \
  if (::agentbox::raw_logging_internal::VLogIsOn(verbose_level)) {      \
    AGENTBOX_RAW_LOG(INFO, (format), ##__VA_ARGS__);                    \
  }

namespace agentbox::raw_logging_internal {

constexpr int kLogBufSize = 3000;

// Formats and writes one log line. Does not allocate memory or acquire locks.
// A FATAL severity aborts the process after writing.
void RawLog(absl::LogSeverity severity, const char* file, int line,
            const char* format, ...) ABSL_PRINTF_ATTRIBUTE(4, 5);

// Writes the buffer to stderr with a direct write(2) syscall.
void SafeWriteToStderr(const char* s, size_t len);

// Returns the part of fname after the last path separator. Evaluated at
// compile time by AGENTBOX_RAW_LOG.
constexpr const char* Basename(const char* fname, int offset) {
  return offset == 0 || fname[offset - 1] == '/'
             ? fname + offset
             : Basename(fname, offset - 1);
}

// Returns whether verbose_level is enabled. The level is read once from the
// AGENTBOX_VLOG_LEVEL environment variable; call this before clone() if the
// value is needed in a child.
bool VLogIsOn(int verbose_level);

}  // namespace agentbox::raw_logging_internal

#endif  // AGENTBOX_UTIL_RAW_LOGGING_H_
