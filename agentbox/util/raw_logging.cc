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

#include "agentbox/util/raw_logging.h"

#include <sys/syscall.h>
#include <unistd.h>

#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/strings/numbers.h"

namespace agentbox::raw_logging_internal {
namespace {

constexpr char kTruncated[] = " ... (message truncated)\n";

constexpr char SeverityLetter(absl::LogSeverity severity) {
  switch (severity) {
    case absl::LogSeverity::kInfo:
      return 'I';
    case absl::LogSeverity::kWarning:
      return 'W';
    case absl::LogSeverity::kError:
      return 'E';
    case absl::LogSeverity::kFatal:
      return 'F';
  }
  return 'U';
}

// Appends to *buf, advancing it and shrinking *size by the bytes written.
// Returns false if the output did not fit. On overflow, leaves room for
// kTruncated when possible.
bool AppendVA(char** buf, int* size, const char* format, va_list ap)
    ABSL_PRINTF_ATTRIBUTE(3, 0);
bool AppendVA(char** buf, int* size, const char* format, va_list ap) {
  int n = vsnprintf(*buf, *size, format, ap);
  bool fits = true;
  if (n < 0 || n >= *size) {
    fits = false;
    n = static_cast<size_t>(*size) > sizeof(kTruncated)
            ? *size - static_cast<int>(sizeof(kTruncated))
            : 0;
  }
  *size -= n;
  *buf += n;
  return fits;
}

bool Append(char** buf, int* size, const char* format, ...)
    ABSL_PRINTF_ATTRIBUTE(3, 4);
bool Append(char** buf, int* size, const char* format, ...) {
  va_list ap;
  va_start(ap, format);
  const bool fits = AppendVA(buf, size, format, ap);
  va_end(ap);
  return fits;
}

}  // namespace

void RawLog(absl::LogSeverity severity, const char* file, int line,
            const char* format, ...) {
  char buffer[kLogBufSize];
  char* buf = buffer;
  int size = sizeof(buffer);

  Append(&buf, &size, "%c [%s : %d] RAW: ", SeverityLetter(severity), file,
         line);
  va_list ap;
  va_start(ap, format);
  const bool fits = AppendVA(&buf, &size, format, ap);
  va_end(ap);
  Append(&buf, &size, "%s", fits ? "\n" : kTruncated);
  SafeWriteToStderr(buffer, strlen(buffer));

  if (severity == absl::LogSeverity::kFatal) {
    abort();
  }
}

void SafeWriteToStderr(const char* s, size_t len) {
  syscall(SYS_write, STDERR_FILENO, s, len);
}

bool VLogIsOn(int verbose_level) {
  static const int external_verbose_level = [] {
    int level = std::numeric_limits<int>::min();
    const char* env_var = getenv("AGENTBOX_VLOG_LEVEL");
    if (!env_var) {
      return level;
    }
    AGENTBOX_RAW_CHECK(absl::SimpleAtoi(env_var, &level) && level >= 0,
                       "AGENTBOX_VLOG_LEVEL needs to be an integer >= 0");
    return level;
  }();
  return verbose_level <= external_verbose_level;
}

}  // namespace agentbox::raw_logging_internal
