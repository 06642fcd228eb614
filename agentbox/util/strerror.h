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

#ifndef AGENTBOX_UTIL_STRERROR_H_
#define AGENTBOX_UTIL_STRERROR_H_

#include <cstddef>
#include <string>

namespace agentbox {

// Returns a human-readable description of a POSIX error code. Unlike
// strerror(), this is thread-safe and leaves errno untouched.
std::string StrError(int errnum);

// Same as StrError() but formats into the provided buffer and never allocates,
// so it may be used between clone() and execve(). May return a pointer to a
// static immutable string instead of buf.
const char* RawStrError(int errnum, char* buf, size_t buflen);

}  // namespace agentbox

#endif  // AGENTBOX_UTIL_STRERROR_H_
