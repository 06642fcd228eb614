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

#ifndef AGENTBOX_SANDBOX_MOUNTS_H_
#define AGENTBOX_SANDBOX_MOUNTS_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace agentbox {

// An explicit host-path-to-sandbox-path visibility grant.
struct BindMount {
  std::string source;
  std::string target;
  bool read_only = true;
};

// The complete filesystem view of a sandbox. Nothing on the host is visible
// inside unless it was added here; /proc, /dev and the root itself are
// provided by the isolation strategy.
class Mounts {
 public:
  enum class EntryType { kDirectory, kFile, kTmpfs, kSymlink };

  struct Entry {
    EntryType type;
    std::string inside;
    // Bind source for directories and files, link target for symlinks.
    std::string outside;
    bool read_only = true;
    size_t tmpfs_size = 0;
  };

  Mounts() = default;

  Mounts(const Mounts&) = default;
  Mounts(Mounts&&) = default;
  Mounts& operator=(const Mounts&) = default;
  Mounts& operator=(Mounts&&) = default;

  absl::Status AddFileAt(absl::string_view outside, absl::string_view inside,
                         bool is_ro = true);

  absl::Status AddDirectoryAt(absl::string_view outside,
                              absl::string_view inside, bool is_ro = true);

  // Adds a file or directory bind, depending on what source is.
  absl::Status AddBindMount(const BindMount& mount);

  absl::Status AddTmpfs(absl::string_view inside, size_t size);

  absl::Status AddSymlink(absl::string_view inside,
                          absl::string_view link_target);

  // Read-only system paths programs need to run: /usr, the library
  // directories, /bin, /sbin and a selection of /etc. Paths missing on the
  // host are skipped; top-level symlinks such as /bin -> usr/bin are
  // recreated as symlinks.
  absl::Status AddSystemDefaults();

  // Binds path read-only at the same location unless it is already visible.
  absl::Status AddHostPathIfMissing(absl::string_view path);

  // Translates a sandbox path into the host path backing it. Fails with
  // NotFound for paths not covered by a bind mount.
  absl::StatusOr<std::string> ResolvePath(absl::string_view inside) const;

  // Returns true if inside lies at or below any entry.
  bool IsVisible(absl::string_view inside) const;

  // Entries ordered so that every entry comes after the entries containing
  // it.
  std::vector<Entry> SortedEntries() const;

  std::vector<BindMount> GetBindMounts() const;

  const std::vector<Entry>& entries() const { return entries_; }

 private:
  absl::Status Insert(Entry entry);

  std::vector<Entry> entries_;
};

}  // namespace agentbox

#endif  // AGENTBOX_SANDBOX_MOUNTS_H_
