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

#include "agentbox/util/fileops.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <climits>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/str_cat.h"
#include "agentbox/testing.h"
#include "agentbox/util/file_helpers.h"
#include "agentbox/util/status_matchers.h"

namespace agentbox::file_util {
namespace {

using ::agentbox::IsOk;
using ::agentbox::StatusIs;
using ::testing::Eq;
using ::testing::IsEmpty;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Ne;
using ::testing::Not;
using ::testing::SizeIs;
using ::testing::StrEq;

class FileOpsTest : public testing::Test {
 protected:
  static void SetUpTestSuite() {
    tmp_dir_ = new std::string(CreateTestTempDir("fileops_test"));
  }

  void SetUp() override { ASSERT_THAT(chdir(tmp_dir_->c_str()), Eq(0)); }

  static std::string* tmp_dir_;
};

std::string* FileOpsTest::tmp_dir_ = nullptr;

TEST_F(FileOpsTest, ExistsTest) {
  ASSERT_THAT(file::SetContents("exists_test", ""), IsOk());
  EXPECT_THAT(fileops::Exists("exists_test", false), IsTrue());
  EXPECT_THAT(fileops::Exists("exists_test", true), IsTrue());

  ASSERT_THAT(symlink("exists_test", "exists_test_link"), Eq(0));
  EXPECT_THAT(fileops::IsSymlink("exists_test_link"), IsTrue());
  EXPECT_THAT(fileops::Exists("exists_test_link", true), IsTrue());

  ASSERT_THAT(unlink("exists_test"), Eq(0));
  EXPECT_THAT(fileops::Exists("exists_test_link", false), IsTrue());
  EXPECT_THAT(fileops::Exists("exists_test_link", true), IsFalse());

  ASSERT_THAT(unlink("exists_test_link"), Eq(0));
  EXPECT_THAT(fileops::Exists("exists_test_link", false), IsFalse());
}

TEST_F(FileOpsTest, ReadLinkTest) {
  EXPECT_THAT(fileops::ReadLink("readlink_not_there"), StrEq(""));

  ASSERT_THAT(symlink("..", "readlink_dotdot"), Eq(0));
  EXPECT_THAT(fileops::ReadLink("readlink_dotdot"), StrEq(".."));
  unlink("readlink_dotdot");

  const std::string very_long_name(PATH_MAX - 1, 'f');
  ASSERT_THAT(symlink(very_long_name.c_str(), "readlink_long"), Eq(0));
  EXPECT_THAT(fileops::ReadLink("readlink_long"), StrEq(very_long_name));
  unlink("readlink_long");
}

TEST_F(FileOpsTest, ListDirectoryEntriesFailTest) {
  std::vector<std::string> files;
  std::string error;
  EXPECT_THAT(fileops::ListDirectoryEntries("no_dir", &files, &error),
              IsFalse());
  EXPECT_THAT(files, IsEmpty());
  EXPECT_THAT(error, StrEq("opendir(no_dir): No such file or directory"));
}

TEST_F(FileOpsTest, ListDirectoryEntriesTest) {
  ASSERT_THAT(mkdir("list_dir", 0700), Eq(0));
  constexpr int kNumFiles = 10;
  for (int i = 0; i < kNumFiles; ++i) {
    ASSERT_THAT(file::SetContents(absl::StrCat("list_dir/file", i), ""),
                IsOk());
  }

  std::vector<std::string> files;
  std::string error;
  EXPECT_THAT(fileops::ListDirectoryEntries("list_dir", &files, &error),
              IsTrue());

  ASSERT_THAT(files, SizeIs(kNumFiles));
  std::sort(files.begin(), files.end());
  for (int i = 0; i < kNumFiles; ++i) {
    EXPECT_THAT(files[i], StrEq(absl::StrCat("file", i)));
  }
}

TEST_F(FileOpsTest, TestBasename) {
  EXPECT_THAT(fileops::Basename(""), StrEq(""));
  EXPECT_THAT(fileops::Basename("/"), StrEq(""));
  EXPECT_THAT(fileops::Basename("/hello/"), StrEq(""));
  EXPECT_THAT(fileops::Basename("//hello"), StrEq("hello"));
  EXPECT_THAT(fileops::Basename("/hello/world"), StrEq("world"));
}

TEST_F(FileOpsTest, TestStripBasename) {
  EXPECT_THAT(fileops::StripBasename(""), StrEq(""));
  EXPECT_THAT(fileops::StripBasename("/"), StrEq("/"));
  EXPECT_THAT(fileops::StripBasename("/hello"), StrEq("/"));
  EXPECT_THAT(fileops::StripBasename("/hello/"), StrEq("/hello"));
  EXPECT_THAT(fileops::StripBasename("/hello/world"), StrEq("/hello"));
  EXPECT_THAT(fileops::StripBasename("hello"), StrEq(""));
}

TEST_F(FileOpsTest, CreateDirectoryRecursivelyTest) {
  EXPECT_THAT(fileops::CreateDirectoryRecursively("a/b/c", 0700), IsOk());
  EXPECT_THAT(fileops::IsDirectory("a/b/c"), IsTrue());
  // Existing directories are fine.
  EXPECT_THAT(fileops::CreateDirectoryRecursively("a/b", 0700), IsOk());

  ASSERT_THAT(file::SetContents("a/file", ""), IsOk());
  EXPECT_THAT(fileops::CreateDirectoryRecursively("a/file/d", 0700),
              Not(IsOk()));
}

TEST_F(FileOpsTest, WriteAndReadFD) {
  int fds[2];
  ASSERT_THAT(pipe2(fds, O_CLOEXEC), Eq(0));
  fileops::FDCloser read_end(fds[0]);
  {
    fileops::FDCloser write_end(fds[1]);
    EXPECT_THAT(fileops::WriteToFD(write_end.get(), "hello", 5), IsTrue());
  }
  absl::StatusOr<std::string> contents = fileops::ReadAllFromFD(read_end.get());
  ASSERT_THAT(contents, IsOk());
  EXPECT_THAT(*contents, StrEq("hello"));

  EXPECT_THAT(fileops::ReadAllFromFD(-1),
              StatusIs(absl::StatusCode::kInternal));
}

TEST_F(FileOpsTest, FDCloserTest) {
  fileops::FDCloser closer(open("/dev/null", O_RDONLY | O_CLOEXEC));
  ASSERT_THAT(closer.get(), Ne(-1));
  const int fd = closer.get();
  EXPECT_THAT(closer.Close(), IsTrue());
  EXPECT_THAT(closer.get(), Eq(-1));
  EXPECT_THAT(fcntl(fd, F_GETFD), Eq(-1));
  EXPECT_THAT(closer.Close(), IsFalse());
}

}  // namespace
}  // namespace agentbox::file_util
