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

#include "agentbox/capability/capability_registry.h"

#include <map>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "agentbox/sandbox/isolation.h"
#include "agentbox/sandbox/mounts.h"
#include "agentbox/testing.h"
#include "agentbox/util/file_helpers.h"
#include "agentbox/util/fileops.h"
#include "agentbox/util/path.h"
#include "agentbox/util/status_matchers.h"

namespace agentbox {
namespace {

namespace fileops = ::agentbox::file_util::fileops;

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::IsTrue;
using ::testing::Pair;
using ::testing::SizeIs;
using ::testing::StrEq;
using ::testing::UnorderedElementsAre;

TEST(ParseFrontMatterTest, ReadsFlatKeys) {
  EXPECT_THAT(ParseFrontMatter("---\n"
                               "name: pdf-tools\n"
                               "Description: \"Extract text: fast.\"\n"
                               "# comment\n"
                               "---\n"
                               "body: ignored\n"),
              UnorderedElementsAre(Pair("name", "pdf-tools"),
                                   Pair("description", "Extract text: fast.")));
}

TEST(ParseFrontMatterTest, RequiresLeadingFence) {
  EXPECT_THAT(ParseFrontMatter("name: pdf-tools\n"), IsEmpty());
  EXPECT_THAT(ParseFrontMatter(""), IsEmpty());
}

class CapabilityRegistryTest : public testing::Test {
 protected:
  void SetUp() override { base_ = CreateTestTempDir("capability_test"); }

  // Creates <root>/<dir> with a SKILL.md and the given scripts.
  void MakeCapability(const std::string& root, const std::string& dir,
                      const std::string& skill,
                      const std::vector<std::string>& scripts) {
    const std::string path = file::JoinPath(base_, root, dir);
    ASSERT_THAT(fileops::CreateDirectoryRecursively(path, 0755), IsOk());
    ASSERT_THAT(file::SetContents(file::JoinPath(path, "SKILL.md"), skill),
                IsOk());
    for (const std::string& script : scripts) {
      const std::string script_path = file::JoinPath(path, "scripts", script);
      ASSERT_THAT(fileops::CreateDirectoryRecursively(
                      fileops::StripBasename(script_path), 0755),
                  IsOk());
      ASSERT_THAT(file::SetContents(script_path, "#!/bin/sh\n"), IsOk());
    }
  }

  std::string Root(const std::string& name) {
    return file::JoinPath(base_, name);
  }

  std::string base_;
};

TEST_F(CapabilityRegistryTest, MissingRootIsNotFound) {
  EXPECT_THAT(CapabilityRegistry::Discover({Root("absent")}),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(CapabilityRegistryTest, DiscoversCapabilities) {
  MakeCapability("a", "pdf", "---\nname: pdf-tools\ndescription: PDFs\n---\n",
                 {"extract.py", "lib/util.sh"});
  MakeCapability("a", "charts", "no front matter\n", {});
  MakeCapability("a", "broken", "---\nname: ../escape\n---\n", {"x.sh"});
  ASSERT_THAT(fileops::CreateDirectoryRecursively(
                  file::JoinPath(Root("a"), "not-a-capability"), 0755),
              IsOk());

  AGENTBOX_ASSERT_OK_AND_ASSIGN(CapabilityRegistry registry,
                                CapabilityRegistry::Discover({Root("a")}));
  EXPECT_THAT(registry.List(),
              ElementsAre(testing::Pointee(Field(&Capability::name, "charts")),
                          testing::Pointee(
                              Field(&Capability::name, "pdf-tools"))));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(const Capability* pdf,
                                registry.Find("pdf-tools"));
  EXPECT_THAT(pdf->description, StrEq("PDFs"));
  EXPECT_THAT(pdf->scripts, ElementsAre("extract.py", "lib/util.sh"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(const Capability* charts,
                                registry.Find("charts"));
  EXPECT_THAT(charts->scripts_dir, IsEmpty());
  EXPECT_THAT(registry.Find("broken"), StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(CapabilityRegistryTest, FirstRootWins) {
  MakeCapability("a", "pdf", "---\nname: pdf\ndescription: first\n---\n",
                 {"one.sh"});
  MakeCapability("b", "pdf", "---\nname: pdf\ndescription: second\n---\n",
                 {"two.sh"});
  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      CapabilityRegistry registry,
      CapabilityRegistry::Discover({Root("a"), Root("b")}));
  AGENTBOX_ASSERT_OK_AND_ASSIGN(const Capability* pdf, registry.Find("pdf"));
  EXPECT_THAT(pdf->description, StrEq("first"));
  EXPECT_THAT(pdf->scripts, ElementsAre("one.sh"));
}

TEST_F(CapabilityRegistryTest, MountsScriptsReadOnly) {
  MakeCapability("a", "pdf", "---\nname: pdf\n---\n", {"extract.py"});
  MakeCapability("a", "docs", "---\nname: docs\n---\n", {});
  AGENTBOX_ASSERT_OK_AND_ASSIGN(CapabilityRegistry registry,
                                CapabilityRegistry::Discover({Root("a")}));
  std::vector<BindMount> mounts = registry.GetBindMounts();
  ASSERT_THAT(mounts, SizeIs(1));
  EXPECT_THAT(mounts[0].source,
              StrEq(file::JoinPath(Root("a"), "pdf", "scripts")));
  EXPECT_THAT(mounts[0].target, StrEq("/capabilities/pdf/scripts"));
  EXPECT_THAT(mounts[0].read_only, IsTrue());

  Mounts sandbox;
  ASSERT_THAT(sandbox.AddBindMount(mounts[0]), IsOk());
  EXPECT_THAT(sandbox.ResolvePath("/capabilities/pdf/scripts/extract.py"),
              IsOkAndHolds(file::JoinPath(Root("a"), "pdf", "scripts",
                                          "extract.py")));
}

TEST_F(CapabilityRegistryTest, BuildsInvocations) {
  MakeCapability("a", "pdf", "---\nname: pdf\n---\n",
                 {"extract.py", "convert.sh", "bin/tool"});
  AGENTBOX_ASSERT_OK_AND_ASSIGN(CapabilityRegistry registry,
                                CapabilityRegistry::Discover({Root("a")}));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Command python,
      registry.BuildInvocation("pdf", "extract.py", {"in.pdf"},
                               "/usr/bin/python3"));
  EXPECT_THAT(python.argv,
              ElementsAre("/usr/bin/python3",
                          "/capabilities/pdf/scripts/extract.py", "in.pdf"));
  EXPECT_THAT(python.working_dir, StrEq("/workspace"));
  EXPECT_THAT(python.env,
              Contains("CAPABILITY_DIR=/capabilities/pdf/scripts"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Command shell,
      registry.BuildInvocation("pdf", "convert.sh", {}, "/usr/bin/python3"));
  EXPECT_THAT(shell.argv,
              ElementsAre("/bin/bash", "/capabilities/pdf/scripts/convert.sh"));

  AGENTBOX_ASSERT_OK_AND_ASSIGN(
      Command direct,
      registry.BuildInvocation("pdf", "bin/tool", {"-v"}, "/usr/bin/python3"));
  EXPECT_THAT(direct.argv,
              ElementsAre("/capabilities/pdf/scripts/bin/tool", "-v"));
}

TEST_F(CapabilityRegistryTest, RejectsScriptsOutsideCapability) {
  MakeCapability("a", "pdf", "---\nname: pdf\n---\n", {"extract.py"});
  AGENTBOX_ASSERT_OK_AND_ASSIGN(CapabilityRegistry registry,
                                CapabilityRegistry::Discover({Root("a")}));
  for (const char* script :
       {"../../etc/passwd", "/etc/passwd", "", "./extract.py"}) {
    EXPECT_THAT(registry.BuildInvocation("pdf", script, {}, "python3"),
                StatusIs(absl::StatusCode::kInvalidArgument))
        << script;
  }
  EXPECT_THAT(registry.BuildInvocation("pdf", "missing.py", {}, "python3"),
              StatusIs(absl::StatusCode::kNotFound));
  EXPECT_THAT(registry.BuildInvocation("nope", "extract.py", {}, "python3"),
              StatusIs(absl::StatusCode::kNotFound));
}

}  // namespace
}  // namespace agentbox
