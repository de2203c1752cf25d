// Copyright 2026 Google LLC
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


#include "testpick/options.h"

#include <optional>
#include <string_view>
#include <vector>

#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace testpick {
namespace {

using absl_testing::IsOk;
using absl_testing::StatusIs;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Ge;
using ::testing::IsEmpty;
using ::testing::Lt;
using ::testing::Optional;

static absl::StatusOr<CommandLine> Parse(std::vector<std::string_view> args) {
  args.insert(args.begin(), "testpick");
  absl::BitGen random;
  return ParseCommandLine(args, random);
}

TEST(ParseCommandLineTest, Defaults) {
  const absl::StatusOr<CommandLine> result = Parse({});
  ASSERT_THAT(result, IsOk());
  const Config& config = result->config;
  EXPECT_THAT(config.seed, AllOf(Ge(0), Lt(0xFFFF)));
  EXPECT_FALSE(config.changed);
  EXPECT_EQ(config.ref, "");
  EXPECT_EQ(config.jobs, std::nullopt);
  EXPECT_FALSE(config.verbose);
  EXPECT_FALSE(config.dry_run);
  EXPECT_FALSE(config.list);
  EXPECT_FALSE(config.debug);
  EXPECT_EQ(result->config_file, std::nullopt);
  EXPECT_FALSE(result->help);
  EXPECT_THAT(result->paths, IsEmpty());
}

TEST(ParseCommandLineTest, ParsesFlags) {
  const absl::StatusOr<CommandLine> result =
      Parse({"--seed=1234", "--changed", "--jobs=8", "--verbose", "--dry-run",
             "--list", "--debug", "--config=ci.json", "test/models",
             "test/a_test.rb:12"});
  ASSERT_THAT(result, IsOk());
  const Config& config = result->config;
  EXPECT_EQ(config.seed, 1234);
  EXPECT_TRUE(config.changed);
  EXPECT_EQ(config.ref, "");
  EXPECT_THAT(config.jobs, Optional(8));
  EXPECT_TRUE(config.verbose);
  EXPECT_TRUE(config.dry_run);
  EXPECT_TRUE(config.list);
  EXPECT_TRUE(config.debug);
  EXPECT_THAT(result->config_file, Optional(std::string("ci.json")));
  EXPECT_THAT(result->paths, ElementsAre("test/models", "test/a_test.rb:12"));
}

TEST(ParseCommandLineTest, ReferenceImpliesChanged) {
  const absl::StatusOr<CommandLine> result = Parse({"--ref=origin/main"});
  ASSERT_THAT(result, IsOk());
  EXPECT_TRUE(result->config.changed);
  EXPECT_EQ(result->config.ref, "origin/main");
}

TEST(ParseCommandLineTest, StopsAtFirstPath) {
  const absl::StatusOr<CommandLine> result =
      Parse({"--list", "test", "--verbose"});
  ASSERT_THAT(result, IsOk());
  EXPECT_TRUE(result->config.list);
  EXPECT_FALSE(result->config.verbose);
  EXPECT_THAT(result->paths, ElementsAre("test", "--verbose"));
}

TEST(ParseCommandLineTest, StopsAtDoubleDash) {
  const absl::StatusOr<CommandLine> result =
      Parse({"--list", "--", "--weird", "-x"});
  ASSERT_THAT(result, IsOk());
  EXPECT_THAT(result->paths, ElementsAre("--weird", "-x"));
}

TEST(ParseCommandLineTest, Help) {
  const absl::StatusOr<CommandLine> result = Parse({"--help"});
  ASSERT_THAT(result, IsOk());
  EXPECT_TRUE(result->help);
}

TEST(ParseCommandLineTest, RejectsInvalidArguments) {
  for (const std::vector<std::string_view>& args :
       std::vector<std::vector<std::string_view>>{
           {"--frobnicate"},
           {"-v"},
           {"--seed"},
           {"--seed="},
           {"--seed=abc"},
           {"--seed=-1"},
           {"--jobs=0"},
           {"--jobs=2x"},
           {"--jobs=99999999999"},
           {"--config="},
       }) {
    EXPECT_THAT(Parse(args), StatusIs(absl::StatusCode::kInvalidArgument))
        << ::testing::PrintToString(args);
  }
}

TEST(ParseCommandLineTest, RejectsEmptyArgumentVector) {
  absl::BitGen random;
  EXPECT_THAT(ParseCommandLine({}, random),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace testpick
