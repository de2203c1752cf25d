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


#include "testpick/dispatch.h"

#include <sstream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "testpick/config.h"
#include "tests/mock_runner.h"

namespace testpick {
namespace {

using absl_testing::IsOkAndHolds;
using absl_testing::StatusIs;
using ::testing::IsEmpty;
using ::testing::Return;
using ::testing::StrictMock;

constexpr char kCommand[] = "SEED=1 bin/test a_test.x b_test.x";

TEST(DispatchTest, RunsCommand) {
  StrictMock<MockRunner> runner;
  EXPECT_CALL(runner, Shell(kCommand)).WillOnce(Return(3));
  Config config;
  const std::vector<std::string> files = {"a_test.x", "b_test.x"};
  std::ostringstream out;
  EXPECT_THAT(Dispatch(config, files, kCommand, out, runner), IsOkAndHolds(3));
  EXPECT_THAT(out.str(), IsEmpty());
}

TEST(DispatchTest, PropagatesSpawnFailure) {
  StrictMock<MockRunner> runner;
  EXPECT_CALL(runner, Shell(kCommand))
      .WillOnce(Return(absl::PermissionDeniedError("posix_spawn failed")));
  Config config;
  const std::vector<std::string> files = {"a_test.x", "b_test.x"};
  std::ostringstream out;
  EXPECT_THAT(Dispatch(config, files, kCommand, out, runner),
              StatusIs(absl::StatusCode::kPermissionDenied));
}

TEST(DispatchTest, ListsFiles) {
  StrictMock<MockRunner> runner;
  Config config;
  config.list = true;
  const std::vector<std::string> files = {"a_test.x", "b_test.x"};
  std::ostringstream out;
  EXPECT_THAT(Dispatch(config, files, kCommand, out, runner), IsOkAndHolds(0));
  EXPECT_EQ(out.str(), "a_test.x\nb_test.x\n");
}

TEST(DispatchTest, PrintsCommandOnDryRun) {
  StrictMock<MockRunner> runner;
  Config config;
  config.dry_run = true;
  const std::vector<std::string> files = {"a_test.x", "b_test.x"};
  std::ostringstream out;
  EXPECT_THAT(Dispatch(config, files, kCommand, out, runner), IsOkAndHolds(0));
  EXPECT_EQ(out.str(), absl::StrCat(kCommand, "\n"));
}

TEST(DispatchTest, ListsBeforeDryRun) {
  StrictMock<MockRunner> runner;
  Config config;
  config.list = true;
  config.dry_run = true;
  const std::vector<std::string> files = {"a_test.x", "b_test.x"};
  std::ostringstream out;
  EXPECT_THAT(Dispatch(config, files, kCommand, out, runner), IsOkAndHolds(0));
  EXPECT_EQ(out.str(), absl::StrCat("a_test.x\nb_test.x\n", kCommand, "\n"));
}

TEST(DispatchTest, NeverRunsWithoutFiles) {
  StrictMock<MockRunner> runner;
  Config config;
  std::ostringstream out;
  EXPECT_THAT(Dispatch(config, {}, "SEED=1 bin/test", out, runner),
              IsOkAndHolds(0));
  EXPECT_THAT(out.str(), IsEmpty());

  config.list = true;
  EXPECT_THAT(Dispatch(config, {}, "SEED=1 bin/test", out, runner),
              IsOkAndHolds(0));
  EXPECT_THAT(out.str(), IsEmpty());

  config.dry_run = true;
  EXPECT_THAT(Dispatch(config, {}, "SEED=1 bin/test", out, runner),
              IsOkAndHolds(0));
  EXPECT_EQ(out.str(), "SEED=1 bin/test\n");
}

}  // namespace
}  // namespace testpick
