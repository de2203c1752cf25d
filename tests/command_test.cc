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


#include "testpick/command.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "testpick/config.h"

namespace testpick {
namespace {

TEST(BuildCommandTest, JoinsEnvironmentCommandAndFiles) {
  Config config;
  config.environment = "FOO=1";
  config.seed_variable = "SEED";
  config.seed = 42;
  config.command = "run";
  const std::vector<std::string> files = {"a_test.x", "b_test.x"};
  EXPECT_EQ(BuildCommand(config, files), "FOO=1 SEED=42 run a_test.x b_test.x");
}

TEST(BuildCommandTest, AddsWorkerCountAfterSeed) {
  Config config;
  config.environment = "FOO=1";
  config.seed = 42;
  config.command = "run";
  config.parallel_variable = "PARALLEL";
  config.jobs = 4;
  const std::vector<std::string> files = {"a_test.x"};
  EXPECT_EQ(BuildCommand(config, files),
            "FOO=1 SEED=42 PARALLEL=4 run a_test.x");
}

TEST(BuildCommandTest, UsesVerboseCommand) {
  Config config;
  config.seed = 7;
  config.verbose = true;
  const std::vector<std::string> files = {"test/a_test.x:3"};
  EXPECT_EQ(BuildCommand(config, files),
            "SEED=7 bin/test --verbose test/a_test.x:3");
}

TEST(BuildCommandTest, OmitsEmptyParts) {
  Config config;
  config.seed = 0;
  EXPECT_EQ(BuildCommand(config, {}), "SEED=0 bin/test");
}

}  // namespace
}  // namespace testpick
