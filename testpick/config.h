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


#ifndef TESTPICK_CONFIG_H_
#define TESTPICK_CONFIG_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"

#include "testpick/system.h"

namespace testpick {

struct Config final {
  // Settings that a configuration file can override.
  std::string test_directory = "test";
  std::vector<std::string> suffixes = {"_test.*"};
  std::string command = "bin/test";
  std::string verbose_command = "bin/test --verbose";
  std::string seed_variable = "SEED";
  std::string parallel_variable = "PARALLEL_WORKERS";
  std::string environment;

  // Settings that only come from the command line.
  int seed = 0;
  bool changed = false;
  std::string ref;
  std::optional<int> jobs;
  bool verbose = false;
  bool dry_run = false;
  bool list = false;
  bool debug = false;
};

// Reads a JSON file holding a testpick.ConfigFile message and overwrites the
// corresponding fields of config.  Unknown fields are an error.
absl::Status LoadConfigFile(const FileName& file, Config& config);

// Loads file if given.  Otherwise loads the default configuration file from
// the working directory if it exists.
absl::Status LoadConfig(const std::optional<std::string>& file,
                        Config& config);

// Checks the settings that the rest of the program relies on.
absl::Status ValidateConfig(const Config& config);

}  // namespace testpick

#endif  // TESTPICK_CONFIG_H_
