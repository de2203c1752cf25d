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


#ifndef TESTPICK_OPTIONS_H_
#define TESTPICK_OPTIONS_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/random/bit_gen_ref.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"

#include "testpick/config.h"

namespace testpick {

inline constexpr char kUsage[] =
    "usage: testpick [--seed=N] [--changed] [--ref=REF] [--jobs=N] "
    "[--verbose] [--dry-run] [--list] [--debug] [--config=FILE] [--] "
    "[PATH[:LINE]...]";

struct CommandLine final {
  // Only the command-line settings are filled in; the others keep their
  // defaults.
  Config config;

  // Value of --config, if given.
  std::optional<std::string> config_file;

  bool help = false;

  std::vector<std::string> paths;
};

// Parses the program arguments, including the program name in args[0].
// Flags end at “--” or at the first argument that doesn’t start with a dash.
// If there’s no --seed flag, the seed is drawn from random.
absl::StatusOr<CommandLine> ParseCommandLine(
    absl::Span<const std::string_view> args, absl::BitGenRef random);

}  // namespace testpick

#endif  // TESTPICK_OPTIONS_H_
