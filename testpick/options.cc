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
#include <string>
#include <string_view>

#include "absl/random/bit_gen_ref.h"
#include "absl/random/distributions.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"

#include "testpick/strings.h"

namespace testpick {

// Random seeds are drawn from [0, kSeedLimit).
constexpr int kSeedLimit = 0xFFFF;

static absl::StatusOr<int> ParseNumber(const std::string_view flag,
                                       const std::string_view value,
                                       const int min) {
  int number;
  if (!absl::SimpleAtoi(value, &number) || number < min) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid value %s for --%s", Quote(value), flag));
  }
  return number;
}

absl::StatusOr<CommandLine> ParseCommandLine(
    absl::Span<const std::string_view> args, absl::BitGenRef random) {
  if (args.empty()) return absl::InvalidArgumentError("Empty argument vector");
  args.remove_prefix(1);

  CommandLine result;
  Config& config = result.config;
  std::optional<int> seed;
  while (!args.empty()) {
    std::string_view arg = args.front();
    if (arg.empty() || arg.front() != '-') break;
    args.remove_prefix(1);
    if (arg == "--") break;
    if (ConsumePrefix(arg, "--seed=")) {
      const absl::StatusOr<int> number = ParseNumber("seed", arg, 0);
      if (!number.ok()) return number.status();
      seed = *number;
    } else if (arg == "--changed") {
      config.changed = true;
    } else if (ConsumePrefix(arg, "--ref=")) {
      config.changed = true;
      config.ref = arg;
    } else if (ConsumePrefix(arg, "--jobs=")) {
      const absl::StatusOr<int> number = ParseNumber("jobs", arg, 1);
      if (!number.ok()) return number.status();
      config.jobs = *number;
    } else if (arg == "--verbose") {
      config.verbose = true;
    } else if (arg == "--dry-run") {
      config.dry_run = true;
    } else if (arg == "--list") {
      config.list = true;
    } else if (arg == "--debug") {
      config.debug = true;
    } else if (ConsumePrefix(arg, "--config=")) {
      if (arg.empty()) {
        return absl::InvalidArgumentError("Empty configuration filename");
      }
      result.config_file = arg;
    } else if (arg == "--help") {
      result.help = true;
    } else {
      return absl::InvalidArgumentError(
          absl::StrFormat("Invalid command-line argument %s", Quote(arg)));
    }
  }
  config.seed = seed.has_value() ? *seed : absl::Uniform(random, 0, kSeedLimit);
  result.paths.assign(args.begin(), args.end());
  return result;
}

}  // namespace testpick
