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


#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/log_severity.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/span.h"

#include "testpick/command.h"
#include "testpick/config.h"
#include "testpick/dispatch.h"
#include "testpick/options.h"
#include "testpick/resolver.h"
#include "testpick/runner.h"
#include "testpick/suffix.h"
#include "testpick/system.h"

namespace testpick {

static absl::StatusOr<int> Main(
    const absl::Span<const std::string_view> args) {
  absl::BitGen random;
  absl::StatusOr<CommandLine> cmdline = ParseCommandLine(args, random);
  if (!cmdline.ok()) return cmdline.status();
  if (cmdline->help) {
    std::cout << kUsage << std::endl;
    return 0;
  }
  Config& config = cmdline->config;
  if (config.debug) absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);

  if (const absl::Status status = LoadConfig(cmdline->config_file, config);
      !status.ok()) {
    return status;
  }
  if (const absl::Status status = ValidateConfig(config); !status.ok()) {
    return status;
  }
  const absl::StatusOr<SuffixMatcher> matcher =
      SuffixMatcher::Create(config.suffixes);
  if (!matcher.ok()) return matcher.status();
  const absl::StatusOr<FileName> cwd = WorkingDirectory();
  if (!cwd.ok()) return cwd.status();
  absl::StatusOr<SystemRunner> runner = SystemRunner::Create();
  if (!runner.ok()) return runner.status();
  LOG(INFO) << "Seed: " << config.seed;

  absl::Time start = absl::Now();
  Resolver resolver(config, *matcher, *cwd, *runner);
  const absl::StatusOr<Resolution> resolution =
      resolver.Resolve(cmdline->paths);
  if (!resolution.ok()) return resolution.status();
  LOG(INFO) << "Resolved " << resolution->files.size() << " test files in "
            << absl::Now() - start;

  const std::string command = BuildCommand(config, resolution->files);
  LOG(INFO) << "Command: " << command;

  start = absl::Now();
  const absl::StatusOr<int> code =
      Dispatch(config, resolution->files, command, std::cout, *runner);
  LOG(INFO) << "Dispatch finished in " << absl::Now() - start;
  return code;
}

}  // namespace testpick

int main(int argc, char** argv) {
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);
  const std::vector<std::string_view> args(argv, argv + argc);
  const absl::StatusOr<int> code = testpick::Main(args);
  if (!code.ok()) {
    LOG(ERROR) << code.status();
    if (absl::IsInvalidArgument(code.status())) {
      std::cerr << testpick::kUsage << std::endl;
    }
    return EXIT_FAILURE;
  }
  return *code;
}
