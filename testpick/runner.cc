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

#include "testpick/runner.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"

#include "testpick/platform.h"
#include "testpick/system.h"

namespace testpick {

absl::StatusOr<SystemRunner> SystemRunner::Create() {
  absl::StatusOr<Environment> env = Environment::Current();
  if (!env.ok()) return env.status();
  return SystemRunner(*std::move(env));
}

absl::StatusOr<CapturedOutput> SystemRunner::Capture(
    const std::string_view program, const absl::Span<const std::string> args) {
  const absl::StatusOr<FileName> name = FileName::FromString(program);
  if (!name.ok()) return name.status();
  const absl::StatusOr<FileName> resolved = SearchPath(*name);
  if (!resolved.ok()) return resolved.status();

  const absl::StatusOr<FileName> dir = CreateTemporaryDirectory();
  if (!dir.ok()) return dir.status();
  const absl::Cleanup cleanup = [&dir] {
    const absl::Status status = RemoveTree(*dir);
    if (!status.ok()) LOG(ERROR) << status;
  };
  const absl::StatusOr<FileName> output_file = dir->Child("stdout");
  if (!output_file.ok()) return output_file.status();
  const absl::StatusOr<FileName> error_file = dir->Child("stderr");
  if (!error_file.ok()) return error_file.status();

  RunOptions options;
  options.output_file = *output_file;
  options.error_file = *error_file;
  const absl::StatusOr<int> code = Run(*resolved, args, env_, options);
  if (!code.ok()) return code.status();

  absl::StatusOr<std::string> output = ReadFile(*output_file);
  if (!output.ok()) return output.status();
  absl::StatusOr<std::string> error = ReadFile(*error_file);
  if (!error.ok()) return error.status();
  return CapturedOutput{*code, *std::move(output), *std::move(error)};
}

absl::StatusOr<int> SystemRunner::Shell(const std::string_view command) {
  const absl::StatusOr<FileName> shell = FileName::FromString(kShell);
  if (!shell.ok()) return shell.status();
  const std::vector<std::string> args = {"-c", std::string(command)};
  return Run(*shell, args, env_);
}

}  // namespace testpick
