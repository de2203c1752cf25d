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

#ifndef TESTPICK_RUNNER_H_
#define TESTPICK_RUNNER_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/types/span.h"

#include "testpick/system.h"

namespace testpick {

struct CapturedOutput final {
  int exit_code = 0;
  std::string output;
  std::string error;
};

// Runs subprocesses synchronously.
class Runner {
 public:
  virtual ~Runner() = default;

  // Runs a program found in PATH with the given arguments and returns its
  // exit code and output.  Standard input is inherited.
  virtual absl::StatusOr<CapturedOutput> Capture(
      std::string_view program, absl::Span<const std::string> args) = 0;

  // Runs a command line through the shell, with all standard streams
  // inherited, and returns its exit code.
  virtual absl::StatusOr<int> Shell(std::string_view command) = 0;
};

class SystemRunner final : public Runner {
 public:
  // Snapshots the current environment for all subprocesses.
  static absl::StatusOr<SystemRunner> Create();

  SystemRunner(const SystemRunner&) = delete;
  SystemRunner& operator=(const SystemRunner&) = delete;
  SystemRunner(SystemRunner&&) = default;
  SystemRunner& operator=(SystemRunner&&) = default;

  absl::StatusOr<CapturedOutput> Capture(
      std::string_view program, absl::Span<const std::string> args) override;

  absl::StatusOr<int> Shell(std::string_view command) override;

 private:
  explicit SystemRunner(Environment env) : env_(std::move(env)) {}

  Environment env_;
};

}  // namespace testpick

#endif  // TESTPICK_RUNNER_H_
