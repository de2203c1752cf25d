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

#include "testpick/changes.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"

#include "testpick/runner.h"
#include "testpick/strings.h"

namespace testpick {

inline constexpr char kGit[] = "git";

static std::vector<std::string> DiffArgs(
    const std::string_view ref, const absl::Span<const std::string> paths) {
  std::vector<std::string> args = {"diff", "--no-ext-diff", "--name-only"};
  if (!ref.empty()) args.emplace_back(ref);
  args.emplace_back("--");
  args.insert(args.end(), paths.begin(), paths.end());
  return args;
}

static std::vector<std::string> UntrackedArgs(
    const absl::Span<const std::string> paths) {
  std::vector<std::string> args = {"ls-files", "--others",
                                   "--exclude-standard", "--"};
  args.insert(args.end(), paths.begin(), paths.end());
  return args;
}

static std::string Render(const absl::Span<const std::string> args) {
  return absl::StrCat(kGit, " ", absl::StrJoin(args, " "));
}

// Returns the lines Git printed, or nothing if it failed.
static std::optional<std::vector<std::string>> RunGit(
    Runner& runner, const absl::Span<const std::string> args) {
  const absl::StatusOr<CapturedOutput> result = runner.Capture(kGit, args);
  if (!result.ok()) {
    LOG(INFO) << "Cannot run " << Render(args) << ": " << result.status();
    return std::nullopt;
  }
  if (result->exit_code != 0) {
    LOG(INFO) << Render(args) << " failed with exit code " << result->exit_code
              << ": " << result->error;
    return std::nullopt;
  }
  return SplitLines(result->output);
}

ChangeQuery QueryChanges(Runner& runner, const std::string_view ref,
                         const absl::Span<const std::string> paths) {
  const std::vector<std::string> diff = DiffArgs(ref, paths);
  const std::vector<std::string> untracked = UntrackedArgs(paths);
  ChangeQuery query;
  query.command = absl::StrCat(Render(diff), " && ", Render(untracked));

  // Mirror the shell’s && semantics: list untracked files only if the diff
  // succeeded, and report nothing if either step failed.
  std::optional<std::vector<std::string>> changed = RunGit(runner, diff);
  if (!changed.has_value()) return query;
  std::optional<std::vector<std::string>> added = RunGit(runner, untracked);
  if (!added.has_value()) return query;

  query.files = *std::move(changed);
  query.files.insert(query.files.end(), added->begin(), added->end());
  return query;
}

}  // namespace testpick
