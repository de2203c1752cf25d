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

#ifndef TESTPICK_CHANGES_H_
#define TESTPICK_CHANGES_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/types/span.h"

#include "testpick/runner.h"

namespace testpick {

struct ChangeQuery final {
  // Shell rendition of the Git commands, for diagnostics.
  std::string command;

  // Files changed relative to the reference, followed by untracked files.
  // May contain duplicates.
  std::vector<std::string> files;
};

// Asks Git for files below paths that differ from ref (or from the index if
// ref is empty), and for untracked files that aren’t ignored.  Both queries
// get the paths as separate arguments.  If Git can’t be started or fails,
// the file list is empty; the failure is only logged at INFO severity.
ChangeQuery QueryChanges(Runner& runner, std::string_view ref,
                         absl::Span<const std::string> paths);

}  // namespace testpick

#endif  // TESTPICK_CHANGES_H_
