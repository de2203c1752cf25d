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

#ifndef TESTPICK_GLOB_H_
#define TESTPICK_GLOB_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"

#include "testpick/suffix.h"
#include "testpick/system.h"

namespace testpick {

// Finds the test files selected by a prefix.  The prefix is made absolute
// relative to cwd and normalized; every filesystem entry whose absolute name
// starts with it is a candidate, as is everything nested below such an
// entry.  If the prefix is empty, ends in a separator, or names the working
// directory, only that directory is expanded.  Below the prefix, hidden
// entries are skipped and symbolic links to directories aren’t followed.
// Candidates that match a test suffix are returned relative to cwd, or
// absolute if they are outside of cwd, in unspecified order.
//
// Unreadable directories are skipped with a warning.  The function only
// fails if the prefix isn’t a valid filename.
absl::StatusOr<std::vector<std::string>> ExpandPrefix(
    std::string_view prefix, const SuffixMatcher& matcher,
    const FileName& cwd);

}  // namespace testpick

#endif  // TESTPICK_GLOB_H_
