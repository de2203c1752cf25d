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

#ifndef TESTPICK_PATH_SPEC_H_
#define TESTPICK_PATH_SPEC_H_

#include <optional>
#include <string>
#include <string_view>

#include "testpick/suffix.h"

namespace testpick {

// A command-line path argument, optionally followed by “:LINE”.
struct PathSpec final {
  // The argument as given.
  std::string raw;

  // The argument without the line locator.
  std::string file;

  std::optional<int> line;
};

enum class PathKind { kSingleTest, kPrefix };

// Splits off a trailing “:LINE” locator.  If the text after the last colon is
// empty or not a decimal number, there’s no locator and the whole argument is
// the file part.
PathSpec ParsePathSpec(std::string_view arg);

// An argument names a single test if it has a line locator and its file part
// is a test file.  Everything else is a prefix to expand.
[[nodiscard]] PathKind Classify(const PathSpec& spec,
                                const SuffixMatcher& matcher);

}  // namespace testpick

#endif  // TESTPICK_PATH_SPEC_H_
