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

#ifndef TESTPICK_SUFFIX_H_
#define TESTPICK_SUFFIX_H_

#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"

namespace testpick {

// Decides whether a filename names a test file.  A pattern matches if the
// filename ends with it.  In patterns, “*” stands for any sequence of
// characters other than “/”, and “?” for a single such character.
class SuffixMatcher final {
 public:
  static absl::StatusOr<SuffixMatcher> Create(
      absl::Span<const std::string> patterns);

  SuffixMatcher(const SuffixMatcher&) = default;
  SuffixMatcher& operator=(const SuffixMatcher&) = default;
  SuffixMatcher(SuffixMatcher&&) = default;
  SuffixMatcher& operator=(SuffixMatcher&&) = default;

  [[nodiscard]] bool Matches(std::string_view file) const;

 private:
  explicit SuffixMatcher(std::vector<std::regex> regexes)
      : regexes_(std::move(regexes)) {}

  std::vector<std::regex> regexes_;
};

}  // namespace testpick

#endif  // TESTPICK_SUFFIX_H_
