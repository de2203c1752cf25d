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

#include "testpick/suffix.h"

#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"

#include "testpick/strings.h"

namespace testpick {

static std::string ToRegex(const std::string_view pattern) {
  std::string result;
  for (const char ch : pattern) {
    switch (ch) {
      case '*':
        result += "[^/]*";
        break;
      case '?':
        result += "[^/]";
        break;
      case '.':
      case '[':
      case ']':
      case '(':
      case ')':
      case '{':
      case '}':
      case '+':
      case '^':
      case '$':
      case '|':
      case '\\':
        result += '\\';
        result += ch;
        break;
      default:
        result += ch;
    }
  }
  result += '$';
  return result;
}

absl::StatusOr<SuffixMatcher> SuffixMatcher::Create(
    const absl::Span<const std::string> patterns) {
  std::vector<std::regex> regexes;
  for (const std::string& pattern : patterns) {
    if (pattern.empty()) {
      return absl::InvalidArgumentError("Empty test file suffix");
    }
    if (ContainsNull(pattern)) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Test file suffix %s contains null character", Quote(pattern)));
    }
    regexes.emplace_back(ToRegex(pattern),
                         std::regex::ECMAScript | std::regex::optimize);
  }
  return SuffixMatcher(std::move(regexes));
}

bool SuffixMatcher::Matches(const std::string_view file) const {
  return absl::c_any_of(regexes_, [file](const std::regex& regex) {
    return std::regex_search(file.begin(), file.end(), regex);
  });
}

}  // namespace testpick
