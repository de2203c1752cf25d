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

#ifndef TESTPICK_STRINGS_H_
#define TESTPICK_STRINGS_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/strip.h"

namespace testpick {

[[nodiscard]] inline bool StartsWith(const std::string_view string,
                                     const std::string_view prefix) {
  return absl::StartsWith(string, prefix);
}

[[nodiscard]] inline bool ConsumePrefix(std::string_view& string,
                                        const std::string_view prefix) {
  return absl::ConsumePrefix(&string, prefix);
}

// Returns the string in double quotes, with embedded quotes and backslashes
// escaped.  Used for error messages and log lines.
std::string Quote(std::string_view string);

[[nodiscard]] inline bool ContainsNull(const std::string_view string) {
  return string.find('\0') != string.npos;
}

// Splits process output into lines.  Drops empty lines and a trailing
// carriage return on each line.
std::vector<std::string> SplitLines(std::string_view text);

// Reports whether the string is a valid POSIX shell variable name.
[[nodiscard]] bool IsShellIdentifier(std::string_view string);

}  // namespace testpick

#endif  // TESTPICK_STRINGS_H_
