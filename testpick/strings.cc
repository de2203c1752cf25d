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

#include "testpick/strings.h"

#include <iomanip>
#include <ios>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace testpick {

std::string Quote(const std::string_view string) {
  std::ostringstream stream;
  stream.exceptions(std::ios::badbit | std::ios::failbit | std::ios::eofbit);
  stream.imbue(std::locale::classic());
  stream << std::quoted(string) << std::flush;
  return stream.str();
}

std::vector<std::string> SplitLines(const std::string_view text) {
  std::vector<std::string> result;
  for (std::string_view line : absl::StrSplit(text, '\n', absl::SkipEmpty())) {
    absl::ConsumeSuffix(&line, "\r");
    if (!line.empty()) result.emplace_back(line);
  }
  return result;
}

bool IsShellIdentifier(const std::string_view string) {
  if (string.empty()) return false;
  const unsigned char first = static_cast<unsigned char>(string.front());
  if (first != '_' && !absl::ascii_isalpha(first)) return false;
  return absl::c_all_of(string, [](const char ch) {
    const unsigned char u = static_cast<unsigned char>(ch);
    return u == '_' || absl::ascii_isalnum(u);
  });
}

}  // namespace testpick
