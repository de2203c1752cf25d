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


#include "testpick/command.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"

#include "testpick/config.h"

namespace testpick {

std::string BuildCommand(const Config& config,
                         const absl::Span<const std::string> files) {
  std::vector<std::string> parts;
  if (!config.environment.empty()) parts.push_back(config.environment);
  parts.push_back(absl::StrCat(config.seed_variable, "=", config.seed));
  if (config.jobs.has_value()) {
    parts.push_back(absl::StrCat(config.parallel_variable, "=", *config.jobs));
  }
  parts.push_back(config.verbose ? config.verbose_command : config.command);
  if (!files.empty()) parts.push_back(absl::StrJoin(files, " "));
  return absl::StrJoin(parts, " ");
}

}  // namespace testpick
