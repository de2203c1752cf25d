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


#include "testpick/dispatch.h"

#include <ostream>
#include <string>
#include <string_view>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"

#include "testpick/config.h"
#include "testpick/runner.h"

namespace testpick {

absl::StatusOr<int> Dispatch(const Config& config,
                             const absl::Span<const std::string> files,
                             const std::string_view command, std::ostream& out,
                             Runner& runner) {
  if (config.list) {
    for (const std::string& file : files) out << file << '\n';
  }
  if (config.dry_run) out << command << '\n';
  if (config.list || config.dry_run) {
    out.flush();
    if (!out.good()) return absl::DataLossError("Cannot write to output");
    return 0;
  }
  if (files.empty()) {
    LOG(INFO) << "No test files found, not running " << command;
    return 0;
  }
  LOG(INFO) << "Running " << command;
  return runner.Shell(command);
}

}  // namespace testpick
