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


#ifndef TESTPICK_DISPATCH_H_
#define TESTPICK_DISPATCH_H_

#include <ostream>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "absl/types/span.h"

#include "testpick/config.h"
#include "testpick/runner.h"

namespace testpick {

// Acts on the resolved files according to the --list and --dry-run flags.
// Listing writes the files to out, one per line; a dry run writes the
// command.  If neither flag is set and there are files, runs the command
// through the shell.  Returns the exit code for the process.
absl::StatusOr<int> Dispatch(const Config& config,
                             absl::Span<const std::string> files,
                             std::string_view command, std::ostream& out,
                             Runner& runner);

}  // namespace testpick

#endif  // TESTPICK_DISPATCH_H_
