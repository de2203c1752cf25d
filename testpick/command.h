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


#ifndef TESTPICK_COMMAND_H_
#define TESTPICK_COMMAND_H_

#include <string>

#include "absl/types/span.h"

#include "testpick/config.h"

namespace testpick {

// Builds the shell command line that runs the given test files: environment
// assignments, then the base command, then the files.  Empty parts are left
// out.  Filenames aren’t quoted.
std::string BuildCommand(const Config& config,
                         absl::Span<const std::string> files);

}  // namespace testpick

#endif  // TESTPICK_COMMAND_H_
