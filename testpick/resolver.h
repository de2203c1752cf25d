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


#ifndef TESTPICK_RESOLVER_H_
#define TESTPICK_RESOLVER_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"

#include "testpick/changes.h"
#include "testpick/config.h"
#include "testpick/runner.h"
#include "testpick/suffix.h"
#include "testpick/system.h"

namespace testpick {

struct Resolution final {
  // Sorted and free of duplicates.
  std::vector<std::string> files;

  // Present in changed-only mode.
  std::optional<ChangeQuery> changes;
};

// Turns command-line path arguments into the list of test files to run.
class Resolver final {
 public:
  // The arguments must outlive the resolver.
  explicit Resolver(const Config& config, const SuffixMatcher& matcher,
                    const FileName& cwd, Runner& runner)
      : config_(config), matcher_(matcher), cwd_(cwd), runner_(runner) {}

  Resolver(const Resolver&) = delete;
  Resolver& operator=(const Resolver&) = delete;

  // Without arguments, resolves the configured test directory.  An argument
  // of the form FILE:LINE naming a test file is passed through unchanged;
  // every other argument is expanded as a prefix.  In changed-only mode, the
  // result is restricted to files that Git reports as modified or untracked.
  absl::StatusOr<Resolution> Resolve(absl::Span<const std::string> args);

 private:
  const Config& config_;
  const SuffixMatcher& matcher_;
  const FileName& cwd_;
  Runner& runner_;
};

}  // namespace testpick

#endif  // TESTPICK_RESOLVER_H_
