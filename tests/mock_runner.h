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


#ifndef TESTPICK_TESTS_MOCK_RUNNER_H_
#define TESTPICK_TESTS_MOCK_RUNNER_H_

#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "gmock/gmock.h"

#include "testpick/runner.h"

namespace testpick {

class MockRunner : public Runner {
 public:
  MOCK_METHOD(absl::StatusOr<CapturedOutput>, Capture,
              (std::string_view program, absl::Span<const std::string> args),
              (override));
  MOCK_METHOD(absl::StatusOr<int>, Shell, (std::string_view command),
              (override));
};

}  // namespace testpick

#endif  // TESTPICK_TESTS_MOCK_RUNNER_H_
