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

#ifndef TESTPICK_PLATFORM_H_
#define TESTPICK_PLATFORM_H_

#if !defined __cplusplus || __cplusplus < 201703L
#  error this file requires at least C++17
#endif

#ifdef _WIN32
#  error testpick runs test commands through a POSIX shell
#endif

namespace testpick {

inline constexpr char kSeparator = '/';

// Interpreter used for the final test command.
inline constexpr char kShell[] = "/bin/sh";

// Configuration file looked up in the working directory if --config isn’t
// given.
inline constexpr char kDefaultConfigFile[] = ".testpick.json";

}  // namespace testpick

#endif  // TESTPICK_PLATFORM_H_
