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


#include "testpick/config.h"

#include <optional>
#include <string>
#include <string_view>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "google/protobuf/json/json.h"

#include "testpick/config.pb.h"
#include "testpick/platform.h"
#include "testpick/strings.h"
#include "testpick/system.h"

namespace testpick {

absl::Status LoadConfigFile(const FileName& file, Config& config) {
  const absl::StatusOr<std::string> json = ReadFile(file);
  if (!json.ok()) return json.status();
  ConfigFile proto;
  google::protobuf::json::ParseOptions options;
  options.ignore_unknown_fields = false;
  const absl::Status status =
      google::protobuf::json::JsonStringToMessage(*json, &proto, options);
  if (!status.ok()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Invalid configuration file %#s: %s", file, status.message()));
  }
  if (proto.has_test_directory()) {
    config.test_directory = proto.test_directory();
  }
  if (!proto.suffixes().empty()) {
    config.suffixes.assign(proto.suffixes().begin(), proto.suffixes().end());
  }
  if (proto.has_command()) config.command = proto.command();
  if (proto.has_verbose_command()) {
    config.verbose_command = proto.verbose_command();
  }
  if (proto.has_seed_variable()) config.seed_variable = proto.seed_variable();
  if (proto.has_parallel_variable()) {
    config.parallel_variable = proto.parallel_variable();
  }
  if (proto.has_environment()) config.environment = proto.environment();
  LOG(INFO) << "Loaded configuration from " << file.string();
  return absl::OkStatus();
}

absl::Status LoadConfig(const std::optional<std::string>& file,
                        Config& config) {
  const absl::StatusOr<FileName> name =
      FileName::FromString(file.has_value() ? *file : kDefaultConfigFile);
  if (!name.ok()) return name.status();
  if (!file.has_value() && !FileExists(*name)) return absl::OkStatus();
  return LoadConfigFile(*name, config);
}

static absl::Status CheckNotEmpty(const std::string_view what,
                                  const std::string_view value) {
  if (value.empty()) {
    return absl::InvalidArgumentError(absl::StrCat("Empty ", what));
  }
  return absl::OkStatus();
}

static absl::Status CheckVariable(const std::string_view what,
                                  const std::string_view name) {
  if (!IsShellIdentifier(name)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid %s %s", what, Quote(name)));
  }
  return absl::OkStatus();
}

absl::Status ValidateConfig(const Config& config) {
  if (absl::Status status =
          CheckNotEmpty("test directory", config.test_directory);
      !status.ok()) {
    return status;
  }
  if (config.suffixes.empty()) {
    return absl::InvalidArgumentError("No test file suffixes");
  }
  for (const std::string& suffix : config.suffixes) {
    if (suffix.empty()) {
      return absl::InvalidArgumentError("Empty test file suffix");
    }
  }
  if (absl::Status status = CheckNotEmpty("command", config.command);
      !status.ok()) {
    return status;
  }
  if (absl::Status status =
          CheckNotEmpty("verbose command", config.verbose_command);
      !status.ok()) {
    return status;
  }
  if (absl::Status status =
          CheckVariable("seed variable", config.seed_variable);
      !status.ok()) {
    return status;
  }
  // The parallel variable may only be empty if there’s no worker count.
  if (config.jobs.has_value() || !config.parallel_variable.empty()) {
    if (absl::Status status =
            CheckVariable("parallel variable", config.parallel_variable);
        !status.ok()) {
      return status;
    }
  }
  if (config.jobs.has_value() && *config.jobs < 1) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid number of jobs %d", *config.jobs));
  }
  return absl::OkStatus();
}

}  // namespace testpick
