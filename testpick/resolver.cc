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


#include "testpick/resolver.h"

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"

#include "testpick/changes.h"
#include "testpick/glob.h"
#include "testpick/path_spec.h"

namespace testpick {

absl::StatusOr<Resolution> Resolver::Resolve(
    absl::Span<const std::string> args) {
  const std::vector<std::string> defaults = {config_.test_directory};
  if (args.empty()) args = defaults;
  LOG(INFO) << "Resolving " << absl::StrJoin(args, " ");

  // std::set sorts by byte order and removes duplicates.
  std::set<std::string> candidates;
  std::vector<std::string> paths;
  for (const std::string& arg : args) {
    PathSpec spec = ParsePathSpec(arg);
    if (Classify(spec, matcher_) == PathKind::kSingleTest) {
      candidates.insert(spec.raw);
    } else {
      absl::StatusOr<std::vector<std::string>> files =
          ExpandPrefix(spec.file, matcher_, cwd_);
      if (!files.ok()) return files.status();
      candidates.insert(files->begin(), files->end());
    }
    paths.push_back(std::move(spec.file));
  }
  LOG(INFO) << candidates.size() << " candidate files";

  Resolution result;
  if (!config_.changed) {
    result.files.assign(candidates.begin(), candidates.end());
    return result;
  }

  ChangeQuery query = QueryChanges(runner_, config_.ref, paths);
  LOG(INFO) << "Git command: " << query.command;
  LOG(INFO) << "Git reported " << query.files.size() << " files";
  // Git only reports files, so its output is filtered without expanding
  // directories.
  std::set<std::string> changed;
  for (const std::string& file : query.files) {
    PathSpec spec = ParsePathSpec(file);
    if (matcher_.Matches(spec.file)) changed.insert(std::move(spec.file));
  }
  for (const std::string& candidate : candidates) {
    if (changed.count(ParsePathSpec(candidate).file) != 0) {
      result.files.push_back(candidate);
    }
  }
  result.changes = std::move(query);
  return result;
}

}  // namespace testpick
