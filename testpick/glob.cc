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

#include "testpick/glob.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

#include "testpick/platform.h"
#include "testpick/strings.h"
#include "testpick/suffix.h"
#include "testpick/system.h"

namespace testpick {

namespace {

constexpr int kMaxDepth = 100;

class Globber final {
 public:
  explicit Globber(const SuffixMatcher& matcher, const FileName& cwd)
      : matcher_(matcher), base_(cwd.string()) {
    if (base_.back() != kSeparator) base_.push_back(kSeparator);
  }

  Globber(const Globber&) = delete;
  Globber& operator=(const Globber&) = delete;

  void Expand(const FileName& prefix) {
    FileName parent = prefix;
    std::string_view stem;
    if (const absl::StatusOr<FileName> p = prefix.Parent(); p.ok()) {
      parent = *p;
      stem = prefix.Basename();
    }
    if (!IsDirectory(parent, Links::kFollow)) return;
    const absl::StatusOr<std::vector<FileName>> entries = List(parent);
    if (!entries.ok()) return;
    for (const FileName& entry : *entries) {
      const std::string& name = entry.string();
      if (!StartsWith(name, stem)) continue;
      if (stem.empty() && StartsWith(name, ".")) continue;
      const absl::StatusOr<FileName> file = parent.Child(entry);
      if (!file.ok()) {
        LOG(WARNING) << file.status();
        continue;
      }
      this->Add(*file);
      if (IsDirectory(*file, Links::kFollow)) this->Walk(*file, 1);
    }
  }

  void ExpandDirectory(const FileName& dir) {
    if (IsDirectory(dir, Links::kFollow)) this->Walk(dir, 1);
  }

  std::vector<std::string> Release() && { return std::move(result_); }

 private:
  absl::StatusOr<std::vector<FileName>> List(const FileName& dir) const {
    absl::StatusOr<std::vector<FileName>> entries = ListDirectory(dir);
    // A missing directory just means that the prefix doesn’t match anything.
    if (!entries.ok() && !absl::IsNotFound(entries.status())) {
      LOG(WARNING) << "Skipping directory " << dir.string() << ": "
                   << entries.status();
    }
    return entries;
  }

  void Walk(const FileName& dir, const int depth) {
    if (depth > kMaxDepth) {
      LOG(WARNING) << "Potential filesystem loop in " << dir.string()
                   << "; not descending further";
      return;
    }
    const absl::StatusOr<std::vector<FileName>> entries = List(dir);
    if (!entries.ok()) return;
    for (const FileName& entry : *entries) {
      if (StartsWith(entry.string(), ".")) continue;
      const absl::StatusOr<FileName> file = dir.Child(entry);
      if (!file.ok()) {
        LOG(WARNING) << file.status();
        continue;
      }
      this->Add(*file);
      if (IsDirectory(*file)) this->Walk(*file, depth + 1);
    }
  }

  void Add(const FileName& file) {
    const std::string& name = file.string();
    if (!matcher_.Matches(name)) return;
    std::string_view rel = name;
    if (!ConsumePrefix(rel, base_) || rel.empty()) rel = name;
    result_.emplace_back(rel);
  }

  const SuffixMatcher& matcher_;
  std::string base_;
  std::vector<std::string> result_;
};

}  // namespace

absl::StatusOr<std::vector<std::string>> ExpandPrefix(
    const std::string_view prefix, const SuffixMatcher& matcher,
    const FileName& cwd) {
  absl::StatusOr<FileName> name = cwd;
  if (!prefix.empty()) {
    name = FileName::FromString(prefix);
    if (!name.ok()) return name.status();
    if (!name->IsAbsolute()) name = cwd.Join(*name);
    if (!name.ok()) return name.status();
  }
  const absl::StatusOr<FileName> abs = name->Normalize();
  if (!abs.ok()) return abs.status();
  const absl::StatusOr<FileName> base = cwd.Normalize();
  if (!base.ok()) return base.status();
  Globber globber(matcher, cwd);
  // A prefix that explicitly names a directory selects only that directory,
  // not its siblings sharing the same name prefix.
  if (prefix.empty() || prefix.back() == kSeparator || *abs == *base) {
    globber.ExpandDirectory(*abs);
  } else {
    globber.Expand(*abs);
  }
  return std::move(globber).Release();
}

}  // namespace testpick
