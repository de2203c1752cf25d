// Copyright 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TESTPICK_SYSTEM_H_
#define TESTPICK_SYSTEM_H_

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"

#include "testpick/platform.h"
#include "testpick/strings.h"

namespace testpick {

class FileName final {
 public:
  static absl::StatusOr<FileName> FromString(std::string_view string);

  FileName(const FileName&) = default;
  FileName& operator=(const FileName&) = default;
  FileName(FileName&&) = default;
  FileName& operator=(FileName&&) = default;

  const std::string& string() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    CHECK(!string_.empty());
    return string_;
  }

  const char* pointer() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    CHECK(!string_.empty());
    CHECK(!ContainsNull(string_));
    return string_.c_str();
  }

  absl::StatusOr<FileName> Parent() const;
  absl::StatusOr<FileName> Child(const FileName& child) const;
  absl::StatusOr<FileName> Child(std::string_view child) const;
  absl::StatusOr<FileName> Join(const FileName& descendant) const;
  absl::StatusOr<FileName> Join(std::string_view descendant) const;

  // Returns the last component, ignoring trailing separators.  Returns an
  // empty string for the root directory.
  std::string_view Basename() const ABSL_ATTRIBUTE_LIFETIME_BOUND;

  bool IsAbsolute() const;
  absl::StatusOr<FileName> MakeAbsolute() const;

  // Removes “.” components, redundant and trailing separators, and resolves
  // “..” components lexically without consulting the filesystem.  “..” at the
  // root stays at the root.  Relative names can’t be normalized.
  absl::StatusOr<FileName> Normalize() const;

  friend bool operator==(const FileName& a, const FileName& b) {
    return a.string_ == b.string_;
  }

  friend bool operator!=(const FileName& a, const FileName& b) {
    return a.string_ != b.string_;
  }

  friend bool operator<(const FileName& a, const FileName& b) {
    return a.string_ < b.string_;
  }

  friend bool operator>(const FileName& a, const FileName& b) {
    return a.string_ > b.string_;
  }

  friend bool operator<=(const FileName& a, const FileName& b) {
    return a.string_ <= b.string_;
  }

  friend bool operator>=(const FileName& a, const FileName& b) {
    return a.string_ >= b.string_;
  }

  // Supports the %s conversion.  With the # flag (%#s), the name is quoted.
  friend absl::FormatConvertResult<absl::FormatConversionCharSet::kString>
  AbslFormatConvert(const FileName& file,
                    const absl::FormatConversionSpec& spec,
                    absl::FormatSink* sink);

  friend void PrintTo(const FileName& file, std::ostream* stream);

 private:
  explicit FileName(std::string string) : string_(std::move(string)) {
    CHECK(!string_.empty());
  }

  std::string string_;
};

absl::StatusOr<FileName> WorkingDirectory();

absl::StatusOr<std::string> ReadFile(const FileName& file);
[[nodiscard]] bool FileExists(const FileName& file);

enum class Links { kIgnore, kFollow };

// With Links::kIgnore, a symbolic link is never a directory.
[[nodiscard]] bool IsDirectory(const FileName& file,
                               Links links = Links::kIgnore);

absl::Status RemoveTree(const FileName& directory);
absl::StatusOr<FileName> CreateTemporaryDirectory();

// Returns the names of the entries in the given directory, excluding “.” and
// “..”, in unspecified order.
absl::StatusOr<std::vector<FileName>> ListDirectory(const FileName& dir);

// Looks up a program in PATH.  Names that contain a separator are returned
// unchanged.
absl::StatusOr<FileName> SearchPath(const FileName& program);

class Environment final {
 private:
  using Map = absl::flat_hash_map<std::string, std::string>;

 public:
  static absl::StatusOr<Environment> Current();

  template <typename I>
  static absl::StatusOr<Environment> Create(I begin, const I end) {
    Map map;
    for (; begin != end; ++begin) {
      const auto& [key, value] = *begin;
      if (key.empty()) {
        return absl::InvalidArgumentError("Empty environment variable name");
      }
      if (ContainsNull(key)) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Environment variable name %s contains null character",
            Quote(key)));
      }
      if (ContainsNull(value)) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Value %s for environment variable %s contains null character",
            Quote(value), key));
      }
      const auto [it, ok] = map.emplace(key, value);
      if (!ok) {
        return absl::AlreadyExistsError(
            absl::StrFormat("Duplicate environment variable %s", key));
      }
    }
    return Environment(std::move(map));
  }

  using value_type = Map::value_type;
  using reference = Map::reference;
  using const_reference = Map::const_reference;
  using iterator = Map::iterator;
  using const_iterator = Map::const_iterator;
  using difference_type = Map::difference_type;
  using size_type = Map::size_type;

  Environment() = default;
  Environment(const Environment&) = default;
  Environment& operator=(const Environment&) = default;
  Environment(Environment&&) = default;
  Environment& operator=(Environment&&) = default;

  iterator begin() { return map_.begin(); }
  const_iterator begin() const { return map_.begin(); }
  iterator end() { return map_.end(); }
  const_iterator end() const { return map_.end(); }
  const_iterator cbegin() const { return map_.cbegin(); }
  const_iterator cend() const { return map_.cend(); }
  size_type size() const { return map_.size(); }
  bool empty() const { return map_.empty(); }

 private:
  explicit Environment(Map map) : map_(std::move(map)) {}

  Map map_;
};

struct RunOptions final {
  // If set, redirect standard output to this file.
  std::optional<FileName> output_file;

  // If set, redirect standard error to this file.
  std::optional<FileName> error_file;
};

// Runs the program synchronously and returns its exit code.  A program
// terminated by a signal yields 0xFF.  The program name must contain a
// separator; use SearchPath to find programs in PATH.
absl::StatusOr<int> Run(const FileName& program,
                        absl::Span<const std::string> args,
                        const Environment& env, const RunOptions& options = {});

}  // namespace testpick

#endif  // TESTPICK_SYSTEM_H_
