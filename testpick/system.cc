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

#include "testpick/system.h"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <spawn.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <ios>
#include <iostream>
#include <locale>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/cleanup/cleanup.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/types/span.h"

#include "testpick/platform.h"
#include "testpick/strings.h"

extern char** environ;

namespace testpick {

namespace {

absl::Status MakeErrorStatus(const std::error_code& code,
                             const std::string_view function) {
  if (!code) return absl::OkStatus();
  const std::error_condition condition = code.default_error_condition();
  const std::string message =
      absl::StrCat(function, ": ", code.category().name(), "/", code.value(),
                   ": ", code.message());
  return condition.category() == std::generic_category()
             ? absl::ErrnoToStatus(condition.value(), message)
             : absl::UnknownError(message);
}

template <typename... Ts>
absl::Status ErrorStatus(const std::error_code& code,
                         const absl::FormatSpec<Ts...>& format,
                         const Ts&... args) {
  return MakeErrorStatus(code, absl::StrFormat(format, args...));
}

[[nodiscard]] std::error_code ErrnoError() {
  const int code = errno;
  return std::error_code(code, std::generic_category());
}

template <typename... Ts>
absl::Status ErrnoStatus(const absl::FormatSpec<Ts...>& format,
                         const Ts&... args) {
  const std::error_code code = ErrnoError();
  return ErrorStatus(code, format, args...);
}

}  // namespace

absl::StatusOr<FileName> FileName::FromString(const std::string_view string) {
  if (string.empty()) return absl::InvalidArgumentError("Empty filename");
  if (ContainsNull(string)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Filename %s contains null character", Quote(string)));
  }
  return FileName(std::string(string));
}

absl::StatusOr<FileName> FileName::Parent() const {
  std::string string = string_;
  while (string.length() > 1 && string.back() == kSeparator) string.pop_back();
  const std::string::size_type i = string.rfind(kSeparator);
  if (i == string.npos || string == "/") {
    return absl::InvalidArgumentError(
        absl::StrFormat("File %s has no parent", *this));
  }
  const std::string_view view = string;
  const std::string_view element = view.substr(i + 1);
  if (element == "." || element == "..") {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Removing trailing component %s would be ambiguous", element));
  }
  // Root directories need to end in a separator character.
  return FileName::FromString(string.substr(0, i == 0 ? 1 : i));
}

absl::StatusOr<FileName> FileName::Child(const FileName& child) const {
  const std::string& string = child.string_;
  if (string == "." || string == ".." ||
      string.find(kSeparator) != string.npos) {
    return absl::InvalidArgumentError(
        absl::StrFormat("File %s is not a child of %s", child, *this));
  }
  return this->Join(child);
}

absl::StatusOr<FileName> FileName::Child(const std::string_view child) const {
  const absl::StatusOr<FileName> name = FileName::FromString(child);
  if (!name.ok()) return name.status();
  return this->Child(*name);
}

absl::StatusOr<FileName> FileName::Join(const FileName& descendant) const {
  if (descendant.IsAbsolute()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("File name %s is absolute", descendant));
  }
  return FileName::FromString(absl::StrCat(
      string_, string_.back() == kSeparator ? "" : "/", descendant.string_));
}

absl::StatusOr<FileName> FileName::Join(
    const std::string_view descendant) const {
  const absl::StatusOr<FileName> name = FileName::FromString(descendant);
  if (!name.ok()) return name.status();
  return this->Join(*name);
}

std::string_view FileName::Basename() const {
  std::string_view view = string_;
  while (view.length() > 1 && view.back() == kSeparator) view.remove_suffix(1);
  if (view == "/") return std::string_view();
  const std::string_view::size_type i = view.rfind(kSeparator);
  return i == view.npos ? view : view.substr(i + 1);
}

absl::FormatConvertResult<absl::FormatConversionCharSet::kString>
AbslFormatConvert(const FileName& file, const absl::FormatConversionSpec& spec,
                  absl::FormatSink* const sink) {
  CHECK_EQ(spec.conversion_char(), absl::FormatConversionChar::s);
  if (spec.has_alt_flag()) {
    sink->Append(Quote(file.string_));
    return {true};
  }
  return {absl::Format(sink, "%s", file.string_)};
}

void PrintTo(const FileName& file, std::ostream* const stream) {
  *stream << file.string_;
}

absl::StatusOr<FileName> WorkingDirectory() {
  // Assume that we always run on an OS that allocates a buffer when passed a
  // null pointer.
  char* const ptr = getcwd(nullptr, 0);
  if (ptr == nullptr) return ErrnoStatus("getcwd(nullptr, 0)");
  const absl::Cleanup cleanup = [ptr] { std::free(ptr); };
  // See the Linux man page for getcwd(3) why this can happen.
  if (*ptr != '/') {
    return absl::NotFoundError(
        absl::StrFormat("Current working directory %s is unreachable", ptr));
  }
  return FileName::FromString(ptr);
}

bool FileName::IsAbsolute() const { return string_.front() == kSeparator; }

absl::StatusOr<FileName> FileName::MakeAbsolute() const {
  if (this->IsAbsolute()) return *this;
  const absl::StatusOr<FileName> cwd = WorkingDirectory();
  if (!cwd.ok()) return cwd.status();
  return cwd->Join(*this);
}

absl::StatusOr<FileName> FileName::Normalize() const {
  if (!this->IsAbsolute()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Can’t normalize relative filename %s", *this));
  }
  std::vector<std::string_view> parts;
  for (const std::string_view part :
       absl::StrSplit(string_, kSeparator, absl::SkipEmpty())) {
    if (part == ".") continue;
    if (part == "..") {
      if (!parts.empty()) parts.pop_back();
      continue;
    }
    parts.push_back(part);
  }
  return FileName::FromString(absl::StrCat("/", absl::StrJoin(parts, "/")));
}

absl::StatusOr<std::string> ReadFile(const FileName& file) {
  std::ifstream stream(file.string(), std::ios::in | std::ios::binary);
  if (!stream.is_open() || !stream.good()) {
    return absl::NotFoundError(
        absl::StrFormat("Cannot open file %s for reading", file));
  }
  stream.imbue(std::locale::classic());
  std::ostringstream buffer;
  buffer.imbue(std::locale::classic());
  // Streaming an empty buffer sets the failbit on the target.
  if (stream.peek() != std::ifstream::traits_type::eof()) {
    buffer << stream.rdbuf();
  }
  buffer.flush();
  if (!buffer.good() || stream.bad()) {
    return absl::UnknownError(absl::StrFormat("Cannot read file %s", file));
  }
  return buffer.str();
}

bool FileExists(const FileName& file) {
  struct stat st;
  return lstat(file.pointer(), &st) == 0;
}

bool IsDirectory(const FileName& file, const Links links) {
  struct stat st;
  const int result = links == Links::kFollow ? stat(file.pointer(), &st)
                                             : lstat(file.pointer(), &st);
  return result == 0 && S_ISDIR(st.st_mode);
}

static int Remove(const char* const name, const struct stat*, const int type,
                  struct FTW* const ftw) {
  switch (type) {
    case FTW_DP:
      return rmdir(name);
    case FTW_F:
    case FTW_SL:
    case FTW_SLN:
      return unlink(name);
    default:
      LOG(ERROR) << "File " << name << " encountered at level " << ftw->level
                 << " has unsupported type " << type;
      errno = ENOTSUP;
      return -1;
  }
}

absl::Status RemoveTree(const FileName& directory) {
  const absl::StatusOr<FileName> abs = directory.MakeAbsolute();
  if (!abs.ok()) return abs.status();
  constexpr int fd_limit = 100;
  constexpr int flags = FTW_DEPTH | FTW_MOUNT | FTW_PHYS;
  const int result = nftw(abs->pointer(), Remove, fd_limit, flags);
  if (result != 0) {
    return ErrnoStatus("nftw(%#s, ..., %d, %#x)", *abs, fd_limit, flags);
  }
  return absl::OkStatus();
}

absl::StatusOr<FileName> CreateTemporaryDirectory() {
  const char* const dir = std::getenv("TMPDIR");
  std::string buffer = absl::StrCat(
      dir == nullptr || *dir == '\0' ? "/tmp" : dir, "/testpick.XXXXXX");
  char* const name = mkdtemp(buffer.data());
  if (name == nullptr) return ErrnoStatus("mkdtemp(%#s)", buffer);
  const absl::StatusOr<FileName> result = FileName::FromString(name);
  if (!result.ok()) {
    if (rmdir(name) != 0) LOG(ERROR) << ErrnoStatus("rmdir(%#s)", name);
    return result.status();
  }
  return *std::move(result);
}

absl::StatusOr<std::vector<FileName>> ListDirectory(const FileName& dir) {
  std::vector<FileName> result;
  DIR* const handle = opendir(dir.pointer());
  if (handle == nullptr) return ErrnoStatus("opendir(%#s)", dir);
  const absl::Cleanup cleanup = [handle] {
    if (closedir(handle) != 0) LOG(ERROR) << ErrnoStatus("closedir");
  };
  while (true) {
    errno = 0;
    const struct dirent* const entry = readdir(handle);
    if (entry == nullptr) {
      if (errno != 0) return ErrnoStatus("readdir");
      break;
    }
    const std::string_view name = entry->d_name;
    if (name == "." || name == "..") continue;
    absl::StatusOr<FileName> file = FileName::FromString(name);
    if (!file.ok()) return file.status();
    result.push_back(*std::move(file));
  }
  return result;
}

absl::StatusOr<FileName> SearchPath(const FileName& program) {
  // See the description of PATH at
  // https://pubs.opengroup.org/onlinepubs/9799919799/basedefs/V1_chap08.html#tag_08_03.
  const std::string& string = program.string();
  if (string.find(kSeparator) != string.npos) return program;
  const char* const path = std::getenv("PATH");
  if (path == nullptr) {
    return absl::NotFoundError("PATH environment variable not set");
  }
  for (const std::string_view dir : absl::StrSplit(path, ':')) {
    std::string file(dir.empty() ? "." : dir);
    if (file.back() != kSeparator) file += kSeparator;
    file += string;
    if (access(file.c_str(), X_OK) == 0) return FileName::FromString(file);
  }
  return absl::NotFoundError(
      absl::StrFormat("Program %s not found in PATH %s", program, path));
}

absl::StatusOr<Environment> Environment::Current() {
  Map map;
  for (char** ptr = environ; ptr != nullptr && *ptr != nullptr; ++ptr) {
    const std::string_view var = *ptr;
    const std::size_t i = var.find('=');
    if (i == 0 || i == var.npos) {
      return absl::FailedPreconditionError(
          absl::StrFormat("Invalid environment block entry %s", Quote(var)));
    }
    const std::string_view key = var.substr(0, i);
    const auto [it, ok] = map.emplace(key, var.substr(i + 1));
    if (!ok) {
      return absl::AlreadyExistsError(
          absl::StrFormat("Duplicate environment variable %s", key));
    }
  }
  return Environment(std::move(map));
}

static std::vector<char*> Pointers(
    std::vector<std::string>& strings ABSL_ATTRIBUTE_LIFETIME_BOUND) {
  std::vector<char*> ptrs;
  for (std::string& s : strings) {
    CHECK(!ContainsNull(s)) << s << " contains null character";
    ptrs.push_back(s.data());
  }
  ptrs.push_back(nullptr);
  return ptrs;
}

static void FlushEverything() {
  std::cout.flush();
  std::cerr.flush();
  if (std::fflush(nullptr) != 0) LOG(ERROR) << ErrnoStatus("fflush(nullptr)");
}

static absl::Status Redirect(posix_spawn_file_actions_t& actions, const int fd,
                             const FileName& file) {
  constexpr int oflag = O_WRONLY | O_CREAT | O_TRUNC | O_NOCTTY;
  constexpr mode_t mode = S_IRUSR | S_IWUSR;
  const int error = posix_spawn_file_actions_addopen(
      &actions, fd, file.pointer(), oflag, mode);
  if (error != 0) {
    return ErrorStatus(
        std::error_code(error, std::generic_category()),
        "posix_spawn_file_actions_addopen(..., %d, %#s, %#x, %#04o)", fd, file,
        oflag, mode);
  }
  return absl::OkStatus();
}

absl::StatusOr<int> Run(const FileName& program,
                        const absl::Span<const std::string> args,
                        const Environment& env, const RunOptions& options) {
  for (const std::string& arg : args) {
    if (ContainsNull(arg)) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Argument %s contains null character", Quote(arg)));
    }
  }
  const std::string& string = program.string();
  if (string.find(kSeparator) == string.npos) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Program name %s doesn’t contain a directory separator character",
        program));
  }
  const absl::StatusOr<FileName> abs_program = program.MakeAbsolute();
  if (!abs_program.ok()) return abs_program.status();
  std::vector<std::string> args_vec = {program.string()};
  args_vec.insert(args_vec.end(), args.cbegin(), args.cend());
  std::vector<std::string> final_env;
  for (const auto& [key, value] : env) {
    final_env.push_back(absl::StrCat(key, "=", value));
  }
  // Sort entries for hermeticity.
  absl::c_sort(final_env);
  FlushEverything();
  const absl::Cleanup flush = FlushEverything;
  posix_spawn_file_actions_t actions;
  if (const int error = posix_spawn_file_actions_init(&actions); error != 0) {
    return ErrorStatus(std::error_code(error, std::generic_category()),
                       "posix_spawn_file_actions_init");
  }
  const absl::Cleanup cleanup = [&actions] {
    if (const int error = posix_spawn_file_actions_destroy(&actions);
        error != 0) {
      LOG(ERROR) << ErrorStatus(std::error_code(error, std::generic_category()),
                                "posix_spawn_file_actions_destroy");
    }
  };
  if (options.output_file.has_value()) {
    const absl::Status status =
        Redirect(actions, STDOUT_FILENO, *options.output_file);
    if (!status.ok()) return status;
  }
  if (options.error_file.has_value()) {
    const absl::Status status =
        Redirect(actions, STDERR_FILENO, *options.error_file);
    if (!status.ok()) return status;
  }
  const std::vector<char*> argv = Pointers(args_vec);
  const std::vector<char*> envp = Pointers(final_env);
  pid_t pid;
  const int error = posix_spawn(&pid, abs_program->pointer(), &actions, nullptr,
                                argv.data(), envp.data());
  if (error != 0) {
    return ErrorStatus(std::error_code(error, std::generic_category()),
                       "posix_spawn(..., %#s)", *abs_program);
  }
  int wstatus;
  pid_t waited;
  do {
    waited = waitpid(pid, &wstatus, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited != pid) return ErrnoStatus("waitpid(%d, ..., 0)", pid);
  return WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : 0xFF;
}

}  // namespace testpick
