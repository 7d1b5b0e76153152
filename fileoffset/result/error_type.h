//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <stddef.h>

#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <android-base/expected.h>
#include <fmt/format.h>

namespace fileoffset {

#if defined(_WIN32)
// GetLastError() value
using PlatformErrorCode = unsigned long;
#else
// errno value
using PlatformErrorCode = int;
#endif

enum class IoErrorKind {
  /** Aborted by a signal (or CancelSynchronousIo) before any byte moved. */
  kInterrupted,
  kPermissionDenied,
  /** Closed, invalid, or not a handle positional I/O can be issued on. */
  kBadHandle,
  kInvalidOffset,
  /** Storage full, quota exceeded, or a media error. */
  kNoSpace,
  /** PReadExact ran into the end of the file. */
  kUnexpectedEof,
  /** PWriteExact made no progress. */
  kWriteZero,
  kOther,
};

const char* IoErrorKindName(IoErrorKind kind);

std::ostream& operator<<(std::ostream&, IoErrorKind);

// Implemented by the platform back-end compiled into this build.
IoErrorKind IoErrorKindFromPlatformCode(PlatformErrorCode code);
std::string DescribePlatformCode(PlatformErrorCode code);

class IoError;

class StackTraceEntry {
 public:
  StackTraceEntry(std::string file, size_t line, std::string pretty_function,
                  std::string expression);

  StackTraceEntry(const StackTraceEntry& other);

  StackTraceEntry(StackTraceEntry&&) = default;
  StackTraceEntry& operator=(const StackTraceEntry& other);
  StackTraceEntry& operator=(StackTraceEntry&&) = default;

  template <typename T>
  StackTraceEntry& operator<<(T&& message_ext) & {
    message_ << std::forward<T>(message_ext);
    return *this;
  }
  template <typename T>
  StackTraceEntry operator<<(T&& message_ext) && {
    message_ << std::forward<T>(message_ext);
    return std::move(*this);
  }

  bool HasMessage() const;
  std::string MessageText() const { return message_.str(); }

  void WriteVerbose(std::ostream& stream) const;

 private:
  std::string file_;
  size_t line_;
  std::string pretty_function_;
  std::string expression_;
  std::stringstream message_;
};

#define FO_STACK_TRACE_ENTRY(expression) \
  StackTraceEntry(__FILE__, __LINE__, __PRETTY_FUNCTION__, expression)

/**
 * A failed I/O operation.
 *
 * The kind and the raw platform code are fixed where the error is created and
 * survive propagation unchanged. Each layer that passes the error along adds a
 * StackTraceEntry describing what it was doing, so the text rendering reads
 * outermost context first and the platform description last.
 */
class IoError {
 public:
  IoError() = default;
  explicit IoError(IoErrorKind kind) : kind_(kind) {}

  static IoError FromPlatformCode(PlatformErrorCode code);

  IoErrorKind Kind() const { return kind_; }
  std::optional<PlatformErrorCode> PlatformCode() const {
    return platform_code_;
  }

  IoError& PushEntry(StackTraceEntry entry) & {
    stack_.emplace_back(std::move(entry));
    return *this;
  }
  IoError PushEntry(StackTraceEntry entry) && {
    stack_.emplace_back(std::move(entry));
    return std::move(*this);
  }
  const std::vector<StackTraceEntry>& Stack() const { return stack_; }

  // "outer context: inner context: platform description (code)"
  std::string Message() const;
  // One block per stack entry, innermost first, with source locations.
  std::string Trace() const;
  // Rendering selected by the FILEOFFSET_ERROR_FORMAT environment variable.
  std::string FormatForEnv() const;

  template <typename T>
  operator android::base::expected<T, IoError>() && {
    return android::base::unexpected(std::move(*this));
  }

 private:
  IoErrorKind kind_ = IoErrorKind::kOther;
  std::optional<PlatformErrorCode> platform_code_;
  std::vector<StackTraceEntry> stack_;
};

std::ostream& operator<<(std::ostream&, const IoError&);

}  // namespace fileoffset

template <>
struct fmt::formatter<fileoffset::IoErrorKind>
    : fmt::formatter<std::string_view> {
  auto format(fileoffset::IoErrorKind kind, format_context& ctx) const
      -> format_context::iterator {
    return fmt::formatter<std::string_view>::format(
        fileoffset::IoErrorKindName(kind), ctx);
  }
};

template <>
struct fmt::formatter<fileoffset::IoError> : fmt::formatter<std::string_view> {
  auto format(const fileoffset::IoError& error, format_context& ctx) const
      -> format_context::iterator {
    return fmt::formatter<std::string_view>::format(error.Message(), ctx);
  }
};
