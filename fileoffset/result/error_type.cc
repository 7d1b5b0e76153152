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

#include "fileoffset/result/error_type.h"

#include <stdlib.h>

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace fileoffset {

const char* IoErrorKindName(IoErrorKind kind) {
  switch (kind) {
    case IoErrorKind::kInterrupted:
      return "interrupted";
    case IoErrorKind::kPermissionDenied:
      return "permission denied";
    case IoErrorKind::kBadHandle:
      return "bad handle";
    case IoErrorKind::kInvalidOffset:
      return "invalid offset";
    case IoErrorKind::kNoSpace:
      return "no space";
    case IoErrorKind::kUnexpectedEof:
      return "unexpected end of file";
    case IoErrorKind::kWriteZero:
      return "write zero";
    case IoErrorKind::kOther:
      return "other";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& out, IoErrorKind kind) {
  return out << IoErrorKindName(kind);
}

StackTraceEntry::StackTraceEntry(std::string file, size_t line,
                                 std::string pretty_function,
                                 std::string expression)
    : file_(std::move(file)),
      line_(line),
      pretty_function_(std::move(pretty_function)),
      expression_(std::move(expression)) {}

StackTraceEntry::StackTraceEntry(const StackTraceEntry& other)
    : file_(other.file_),
      line_(other.line_),
      pretty_function_(other.pretty_function_),
      expression_(other.expression_),
      message_(other.message_.str()) {}

StackTraceEntry& StackTraceEntry::operator=(const StackTraceEntry& other) {
  file_ = other.file_;
  line_ = other.line_;
  pretty_function_ = other.pretty_function_;
  expression_ = other.expression_;
  message_.str(other.message_.str());
  return *this;
}

bool StackTraceEntry::HasMessage() const { return !message_.str().empty(); }

void StackTraceEntry::WriteVerbose(std::ostream& stream) const {
  auto str = message_.str();
  if (str.empty()) {
    stream << "Failure\n";
  } else {
    stream << str << "\n";
  }
  stream << " at " << file_ << ":" << line_ << "\n";
  stream << " in " << pretty_function_ << "\n";
  if (!expression_.empty()) {
    stream << " for FO_EXPECT(" << expression_ << ")\n";
  }
}

IoError IoError::FromPlatformCode(PlatformErrorCode code) {
  IoError error(IoErrorKindFromPlatformCode(code));
  error.platform_code_ = code;
  return error;
}

std::string IoError::Message() const {
  std::vector<std::string> parts;
  for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
    if (it->HasMessage()) {
      parts.emplace_back(it->MessageText());
    }
  }
  if (platform_code_.has_value()) {
    parts.emplace_back(fmt::format("{} ({})",
                                   DescribePlatformCode(*platform_code_),
                                   *platform_code_));
  } else if (parts.empty()) {
    parts.emplace_back(IoErrorKindName(kind_));
  }
  std::string message;
  for (const auto& part : parts) {
    if (!message.empty()) {
      message += ": ";
    }
    message += part;
  }
  return message;
}

std::string IoError::Trace() const {
  std::stringstream writer;
  writer << "kind: " << kind_;
  if (platform_code_.has_value()) {
    writer << ", code: " << *platform_code_ << " ("
           << DescribePlatformCode(*platform_code_) << ")";
  }
  writer << "\n";
  for (const auto& entry : stack_) {
    entry.WriteVerbose(writer);
  }
  return writer.str();
}

std::string IoError::FormatForEnv() const {
  const char* error_format = getenv("FILEOFFSET_ERROR_FORMAT");
  std::string_view format = error_format == nullptr ? "short" : error_format;
  if (format == "message") {
    return Message();
  } else if (format == "trace") {
    return Trace();
  }
  return fmt::format("{}: {}", kind_, Message());
}

std::ostream& operator<<(std::ostream& out, const IoError& error) {
  return out << error.Message();
}

}  // namespace fileoffset
