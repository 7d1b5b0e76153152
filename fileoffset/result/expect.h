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

#include <optional>
#include <type_traits>
#include <utility>

#include <fmt/format.h>  // IWYU pragma: export

#include "fileoffset/result/error_type.h"
#include "fileoffset/result/result_type.h"  // IWYU pragma: export

namespace fileoffset {

/**
 * Error return macros that include the location in the file in the error
 * message.
 *
 * FO_ERR_KIND picks the kind explicitly. FO_PLATFORM_ERR derives the kind from
 * an errno or GetLastError() value and keeps that value for the caller to
 * inspect.
 * Capture the platform code before building the message, since streaming
 * may clobber errno.
 *
 * Example usage:
 *
 *     ssize_t data_read = pread64(fd, buf, count, offset);
 *     if (data_read < 0) {
 *       int error = errno;
 *       return FO_PLATFORM_ERR(error, "pread64(" << fd << ") failed");
 *     }
 *
 * This will return an error with the text
 *
 *     pread64(3) failed: Bad file descriptor (9)
 *
 * and the kind IoErrorKind::kBadHandle.
 */
#define FO_ERR_KIND(KIND, MSG) \
  (IoError(KIND).PushEntry(FO_STACK_TRACE_ENTRY("") << MSG))
#define FO_PLATFORM_ERR(CODE, MSG) \
  (IoError::FromPlatformCode(CODE).PushEntry(FO_STACK_TRACE_ENTRY("") << MSG))

template <typename T>
T OutcomeDereference(std::optional<T>&& value) {
  return std::move(*value);
}

inline void OutcomeDereference(Result<void>&&) {}

template <typename T>
T OutcomeDereference(Result<T>&& result) {
  return std::move(*result);
}

template <typename T>
typename std::enable_if<std::is_convertible_v<T, bool>, T>::type
OutcomeDereference(T&& value) {
  return std::forward<T>(value);
}

inline bool TypeIsSuccess(bool value) { return value; }

template <typename T>
bool TypeIsSuccess(std::optional<T>& value) {
  return value.has_value();
}

template <typename T>
bool TypeIsSuccess(Result<T>& value) {
  return value.ok();
}

inline auto ErrorFromType(bool) { return IoError(); }

template <typename T>
inline auto ErrorFromType(std::optional<T>) {
  return IoError();
}

template <typename T>
auto ErrorFromType(Result<T>& value) {
  return value.error();
}

#define FO_EXPECT_OVERLOAD(_1, _2, NAME, ...) NAME

#define FO_EXPECT2(RESULT, MSG)                               \
  ({                                                          \
    decltype(RESULT)&& macro_intermediate_result = RESULT;    \
    if (!TypeIsSuccess(macro_intermediate_result)) {          \
      auto current_entry = FO_STACK_TRACE_ENTRY(#RESULT);     \
      current_entry << MSG;                                   \
      auto error = ErrorFromType(macro_intermediate_result);  \
      error.PushEntry(std::move(current_entry));              \
      return std::move(error);                                \
    };                                                        \
    OutcomeDereference(std::move(macro_intermediate_result)); \
  })

#define FO_EXPECT1(RESULT) FO_EXPECT2(RESULT, "")

/**
 * Error propagation macro that can be used as an expression.
 *
 * The first argument can be either a Result or a type that is convertible to
 * a boolean. A successful result will return the value inside the result, or
 * a conversion to a `true` value will return the unconverted value.
 *
 * In the failure case, this macro will return from the containing function
 * with a failing Result. A failing inner Result keeps its kind and platform
 * code; the call site and the optional message are pushed on top of its
 * stack. A false boolean or empty optional becomes a kOther error.
 *
 * This macro must be invoked only in functions that return a Result.
 *
 * Example usage:
 *
 *     Result<Header> ReadHeader(OffsetReader& reader) {
 *       Header header = FO_EXPECT(PReadExactBinary<Header>(reader, 0),
 *                                 "Failed to read header");
 *       FO_EXPECT_EQ(header.magic, kMagic);
 *       return header;
 *     }
 */
#define FO_EXPECT(...) \
  FO_EXPECT_OVERLOAD(__VA_ARGS__, FO_EXPECT2, FO_EXPECT1)(__VA_ARGS__)

#define FO_EXPECTF(RESULT, MSG, ...) \
  FO_EXPECT(RESULT, fmt::format(FMT_STRING(MSG), __VA_ARGS__))

#define FO_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, MSG)         \
  ({                                                                        \
    auto&& lhs_macro_intermediate_result = LHS_RESULT;                      \
    auto&& rhs_macro_intermediate_result = RHS_RESULT;                      \
    bool comparison_result = lhs_macro_intermediate_result COMPARE_OP       \
        rhs_macro_intermediate_result;                                      \
    if (!comparison_result) {                                               \
      auto current_entry = FO_STACK_TRACE_ENTRY("");                        \
      current_entry << "Expected \"" << #LHS_RESULT << "\" " << #COMPARE_OP \
                    << " \"" << #RHS_RESULT << "\" but was "                \
                    << lhs_macro_intermediate_result << " vs "              \
                    << rhs_macro_intermediate_result << ". ";               \
      current_entry << MSG;                                                 \
      auto error = ErrorFromType(false);                                    \
      error.PushEntry(std::move(current_entry));                            \
      return std::move(error);                                              \
    };                                                                      \
    comparison_result;                                                      \
  })

#define FO_COMPARE_EXPECT3(COMPARE_OP, LHS_RESULT, RHS_RESULT) \
  FO_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, "")

#define FO_COMPARE_EXPECT_OVERLOAD(_1, _2, _3, _4, NAME, ...) NAME

#define FO_COMPARE_EXPECT(...)                                \
  FO_COMPARE_EXPECT_OVERLOAD(__VA_ARGS__, FO_COMPARE_EXPECT4, \
                             FO_COMPARE_EXPECT3)              \
  (__VA_ARGS__)

#define FO_EXPECT_EQ(LHS_RESULT, RHS_RESULT, ...) \
  FO_COMPARE_EXPECT(==, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)

}  // namespace fileoffset
