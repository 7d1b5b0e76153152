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

#if defined(_WIN32)
#include <windows.h>
#else
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#endif

#include <stddef.h>

#include <string>

#include <fmt/format.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "fileoffset/result/expect.h"
#include "fileoffset/result/result_matchers.h"
#include "fileoffset/result/result_type.h"

namespace fileoffset {
namespace {

using ::testing::HasSubstr;
using ::testing::Optional;
using ::testing::StartsWith;

Result<size_t> InterruptedRead() {
  return FO_ERR_KIND(IoErrorKind::kInterrupted, "read was interrupted");
}

Result<int> ReadCount() {
  size_t count = FO_EXPECT(InterruptedRead(), "while reading the count");
  return static_cast<int>(count);
}

Result<void> CheckPositive(int value) {
  FO_EXPECT(value > 0, "value was " << value);
  return {};
}

Result<void> CheckEqual(int lhs, int rhs) {
  FO_EXPECT_EQ(lhs, rhs);
  return {};
}

TEST(IoErrorTest, ExpectKeepsKind) {
  Result<int> res = ReadCount();
  ASSERT_THAT(res, IsErrorWithKind(IoErrorKind::kInterrupted));
  ASSERT_FALSE(res.error().PlatformCode().has_value());
  ASSERT_EQ(res.error().Stack().size(), 2u);
}

TEST(IoErrorTest, MessageReadsOutermostFirst) {
  Result<int> res = ReadCount();
  ASSERT_THAT(res, IsErrorAndMessage("while reading the count: "
                                     "read was interrupted"));
}

TEST(IoErrorTest, TraceNamesKindAndExpression) {
  Result<int> res = ReadCount();
  ASSERT_THAT(res, IsError());
  std::string trace = res.error().Trace();
  ASSERT_THAT(trace, StartsWith("kind: interrupted\n"));
  ASSERT_THAT(trace, HasSubstr("for FO_EXPECT(InterruptedRead())"));
  ASSERT_THAT(trace, HasSubstr("error_type_test.cc"));
}

TEST(IoErrorTest, FalseConditionIsOtherKind) {
  ASSERT_THAT(CheckPositive(3), IsOk());
  Result<void> res = CheckPositive(-2);
  ASSERT_THAT(res, IsErrorWithKind(IoErrorKind::kOther));
  ASSERT_THAT(res, IsErrorAndMessage("value was -2"));
}

TEST(IoErrorTest, ComparisonFailureDescribesOperands) {
  ASSERT_THAT(CheckEqual(1, 1), IsOk());
  ASSERT_THAT(CheckEqual(1, 2),
              IsErrorAndMessage(HasSubstr("but was 1 vs 2")));
}

TEST(IoErrorTest, BareErrorDescribesKind) {
  IoError error(IoErrorKind::kNoSpace);
  ASSERT_EQ(error.Message(), "no space");
  ASSERT_EQ(fmt::format("{}", error), "no space");
  ASSERT_EQ(fmt::format("{}", IoErrorKind::kBadHandle), "bad handle");
}

#if defined(_WIN32)

TEST(IoErrorKindTest, FromWin32Codes) {
  EXPECT_EQ(IoErrorKindFromPlatformCode(ERROR_OPERATION_ABORTED),
            IoErrorKind::kInterrupted);
  EXPECT_EQ(IoErrorKindFromPlatformCode(ERROR_ACCESS_DENIED),
            IoErrorKind::kPermissionDenied);
  EXPECT_EQ(IoErrorKindFromPlatformCode(ERROR_INVALID_HANDLE),
            IoErrorKind::kBadHandle);
  EXPECT_EQ(IoErrorKindFromPlatformCode(ERROR_NEGATIVE_SEEK),
            IoErrorKind::kInvalidOffset);
  EXPECT_EQ(IoErrorKindFromPlatformCode(ERROR_DISK_FULL),
            IoErrorKind::kNoSpace);
  EXPECT_EQ(IoErrorKindFromPlatformCode(ERROR_GEN_FAILURE),
            IoErrorKind::kOther);
}

#else

TEST(IoErrorKindTest, FromErrno) {
  EXPECT_EQ(IoErrorKindFromPlatformCode(EINTR), IoErrorKind::kInterrupted);
  EXPECT_EQ(IoErrorKindFromPlatformCode(EACCES),
            IoErrorKind::kPermissionDenied);
  EXPECT_EQ(IoErrorKindFromPlatformCode(EPERM),
            IoErrorKind::kPermissionDenied);
  EXPECT_EQ(IoErrorKindFromPlatformCode(EBADF), IoErrorKind::kBadHandle);
  EXPECT_EQ(IoErrorKindFromPlatformCode(EISDIR), IoErrorKind::kBadHandle);
  EXPECT_EQ(IoErrorKindFromPlatformCode(EINVAL), IoErrorKind::kInvalidOffset);
  EXPECT_EQ(IoErrorKindFromPlatformCode(EFBIG), IoErrorKind::kInvalidOffset);
  EXPECT_EQ(IoErrorKindFromPlatformCode(ENOSPC), IoErrorKind::kNoSpace);
  EXPECT_EQ(IoErrorKindFromPlatformCode(EDQUOT), IoErrorKind::kNoSpace);
  EXPECT_EQ(IoErrorKindFromPlatformCode(EIO), IoErrorKind::kNoSpace);
  EXPECT_EQ(IoErrorKindFromPlatformCode(EAGAIN), IoErrorKind::kOther);
}

TEST(IoErrorTest, PlatformCodeIsPreserved) {
  IoError error = IoError::FromPlatformCode(EBADF).PushEntry(
      FO_STACK_TRACE_ENTRY("") << "pread failed");
  ASSERT_EQ(error.Kind(), IoErrorKind::kBadHandle);
  ASSERT_THAT(error.PlatformCode(), Optional(EBADF));
  ASSERT_EQ(error.Message(),
            fmt::format("pread failed: {} ({})", strerror(EBADF), EBADF));
}

class FormatForEnvTest : public ::testing::Test {
 protected:
  void SetUp() override {
    error_ = IoError::FromPlatformCode(ENOSPC).PushEntry(
        FO_STACK_TRACE_ENTRY("") << "pwrite failed");
  }
  void TearDown() override { unsetenv("FILEOFFSET_ERROR_FORMAT"); }

  IoError error_;
};

TEST_F(FormatForEnvTest, DefaultsToKindAndMessage) {
  unsetenv("FILEOFFSET_ERROR_FORMAT");
  ASSERT_EQ(error_.FormatForEnv(),
            fmt::format("no space: {}", error_.Message()));
}

TEST_F(FormatForEnvTest, MessageOnly) {
  setenv("FILEOFFSET_ERROR_FORMAT", "message", 1);
  ASSERT_EQ(error_.FormatForEnv(), error_.Message());
}

TEST_F(FormatForEnvTest, FullTrace) {
  setenv("FILEOFFSET_ERROR_FORMAT", "trace", 1);
  ASSERT_EQ(error_.FormatForEnv(), error_.Trace());
}

#endif

}  // namespace
}  // namespace fileoffset
