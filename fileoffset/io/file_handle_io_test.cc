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

#include "fileoffset/io/file_handle_io.h"

#if defined(_WIN32)
#include <io.h>
#endif

#include <stdint.h>

#include <string>

#include <android-base/file.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "fileoffset/io/read_exact.h"
#include "fileoffset/result/result_matchers.h"

namespace fileoffset {
namespace {

FileHandle HandleOf(int fd) {
#if defined(_WIN32)
  return reinterpret_cast<FileHandle>(_get_osfhandle(fd));
#else
  return fd;
#endif
}

struct Header {
  uint32_t magic;
  uint32_t version;
  uint64_t body_offset;
};

TEST(FileHandleIoTest, ForwardsToFile) {
  android::base::TemporaryFile file;
  FileHandleIo io(HandleOf(file.fd));

  ASSERT_THAT(io.PartialWriteAt("ABCDEFGH", 8, 0), IsOkAndValue(8));

  std::string dst(4, '\0');
  ASSERT_THAT(io.PartialReadAt(dst.data(), dst.size(), 2), IsOkAndValue(4));
  ASSERT_EQ(dst, "CDEF");
}

TEST(FileHandleIoTest, ExactTransfersOnRealFile) {
  android::base::TemporaryFile file;
  FileHandleIo io(HandleOf(file.fd));

  const Header header{0x46494c45, 2, 4096};
  ASSERT_THAT(PWriteExactBinary(io, header, 128), IsOk());

  Result<Header> read = PReadExactBinary<Header>(io, 128);
  ASSERT_THAT(read, IsOk());
  ASSERT_EQ(read->magic, header.magic);
  ASSERT_EQ(read->version, header.version);
  ASSERT_EQ(read->body_offset, header.body_offset);

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(file.path, &contents));
  ASSERT_EQ(contents.size(), 128 + sizeof(Header));
  ASSERT_EQ(contents.substr(0, 128), std::string(128, '\0'));
}

TEST(FileHandleIoTest, ReadExactPastEndFails) {
  android::base::TemporaryFile file;
  FileHandleIo io(HandleOf(file.fd));
  ASSERT_THAT(io.PartialWriteAt("ABC", 3, 0), IsOkAndValue(3));

  char dst[8];
  ASSERT_THAT(PReadExact(io, dst, sizeof(dst), 0),
              IsErrorWithKind(IoErrorKind::kUnexpectedEof));
}

}  // namespace
}  // namespace fileoffset
