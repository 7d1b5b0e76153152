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

#include "fileoffset/io/offset.h"

#include <errno.h>
#include <stdint.h>
#include <string.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <limits>
#include <string>

#include "fileoffset/result/error_type.h"
#include "fileoffset/result/expect.h"
#include "fileoffset/result/result_type.h"

namespace fileoffset {
namespace {

// off64_t is signed
constexpr uint64_t kMaxOffset = std::numeric_limits<int64_t>::max();
constexpr size_t kMaxCount = std::numeric_limits<ssize_t>::max();

ssize_t PositionalRead(int fd, void* buf, size_t count, uint64_t offset) {
#if defined(__linux__)
  return pread64(fd, buf, count, static_cast<off64_t>(offset));
#else
  return pread(fd, buf, count, static_cast<off_t>(offset));
#endif
}

ssize_t PositionalWrite(int fd, const void* buf, size_t count,
                        uint64_t offset) {
#if defined(__linux__)
  return pwrite64(fd, buf, count, static_cast<off64_t>(offset));
#else
  return pwrite(fd, buf, count, static_cast<off_t>(offset));
#endif
}

}  // namespace

IoErrorKind IoErrorKindFromPlatformCode(PlatformErrorCode code) {
  switch (code) {
    case EINTR:
      return IoErrorKind::kInterrupted;
    case EACCES:
    case EPERM:
      return IoErrorKind::kPermissionDenied;
    case EBADF:
    case EISDIR:
    case ESPIPE:
    case ENXIO:
      return IoErrorKind::kBadHandle;
    case EINVAL:
    case EOVERFLOW:
    case EFBIG:
      return IoErrorKind::kInvalidOffset;
    case ENOSPC:
    case EDQUOT:
    case EIO:
      return IoErrorKind::kNoSpace;
    default:
      return IoErrorKind::kOther;
  }
}

std::string DescribePlatformCode(PlatformErrorCode code) {
  return strerror(code);
}

Result<size_t> ReadOffset(FileHandle fd, void* buf, size_t count,
                          uint64_t offset) {
  if (offset > kMaxOffset) {
    return FO_PLATFORM_ERR(EINVAL, "Read offset " << offset
                                                  << " does not fit in off_t");
  }
  ssize_t data_read = PositionalRead(fd, buf, std::min(count, kMaxCount),
                                     offset);
  if (data_read < 0) {
    int error = errno;
    return FO_PLATFORM_ERR(error, "pread(" << fd << ", " << count << ", "
                                           << offset << ") failed");
  }
  return static_cast<size_t>(data_read);
}

Result<size_t> WriteOffset(FileHandle fd, const void* buf, size_t count,
                           uint64_t offset) {
  if (offset > kMaxOffset) {
    return FO_PLATFORM_ERR(EINVAL, "Write offset "
                                       << offset << " does not fit in off_t");
  }
  ssize_t data_written = PositionalWrite(fd, buf, std::min(count, kMaxCount),
                                         offset);
  if (data_written < 0) {
    int error = errno;
    return FO_PLATFORM_ERR(error, "pwrite(" << fd << ", " << count << ", "
                                            << offset << ") failed");
  }
  return static_cast<size_t>(data_written);
}

}  // namespace fileoffset
