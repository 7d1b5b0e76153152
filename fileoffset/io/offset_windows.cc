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

#include <windows.h>
#include <winternl.h>

#include <stdint.h>

#include <algorithm>
#include <limits>
#include <string>

#include <android-base/errors.h>

#include "fileoffset/result/error_type.h"
#include "fileoffset/result/expect.h"
#include "fileoffset/result/result_type.h"

namespace fileoffset {
namespace {

constexpr uint64_t kMaxOffset = std::numeric_limits<int64_t>::max();
constexpr size_t kMaxCount = MAXDWORD;

// Not part of the FILE_INFORMATION_CLASS values winternl.h declares.
constexpr auto kFileModeInformation = static_cast<FILE_INFORMATION_CLASS>(16);
constexpr ULONG kFileSynchronousIoAlert = 0x00000010;
constexpr ULONG kFileSynchronousIoNonalert = 0x00000020;

struct FileModeInformation {
  ULONG mode;
};

/*
 * ReadFile and WriteFile return ERROR_IO_PENDING on handles opened with
 * FILE_FLAG_OVERLAPPED and keep using the OVERLAPPED structure after
 * returning, so only handles the kernel services synchronously are accepted.
 */
Result<void> EnsureSynchronous(HANDLE handle) {
  IO_STATUS_BLOCK status_block = {};
  FileModeInformation info = {};
  NTSTATUS status = NtQueryInformationFile(handle, &status_block, &info,
                                           sizeof(info), kFileModeInformation);
  if (status < 0) {
    return FO_PLATFORM_ERR(RtlNtStatusToDosError(status),
                           "Could not query the mode of handle " << handle);
  }
  const ULONG synchronous = kFileSynchronousIoAlert | kFileSynchronousIoNonalert;
  if ((info.mode & synchronous) == 0) {
    return FO_PLATFORM_ERR(ERROR_NOT_SUPPORTED,
                           "Handle " << handle
                                     << " was opened for overlapped I/O");
  }
  return {};
}

OVERLAPPED OverlappedAt(uint64_t offset) {
  OVERLAPPED overlapped = {};
  overlapped.Offset = static_cast<DWORD>(offset & 0xFFFFFFFF);
  overlapped.OffsetHigh = static_cast<DWORD>(offset >> 32);
  return overlapped;
}

}  // namespace

IoErrorKind IoErrorKindFromPlatformCode(PlatformErrorCode code) {
  switch (code) {
    case ERROR_OPERATION_ABORTED:
      return IoErrorKind::kInterrupted;
    case ERROR_ACCESS_DENIED:
      return IoErrorKind::kPermissionDenied;
    case ERROR_INVALID_HANDLE:
    case ERROR_NOT_SUPPORTED:
      return IoErrorKind::kBadHandle;
    case ERROR_NEGATIVE_SEEK:
    case ERROR_INVALID_PARAMETER:
    case ERROR_FILE_TOO_LARGE:
      return IoErrorKind::kInvalidOffset;
    case ERROR_DISK_FULL:
    case ERROR_HANDLE_DISK_FULL:
    case ERROR_DISK_QUOTA_EXCEEDED:
    case ERROR_CRC:
    case ERROR_IO_DEVICE:
      return IoErrorKind::kNoSpace;
    default:
      return IoErrorKind::kOther;
  }
}

std::string DescribePlatformCode(PlatformErrorCode code) {
  return android::base::SystemErrorCodeToString(static_cast<int>(code));
}

Result<size_t> ReadOffset(FileHandle handle, void* buf, size_t count,
                          uint64_t offset) {
  FO_EXPECT(EnsureSynchronous(handle));
  if (offset > kMaxOffset) {
    return FO_PLATFORM_ERR(ERROR_NEGATIVE_SEEK,
                           "Read offset " << offset << " is out of range");
  }
  DWORD to_read = static_cast<DWORD>(std::min(count, kMaxCount));
  DWORD data_read = 0;
  OVERLAPPED overlapped = OverlappedAt(offset);
  if (!ReadFile(handle, buf, to_read, &data_read, &overlapped)) {
    DWORD error = GetLastError();
    if (error == ERROR_HANDLE_EOF) {
      return 0;
    }
    return FO_PLATFORM_ERR(error, "ReadFile(" << handle << ", " << count
                                              << ", " << offset
                                              << ") failed");
  }
  return static_cast<size_t>(data_read);
}

Result<size_t> WriteOffset(FileHandle handle, const void* buf, size_t count,
                           uint64_t offset) {
  FO_EXPECT(EnsureSynchronous(handle));
  if (offset > kMaxOffset) {
    return FO_PLATFORM_ERR(ERROR_NEGATIVE_SEEK,
                           "Write offset " << offset << " is out of range");
  }
  DWORD to_write = static_cast<DWORD>(std::min(count, kMaxCount));
  DWORD data_written = 0;
  OVERLAPPED overlapped = OverlappedAt(offset);
  if (!WriteFile(handle, buf, to_write, &data_written, &overlapped)) {
    DWORD error = GetLastError();
    return FO_PLATFORM_ERR(error, "WriteFile(" << handle << ", " << count
                                               << ", " << offset
                                               << ") failed");
  }
  return static_cast<size_t>(data_written);
}

}  // namespace fileoffset
