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

#include "fileoffset/io/read_exact.h"

#include <stddef.h>
#include <stdint.h>

#include <utility>

#include <android-base/logging.h>

#include "fileoffset/io/io.h"
#include "fileoffset/result/expect.h"
#include "fileoffset/result/result_type.h"

namespace fileoffset {
namespace {

bool IsInterrupted(const Result<size_t>& result) {
  return !result.ok() && result.error().Kind() == IoErrorKind::kInterrupted;
}

}  // namespace

Result<void> PReadExact(OffsetReader& reader, char* buf, size_t size,
                        uint64_t offset) {
  size_t total_read = 0;
  while (total_read < size) {
    Result<size_t> read_res = reader.PartialReadAt(
        buf + total_read, size - total_read, offset + total_read);
    if (IsInterrupted(read_res)) {
      LOG(VERBOSE) << "Retrying interrupted read at offset "
                   << offset + total_read;
      continue;
    }
    size_t data_read = FO_EXPECTF(std::move(read_res),
                                  "Failed reading {} bytes at offset {}",
                                  size - total_read, offset + total_read);
    if (data_read == 0) {
      LOG(DEBUG) << "End of file at offset " << offset + total_read
                 << " with " << size - total_read << " bytes outstanding";
      return FO_ERR_KIND(IoErrorKind::kUnexpectedEof,
                         "Expected " << size << " bytes at offset " << offset
                                     << ", file ended after " << total_read);
    }
    total_read += data_read;
  }
  return {};
}

Result<void> PWriteExact(OffsetWriter& writer, const char* buf, size_t size,
                         uint64_t offset) {
  size_t total_written = 0;
  while (total_written < size) {
    Result<size_t> write_res = writer.PartialWriteAt(
        buf + total_written, size - total_written, offset + total_written);
    if (IsInterrupted(write_res)) {
      LOG(VERBOSE) << "Retrying interrupted write at offset "
                   << offset + total_written;
      continue;
    }
    size_t data_written = FO_EXPECTF(std::move(write_res),
                                     "Failed writing {} bytes at offset {}",
                                     size - total_written,
                                     offset + total_written);
    if (data_written == 0) {
      return FO_ERR_KIND(IoErrorKind::kWriteZero,
                         "Wrote " << total_written << " of " << size
                                  << " bytes at offset " << offset
                                  << " before the file accepted nothing");
    }
    total_written += data_written;
  }
  return {};
}

}  // namespace fileoffset
