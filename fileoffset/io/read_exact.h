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
#include <stdint.h>

#include <type_traits>

#include "fileoffset/io/io.h"
#include "fileoffset/result/expect.h"
#include "fileoffset/result/result_type.h"

namespace fileoffset {

/*
 * Loops over PartialReadAt until `size` bytes have been read, retrying
 * transfers interrupted by signals. Reaching the end of the file first fails
 * with IoErrorKind::kUnexpectedEof, and the contents of `buf` are then
 * unspecified.
 */
Result<void> PReadExact(OffsetReader&, char* buf, size_t size,
                        uint64_t offset);

/*
 * Loops over PartialWriteAt until `size` bytes have been written, retrying
 * transfers interrupted by signals. A call accepting no bytes fails with
 * IoErrorKind::kWriteZero.
 */
Result<void> PWriteExact(OffsetWriter&, const char* buf, size_t size,
                         uint64_t offset);

template <typename T>
Result<T> PReadExactBinary(OffsetReader& reader, uint64_t offset) {
  static_assert(std::is_trivially_copyable_v<T>);
  T data;
  char* const data_char = reinterpret_cast<char*>(&data);
  FO_EXPECT(PReadExact(reader, data_char, sizeof(data), offset));
  return data;
}

template <typename T>
Result<void> PWriteExactBinary(OffsetWriter& writer, const T& data,
                               uint64_t offset) {
  static_assert(std::is_trivially_copyable_v<T>);
  const char* const data_char = reinterpret_cast<const char*>(&data);
  FO_EXPECT(PWriteExact(writer, data_char, sizeof(data), offset));
  return {};
}

}  // namespace fileoffset
