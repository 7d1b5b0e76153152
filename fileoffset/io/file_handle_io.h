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

#include "fileoffset/io/io.h"
#include "fileoffset/io/offset.h"
#include "fileoffset/result/result_type.h"

namespace fileoffset {

// Borrows `handle`, which must stay open for the lifetime of this object.
class FileHandleIo : public OffsetReaderWriter {
 public:
  explicit FileHandleIo(FileHandle handle);

  Result<size_t> PartialReadAt(void* buf, size_t count,
                               uint64_t offset) const override;
  Result<size_t> PartialWriteAt(const void* buf, size_t count,
                                uint64_t offset) override;

 private:
  FileHandle handle_;
};

}  // namespace fileoffset
