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

#include <memory>
#include <vector>

#include "fileoffset/io/io.h"

namespace fileoffset {

/*
 * A file kept in memory. Reads at or past the end return 0 bytes, and writes
 * past the end zero-fill the gap, matching ReadOffset and WriteOffset on a
 * regular file. Safe to use from multiple threads.
 */
std::unique_ptr<OffsetReaderWriter> InMemoryIo();
std::unique_ptr<OffsetReaderWriter> InMemoryIo(std::vector<char> data);

}  // namespace fileoffset
