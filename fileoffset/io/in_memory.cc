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

#include "fileoffset/io/in_memory.h"

#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "fileoffset/result/expect.h"
#include "fileoffset/result/result_type.h"

namespace fileoffset {
namespace {

class InMemoryIoImpl : public OffsetReaderWriter {
 public:
  InMemoryIoImpl() = default;
  explicit InMemoryIoImpl(std::vector<char> data) : data_(std::move(data)) {}

  Result<size_t> PartialReadAt(void* buf, size_t count,
                               uint64_t offset) const override {
    std::shared_lock lock(mutex_);
    size_t to_read = ClampRange(offset, count);
    if (to_read > 0) {
      memcpy(buf, &data_[offset], to_read);
    }
    return to_read;
  }

  Result<size_t> PartialWriteAt(const void* buf, size_t count,
                                uint64_t offset) override {
    if (count == 0) {
      return 0;
    }
    std::lock_guard lock(mutex_);
    if (offset > data_.max_size() || count > data_.max_size() - offset) {
      return FO_ERR_KIND(IoErrorKind::kInvalidOffset,
                         "Cannot hold " << count << " bytes at offset "
                                        << offset << " in memory");
    }
    GrowTo(offset + count);
    memcpy(&data_[offset], buf, count);
    return count;
  }

 private:
  // Must be called with the lock held for reading or writing
  size_t ClampRange(uint64_t begin, size_t length) const {
    if (begin >= data_.size()) {
      return 0;
    }
    return std::min<uint64_t>(length, data_.size() - begin);
  }

  // Must be called with the lock held for writing
  void GrowTo(uint64_t new_size) {
    if (data_.size() < new_size) {
      data_.resize(new_size, '\0');
    }
  }

  std::vector<char> data_;
  mutable std::shared_mutex mutex_;
};

}  // namespace

std::unique_ptr<OffsetReaderWriter> InMemoryIo() {
  return std::make_unique<InMemoryIoImpl>();
}

std::unique_ptr<OffsetReaderWriter> InMemoryIo(std::vector<char> data) {
  return std::make_unique<InMemoryIoImpl>(std::move(data));
}

}  // namespace fileoffset
