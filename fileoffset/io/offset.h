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

#include "fileoffset/result/result_type.h"

#if !defined(_WIN32) && !defined(__unix__) && !defined(__APPLE__)
#error "fileoffset needs a POSIX or Windows target for positional I/O"
#endif

namespace fileoffset {

#if defined(_WIN32)
// A HANDLE opened without FILE_FLAG_OVERLAPPED.
using FileHandle = void*;
#else
// A file descriptor.
using FileHandle = int;
#endif

/**
 * Reads up to `count` bytes into `buf`, starting at `offset` bytes from the
 * start of the file.
 *
 * Returns the number of bytes read, at most `count`. The offset is absolute
 * and independent of the handle's cursor. Like read(2), a short read is not an
 * error and this function never loops: call it again for the remainder, or use
 * PReadExact. A return value of 0 means end of file was reached at or before
 * `offset`, unless `count` was 0. Bytes of `buf` past the returned count are
 * left in an unspecified state.
 *
 * Errors of kind IoErrorKind::kInterrupted are transient and the call should
 * usually be retried. They are never retried here.
 *
 * The handle is borrowed. It is not closed, duplicated or reopened.
 *
 * Platform-specific behavior
 *
 * On POSIX this is a single pread64(2) and the handle's cursor is not
 * modified. On Windows this is a single ReadFile call with an OVERLAPPED
 * structure carrying the offset, which leaves the cursor at
 * `offset + returned count`. Code mixing this function with cursor-relative
 * reads on Windows has to account for that. Handles opened for overlapped I/O
 * are rejected with IoErrorKind::kBadHandle.
 *
 * Requests larger than a single kernel call accepts (SSIZE_MAX on POSIX,
 * MAXDWORD on Windows) are truncated to that limit.
 */
Result<size_t> ReadOffset(FileHandle handle, void* buf, size_t count,
                          uint64_t offset);

/**
 * Writes up to `count` bytes from `buf`, starting at `offset` bytes from the
 * start of the file.
 *
 * Returns the number of bytes written, at most `count`. Like write(2), a short
 * write is not an error and this function never loops; a return value of 0
 * with a non-empty buffer means nothing was accepted on this call. Writing
 * beyond the end of the file extends it, and the gap reads back as zeros
 * whether or not the filesystem allocates it.
 *
 * Errors of kind IoErrorKind::kInterrupted are transient and the call should
 * usually be retried. They are never retried here.
 *
 * Platform-specific behavior
 *
 * On POSIX this is a single pwrite64(2) and the handle's cursor is not
 * modified. If the descriptor was opened with O_APPEND, Linux ignores
 * `offset` and appends the data at the end of the file; this is passed
 * through unchanged. On Windows this is a single WriteFile call with an
 * OVERLAPPED structure carrying the offset, which leaves the cursor at
 * `offset + returned count`.
 */
Result<size_t> WriteOffset(FileHandle handle, const void* buf, size_t count,
                           uint64_t offset);

}  // namespace fileoffset
