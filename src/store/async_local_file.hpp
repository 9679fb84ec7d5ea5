// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __STORE_ASYNC_LOCAL_FILE_HPP__
#define __STORE_ASYNC_LOCAL_FILE_HPP__

#include <string>

#include <process/future.hpp>

#include <stout/bytes.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "store/local_file.hpp"

namespace bootsync {
namespace internal {
namespace store {

// Forward declarations.
class LocalBootResourceFileProcess;


// Asynchronous front end of a `LocalBootResourceFile`. Every call is
// dispatched to a dedicated actor which performs the blocking I/O,
// so the caller only waits on futures. Calls are executed in the
// order they are made.
//
// A transfer is a sequence of `appendChunk` calls followed by
// `commit`. The caller may stop between two chunks: the data written
// so far stays on disk and the transfer can be resumed later, since
// the size is always read back from disk.
class AsyncLocalBootResourceFile
{
public:
  explicit AsyncLocalBootResourceFile(const LocalBootResourceFile& file);
  ~AsyncLocalBootResourceFile();

  AsyncLocalBootResourceFile(const AsyncLocalBootResourceFile&) = delete;
  AsyncLocalBootResourceFile& operator=(
      const AsyncLocalBootResourceFile&) = delete;

  process::Future<Bytes> size();

  process::Future<bool> complete();

  process::Future<bool> valid();

  process::Future<Nothing> unlink();

  // See `LocalBootResourceFile::appendChunk`.
  process::Future<Try<Nothing, LocalStoreError>> appendChunk(
      const std::string& data);

  // Verifies the content written so far, removing the file if it is
  // incomplete or does not match its digest.
  process::Future<Try<Nothing, LocalStoreError>> commit();

  process::Future<Nothing> extractFile(const std::string& subdirectory);

private:
  LocalBootResourceFileProcess* process;
};

} // namespace store {
} // namespace internal {
} // namespace bootsync {

#endif // __STORE_ASYNC_LOCAL_FILE_HPP__
