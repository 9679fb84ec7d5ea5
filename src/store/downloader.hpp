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

#ifndef __STORE_DOWNLOADER_HPP__
#define __STORE_DOWNLOADER_HPP__

#include <stdint.h>

#include <string>
#include <vector>

#include <bootsync/bootsync.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/bytes.hpp>
#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "store/local_store.hpp"

namespace bootsync {
namespace internal {
namespace store {

// Forward declarations.
class BootResourceDownloaderProcess;


// The content of a remote boot resource file. Implementations wrap
// an (authenticated) HTTP response body.
class ChunkSource
{
public:
  virtual ~ChunkSource() {}

  // Returns the next chunk of the content, or none once all of it has
  // been read. A failed future reports a transport error.
  virtual process::Future<Option<std::string>> read() = 0;
};


// Opens the content at `url`, optionally through an HTTP proxy,
// starting at byte `offset` (sent as an HTTP `Range` header).
typedef lambda::function<Try<process::Owned<ChunkSource>>(
    const std::string& url,
    const Option<std::string>& proxy,
    const Bytes& offset)> ChunkSourceFactory;


// Reports the number of bytes of the given boot resource files that
// this controller holds.
typedef lambda::function<process::Future<Nothing>(
    const std::vector<int64_t>& ids,
    const Bytes& size)> ProgressReporter;


// Downloads boot resource files into the local image storage.
class BootResourceDownloader
{
public:
  BootResourceDownloader(
      const LocalStore& store,
      const ChunkSourceFactory& factory,
      const ProgressReporter& reporter);

  ~BootResourceDownloader();

  // Downloads the file described by `param` from
  // `source_list[attempt % source_list_size]` and extracts it into
  // every `extract_paths` entry.
  //
  // A partial file left by an earlier transport error is resumed at
  // its current size. A file that already holds `total_size` bytes
  // but does not match the digest is downloaded again from scratch.
  //
  // The future is true once the file is stored and verified. It is
  // false if the disk filled up; the partial file is removed and the
  // sync must be restarted once space has been freed. It fails for
  // corrupt content and transport errors. Corrupt content is removed,
  // the partial file of a transport error is kept.
  process::Future<bool> download(
      const ResourceDownloadParam& param,
      size_t attempt = 0);

private:
  BootResourceDownloaderProcess* process;
};

} // namespace store {
} // namespace internal {
} // namespace bootsync {

#endif // __STORE_DOWNLOADER_HPP__
