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

#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/clock.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/loop.hpp>
#include <process/process.hpp>
#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/foreach.hpp>

#include "store/downloader.hpp"

using process::Break;
using process::Clock;
using process::Continue;
using process::ControlFlow;
using process::Failure;
using process::Future;
using process::Owned;
using process::Time;

using std::shared_ptr;
using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace store {

// Minimum delay between two progress reports of the same download.
constexpr Duration REPORT_INTERVAL = Seconds(10);


class BootResourceDownloaderProcess
  : public process::Process<BootResourceDownloaderProcess>
{
public:
  BootResourceDownloaderProcess(
      const LocalStore& _store,
      const ChunkSourceFactory& _factory,
      const ProgressReporter& _reporter)
    : ProcessBase(process::ID::generate("boot-resource-downloader")),
      store(_store),
      factory(_factory),
      reporter(_reporter) {}

  Future<bool> download(const ResourceDownloadParam& param, size_t attempt)
  {
    if (param.source_list_size() == 0) {
      return Failure(
          "No source to download boot resource file " + param.sha256() +
          " from");
    }

    const string url =
      param.source_list(attempt % param.source_list_size());

    VLOG(1) << "Downloading boot resource file " << param.sha256()
            << " from " << url;

    const LocalBootResourceFile file = store.file(
        param.sha256(),
        param.filename_on_disk(),
        Bytes(param.total_size()));

    if (file.valid()) {
      LOG(INFO) << "Boot resource file " << param.sha256()
                << " already downloaded, skipping";
      return finish(file, param);
    }

    // A file that is not valid once complete (or is oversize) cannot
    // be resumed.
    if (file.size() > Bytes(0) && file.size() >= file.totalSize()) {
      LOG(WARNING) << "Removing corrupt boot resource file '"
                   << file.path() << "'";

      Try<Nothing> unlink = file.unlink();
      if (unlink.isError()) {
        return Failure(
            "Failed to remove '" + file.path() + "': " + unlink.error());
      }
    }

    const Bytes offset = file.size();
    if (offset > Bytes(0)) {
      VLOG(1) << "Resuming download of " << param.sha256() << " at "
              << offset;
    }

    Try<Owned<ChunkSource>> source = factory(
        url,
        param.has_http_proxy() ? Option<string>(param.http_proxy()) : None(),
        offset);

    if (source.isError()) {
      return Failure(
          "Failed to download '" + url + "': " + source.error());
    }

    return fetch(file, param, source.get());
  }

private:
  typedef ControlFlow<Option<LocalStoreError>> Flow;

  Future<bool> fetch(
      const LocalBootResourceFile& file,
      const ResourceDownloadParam& param,
      const Owned<ChunkSource>& source)
  {
    const vector<int64_t> ids = rfileIds(param);
    shared_ptr<Time> lastReport(new Time(Clock::now()));

    return process::loop(
        self(),
        [source]() {
          return source->read();
        },
        [=](const Option<string>& chunk) -> Future<Flow> {
          if (chunk.isNone()) {
            return Flow(Break(Option<LocalStoreError>::none()));
          }

          Try<Nothing, LocalStoreError> append = file.appendChunk(chunk.get());
          if (append.isError()) {
            return Flow(Break(Option<LocalStoreError>(append.error())));
          }

          if (Clock::now() - *lastReport < REPORT_INTERVAL) {
            return Flow(Continue());
          }

          *lastReport = Clock::now();

          return reporter(ids, file.size())
            .then([]() -> Flow { return Flow(Continue()); });
        })
      .then(defer(self(), [=](const Option<LocalStoreError>& error)
                              -> Future<bool> {
        if (error.isSome()) {
          return failed(file, param, error.get());
        }

        VLOG(1) << "Download of " << param.sha256()
                << " done, verifying checksum";

        Try<Nothing, LocalStoreError> commit = file.store().commit();
        if (commit.isError()) {
          return failed(file, param, commit.error());
        }

        return finish(file, param);
      }));
  }

  Future<bool> finish(
      const LocalBootResourceFile& file,
      const ResourceDownloadParam& param)
  {
    foreach (const string& target, param.extract_paths()) {
      Try<Nothing> extract = file.extractFile(target);
      if (extract.isError()) {
        return Failure(extract.error());
      }
    }

    return reporter(rfileIds(param), file.size())
      .then([]() { return true; });
  }

  Future<bool> failed(
      const LocalBootResourceFile& file,
      const ResourceDownloadParam& param,
      const LocalStoreError& error)
  {
    switch (error.type) {
      case LocalStoreError::ALLOCATION_FAIL: {
        // Stop this download, the operator has to free some space and
        // restart the sync.
        LOG(ERROR) << "Failed to store boot resource file "
                   << param.sha256() << ": " << error.message;

        Try<Nothing> unlink = file.unlink();
        if (unlink.isError()) {
          return Failure(
              "Failed to remove '" + file.path() + "': " + unlink.error());
        }

        return reporter(rfileIds(param), Bytes(0))
          .then([]() { return false; });
      }
      case LocalStoreError::INVALID_HASH: {
        // The file has already been removed by the commit.
        return reporter(rfileIds(param), Bytes(0))
          .then([]() -> Future<bool> { return Failure("Invalid checksum"); });
      }
      case LocalStoreError::FILE_SIZE_MISMATCH: {
        Try<Nothing> unlink = file.unlink();
        if (unlink.isError()) {
          LOG(WARNING) << "Failed to remove '" << file.path() << "': "
                       << unlink.error();
        }

        const string message = error.message;

        return reporter(rfileIds(param), Bytes(0))
          .then([message]() -> Future<bool> { return Failure(message); });
      }
      case LocalStoreError::IO:
        break;
    }

    return Failure(error.message);
  }

  static vector<int64_t> rfileIds(const ResourceDownloadParam& param)
  {
    return vector<int64_t>(
        param.rfile_ids().begin(),
        param.rfile_ids().end());
  }

  const LocalStore store;
  const ChunkSourceFactory factory;
  const ProgressReporter reporter;
};


BootResourceDownloader::BootResourceDownloader(
    const LocalStore& store,
    const ChunkSourceFactory& factory,
    const ProgressReporter& reporter)
{
  process = new BootResourceDownloaderProcess(store, factory, reporter);
  spawn(process);
}


BootResourceDownloader::~BootResourceDownloader()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<bool> BootResourceDownloader::download(
    const ResourceDownloadParam& param,
    size_t attempt)
{
  return dispatch(
      process,
      &BootResourceDownloaderProcess::download,
      param,
      attempt);
}

} // namespace store {
} // namespace internal {
} // namespace bootsync {
