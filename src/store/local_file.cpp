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

#include <errno.h>

#include <memory>
#include <ostream>
#include <string>

#include <glog/logging.h>

#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "common/sha256.hpp"

#include "store/local_file.hpp"

using std::ostream;
using std::shared_ptr;
using std::string;

namespace bootsync {
namespace internal {
namespace store {

LocalStoreError LocalStoreError::tooMuchData()
{
  return LocalStoreError(FILE_SIZE_MISMATCH, "Too much data received");
}


LocalStoreError LocalStoreError::sizeMismatch()
{
  return LocalStoreError(
      FILE_SIZE_MISMATCH,
      "Content-Length doesn't equal size of received data");
}


LocalStoreError LocalStoreError::invalidHash()
{
  return LocalStoreError(
      INVALID_HASH,
      "Saved content does not match given SHA256 value");
}


LocalStoreError LocalStoreError::allocationFail()
{
  return LocalStoreError(ALLOCATION_FAIL, "No space left on device");
}


ostream& operator<<(ostream& stream, const LocalStoreError::Type& type)
{
  switch (type) {
    case LocalStoreError::FILE_SIZE_MISMATCH:
      return stream << "FILE_SIZE_MISMATCH";
    case LocalStoreError::INVALID_HASH:
      return stream << "INVALID_HASH";
    case LocalStoreError::ALLOCATION_FAIL:
      return stream << "ALLOCATION_FAIL";
    case LocalStoreError::IO:
      return stream << "IO";
  }

  return stream << "UNKNOWN";
}


LocalBootResourceFile::LocalBootResourceFile(
    const string& _storeRoot,
    const string& _sha256,
    const string& _filenameOnDisk,
    const Bytes& _totalSize,
    const shared_ptr<Filesystem>& _filesystem)
  : storeRoot(_storeRoot),
    sha256_(_sha256),
    filenameOnDisk_(_filenameOnDisk),
    totalSize_(_totalSize),
    path_(path::join(_storeRoot, _filenameOnDisk)),
    filesystem(_filesystem) {}


Bytes LocalBootResourceFile::size() const
{
  if (!filesystem->exists(path_)) {
    return Bytes(0);
  }

  Try<Bytes> size = filesystem->size(path_);
  if (size.isError()) {
    LOG(WARNING) << "Failed to get the size of '" << path_ << "': "
                 << size.error();
    return Bytes(0);
  }

  return size.get();
}


bool LocalBootResourceFile::complete() const
{
  return size() == totalSize_;
}


bool LocalBootResourceFile::valid() const
{
  if (!complete()) {
    return false;
  }

  SHA256 digest;
  Option<Error> error;

  Try<Nothing> read = filesystem->read(
      path_,
      [&digest, &error](const string& chunk) {
        if (error.isNone()) {
          Try<Nothing> update = digest.update(chunk);
          if (update.isError()) {
            error = Error(update.error());
          }
        }
      });

  if (read.isError()) {
    LOG(WARNING) << "Failed to read '" << path_ << "': " << read.error();
    return false;
  }

  if (error.isSome()) {
    LOG(WARNING) << "Failed to hash '" << path_ << "': " << error->message;
    return false;
  }

  Try<string> hexdigest = digest.hexdigest();
  if (hexdigest.isError()) {
    LOG(WARNING) << "Failed to hash '" << path_ << "': " << hexdigest.error();
    return false;
  }

  return hexdigest.get() == strings::lower(sha256_);
}


Try<Nothing> LocalBootResourceFile::unlink() const
{
  if (!filesystem->exists(path_)) {
    return Nothing();
  }

  return filesystem->remove(path_);
}


Try<Nothing, LocalStoreError> LocalBootResourceFile::appendChunk(
    const string& data) const
{
  Try<Bytes> available = filesystem->available(storeRoot);
  if (available.isError()) {
    return LocalStoreError(
        LocalStoreError::IO,
        "Failed to get the available space of '" + storeRoot + "': " +
          available.error());
  }

  if (available.get() < Bytes(data.size())) {
    VLOG(1) << "Refusing to write " << Bytes(data.size()) << " to '" << path_
            << "': only " << available.get() << " available";
    return LocalStoreError::allocationFail();
  }

  Try<Nothing, ErrnoError> append = filesystem->append(path_, data);
  if (append.isError()) {
    if (append.error().code == ENOSPC) {
      return LocalStoreError::allocationFail();
    }

    return LocalStoreError(LocalStoreError::IO, append.error().message);
  }

  if (size() > totalSize_) {
    Try<Nothing> truncate = filesystem->truncate(path_, totalSize_);
    if (truncate.isError()) {
      return LocalStoreError(LocalStoreError::IO, truncate.error());
    }

    return LocalStoreError::tooMuchData();
  }

  return Nothing();
}


Try<Nothing> LocalBootResourceFile::extractFile(
    const string& subdirectory) const
{
  const string directory = path::join(storeRoot, subdirectory);

  Try<Nothing> mkdir = filesystem->mkdir(directory);
  if (mkdir.isError()) {
    return Error(
        "Failed to create '" + directory + "': " + mkdir.error());
  }

  Try<Nothing> extract = filesystem->extract(path_, directory);
  if (extract.isError()) {
    return Error(
        "Failed to extract '" + path_ + "' into '" + directory + "': " +
        extract.error());
  }

  return Nothing();
}


LocalStoreWriter LocalBootResourceFile::store() const
{
  return LocalStoreWriter(*this);
}


Try<Nothing, LocalStoreError> LocalStoreWriter::write(const string& data)
{
  if (failed_.isSome()) {
    return failed_.get();
  }

  Try<Nothing, LocalStoreError> append = file.appendChunk(data);
  if (append.isSome()) {
    written_ += Bytes(data.size());
  } else if (append.error().type == LocalStoreError::FILE_SIZE_MISMATCH) {
    failed_ = append.error();
  }

  return append;
}


Try<Nothing, LocalStoreError> LocalStoreWriter::commit()
{
  Option<LocalStoreError> error;

  if (!file.complete()) {
    error = LocalStoreError::sizeMismatch();
  } else if (!file.valid()) {
    error = LocalStoreError::invalidHash();
  }

  if (error.isNone()) {
    return Nothing();
  }

  Try<Nothing> unlink = file.unlink();
  if (unlink.isError()) {
    LOG(WARNING) << "Failed to remove '" << file.path() << "': "
                 << unlink.error();
  }

  return error.get();
}

} // namespace store {
} // namespace internal {
} // namespace bootsync {
