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

#ifndef __STORE_LOCAL_FILE_HPP__
#define __STORE_LOCAL_FILE_HPP__

#include <memory>
#include <ostream>
#include <string>

#include <stout/bytes.hpp>
#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "store/filesystem.hpp"

namespace bootsync {
namespace internal {
namespace store {

// Represents the errors returned when storing boot resource content.
// The message is the reason reported to HTTP clients.
class LocalStoreError : public Error
{
public:
  enum Type
  {
    FILE_SIZE_MISMATCH, // Too much or too little data.
    INVALID_HASH,       // Content does not match the SHA-256 digest.
    ALLOCATION_FAIL,    // No space left on device.
    IO                  // Any other I/O failure.
  };

  LocalStoreError(Type _type, const std::string& _message)
    : Error(_message), type(_type) {}

  static LocalStoreError tooMuchData();
  static LocalStoreError sizeMismatch();
  static LocalStoreError invalidHash();
  static LocalStoreError allocationFail();

  // The reason phrase for the HTTP response rejecting the upload.
  const std::string& reason() const { return message; }

  Type type;
};


std::ostream& operator<<(
    std::ostream& stream,
    const LocalStoreError::Type& type);


class LocalStoreWriter;


// A boot resource file in the local image storage. The file lives at
// `<storeRoot>/<filenameOnDisk>`; its size and validity are always
// computed from the content on disk, so an interrupted transfer can
// be resumed by appending to the existing file.
//
// Writers to the same file must be serialized by the caller.
class LocalBootResourceFile
{
public:
  LocalBootResourceFile(
      const std::string& storeRoot,
      const std::string& sha256,
      const std::string& filenameOnDisk,
      const Bytes& totalSize,
      const std::shared_ptr<Filesystem>& filesystem = Filesystem::posix());

  const std::string& sha256() const { return sha256_; }
  const std::string& filenameOnDisk() const { return filenameOnDisk_; }
  const Bytes& totalSize() const { return totalSize_; }
  const std::string& path() const { return path_; }

  // Bytes currently on disk, 0 if the file does not exist.
  Bytes size() const;

  bool complete() const;

  // Returns true iff the file is complete and its SHA-256 digest
  // matches the declared one (compared case-insensitively).
  bool valid() const;

  // Removes the file. Removing a missing file is not an error.
  Try<Nothing> unlink() const;

  // Appends `data` to the file. A chunk that takes the file beyond
  // the declared size is written and the file is then truncated back
  // to exactly the declared size before FILE_SIZE_MISMATCH is
  // returned. If the filesystem does not have room for `data` nothing
  // is written and ALLOCATION_FAIL is returned.
  Try<Nothing, LocalStoreError> appendChunk(const std::string& data) const;

  // Extracts the file (a tar archive) into `<storeRoot>/<subdirectory>`.
  // The content is not verified.
  Try<Nothing> extractFile(const std::string& subdirectory) const;

  // Starts a write session positioned at the current end of the file.
  LocalStoreWriter store() const;

private:
  std::string storeRoot;
  std::string sha256_;
  std::string filenameOnDisk_;
  Bytes totalSize_;
  std::string path_;
  std::shared_ptr<Filesystem> filesystem;
};


// A write session on a `LocalBootResourceFile`. `commit` verifies the
// content and removes the file if it is incomplete or corrupt.
// Dropping a session without committing keeps the partial file so
// that the transfer can be resumed. A session that received too much
// data refuses any further write.
class LocalStoreWriter
{
public:
  Try<Nothing, LocalStoreError> write(const std::string& data);

  Try<Nothing, LocalStoreError> commit();

  // Bytes written through this session.
  const Bytes& written() const { return written_; }

private:
  friend class LocalBootResourceFile;

  explicit LocalStoreWriter(const LocalBootResourceFile& _file)
    : file(_file) {}

  LocalBootResourceFile file;
  Bytes written_;
  Option<LocalStoreError> failed_;
};

} // namespace store {
} // namespace internal {
} // namespace bootsync {

#endif // __STORE_LOCAL_FILE_HPP__
