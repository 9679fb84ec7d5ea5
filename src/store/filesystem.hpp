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

#ifndef __STORE_FILESYSTEM_HPP__
#define __STORE_FILESYSTEM_HPP__

#include <list>
#include <memory>
#include <string>

#include <stout/bytes.hpp>
#include <stout/error.hpp>
#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace bootsync {
namespace internal {
namespace store {

// The I/O operations the image storage needs. The local store logic
// is written once against this interface; tests substitute a mock to
// simulate a full disk.
class Filesystem
{
public:
  // Returns the process-wide POSIX implementation.
  static std::shared_ptr<Filesystem> posix();

  virtual ~Filesystem() {}

  virtual bool exists(const std::string& path) = 0;

  virtual bool isdir(const std::string& path) = 0;

  virtual Try<Bytes> size(const std::string& path) = 0;

  // Space available to unprivileged users on the filesystem that
  // holds `path` (free blocks times fragment size).
  virtual Try<Bytes> available(const std::string& path) = 0;

  // Total size of the regular files below `directory`.
  virtual Try<Bytes> usage(const std::string& directory) = 0;

  // Appends `data` to `path`, creating the file if needed. The
  // returned error keeps the errno so that callers can tell a full
  // disk apart from other failures.
  virtual Try<Nothing, ErrnoError> append(
      const std::string& path,
      const std::string& data) = 0;

  virtual Try<Nothing> truncate(const std::string& path, const Bytes& size) = 0;

  // Reads `path` sequentially, handing every chunk to `f`.
  virtual Try<Nothing> read(
      const std::string& path,
      const lambda::function<void(const std::string&)>& f) = 0;

  virtual Try<Nothing> remove(const std::string& path) = 0;

  // Creates `directory` and any missing parent with mode 0777
  // (before the umask is applied).
  virtual Try<Nothing> mkdir(const std::string& directory) = 0;

  virtual Try<std::list<std::string>> ls(const std::string& directory) = 0;

  // Extracts the archive at `path` into `directory`.
  virtual Try<Nothing> extract(
      const std::string& path,
      const std::string& directory) = 0;
};


class PosixFilesystem : public Filesystem
{
public:
  bool exists(const std::string& path) override;

  bool isdir(const std::string& path) override;

  Try<Bytes> size(const std::string& path) override;

  Try<Bytes> available(const std::string& path) override;

  Try<Bytes> usage(const std::string& directory) override;

  Try<Nothing, ErrnoError> append(
      const std::string& path,
      const std::string& data) override;

  Try<Nothing> truncate(const std::string& path, const Bytes& size) override;

  Try<Nothing> read(
      const std::string& path,
      const lambda::function<void(const std::string&)>& f) override;

  Try<Nothing> remove(const std::string& path) override;

  Try<Nothing> mkdir(const std::string& directory) override;

  Try<std::list<std::string>> ls(const std::string& directory) override;

  Try<Nothing> extract(
      const std::string& path,
      const std::string& directory) override;
};

} // namespace store {
} // namespace internal {
} // namespace bootsync {

#endif // __STORE_FILESYSTEM_HPP__
