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
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <unistd.h>

#include <list>
#include <memory>
#include <string>
#include <vector>

#include <stout/archiver.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include <stout/os/close.hpp>
#include <stout/os/exists.hpp>
#include <stout/os/ls.hpp>
#include <stout/os/rm.hpp>
#include <stout/os/stat.hpp>

#include "store/filesystem.hpp"

using std::list;
using std::shared_ptr;
using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace store {

// Size of the buffer used when reading files back.
constexpr size_t READ_BUFFER_SIZE = 1024 * 1024;


shared_ptr<Filesystem> Filesystem::posix()
{
  static shared_ptr<Filesystem> filesystem(new PosixFilesystem());
  return filesystem;
}


bool PosixFilesystem::exists(const string& path)
{
  return os::exists(path);
}


bool PosixFilesystem::isdir(const string& path)
{
  return os::stat::isdir(path);
}


Try<Bytes> PosixFilesystem::size(const string& path)
{
  return os::stat::size(path);
}


Try<Bytes> PosixFilesystem::available(const string& path)
{
  struct statvfs buf;
  if (::statvfs(path.c_str(), &buf) < 0) {
    return ErrnoError("Failed to statvfs '" + path + "'");
  }

  return Bytes(buf.f_bavail * buf.f_frsize);
}


Try<Bytes> PosixFilesystem::usage(const string& directory)
{
  Try<list<string>> entries = os::ls(directory);
  if (entries.isError()) {
    return Error(
        "Failed to list '" + directory + "': " + entries.error());
  }

  Bytes total;
  foreach (const string& entry, entries.get()) {
    const string path = path::join(directory, entry);

    if (os::stat::islink(path)) {
      continue;
    }

    if (os::stat::isdir(path)) {
      Try<Bytes> nested = usage(path);
      if (nested.isError()) {
        return nested;
      }
      total += nested.get();
    } else if (os::stat::isfile(path)) {
      Try<Bytes> size = os::stat::size(path);
      if (size.isError()) {
        return Error(
            "Failed to get the size of '" + path + "': " + size.error());
      }
      total += size.get();
    }
  }

  return total;
}


Try<Nothing, ErrnoError> PosixFilesystem::append(
    const string& path,
    const string& data)
{
  int fd = ::open(
      path.c_str(),
      O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
      S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);

  if (fd < 0) {
    return ErrnoError("Failed to open '" + path + "'");
  }

  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t length =
      ::write(fd, data.data() + offset, data.size() - offset);

    if (length < 0) {
      if (errno == EINTR) {
        continue;
      }

      // Keep the errno of the failed write, not the one of close.
      ErrnoError error("Failed to write '" + path + "'");
      os::close(fd);
      return error;
    }

    offset += length;
  }

  if (::close(fd) < 0) {
    return ErrnoError("Failed to close '" + path + "'");
  }

  return Nothing();
}


Try<Nothing> PosixFilesystem::truncate(const string& path, const Bytes& size)
{
  if (::truncate(path.c_str(), static_cast<off_t>(size.bytes())) < 0) {
    return ErrnoError("Failed to truncate '" + path + "'");
  }

  return Nothing();
}


Try<Nothing> PosixFilesystem::read(
    const string& path,
    const lambda::function<void(const string&)>& f)
{
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return ErrnoError("Failed to open '" + path + "'");
  }

  vector<char> buffer(READ_BUFFER_SIZE);

  while (true) {
    ssize_t length = ::read(fd, buffer.data(), buffer.size());

    if (length < 0) {
      if (errno == EINTR) {
        continue;
      }

      ErrnoError error("Failed to read '" + path + "'");
      os::close(fd);
      return error;
    }

    if (length == 0) {
      break;
    }

    f(string(buffer.data(), length));
  }

  os::close(fd);

  return Nothing();
}


Try<Nothing> PosixFilesystem::remove(const string& path)
{
  return os::rm(path);
}


Try<Nothing> PosixFilesystem::mkdir(const string& directory)
{
  string current = strings::startsWith(directory, "/") ? "/" : "";

  foreach (const string& component, strings::tokenize(directory, "/")) {
    current = current.empty() ? component : path::join(current, component);

    if (::mkdir(current.c_str(), 0777) < 0 && errno != EEXIST) {
      return ErrnoError("Failed to create directory '" + current + "'");
    }
  }

  return Nothing();
}


Try<list<string>> PosixFilesystem::ls(const string& directory)
{
  return os::ls(directory);
}


Try<Nothing> PosixFilesystem::extract(
    const string& path,
    const string& directory)
{
  return archiver::extract(path, directory);
}

} // namespace store {
} // namespace internal {
} // namespace bootsync {
