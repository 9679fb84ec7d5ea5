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

#ifndef __STORE_LOCAL_STORE_HPP__
#define __STORE_LOCAL_STORE_HPP__

#include <memory>
#include <string>
#include <vector>

#include <bootsync/bootsync.hpp>

#include <stout/bytes.hpp>
#include <stout/hashset.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "store/filesystem.hpp"
#include "store/local_file.hpp"

namespace bootsync {
namespace internal {
namespace store {

// The image storage directory of a controller. It is a flat
// directory with one file per `filename_on_disk`, plus the
// directories archives get extracted into.
class LocalStore
{
public:
  explicit LocalStore(
      const std::string& root,
      const std::shared_ptr<Filesystem>& filesystem = Filesystem::posix());

  const std::string& root() const { return root_; }

  // Creates the storage directory if it does not exist.
  Try<Nothing> initialize() const;

  LocalBootResourceFile file(
      const std::string& sha256,
      const std::string& filenameOnDisk,
      const Bytes& totalSize) const;

  // Returns whether this controller has enough room for the boot
  // resources described by `requirement`. When the requirement is
  // expressed as the size of all resources, the space already used by
  // the storage counts as available since those files are part of
  // the total.
  Try<bool> checkDiskSpace(
      const SpaceRequirement& requirement,
      const std::string& region) const;

  // Removes the files with the given names. Missing files are skipped.
  Try<Nothing> remove(const std::vector<std::string>& filenamesOnDisk) const;

  // Removes every file of the storage that is not listed in
  // `expected`. Directories are left alone.
  Try<Nothing> cleanup(const hashset<std::string>& expected) const;

private:
  std::string root_;
  std::shared_ptr<Filesystem> filesystem;
};

} // namespace store {
} // namespace internal {
} // namespace bootsync {

#endif // __STORE_LOCAL_STORE_HPP__
