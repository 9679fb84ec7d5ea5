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

#include <list>
#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>

#include "store/local_store.hpp"

using std::list;
using std::shared_ptr;
using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace store {

LocalStore::LocalStore(
    const string& root,
    const shared_ptr<Filesystem>& _filesystem)
  : root_(root),
    filesystem(_filesystem) {}


Try<Nothing> LocalStore::initialize() const
{
  Try<Nothing> mkdir = filesystem->mkdir(root_);
  if (mkdir.isError()) {
    return Error(
        "Failed to create image storage '" + root_ + "': " + mkdir.error());
  }

  return Nothing();
}


LocalBootResourceFile LocalStore::file(
    const string& sha256,
    const string& filenameOnDisk,
    const Bytes& totalSize) const
{
  return LocalBootResourceFile(
      root_, sha256, filenameOnDisk, totalSize, filesystem);
}


Try<bool> LocalStore::checkDiskSpace(
    const SpaceRequirement& requirement,
    const string& region) const
{
  if (requirement.has_min_free_space() &&
      requirement.has_total_resources_size()) {
    return Error(
        "Only one of 'min_free_space' and 'total_resources_size'"
        " can be specified");
  }

  if (!requirement.has_min_free_space() &&
      !requirement.has_total_resources_size()) {
    return Error(
        "One of 'min_free_space' and 'total_resources_size'"
        " must be specified");
  }

  Try<Bytes> free = filesystem->available(root_);
  if (free.isError()) {
    return Error(
        "Failed to get the available space of '" + root_ + "': " +
        free.error());
  }

  Bytes available = free.get();
  Bytes required;

  if (requirement.has_total_resources_size()) {
    Try<Bytes> usage = filesystem->usage(root_);
    if (usage.isError()) {
      return Error(usage.error());
    }

    available += usage.get();
    required = Bytes(requirement.total_resources_size());
  } else {
    required = Bytes(requirement.min_free_space());
  }

  if (available > required) {
    return true;
  }

  LOG(ERROR) << "Not enough disk space at controller '" << region
             << "', needs " << required << " to store all resources.";

  return false;
}


Try<Nothing> LocalStore::remove(const vector<string>& filenamesOnDisk) const
{
  foreach (const string& filename, filenamesOnDisk) {
    const string path = path::join(root_, filename);

    if (!filesystem->exists(path)) {
      continue;
    }

    Try<Nothing> rm = filesystem->remove(path);
    if (rm.isError()) {
      return Error("Failed to remove '" + path + "': " + rm.error());
    }

    LOG(INFO) << "Removed boot resource file '" << path << "'";
  }

  return Nothing();
}


Try<Nothing> LocalStore::cleanup(const hashset<string>& expected) const
{
  Try<list<string>> entries = filesystem->ls(root_);
  if (entries.isError()) {
    return Error(
        "Failed to list image storage '" + root_ + "': " + entries.error());
  }

  vector<string> unexpected;
  foreach (const string& entry, entries.get()) {
    if (expected.contains(entry)) {
      continue;
    }

    // Extracted archives live in sub-directories of the storage.
    if (filesystem->isdir(path::join(root_, entry))) {
      continue;
    }

    unexpected.push_back(entry);
  }

  return remove(unexpected);
}

} // namespace store {
} // namespace internal {
} // namespace bootsync {
