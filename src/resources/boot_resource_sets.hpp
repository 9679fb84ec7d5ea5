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

#ifndef __RESOURCES_BOOT_RESOURCE_SETS_HPP__
#define __RESOURCES_BOOT_RESOURCE_SETS_HPP__

#include <stdint.h>

#include <vector>

#include <bootsync/bootsync.hpp>

#include <process/future.hpp>

#include <stout/option.hpp>

#include "resources/repository.hpp"

namespace bootsync {
namespace internal {
namespace resources {

// Forward declarations.
class BootResourceSetsProcess;


// Computes how far the files of boot resource sets have been synced
// to the region controllers and whether the sets can be deployed.
// Nothing is modified; every call reads the file list of a set at
// most once.
//
// The operations on a set fail if the set does not exist.
class BootResourceSets
{
public:
  // The repository must outlive this object.
  explicit BootResourceSets(BootResourceRepository* repository);
  ~BootResourceSets();

  // Percentage (0 to 100) of the bytes of the set held by the
  // regions: the bytes reported by every region for every file over
  // the size of the set times the number of regions. Exactly 100.0
  // once every region reported every file complete, 0.0 for an empty
  // set.
  process::Future<double> getSyncProgress(int64_t setId);

  process::Future<bool> isSyncComplete(int64_t setId);

  // Returns the newest set of the resource that is completely synced.
  process::Future<Option<BootResourceSet>> getLatestCompleteSetForBootResource(
      int64_t resourceId);

  // A set is usable if it has a kernel and a root filesystem.
  process::Future<bool> isUsable(int64_t setId);

  // A set is xinstallable if it has a root tarball or disk image.
  process::Future<bool> isXinstallable(int64_t setId);

  // Returns the sets of the resource that are superseded: every set
  // but the newest completely synced one. When no set is complete
  // all of them are returned.
  process::Future<std::vector<BootResourceSet>> selectSetsToDelete(
      int64_t resourceId);

private:
  BootResourceSetsProcess* process;
};

} // namespace resources {
} // namespace internal {
} // namespace bootsync {

#endif // __RESOURCES_BOOT_RESOURCE_SETS_HPP__
