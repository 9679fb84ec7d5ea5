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

#ifndef __RESOURCES_REPOSITORY_HPP__
#define __RESOURCES_REPOSITORY_HPP__

#include <stdint.h>

#include <vector>

#include <bootsync/bootsync.hpp>

#include <process/future.hpp>

#include <stout/option.hpp>

namespace bootsync {
namespace internal {
namespace resources {

// Read access to the boot resources persisted by the region. All
// calls may complete asynchronously.
class BootResourceRepository
{
public:
  virtual ~BootResourceRepository() {}

  virtual process::Future<Option<BootResource>> getResource(int64_t id) = 0;

  virtual process::Future<Option<BootResourceSet>> getSet(int64_t id) = 0;

  // Returns the sets of the resource, in no particular order.
  virtual process::Future<std::vector<BootResourceSet>> getSetsForResource(
      int64_t resourceId) = 0;

  virtual process::Future<std::vector<BootResourceFile>> getFiles(
      int64_t setId) = 0;

  // Returns the sync records of the given files, at most one per file
  // and region.
  virtual process::Future<std::vector<FileSyncStatus>> getSyncStatus(
      const std::vector<int64_t>& fileIds) = 0;

  // Number of region controllers that must hold every file.
  virtual process::Future<size_t> getRegionCount() = 0;
};

} // namespace resources {
} // namespace internal {
} // namespace bootsync {

#endif // __RESOURCES_REPOSITORY_HPP__
