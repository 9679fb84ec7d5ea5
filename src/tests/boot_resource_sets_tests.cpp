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

#include <stdint.h>

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <bootsync/bootsync.hpp>

#include <process/future.hpp>
#include <process/gtest.hpp>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/hashmap.hpp>
#include <stout/option.hpp>

#include "resources/boot_resource_sets.hpp"
#include "resources/file_types.hpp"
#include "resources/repository.hpp"

using bootsync::internal::resources::BootResourceRepository;
using bootsync::internal::resources::BootResourceSets;

using process::Future;

using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace tests {

// In-memory repository.
class FakeBootResourceRepository : public BootResourceRepository
{
public:
  FakeBootResourceRepository() : regions(1) {}

  Future<Option<BootResource>> getResource(int64_t id) override
  {
    return resources.get(id);
  }

  Future<Option<BootResourceSet>> getSet(int64_t id) override
  {
    return sets.get(id);
  }

  Future<vector<BootResourceSet>> getSetsForResource(
      int64_t resourceId) override
  {
    vector<BootResourceSet> result;
    foreachvalue (const BootResourceSet& set, sets) {
      if (set.resource_id() == resourceId) {
        result.push_back(set);
      }
    }

    return result;
  }

  Future<vector<BootResourceFile>> getFiles(int64_t setId) override
  {
    vector<BootResourceFile> result;
    foreach (const BootResourceFile& file, files) {
      if (file.resource_set_id() == setId) {
        result.push_back(file);
      }
    }

    return result;
  }

  Future<vector<FileSyncStatus>> getSyncStatus(
      const vector<int64_t>& fileIds) override
  {
    vector<FileSyncStatus> result;
    foreach (const FileSyncStatus& status, statuses) {
      if (std::find(fileIds.begin(), fileIds.end(), status.file_id()) !=
          fileIds.end()) {
        result.push_back(status);
      }
    }

    return result;
  }

  Future<size_t> getRegionCount() override
  {
    return regions;
  }

  void addResource(int64_t id, const string& name)
  {
    BootResource resource;
    resource.set_id(id);
    resource.set_name(name);
    resource.set_architecture("amd64/generic");
    resources.put(id, resource);
  }

  void addSet(int64_t id, int64_t resourceId)
  {
    BootResourceSet set;
    set.set_id(id);
    set.set_resource_id(resourceId);
    set.set_version("2024030" + std::to_string(id % 10));
    set.set_label("stable");
    sets.put(id, set);
  }

  void addFile(
      int64_t id,
      int64_t setId,
      BootResourceFile::Type type,
      uint64_t size)
  {
    BootResourceFile file;
    file.set_id(id);
    file.set_resource_set_id(setId);
    file.set_filename(BootResourceFile::Type_Name(type));
    file.set_type(type);
    file.set_sha256(string(64, static_cast<char>('a' + id % 6)));
    file.set_filename_on_disk(file.sha256().substr(0, 7));
    file.set_size(size);
    files.push_back(file);
  }

  // Replaces any previous record of the file and region.
  void addStatus(int64_t fileId, const string& region, uint64_t size)
  {
    foreach (FileSyncStatus& status, statuses) {
      if (status.file_id() == fileId && status.region_id() == region) {
        status.set_size(size);
        return;
      }
    }

    FileSyncStatus status;
    status.set_file_id(fileId);
    status.set_region_id(region);
    status.set_size(size);
    statuses.push_back(status);
  }

  // Marks every file of the set as synced on every region.
  void complete(int64_t setId)
  {
    foreach (const BootResourceFile& file, files) {
      if (file.resource_set_id() == setId) {
        for (size_t i = 0; i < regions; i++) {
          addStatus(file.id(), "region-" + std::to_string(i), file.size());
        }
      }
    }
  }

  size_t regions;

private:
  hashmap<int64_t, BootResource> resources;
  hashmap<int64_t, BootResourceSet> sets;
  vector<BootResourceFile> files;
  vector<FileSyncStatus> statuses;
};


TEST(BootResourceSetsTest, GetSyncProgress)
{
  FakeBootResourceRepository repository;
  repository.regions = 2;
  repository.addResource(1, "ubuntu/jammy");
  repository.addSet(10, 1);
  repository.addFile(100, 10, BootResourceFile::BOOT_KERNEL, 100);
  repository.addFile(101, 10, BootResourceFile::SQUASHFS_IMAGE, 300);

  repository.addStatus(100, "region-0", 100);
  repository.addStatus(100, "region-1", 50);
  repository.addStatus(101, "region-0", 300);

  BootResourceSets sets(&repository);

  // (100 + 50 + 300) / ((100 + 300) * 2).
  AWAIT_EXPECT_EQ(56.25, sets.getSyncProgress(10));
  AWAIT_EXPECT_FALSE(sets.isSyncComplete(10));

  repository.addStatus(100, "region-1", 100);
  repository.addStatus(101, "region-1", 300);

  AWAIT_EXPECT_EQ(100.0, sets.getSyncProgress(10));
  AWAIT_EXPECT_TRUE(sets.isSyncComplete(10));
}


// The progress never goes down while regions report more bytes, and
// only reaches 100 once every region holds every file.
TEST(BootResourceSetsTest, GetSyncProgressIsMonotonic)
{
  FakeBootResourceRepository repository;
  repository.regions = 3;
  repository.addResource(1, "ubuntu/jammy");
  repository.addSet(10, 1);
  repository.addFile(100, 10, BootResourceFile::BOOT_KERNEL, 1000);
  repository.addFile(101, 10, BootResourceFile::SQUASHFS_IMAGE, 4096);

  BootResourceSets sets(&repository);

  const hashmap<int64_t, uint64_t> sizes = {{100, 1000}, {101, 4096}};

  double previous = 0.0;

  for (uint64_t received = 512; received < 4096 + 512; received += 512) {
    for (size_t region = 0; region < repository.regions; region++) {
      foreachpair (int64_t fileId, uint64_t size, sizes) {
        repository.addStatus(
            fileId,
            "region-" + std::to_string(region),
            std::min(received, size));

        Future<double> progress = sets.getSyncProgress(10);
        AWAIT_READY(progress);

        EXPECT_LE(previous, progress.get());
        EXPECT_GE(100.0, progress.get());

        previous = progress.get();
      }
    }

    if (received < 4096) {
      AWAIT_EXPECT_FALSE(sets.isSyncComplete(10));
    }
  }

  EXPECT_EQ(100.0, previous);
  AWAIT_EXPECT_TRUE(sets.isSyncComplete(10));
}


TEST(BootResourceSetsTest, GetSyncProgressEmptySet)
{
  FakeBootResourceRepository repository;
  repository.addResource(1, "ubuntu/jammy");
  repository.addSet(10, 1);

  BootResourceSets sets(&repository);

  AWAIT_EXPECT_EQ(0.0, sets.getSyncProgress(10));
  AWAIT_EXPECT_FALSE(sets.isSyncComplete(10));
}


TEST(BootResourceSetsTest, GetSyncProgressWithoutRegions)
{
  FakeBootResourceRepository repository;
  repository.regions = 0;
  repository.addResource(1, "ubuntu/jammy");
  repository.addSet(10, 1);
  repository.addFile(100, 10, BootResourceFile::BOOT_KERNEL, 100);

  BootResourceSets sets(&repository);

  AWAIT_EXPECT_EQ(0.0, sets.getSyncProgress(10));
  AWAIT_EXPECT_FALSE(sets.isSyncComplete(10));
}


TEST(BootResourceSetsTest, MissingSet)
{
  FakeBootResourceRepository repository;

  BootResourceSets sets(&repository);

  Future<double> progress = sets.getSyncProgress(10);

  AWAIT_FAILED(progress);
  EXPECT_EQ("Boot resource set 10 not found", progress.failure());

  AWAIT_FAILED(sets.isSyncComplete(10));
  AWAIT_FAILED(sets.isUsable(10));
  AWAIT_FAILED(sets.isXinstallable(10));
}


TEST(BootResourceSetsTest, GetLatestCompleteSetForBootResource)
{
  FakeBootResourceRepository repository;
  repository.addResource(1, "ubuntu/jammy");

  repository.addSet(10, 1);
  repository.addFile(100, 10, BootResourceFile::BOOT_KERNEL, 100);
  repository.complete(10);

  repository.addSet(11, 1);
  repository.addFile(110, 11, BootResourceFile::BOOT_KERNEL, 100);
  repository.complete(11);

  // Newest, still syncing.
  repository.addSet(12, 1);
  repository.addFile(120, 12, BootResourceFile::BOOT_KERNEL, 100);
  repository.addStatus(120, "region-0", 10);

  // Another resource.
  repository.addResource(2, "ubuntu/noble");
  repository.addSet(20, 2);
  repository.addFile(200, 20, BootResourceFile::BOOT_KERNEL, 100);
  repository.complete(20);

  BootResourceSets sets(&repository);

  Future<Option<BootResourceSet>> latest =
    sets.getLatestCompleteSetForBootResource(1);

  AWAIT_READY(latest);
  ASSERT_SOME(latest.get());
  EXPECT_EQ(11, latest->get().id());
}


TEST(BootResourceSetsTest, GetLatestCompleteSetForBootResourceNone)
{
  FakeBootResourceRepository repository;
  repository.addResource(1, "ubuntu/jammy");
  repository.addSet(10, 1);
  repository.addFile(100, 10, BootResourceFile::BOOT_KERNEL, 100);

  BootResourceSets sets(&repository);

  Future<Option<BootResourceSet>> latest =
    sets.getLatestCompleteSetForBootResource(1);

  AWAIT_READY(latest);
  EXPECT_NONE(latest.get());

  Future<Option<BootResourceSet>> missing =
    sets.getLatestCompleteSetForBootResource(2);

  AWAIT_FAILED(missing);
  EXPECT_EQ("Boot resource 2 not found", missing.failure());
}


TEST(BootResourceSetsTest, IsUsable)
{
  FakeBootResourceRepository repository;
  repository.addResource(1, "ubuntu/jammy");

  repository.addSet(10, 1);
  repository.addFile(100, 10, BootResourceFile::BOOT_KERNEL, 100);
  repository.addFile(101, 10, BootResourceFile::BOOT_INITRD, 100);
  repository.addFile(102, 10, BootResourceFile::SQUASHFS_IMAGE, 100);

  // No root filesystem.
  repository.addSet(11, 1);
  repository.addFile(110, 11, BootResourceFile::BOOT_KERNEL, 100);
  repository.addFile(111, 11, BootResourceFile::BOOT_INITRD, 100);

  // No kernel.
  repository.addSet(12, 1);
  repository.addFile(120, 12, BootResourceFile::ROOT_TGZ, 100);

  BootResourceSets sets(&repository);

  AWAIT_EXPECT_TRUE(sets.isUsable(10));
  AWAIT_EXPECT_FALSE(sets.isUsable(11));
  AWAIT_EXPECT_FALSE(sets.isUsable(12));
}


TEST(BootResourceSetsTest, IsXinstallable)
{
  FakeBootResourceRepository repository;
  repository.addResource(1, "ubuntu/jammy");

  repository.addSet(10, 1);
  repository.addFile(100, 10, BootResourceFile::BOOT_KERNEL, 100);
  repository.addFile(101, 10, BootResourceFile::SQUASHFS_IMAGE, 100);

  repository.addSet(11, 1);
  repository.addFile(110, 11, BootResourceFile::ROOT_TGZ, 100);

  repository.addSet(12, 1);
  repository.addFile(120, 12, BootResourceFile::ROOT_DDXZ, 100);

  BootResourceSets sets(&repository);

  AWAIT_EXPECT_FALSE(sets.isXinstallable(10));
  AWAIT_EXPECT_TRUE(sets.isXinstallable(11));
  AWAIT_EXPECT_TRUE(sets.isXinstallable(12));
}


TEST(BootResourceSetsTest, SelectSetsToDelete)
{
  FakeBootResourceRepository repository;
  repository.addResource(1, "ubuntu/jammy");

  repository.addSet(10, 1);
  repository.addFile(100, 10, BootResourceFile::BOOT_KERNEL, 100);
  repository.complete(10);

  repository.addSet(11, 1);
  repository.addFile(110, 11, BootResourceFile::BOOT_KERNEL, 100);
  repository.complete(11);

  repository.addSet(12, 1);
  repository.addFile(120, 12, BootResourceFile::BOOT_KERNEL, 100);

  BootResourceSets sets(&repository);

  Future<vector<BootResourceSet>> selected = sets.selectSetsToDelete(1);

  AWAIT_READY(selected);
  ASSERT_EQ(2u, selected->size());
  EXPECT_EQ(12, selected->at(0).id());
  EXPECT_EQ(10, selected->at(1).id());
}


TEST(BootResourceSetsTest, SelectSetsToDeleteWithoutCompleteSet)
{
  FakeBootResourceRepository repository;
  repository.addResource(1, "ubuntu/jammy");

  repository.addSet(10, 1);
  repository.addFile(100, 10, BootResourceFile::BOOT_KERNEL, 100);

  repository.addSet(11, 1);
  repository.addFile(110, 11, BootResourceFile::BOOT_KERNEL, 100);

  BootResourceSets sets(&repository);

  Future<vector<BootResourceSet>> selected = sets.selectSetsToDelete(1);

  AWAIT_READY(selected);
  ASSERT_EQ(2u, selected->size());
  EXPECT_EQ(11, selected->at(0).id());
  EXPECT_EQ(10, selected->at(1).id());
}


TEST(FileTypesTest, Classes)
{
  using namespace resources;

  EXPECT_TRUE(isKernel(BootResourceFile::BOOT_KERNEL));
  EXPECT_FALSE(isKernel(BootResourceFile::BOOT_INITRD));

  EXPECT_TRUE(isRoot(BootResourceFile::SQUASHFS_IMAGE));
  EXPECT_TRUE(isRoot(BootResourceFile::ROOT_IMAGE));
  EXPECT_TRUE(isRoot(BootResourceFile::ROOT_TXZ));
  EXPECT_TRUE(isRoot(BootResourceFile::ROOT_DDRAW));
  EXPECT_FALSE(isRoot(BootResourceFile::BOOT_DTB));
  EXPECT_FALSE(isRoot(BootResourceFile::ARCHIVE_TAR_XZ));

  EXPECT_TRUE(isXinstallable(BootResourceFile::ROOT_TBZ));
  EXPECT_TRUE(isXinstallable(BootResourceFile::ROOT_DD));
  EXPECT_FALSE(isXinstallable(BootResourceFile::SQUASHFS_IMAGE));
  EXPECT_FALSE(isXinstallable(BootResourceFile::ROOT_IMAGE));
}

} // namespace tests {
} // namespace internal {
} // namespace bootsync {
