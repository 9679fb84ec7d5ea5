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

#ifndef __STORAGE_MACHINE_HPP__
#define __STORAGE_MACHINE_HPP__

#include <stdint.h>

#include <string>
#include <vector>

#include <stout/bytes.hpp>
#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace bootsync {
namespace internal {
namespace storage {

// Identifies a storage object of a machine: a block device, a
// partition table, a volume group or a cache set.
typedef int64_t DeviceId;


// The storage configuration of a machine a layout is applied to.
class Machine
{
public:
  virtual ~Machine() {}

  // Returns the physical disks of the machine, by name.
  virtual Try<hashmap<std::string, DeviceId>> physicalDisks() = 0;

  // Removes every storage object of the machine except the physical
  // disks themselves.
  virtual Try<Nothing> clear() = 0;

  virtual Try<Nothing> setBootDisk(DeviceId disk) = 0;

  // Returns the partition table.
  virtual Try<DeviceId> createPartitionTable(
      DeviceId disk,
      const std::string& type) = 0;

  // Returns the partition, appended to the partition table.
  virtual Try<DeviceId> createPartition(
      DeviceId partitionTable,
      const Bytes& size,
      bool bootable) = 0;

  virtual Try<Nothing> createFilesystem(
      DeviceId device,
      const std::string& type,
      const Option<std::string>& mountpoint,
      const Option<std::string>& mountOptions) = 0;

  // Creates a memory backed filesystem (tmpfs, ramfs).
  virtual Try<Nothing> createSpecialFilesystem(
      const std::string& type,
      const std::string& mountpoint,
      const Option<std::string>& mountOptions) = 0;

  // Returns the RAID device. The members and spares are formatted as
  // RAID members.
  virtual Try<DeviceId> createRaid(
      const std::string& name,
      int level,
      const std::vector<DeviceId>& members,
      const std::vector<DeviceId>& spares) = 0;

  // Returns the volume group. The members are formatted as LVM
  // physical volumes.
  virtual Try<DeviceId> createVolumeGroup(
      const std::string& name,
      const std::vector<DeviceId>& members) = 0;

  virtual Try<DeviceId> createLogicalVolume(
      DeviceId volumeGroup,
      const std::string& name,
      const Bytes& size) = 0;

  // Returns the cache set. The device is formatted as bcache cache.
  virtual Try<DeviceId> createCacheSet(DeviceId device) = 0;

  // Returns the bcache device. The backing device is formatted as
  // bcache backing.
  virtual Try<DeviceId> createBcache(
      const std::string& name,
      DeviceId backingDevice,
      DeviceId cacheSet,
      const std::string& cacheMode) = 0;
};

} // namespace storage {
} // namespace internal {
} // namespace bootsync {

#endif // __STORAGE_MACHINE_HPP__
