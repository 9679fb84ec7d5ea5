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

#include <algorithm>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/option.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "storage/apply.hpp"

using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace storage {

Try<Bytes> alignPartitionSize(uint64_t size)
{
  const uint64_t alignment = PARTITION_ALIGNMENT_SIZE.bytes();

  if (size < alignment) {
    return Error(
        stringify(Bytes(size)) + " is smaller than the " +
        stringify(PARTITION_ALIGNMENT_SIZE) + " alignment");
  }

  return Bytes((size / alignment) * alignment);
}


static LayoutError unappliable(const string& message)
{
  return LayoutError(LayoutError::UNAPPLIABLE, message);
}


// Returns the size of the entries carved out of another device.
static Option<uint64_t> allocatedSize(const StorageEntry& entry)
{
  return entry.visit(
      [](const Disk&) -> Option<uint64_t> { return None(); },
      [](const Partition& partition) -> Option<uint64_t> {
        return partition.size;
      },
      [](const FileSystem&) -> Option<uint64_t> { return None(); },
      [](const RAID&) -> Option<uint64_t> { return None(); },
      [](const LVM&) -> Option<uint64_t> { return None(); },
      [](const LogicalVolume& volume) -> Option<uint64_t> {
        return volume.size;
      },
      [](const BCache&) -> Option<uint64_t> { return None(); },
      [](const SpecialDevice&) -> Option<uint64_t> { return None(); });
}


static Try<Bytes, LayoutError> alignedSize(
    const string& name,
    uint64_t size)
{
  Try<Bytes> aligned = alignPartitionSize(size);
  if (aligned.isError()) {
    return unappliable(
        "Invalid size of '" + name + "': " + aligned.error());
  }

  return aligned.get();
}


namespace {

// Creates the storage objects of the entries of a layout, in order.
// Every created object is recorded under the name of its entry so
// that the entries built on it can find it. Partition tables and
// cache sets are recorded as "<device>[ptable]" and
// "<device>[cacheset]".
class LayoutApplier
{
public:
  LayoutApplier(Machine* _machine, const hashmap<string, DeviceId>& disks)
    : machine(_machine),
      devices(disks) {}

  Try<Nothing, LayoutError> apply(const StorageEntry& entry)
  {
    VLOG(1) << "Applying " << entry;

    return entry.visit(
        [this](const Disk& disk) { return apply(disk); },
        [this](const Partition& partition) { return apply(partition); },
        [this](const FileSystem& filesystem) { return apply(filesystem); },
        [this](const RAID& raid) { return apply(raid); },
        [this](const LVM& lvm) { return apply(lvm); },
        [this](const LogicalVolume& volume) { return apply(volume); },
        [this](const BCache& bcache) { return apply(bcache); },
        [this](const SpecialDevice& device) { return apply(device); });
  }

private:
  Try<Nothing, LayoutError> apply(const Disk& disk)
  {
    Try<DeviceId, LayoutError> id = device(disk.name);
    if (id.isError()) {
      return id.error();
    }

    if (disk.boot) {
      Try<Nothing> boot = machine->setBootDisk(id.get());
      if (boot.isError()) {
        return unappliable(
            "Failed to set boot disk '" + disk.name + "': " + boot.error());
      }
    }

    if (disk.ptable.isSome()) {
      Try<DeviceId> ptable =
        machine->createPartitionTable(id.get(), disk.ptable.get());

      if (ptable.isError()) {
        return unappliable(
            "Failed to create partition table on '" + disk.name + "': " +
            ptable.error());
      }

      devices.put(disk.name + "[ptable]", ptable.get());
    }

    return Nothing();
  }

  Try<Nothing, LayoutError> apply(const Partition& partition)
  {
    Try<DeviceId, LayoutError> ptable = device(partition.on + "[ptable]");
    if (ptable.isError()) {
      return ptable.error();
    }

    Try<Bytes, LayoutError> size =
      alignedSize(partition.name, partition.size);

    if (size.isError()) {
      return size.error();
    }

    Try<DeviceId> id = machine->createPartition(
        ptable.get(),
        size.get(),
        partition.bootable);

    if (id.isError()) {
      return unappliable(
          "Failed to create partition '" + partition.name + "': " +
          id.error());
    }

    devices.put(partition.name, id.get());

    return Nothing();
  }

  Try<Nothing, LayoutError> apply(const FileSystem& filesystem)
  {
    Try<Nothing> created = Nothing();

    if (specials.contains(filesystem.on)) {
      if (filesystem.mount.isNone()) {
        return unappliable(
            "Special filesystem '" + filesystem.name + "' has no mountpoint");
      }

      created = machine->createSpecialFilesystem(
          filesystem.type,
          filesystem.mount.get(),
          filesystem.mountOptions);
    } else {
      Try<DeviceId, LayoutError> id = device(filesystem.on);
      if (id.isError()) {
        return id.error();
      }

      created = machine->createFilesystem(
          id.get(),
          filesystem.type,
          filesystem.mount,
          filesystem.mountOptions);
    }

    if (created.isError()) {
      return unappliable(
          "Failed to create filesystem on '" + filesystem.on + "': " +
          created.error());
    }

    return Nothing();
  }

  Try<Nothing, LayoutError> apply(const RAID& raid)
  {
    Try<vector<DeviceId>, LayoutError> members = lookup(raid.members);
    if (members.isError()) {
      return members.error();
    }

    Try<vector<DeviceId>, LayoutError> spares = lookup(raid.spares);
    if (spares.isError()) {
      return spares.error();
    }

    Try<DeviceId> id = machine->createRaid(
        raid.name,
        raid.level,
        members.get(),
        spares.get());

    if (id.isError()) {
      return unappliable(
          "Failed to create RAID '" + raid.name + "': " + id.error());
    }

    devices.put(raid.name, id.get());

    return Nothing();
  }

  Try<Nothing, LayoutError> apply(const LVM& lvm)
  {
    Try<vector<DeviceId>, LayoutError> members = lookup(lvm.members);
    if (members.isError()) {
      return members.error();
    }

    Try<DeviceId> id = machine->createVolumeGroup(lvm.name, members.get());
    if (id.isError()) {
      return unappliable(
          "Failed to create volume group '" + lvm.name + "': " + id.error());
    }

    devices.put(lvm.name, id.get());

    return Nothing();
  }

  Try<Nothing, LayoutError> apply(const LogicalVolume& volume)
  {
    Try<DeviceId, LayoutError> group = device(volume.on);
    if (group.isError()) {
      return group.error();
    }

    Try<Bytes, LayoutError> size = alignedSize(volume.name, volume.size);
    if (size.isError()) {
      return size.error();
    }

    Try<DeviceId> id = machine->createLogicalVolume(
        group.get(),
        volume.name,
        size.get());

    if (id.isError()) {
      return unappliable(
          "Failed to create logical volume '" + volume.name + "': " +
          id.error());
    }

    devices.put(volume.name, id.get());

    return Nothing();
  }

  Try<Nothing, LayoutError> apply(const BCache& bcache)
  {
    Try<DeviceId, LayoutError> backing = device(bcache.backingDevice);
    if (backing.isError()) {
      return backing.error();
    }

    // Several bcache devices can share the cache set of a device.
    const string cacheSetName = bcache.cacheDevice + "[cacheset]";

    if (!devices.contains(cacheSetName)) {
      Try<DeviceId, LayoutError> cache = device(bcache.cacheDevice);
      if (cache.isError()) {
        return cache.error();
      }

      Try<DeviceId> cacheSet = machine->createCacheSet(cache.get());
      if (cacheSet.isError()) {
        return unappliable(
            "Failed to create cache set on '" + bcache.cacheDevice + "': " +
            cacheSet.error());
      }

      devices.put(cacheSetName, cacheSet.get());
    }

    Try<DeviceId> id = machine->createBcache(
        bcache.name,
        backing.get(),
        devices.at(cacheSetName),
        bcache.cacheMode);

    if (id.isError()) {
      return unappliable(
          "Failed to create bcache '" + bcache.name + "': " + id.error());
    }

    devices.put(bcache.name, id.get());

    return Nothing();
  }

  Try<Nothing, LayoutError> apply(const SpecialDevice& device)
  {
    // There is no block device, only the filesystem is created.
    specials.insert(device.name);
    return Nothing();
  }

  Try<DeviceId, LayoutError> device(const string& name) const
  {
    Option<DeviceId> id = devices.get(name);
    if (id.isNone()) {
      return unappliable("Device '" + name + "' not found");
    }

    return id.get();
  }

  Try<vector<DeviceId>, LayoutError> lookup(const vector<string>& names) const
  {
    vector<DeviceId> result;

    foreach (const string& name, names) {
      Try<DeviceId, LayoutError> id = device(name);
      if (id.isError()) {
        return id.error();
      }

      result.push_back(id.get());
    }

    return result;
  }

  Machine* machine;
  hashmap<string, DeviceId> devices;
  hashset<string> specials;
};

} // namespace {


Try<Nothing, LayoutError> applyLayoutToMachine(
    const StorageLayout& layout,
    Machine* machine)
{
  Try<hashmap<string, DeviceId>> disks = machine->physicalDisks();
  if (disks.isError()) {
    return unappliable("Failed to list machine disks: " + disks.error());
  }

  vector<string> missing;
  foreach (const string& name, layout.diskNames()) {
    if (!disks->contains(name)) {
      missing.push_back(name);
    }
  }

  if (!missing.empty()) {
    std::sort(missing.begin(), missing.end());
    return unappliable(
        "Unknown machine disk(s): " + strings::join(", ", missing));
  }

  foreach (const StorageEntry& entry, layout.sortedEntries) {
    const Option<uint64_t> size = allocatedSize(entry);
    if (size.isSome()) {
      Try<Bytes, LayoutError> aligned = alignedSize(name(entry), size.get());
      if (aligned.isError()) {
        return aligned.error();
      }
    }
  }

  Try<Nothing> clear = machine->clear();
  if (clear.isError()) {
    return unappliable(
        "Failed to clear the storage configuration: " + clear.error());
  }

  LayoutApplier applier(machine, disks.get());

  foreach (const StorageEntry& entry, layout.sortedEntries) {
    Try<Nothing, LayoutError> applied = applier.apply(entry);
    if (applied.isError()) {
      return applied.error();
    }
  }

  return Nothing();
}

} // namespace storage {
} // namespace internal {
} // namespace bootsync {
