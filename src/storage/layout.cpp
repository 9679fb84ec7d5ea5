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

#include <ctype.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/numify.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "storage/layout.hpp"
#include "storage/schema.hpp"

using std::ostream;
using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace storage {

string name(const StorageEntry& entry)
{
  return entry.visit(
      [](const Disk& disk) { return disk.name; },
      [](const Partition& partition) { return partition.name; },
      [](const FileSystem& filesystem) { return filesystem.name; },
      [](const RAID& raid) { return raid.name; },
      [](const LVM& lvm) { return lvm.name; },
      [](const LogicalVolume& volume) { return volume.name; },
      [](const BCache& bcache) { return bcache.name; },
      [](const SpecialDevice& device) { return device.name; });
}


vector<string> deps(const StorageEntry& entry)
{
  return entry.visit(
      [](const Disk&) {
        return vector<string>();
      },
      [](const Partition& partition) {
        vector<string> result = {partition.on};
        if (partition.after.isSome()) {
          result.push_back(partition.after.get());
        }
        return result;
      },
      [](const FileSystem& filesystem) {
        return vector<string>({filesystem.on});
      },
      [](const RAID& raid) {
        vector<string> result = raid.members;
        result.insert(result.end(), raid.spares.begin(), raid.spares.end());
        return result;
      },
      [](const LVM& lvm) {
        return lvm.members;
      },
      [](const LogicalVolume& volume) {
        return vector<string>({volume.on});
      },
      [](const BCache& bcache) {
        return vector<string>({bcache.backingDevice, bcache.cacheDevice});
      },
      [](const SpecialDevice&) {
        return vector<string>();
      });
}


bool operator==(const Disk& left, const Disk& right)
{
  return left.name == right.name &&
         left.ptable == right.ptable &&
         left.boot == right.boot;
}


bool operator==(const Partition& left, const Partition& right)
{
  return left.name == right.name &&
         left.on == right.on &&
         left.size == right.size &&
         left.bootable == right.bootable &&
         left.after == right.after;
}


bool operator==(const FileSystem& left, const FileSystem& right)
{
  return left.name == right.name &&
         left.on == right.on &&
         left.type == right.type &&
         left.mount == right.mount &&
         left.mountOptions == right.mountOptions;
}


bool operator==(const RAID& left, const RAID& right)
{
  return left.name == right.name &&
         left.level == right.level &&
         left.members == right.members &&
         left.spares == right.spares;
}


bool operator==(const LVM& left, const LVM& right)
{
  return left.name == right.name && left.members == right.members;
}


bool operator==(const LogicalVolume& left, const LogicalVolume& right)
{
  return left.name == right.name &&
         left.on == right.on &&
         left.size == right.size;
}


bool operator==(const BCache& left, const BCache& right)
{
  return left.name == right.name &&
         left.backingDevice == right.backingDevice &&
         left.cacheDevice == right.cacheDevice &&
         left.cacheMode == right.cacheMode;
}


bool operator==(const SpecialDevice& left, const SpecialDevice& right)
{
  return left.name == right.name;
}


ostream& operator<<(ostream& stream, const Disk& disk)
{
  stream << "disk " << disk.name;

  if (disk.ptable.isSome()) {
    stream << " ptable=" << disk.ptable.get();
  }

  if (disk.boot) {
    stream << " boot";
  }

  return stream;
}


ostream& operator<<(ostream& stream, const Partition& partition)
{
  stream << "partition " << partition.name << " on=" << partition.on
         << " size=" << partition.size;

  if (partition.bootable) {
    stream << " bootable";
  }

  if (partition.after.isSome()) {
    stream << " after=" << partition.after.get();
  }

  return stream;
}


ostream& operator<<(ostream& stream, const FileSystem& filesystem)
{
  stream << "filesystem " << filesystem.name << " on=" << filesystem.on
         << " type=" << filesystem.type;

  if (filesystem.mount.isSome()) {
    stream << " mount=" << filesystem.mount.get();
  }

  if (filesystem.mountOptions.isSome()) {
    stream << " options=" << filesystem.mountOptions.get();
  }

  return stream;
}


ostream& operator<<(ostream& stream, const RAID& raid)
{
  stream << "raid " << raid.name << " level=" << raid.level
         << " members=" << strings::join(",", raid.members);

  if (!raid.spares.empty()) {
    stream << " spares=" << strings::join(",", raid.spares);
  }

  return stream;
}


ostream& operator<<(ostream& stream, const LVM& lvm)
{
  return stream << "lvm " << lvm.name
                << " members=" << strings::join(",", lvm.members);
}


ostream& operator<<(ostream& stream, const LogicalVolume& volume)
{
  return stream << "logical-volume " << volume.name << " on=" << volume.on
                << " size=" << volume.size;
}


ostream& operator<<(ostream& stream, const BCache& bcache)
{
  return stream << "bcache " << bcache.name
                << " backing-device=" << bcache.backingDevice
                << " cache-device=" << bcache.cacheDevice
                << " cache-mode=" << bcache.cacheMode;
}


ostream& operator<<(ostream& stream, const SpecialDevice& device)
{
  return stream << "special " << device.name;
}


ostream& operator<<(ostream& stream, const StorageEntry& entry)
{
  entry.visit(
      [&stream](const Disk& disk) { stream << disk; },
      [&stream](const Partition& partition) { stream << partition; },
      [&stream](const FileSystem& filesystem) { stream << filesystem; },
      [&stream](const RAID& raid) { stream << raid; },
      [&stream](const LVM& lvm) { stream << lvm; },
      [&stream](const LogicalVolume& volume) { stream << volume; },
      [&stream](const BCache& bcache) { stream << bcache; },
      [&stream](const SpecialDevice& device) { stream << device; });

  return stream;
}


hashset<string> StorageLayout::diskNames() const
{
  hashset<string> result;

  foreachpair (const string& name, const StorageEntry& entry, entries) {
    const bool disk = entry.visit(
        [](const Disk&) { return true; },
        [](const Partition&) { return false; },
        [](const FileSystem&) { return false; },
        [](const RAID&) { return false; },
        [](const LVM&) { return false; },
        [](const LogicalVolume&) { return false; },
        [](const BCache&) { return false; },
        [](const SpecialDevice&) { return false; });

    if (disk) {
      result.insert(name);
    }
  }

  return result;
}


static LayoutError configError(const string& message)
{
  return LayoutError(LayoutError::CONFIG, message);
}


Try<uint64_t, LayoutError> parseSize(const string& size)
{
  static const string suffixes = "KMGTPE";

  string number = size;
  double multiplier = 1;

  if (!size.empty() &&
      !isdigit(static_cast<unsigned char>(size.back())) &&
      size.back() != '.') {
    const size_t index = suffixes.find(size.back());
    if (index == string::npos) {
      return configError("Invalid size '" + size + "'");
    }

    number = size.substr(0, size.size() - 1);
    multiplier = std::pow(1000.0, static_cast<double>(index + 1));
  }

  Try<double> value = numify<double>(number);
  if (value.isError() || std::isnan(value.get())) {
    return configError("Invalid size '" + size + "'");
  }

  if (value.get() <= 0) {
    return configError("Invalid negative size '" + size + "'");
  }

  const double bytes = std::round(value.get() * multiplier);

  if (bytes >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
    return configError("Invalid size '" + size + "'");
  }

  return static_cast<uint64_t>(bytes);
}


namespace {

// Accumulates the entries of a layout in declaration order.
class LayoutBuilder
{
public:
  Option<LayoutError> add(const StorageEntry& entry)
  {
    const string entryName = name(entry);

    if (entries.contains(entryName)) {
      return configError("Duplicated device name '" + entryName + "'");
    }

    order.push_back(entryName);
    entries.put(entryName, entry);

    return None();
  }

  // Adds the filesystem `type` on the device `on`, if any.
  Option<LayoutError> addFilesystem(
      const string& on,
      const Option<string>& type)
  {
    if (type.isNone()) {
      return None();
    }

    static const vector<string> types = {
      "ext2",
      "ext4",
      "xfs",
      "fat32",
      "vfat",
      "swap",
      "btrfs",
      "zfsroot",
      "tmpfs",
      "ramfs",
    };

    if (std::find(types.begin(), types.end(), type.get()) == types.end()) {
      return configError("Unknown filesystem type '" + type.get() + "'");
    }

    const FileSystem filesystem{on + "[fs]", on, type.get(), None(), None()};

    Option<LayoutError> error = add(filesystem);
    if (error.isSome()) {
      return error;
    }

    filesystems.put(filesystem.name, filesystem);

    return None();
  }

  vector<string> order;
  hashmap<string, StorageEntry> entries;
  hashmap<string, FileSystem> filesystems;
  vector<string> specials;
};


// Accessors for documents that passed `validateConfig`.

Option<string> getString(const JSON::Object& object, const string& key)
{
  auto value = object.values.find(key);
  if (value == object.values.end()) {
    return None();
  }

  return value->second.as<JSON::String>().value;
}


bool getBool(const JSON::Object& object, const string& key)
{
  auto value = object.values.find(key);
  if (value == object.values.end()) {
    return false;
  }

  return value->second.as<JSON::Boolean>().value;
}


vector<string> getStrings(const JSON::Object& object, const string& key)
{
  vector<string> result;

  auto value = object.values.find(key);
  if (value != object.values.end()) {
    foreach (const JSON::Value& item, value->second.as<JSON::Array>().values) {
      result.push_back(item.as<JSON::String>().value);
    }
  }

  return result;
}


vector<JSON::Object> getObjects(const JSON::Object& object, const string& key)
{
  vector<JSON::Object> result;

  auto value = object.values.find(key);
  if (value != object.values.end()) {
    foreach (const JSON::Value& item, value->second.as<JSON::Array>().values) {
      result.push_back(item.as<JSON::Object>());
    }
  }

  return result;
}


Option<LayoutError> flattenDisk(
    const string& diskName,
    const JSON::Object& data,
    LayoutBuilder* builder)
{
  const Option<string> ptable = getString(data, "ptable");
  const vector<JSON::Object> partitions = getObjects(data, "partitions");

  if (!partitions.empty() && ptable.isNone()) {
    return configError(
        "Partition table not specified for '" + diskName + "'");
  }

  Option<LayoutError> error =
    builder->add(Disk{diskName, ptable, getBool(data, "boot")});

  if (error.isNone()) {
    error = builder->addFilesystem(diskName, getString(data, "fs"));
  }

  Option<string> previous;

  foreach (const JSON::Object& partition, partitions) {
    if (error.isSome()) {
      return error;
    }

    const string partitionName = getString(partition, "name").get();

    Try<uint64_t, LayoutError> size =
      parseSize(getString(partition, "size").get());

    if (size.isError()) {
      return size.error();
    }

    error = builder->add(Partition{
        partitionName,
        diskName,
        size.get(),
        getBool(partition, "bootable"),
        previous});

    if (error.isNone()) {
      error = builder->addFilesystem(
          partitionName,
          getString(partition, "fs"));
    }

    previous = partitionName;
  }

  return error;
}


Option<LayoutError> flattenRaid(
    const string& raidName,
    const JSON::Object& data,
    LayoutBuilder* builder)
{
  const int level = static_cast<int>(
      data.values.at("level").as<JSON::Number>().as<double>());

  const vector<string> members = getStrings(data, "members");
  const vector<string> spares = getStrings(data, "spares");

  if (level == 0 && !spares.empty()) {
    return configError("RAID level 0 doesn't support spares");
  }

  foreach (const string& spare, spares) {
    if (std::find(members.begin(), members.end(), spare) != members.end()) {
      return configError(
          "RAID '" + raidName + "' has duplicated devices in members and "
          "spares");
    }
  }

  Option<LayoutError> error =
    builder->add(RAID{raidName, level, members, spares});

  if (error.isSome()) {
    return error;
  }

  return builder->addFilesystem(raidName, getString(data, "fs"));
}


Option<LayoutError> flattenLvm(
    const string& lvmName,
    const JSON::Object& data,
    LayoutBuilder* builder)
{
  Option<LayoutError> error =
    builder->add(LVM{lvmName, getStrings(data, "members")});

  if (error.isSome()) {
    return error;
  }

  foreach (const JSON::Object& volume, getObjects(data, "volumes")) {
    const string volumeName = getString(volume, "name").get();

    Try<uint64_t, LayoutError> size =
      parseSize(getString(volume, "size").get());

    if (size.isError()) {
      return size.error();
    }

    error = builder->add(LogicalVolume{volumeName, lvmName, size.get()});

    if (error.isNone()) {
      error = builder->addFilesystem(volumeName, getString(volume, "fs"));
    }

    if (error.isSome()) {
      return error;
    }
  }

  return None();
}


Option<LayoutError> flattenBcache(
    const string& bcacheName,
    const JSON::Object& data,
    LayoutBuilder* builder)
{
  Option<LayoutError> error = builder->add(BCache{
      bcacheName,
      getString(data, "backing-device").get(),
      getString(data, "cache-device").get(),
      getString(data, "cache-mode").getOrElse("writethrough")});

  if (error.isSome()) {
    return error;
  }

  return builder->addFilesystem(bcacheName, getString(data, "fs"));
}


Option<LayoutError> flattenSpecial(
    const string& deviceName,
    const JSON::Object& data,
    LayoutBuilder* builder)
{
  const string fs = getString(data, "fs").get();

  if (fs != "tmpfs" && fs != "ramfs") {
    return configError("Invalid special filesystem '" + fs + "'");
  }

  Option<LayoutError> error = builder->add(SpecialDevice{deviceName});
  if (error.isSome()) {
    return error;
  }

  builder->specials.push_back(deviceName);

  return builder->addFilesystem(deviceName, fs);
}


// Orders the entries so that every entry comes after its
// dependencies. Entries that are ready keep their declaration order.
Try<vector<StorageEntry>, LayoutError> sortEntries(
    const LayoutBuilder& builder)
{
  vector<StorageEntry> result;
  hashset<string> sorted;
  vector<string> remaining = builder.order;

  while (!remaining.empty()) {
    vector<string> blocked;

    foreach (const string& entryName, remaining) {
      const StorageEntry& entry = builder.entries.at(entryName);

      bool ready = true;
      foreach (const string& dependency, deps(entry)) {
        if (!sorted.contains(dependency)) {
          ready = false;
          break;
        }
      }

      if (ready) {
        result.push_back(entry);
        sorted.insert(entryName);
      } else {
        blocked.push_back(entryName);
      }
    }

    if (blocked.size() == remaining.size()) {
      std::sort(blocked.begin(), blocked.end());
      return configError(
          "Dependency cycle between devices: " +
          strings::join(", ", blocked));
    }

    remaining = blocked;
  }

  return result;
}

} // namespace {


Try<StorageLayout, LayoutError> getStorageLayout(const JSON::Object& config)
{
  Option<LayoutError> error = validateConfig(config);
  if (error.isSome()) {
    return error.get();
  }

  LayoutBuilder builder;

  const JSON::Object& layout = config.values.at("layout").as<JSON::Object>();

  foreachpair (const string& entryName,
               const JSON::Value& value,
               layout.values) {
    const JSON::Object& data = value.as<JSON::Object>();
    const string type = getString(data, "type").get();

    if (type == "disk") {
      error = flattenDisk(entryName, data, &builder);
    } else if (type == "raid") {
      error = flattenRaid(entryName, data, &builder);
    } else if (type == "lvm") {
      error = flattenLvm(entryName, data, &builder);
    } else if (type == "bcache") {
      error = flattenBcache(entryName, data, &builder);
    } else if (type == "special") {
      error = flattenSpecial(entryName, data, &builder);
    } else {
      error = configError("Unsupported device type '" + type + "'");
    }

    if (error.isSome()) {
      return error.get();
    }
  }

  // Devices that are referenced but not declared are disks.
  vector<string> implicit;
  foreach (const string& entryName, builder.order) {
    foreach (const string& dependency, deps(builder.entries.at(entryName))) {
      if (!builder.entries.contains(dependency) &&
          std::find(implicit.begin(), implicit.end(), dependency) ==
            implicit.end()) {
        implicit.push_back(dependency);
      }
    }
  }

  std::sort(implicit.begin(), implicit.end());

  foreach (const string& diskName, implicit) {
    error = builder.add(Disk{diskName, None(), false});
    if (error.isSome()) {
      return error.get();
    }
  }

  const JSON::Object& mounts = config.values.at("mounts").as<JSON::Object>();

  foreachpair (const string& mountpoint,
               const JSON::Value& value,
               mounts.values) {
    const JSON::Object& mount = value.as<JSON::Object>();
    const string device = getString(mount, "device").get();

    Option<FileSystem> filesystem = builder.filesystems.get(device + "[fs]");
    if (filesystem.isNone()) {
      return configError("Filesystem not found for device '" + device + "'");
    }

    filesystem->mount = mountpoint;
    filesystem->mountOptions = getString(mount, "options");

    builder.filesystems.put(filesystem->name, filesystem.get());
    builder.entries.put(filesystem->name, filesystem.get());
  }

  vector<string> unmounted;
  foreach (const string& device, builder.specials) {
    if (builder.filesystems.at(device + "[fs]").mount.isNone()) {
      unmounted.push_back(device);
    }
  }

  if (!unmounted.empty()) {
    std::sort(unmounted.begin(), unmounted.end());
    return configError(
        "Special device(s) missing mountpoint: " +
        strings::join(", ", unmounted));
  }

  Try<vector<StorageEntry>, LayoutError> sorted = sortEntries(builder);
  if (sorted.isError()) {
    return sorted.error();
  }

  StorageLayout result;
  result.entries = builder.entries;
  result.sortedEntries = sorted.get();

  return result;
}


Try<StorageLayout, LayoutError> parseStorageLayout(const string& json)
{
  Try<JSON::Object> config = JSON::parse<JSON::Object>(json);
  if (config.isError()) {
    return configError("Invalid config: " + config.error());
  }

  return getStorageLayout(config.get());
}

} // namespace storage {
} // namespace internal {
} // namespace bootsync {
