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

#ifndef __STORAGE_LAYOUT_HPP__
#define __STORAGE_LAYOUT_HPP__

#include <stdint.h>

#include <ostream>
#include <string>
#include <vector>

#include <stout/error.hpp>
#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/json.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>
#include <stout/variant.hpp>

namespace bootsync {
namespace internal {
namespace storage {

// Represents the errors of custom storage layouts.
class LayoutError : public Error
{
public:
  enum Type
  {
    CONFIG,     // The layout document is invalid.
    UNAPPLIABLE // The layout does not fit the machine.
  };

  LayoutError(Type _type, const std::string& _message)
    : Error(_message), type(_type) {}

  Type type;
};


// A physical disk of the machine.
struct Disk
{
  std::string name;
  Option<std::string> ptable; // "gpt" or "mbr".
  bool boot;
};


struct Partition
{
  std::string name;
  std::string on; // Disk.
  uint64_t size;
  bool bootable;

  // The partition that precedes this one on the disk.
  Option<std::string> after;
};


// A filesystem on the device `on`, named "<on>[fs]".
struct FileSystem
{
  std::string name;
  std::string on;
  std::string type;
  Option<std::string> mount;
  Option<std::string> mountOptions;
};


struct RAID
{
  std::string name;
  int level;
  std::vector<std::string> members;
  std::vector<std::string> spares;
};


// An LVM volume group.
struct LVM
{
  std::string name;
  std::vector<std::string> members;
};


struct LogicalVolume
{
  std::string name;
  std::string on; // Volume group.
  uint64_t size;
};


struct BCache
{
  std::string name;
  std::string backingDevice;
  std::string cacheDevice;
  std::string cacheMode;
};


// A device backing a memory filesystem (tmpfs, ramfs).
struct SpecialDevice
{
  std::string name;
};


typedef Variant<
    Disk,
    Partition,
    FileSystem,
    RAID,
    LVM,
    LogicalVolume,
    BCache,
    SpecialDevice> StorageEntry;


std::string name(const StorageEntry& entry);

// Returns the names of the devices `entry` is built on.
std::vector<std::string> deps(const StorageEntry& entry);


bool operator==(const Disk& left, const Disk& right);
bool operator==(const Partition& left, const Partition& right);
bool operator==(const FileSystem& left, const FileSystem& right);
bool operator==(const RAID& left, const RAID& right);
bool operator==(const LVM& left, const LVM& right);
bool operator==(const LogicalVolume& left, const LogicalVolume& right);
bool operator==(const BCache& left, const BCache& right);
bool operator==(const SpecialDevice& left, const SpecialDevice& right);


std::ostream& operator<<(std::ostream& stream, const Disk& disk);
std::ostream& operator<<(std::ostream& stream, const Partition& partition);
std::ostream& operator<<(std::ostream& stream, const FileSystem& filesystem);
std::ostream& operator<<(std::ostream& stream, const RAID& raid);
std::ostream& operator<<(std::ostream& stream, const LVM& lvm);
std::ostream& operator<<(std::ostream& stream, const LogicalVolume& volume);
std::ostream& operator<<(std::ostream& stream, const BCache& bcache);
std::ostream& operator<<(std::ostream& stream, const SpecialDevice& device);
std::ostream& operator<<(std::ostream& stream, const StorageEntry& entry);


// A compiled custom storage layout.
struct StorageLayout
{
  // Names of the disks the layout uses, declared or referenced.
  hashset<std::string> diskNames() const;

  hashmap<std::string, StorageEntry> entries;

  // Every entry comes after the entries it depends on.
  std::vector<StorageEntry> sortedEntries;
};


// Parses a size such as "500M" or "0.2G". Suffixes K, M, G, T, P and
// E are powers of 1000; a number without suffix is a byte count.
Try<uint64_t, LayoutError> parseSize(const std::string& size);


// Compiles a custom storage layout document:
//
//   {
//     "layout": {
//       "sda": {
//         "type": "disk",
//         "ptable": "gpt",
//         "boot": true,
//         "partitions": [
//           {"name": "sda1", "size": "100M", "fs": "vfat", "bootable": true},
//           {"name": "sda2", "size": "20G", "fs": "ext4"}
//         ]
//       }
//     },
//     "mounts": {
//       "/": {"device": "sda2", "options": "noatime"},
//       "/boot/efi": {"device": "sda1"}
//     }
//   }
//
// Devices referenced but not declared are physical disks. All errors
// are of type CONFIG.
Try<StorageLayout, LayoutError> getStorageLayout(const JSON::Object& config);

Try<StorageLayout, LayoutError> parseStorageLayout(const std::string& json);

} // namespace storage {
} // namespace internal {
} // namespace bootsync {

#endif // __STORAGE_LAYOUT_HPP__
