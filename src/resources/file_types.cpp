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

#include "resources/file_types.hpp"

namespace bootsync {
namespace internal {
namespace resources {

bool isKernel(BootResourceFile::Type type)
{
  return type == BootResourceFile::BOOT_KERNEL;
}


static bool isDiskImage(BootResourceFile::Type type)
{
  switch (type) {
    case BootResourceFile::ROOT_DD:
    case BootResourceFile::ROOT_DDTAR:
    case BootResourceFile::ROOT_DDRAW:
    case BootResourceFile::ROOT_DDTGZ:
    case BootResourceFile::ROOT_DDTBZ:
    case BootResourceFile::ROOT_DDTXZ:
    case BootResourceFile::ROOT_DDGZ:
    case BootResourceFile::ROOT_DDBZ2:
    case BootResourceFile::ROOT_DDXZ:
      return true;
    default:
      return false;
  }
}


static bool isTarball(BootResourceFile::Type type)
{
  return type == BootResourceFile::ROOT_TGZ ||
         type == BootResourceFile::ROOT_TBZ ||
         type == BootResourceFile::ROOT_TXZ;
}


bool isRoot(BootResourceFile::Type type)
{
  return type == BootResourceFile::SQUASHFS_IMAGE ||
         type == BootResourceFile::ROOT_IMAGE ||
         isTarball(type) ||
         isDiskImage(type);
}


bool isXinstallable(BootResourceFile::Type type)
{
  return isTarball(type) || isDiskImage(type);
}

} // namespace resources {
} // namespace internal {
} // namespace bootsync {
