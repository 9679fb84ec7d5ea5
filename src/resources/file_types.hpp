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

#ifndef __RESOURCES_FILE_TYPES_HPP__
#define __RESOURCES_FILE_TYPES_HPP__

#include <bootsync/bootsync.hpp>

namespace bootsync {
namespace internal {
namespace resources {

bool isKernel(BootResourceFile::Type type);

// Root filesystems a machine can boot from: squashfs and raw images,
// tarballs and disk images.
bool isRoot(BootResourceFile::Type type);

// Root filesystems the installer can write directly to disk.
bool isXinstallable(BootResourceFile::Type type);

} // namespace resources {
} // namespace internal {
} // namespace bootsync {

#endif // __RESOURCES_FILE_TYPES_HPP__
