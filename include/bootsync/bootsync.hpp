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

#ifndef __BOOTSYNC_HPP__
#define __BOOTSYNC_HPP__

#include <ostream>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <bootsync/bootsync.pb.h>

namespace bootsync {

inline std::ostream& operator<<(
    std::ostream& stream,
    const BootResourceFile::Type& type)
{
  return stream << BootResourceFile::Type_Name(type);
}


inline bool operator==(
    const BootResourceSet& left,
    const BootResourceSet& right)
{
  return left.id() == right.id() &&
         left.resource_id() == right.resource_id() &&
         left.version() == right.version() &&
         left.label() == right.label();
}


inline bool operator!=(
    const BootResourceSet& left,
    const BootResourceSet& right)
{
  return !(left == right);
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const BootResourceSet& set)
{
  return stream << set.id() << " (" << set.version() << "/" << set.label()
                << ")";
}

} // namespace bootsync {

#endif // __BOOTSYNC_HPP__
