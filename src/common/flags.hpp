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

#ifndef __COMMON_FLAGS_HPP__
#define __COMMON_FLAGS_HPP__

#include <string>

#include <stout/flags.hpp>

#include "logging/flags.hpp"

namespace bootsync {
namespace internal {

// Flags shared by every bootsync program. Each flag can also be set
// through the environment, e.g. BOOTSYNC_DATA_DIR.
class Flags : public virtual logging::Flags
{
public:
  Flags();

  std::string data_dir;
};


// Returns the image storage directory under `dataDir`.
std::string imageStoragePath(const std::string& dataDir);

} // namespace internal {
} // namespace bootsync {

#endif // __COMMON_FLAGS_HPP__
