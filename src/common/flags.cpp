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

#include <string>

#include <stout/path.hpp>

#include "common/flags.hpp"

using std::string;

namespace bootsync {
namespace internal {

Flags::Flags()
{
  add(&Flags::data_dir,
      "data_dir",
      "Directory holding the state of this controller. Boot resource\n"
      "files are stored under `<data_dir>/image-storage`.",
      "/var/lib/bootsync");
}


string imageStoragePath(const string& dataDir)
{
  return path::join(dataDir, "image-storage");
}

} // namespace internal {
} // namespace bootsync {
