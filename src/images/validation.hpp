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

#ifndef __IMAGES_VALIDATION_HPP__
#define __IMAGES_VALIDATION_HPP__

#include <string>

#include <stout/json.hpp>

namespace bootsync {
namespace internal {
namespace images {

// Returns whether this version of the engine can use the
// simplestreams product `productName` with metadata `data`.
//
// Product names are ':' separated. Bootloaders are named
// `<prefix>:1:<os>:<bootloader-type>:<arch>` and must be one of the
// supported bootloaders. Ubuntu products are named
// `<prefix>:<format>:boot:<version>:<arch>:<subarch>` with format v2,
// v3 or v3+platform. Ubuntu Core products use format v4. Products of
// any other operating system are accepted.
bool validateProduct(const JSON::Object& data, const std::string& productName);

} // namespace images {
} // namespace internal {
} // namespace bootsync {

#endif // __IMAGES_VALIDATION_HPP__
