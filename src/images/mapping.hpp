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

#ifndef __IMAGES_MAPPING_HPP__
#define __IMAGES_MAPPING_HPP__

#include <utility>
#include <vector>

#include <stout/hashmap.hpp>
#include <stout/json.hpp>
#include <stout/option.hpp>

#include "images/image_spec.hpp"

namespace bootsync {
namespace internal {
namespace images {

// The boot images available from an image source, with the product
// metadata of the simplestreams item that provides each of them.
class BootImageMapping
{
public:
  // Associates `metadata` with `spec`, replacing any previous value.
  void set(const ImageSpec& spec, const JSON::Object& metadata);

  // Associates `metadata` with `spec` unless `spec` is already
  // present. Returns whether the mapping changed.
  bool setIfAbsent(const ImageSpec& spec, const JSON::Object& metadata);

  Option<JSON::Object> get(const ImageSpec& spec) const;

  bool contains(const ImageSpec& spec) const;

  size_t size() const;

  bool empty() const;

  // Returns the entries in no particular order.
  std::vector<std::pair<ImageSpec, JSON::Object>> items() const;

  // Renders the mapping as nested objects:
  //   os -> arch -> subarch -> kflavor -> release -> label -> metadata.
  JSON::Object dumpJson() const;

private:
  hashmap<ImageSpec, JSON::Object> mapping;
};

} // namespace images {
} // namespace internal {
} // namespace bootsync {

#endif // __IMAGES_MAPPING_HPP__
