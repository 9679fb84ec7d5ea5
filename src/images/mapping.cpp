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
#include <utility>
#include <vector>

#include <stout/foreach.hpp>

#include "images/mapping.hpp"

using std::pair;
using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace images {

void BootImageMapping::set(const ImageSpec& spec, const JSON::Object& metadata)
{
  mapping.put(spec, metadata);
}


bool BootImageMapping::setIfAbsent(
    const ImageSpec& spec,
    const JSON::Object& metadata)
{
  if (mapping.contains(spec)) {
    return false;
  }

  mapping.put(spec, metadata);
  return true;
}


Option<JSON::Object> BootImageMapping::get(const ImageSpec& spec) const
{
  return mapping.get(spec);
}


bool BootImageMapping::contains(const ImageSpec& spec) const
{
  return mapping.contains(spec);
}


size_t BootImageMapping::size() const
{
  return mapping.size();
}


bool BootImageMapping::empty() const
{
  return mapping.empty();
}


vector<pair<ImageSpec, JSON::Object>> BootImageMapping::items() const
{
  vector<pair<ImageSpec, JSON::Object>> result;
  result.reserve(mapping.size());

  foreachpair (const ImageSpec& spec, const JSON::Object& metadata, mapping) {
    result.push_back(std::make_pair(spec, metadata));
  }

  return result;
}


// Stores `metadata` in `object` under the nested keys `path[index:]`.
static void insert(
    JSON::Object* object,
    const vector<string>& path,
    size_t index,
    const JSON::Object& metadata)
{
  const string& key = path[index];

  if (index + 1 == path.size()) {
    object->values[key] = metadata;
    return;
  }

  JSON::Object child;

  auto existing = object->values.find(key);
  if (existing != object->values.end() &&
      existing->second.is<JSON::Object>()) {
    child = existing->second.as<JSON::Object>();
  }

  insert(&child, path, index + 1, metadata);

  object->values[key] = child;
}


JSON::Object BootImageMapping::dumpJson() const
{
  JSON::Object result;

  foreachpair (const ImageSpec& spec, const JSON::Object& metadata, mapping) {
    const vector<string> path = {
      spec.os,
      spec.arch,
      spec.subarch,
      spec.kflavor,
      spec.release,
      spec.label
    };

    insert(&result, path, 0, metadata);
  }

  return result;
}

} // namespace images {
} // namespace internal {
} // namespace bootsync {
