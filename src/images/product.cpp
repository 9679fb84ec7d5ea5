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

#include <stout/foreach.hpp>

#include "images/product.hpp"

using std::string;

namespace bootsync {
namespace internal {
namespace images {

Option<string> getString(const JSON::Object& object, const string& key)
{
  auto value = object.values.find(key);
  if (value == object.values.end() || !value->second.is<JSON::String>()) {
    return None();
  }

  return value->second.as<JSON::String>().value;
}


// Copies the fields of `object` that are not objects or arrays.
static void mergeScalars(const JSON::Object& object, JSON::Object* exdata)
{
  foreachpair (const string& key, const JSON::Value& value, object.values) {
    if (value.is<JSON::Object>() || value.is<JSON::Array>()) {
      continue;
    }

    exdata->values[key] = value;
  }
}


// Returns the child object `name` of the object `key` in `parent`,
// an empty object if any of them is missing.
static JSON::Object child(
    const JSON::Object& parent,
    const string& key,
    const string& name)
{
  auto collection = parent.values.find(key);
  if (collection == parent.values.end() ||
      !collection->second.is<JSON::Object>()) {
    return JSON::Object();
  }

  const JSON::Object& children = collection->second.as<JSON::Object>();

  auto result = children.values.find(name);
  if (result == children.values.end() || !result->second.is<JSON::Object>()) {
    return JSON::Object();
  }

  return result->second.as<JSON::Object>();
}


JSON::Object productsExdata(
    const JSON::Object& tree,
    const string& productName,
    const string& versionName,
    const string& itemName)
{
  JSON::Object exdata;
  mergeScalars(tree, &exdata);

  const JSON::Object product = child(tree, "products", productName);
  mergeScalars(product, &exdata);
  exdata.values["product_name"] = productName;

  const JSON::Object version = child(product, "versions", versionName);
  mergeScalars(version, &exdata);
  exdata.values["version_name"] = versionName;

  const JSON::Object item = child(version, "items", itemName);
  mergeScalars(item, &exdata);
  exdata.values["item_name"] = itemName;

  return exdata;
}


JSON::Object cleanUpRepoItem(const JSON::Object& item)
{
  static const char* keys[] = {
    "content_id",
    "product_name",
    "version_name",
    "path",
    "subarches",
    "release_codename",
    "release_title",
    "support_eol",
    "kflavor",
    "bootloader-type",
    "os_title",
    "gadget_title",
  };

  JSON::Object result;

  foreach (const char* key, keys) {
    auto value = item.values.find(key);
    if (value != item.values.end()) {
      result.values[key] = value->second;
    }
  }

  return result;
}

} // namespace images {
} // namespace internal {
} // namespace bootsync {
