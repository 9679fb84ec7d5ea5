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

#ifndef __IMAGES_PRODUCT_HPP__
#define __IMAGES_PRODUCT_HPP__

#include <string>

#include <stout/json.hpp>
#include <stout/option.hpp>

namespace bootsync {
namespace internal {
namespace images {

// Returns the string stored under `key`, none if the key is missing
// or does not hold a string.
Option<std::string> getString(
    const JSON::Object& object,
    const std::string& key);


// Returns the flattened metadata of an item of a simplestreams
// products document: the scalar fields of the document, the product,
// the version and the item (the innermost level wins), plus the
// `product_name`, `version_name` and `item_name` of the item.
JSON::Object productsExdata(
    const JSON::Object& tree,
    const std::string& productName,
    const std::string& versionName,
    const std::string& itemName);


// Returns the subset of the item metadata kept in a boot image mapping.
JSON::Object cleanUpRepoItem(const JSON::Object& item);

} // namespace images {
} // namespace internal {
} // namespace bootsync {

#endif // __IMAGES_PRODUCT_HPP__
