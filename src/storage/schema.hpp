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

#ifndef __STORAGE_SCHEMA_HPP__
#define __STORAGE_SCHEMA_HPP__

#include <stout/json.hpp>
#include <stout/option.hpp>

#include "storage/layout.hpp"

namespace bootsync {
namespace internal {
namespace storage {

// Checks the structure of a custom storage layout document: the keys
// and value types of every entry, and the values allowed for the
// enumerated ones. Entries with an unknown `type` are only required
// to have a type. The error names the offending path, e.g.
// "Invalid config at layout/sda/ptable: 'foo' is not one of
// ['gpt', 'mbr']".
Option<LayoutError> validateConfig(const JSON::Object& config);

} // namespace storage {
} // namespace internal {
} // namespace bootsync {

#endif // __STORAGE_SCHEMA_HPP__
