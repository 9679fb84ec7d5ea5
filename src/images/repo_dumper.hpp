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

#ifndef __IMAGES_REPO_DUMPER_HPP__
#define __IMAGES_REPO_DUMPER_HPP__

#include <string>

#include <stout/json.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "images/mapping.hpp"

namespace bootsync {
namespace internal {
namespace images {

// Gives access to the documents of a simplestreams mirror.
class StreamReader
{
public:
  virtual ~StreamReader() {}

  // Returns the content of the document at `path`, relative to the
  // root of the stream.
  virtual Try<std::string> read(const std::string& path) = 0;
};


// Reads a stream mirrored into a local directory.
class LocalStreamReader : public StreamReader
{
public:
  explicit LocalStreamReader(const std::string& _root) : root(_root) {}

  Try<std::string> read(const std::string& path) override;

private:
  const std::string root;
};


// Walks a simplestreams tree and records every boot image it offers
// in a `BootImageMapping`.
class RepoDumper
{
public:
  // The mapping must outlive the dumper.
  explicit RepoDumper(BootImageMapping* mapping, bool validateProducts = true);

  // Reads the index or products document at `path` and inserts the
  // items of the newest version of every product. Errors reading or
  // parsing the stream are logged and returned.
  Try<Nothing> sync(StreamReader* reader, const std::string& path);

  // Inserts one simplestreams item, described by its flattened
  // metadata (see `productsExdata`), of the product `productName`.
  // Items of unsupported products are dropped.
  void insertItem(const JSON::Object& item, const std::string& productName);

private:
  Try<Nothing> syncIndex(StreamReader* reader, const JSON::Object& index);

  Try<Nothing> syncProducts(const JSON::Object& products);

  BootImageMapping* mapping;
  const bool validateProducts;
};

} // namespace images {
} // namespace internal {
} // namespace bootsync {

#endif // __IMAGES_REPO_DUMPER_HPP__
