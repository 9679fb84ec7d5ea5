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
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include "images/product.hpp"
#include "images/repo_dumper.hpp"
#include "images/validation.hpp"

using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace images {

Try<string> LocalStreamReader::read(const string& path)
{
  return os::read(path::join(root, path));
}


static Try<JSON::Object> load(StreamReader* reader, const string& path)
{
  Try<string> content = reader->read(path);
  if (content.isError()) {
    return Error("Failed to read '" + path + "': " + content.error());
  }

  Try<JSON::Object> document = JSON::parse<JSON::Object>(content.get());
  if (document.isError()) {
    return Error("Failed to parse '" + path + "': " + document.error());
  }

  return document.get();
}


// Returns the object stored under `key`, none if there is no such
// object.
static Option<JSON::Object> getObject(
    const JSON::Object& object,
    const string& key)
{
  auto value = object.values.find(key);
  if (value == object.values.end() || !value->second.is<JSON::Object>()) {
    return None();
  }

  return value->second.as<JSON::Object>();
}


RepoDumper::RepoDumper(BootImageMapping* _mapping, bool _validateProducts)
  : mapping(_mapping),
    validateProducts(_validateProducts) {}


Try<Nothing> RepoDumper::sync(StreamReader* reader, const string& path)
{
  Try<Nothing> result = [&]() -> Try<Nothing> {
    Try<JSON::Object> document = load(reader, path);
    if (document.isError()) {
      return Error(document.error());
    }

    const Option<string> format = getString(document.get(), "format");

    if (format == "index:1.0") {
      return syncIndex(reader, document.get());
    }

    if (format == "products:1.0") {
      return syncProducts(document.get());
    }

    return Error(
        "Unsupported format '" + format.getOrElse("") + "' of '" + path + "'");
  }();

  if (result.isError()) {
    LOG(WARNING) << "I/O error while syncing boot images. If this problem "
                 << "persists, verify network connectivity and disk usage: "
                 << result.error();
  }

  return result;
}


Try<Nothing> RepoDumper::syncIndex(
    StreamReader* reader,
    const JSON::Object& index)
{
  const Option<JSON::Object> entries = getObject(index, "index");
  if (entries.isNone()) {
    return Nothing();
  }

  foreachpair (const string& contentId,
               const JSON::Value& entry,
               entries->values) {
    if (!entry.is<JSON::Object>()) {
      return Error("Invalid index entry '" + contentId + "'");
    }

    const Option<string> path = getString(entry.as<JSON::Object>(), "path");
    if (path.isNone()) {
      return Error("Index entry '" + contentId + "' has no path");
    }

    VLOG(1) << "Syncing products of '" << contentId << "' from '"
            << path.get() << "'";

    Try<JSON::Object> products = load(reader, path.get());
    if (products.isError()) {
      return Error(products.error());
    }

    Try<Nothing> sync = syncProducts(products.get());
    if (sync.isError()) {
      return sync;
    }
  }

  return Nothing();
}


Try<Nothing> RepoDumper::syncProducts(const JSON::Object& products)
{
  const Option<JSON::Object> entries = getObject(products, "products");
  if (entries.isNone()) {
    return Nothing();
  }

  foreachpair (const string& productName,
               const JSON::Value& product,
               entries->values) {
    if (!product.is<JSON::Object>()) {
      return Error("Invalid product '" + productName + "'");
    }

    const Option<JSON::Object> versions =
      getObject(product.as<JSON::Object>(), "versions");

    if (versions.isNone() || versions->values.empty()) {
      continue;
    }

    // Version names sort chronologically (e.g. "20240301.1"), only
    // the newest one is mirrored.
    const string& versionName = versions->values.rbegin()->first;
    const JSON::Value& version = versions->values.rbegin()->second;

    if (!version.is<JSON::Object>()) {
      return Error(
          "Invalid version '" + versionName + "' of '" + productName + "'");
    }

    const Option<JSON::Object> items =
      getObject(version.as<JSON::Object>(), "items");

    if (items.isNone()) {
      continue;
    }

    foreachkey (const string& itemName, items->values) {
      insertItem(
          productsExdata(products, productName, versionName, itemName),
          productName);
    }
  }

  return Nothing();
}


void RepoDumper::insertItem(const JSON::Object& item, const string& productName)
{
  if (validateProducts && !validateProduct(item, productName)) {
    VLOG(1) << "Ignoring unsupported product " << productName;
    return;
  }

  const string os = getString(item, "os").getOrElse("ubuntu");

  const Option<string> arch = getString(item, "arch");
  if (arch.isNone()) {
    LOG(WARNING) << "Ignoring item of product " << productName
                 << " without architecture";
    return;
  }

  const Option<string> bootloaderType = getString(item, "bootloader-type");

  string release;
  string kflavor;

  if (bootloaderType.isSome()) {
    release = bootloaderType.get();
    kflavor = "bootloader";
  } else {
    const Option<string> _release = getString(item, "release");
    if (_release.isNone()) {
      LOG(WARNING) << "Ignoring item of product " << productName
                   << " without release";
      return;
    }

    release = _release.get();
    kflavor = getString(item, "kflavor").getOrElse("generic");
  }

  const string label = getString(item, "label").getOrElse("*");
  const JSON::Object metadata = cleanUpRepoItem(item);

  if (os == "ubuntu-core") {
    // One entry per release, architecture and gadget.
    mapping->setIfAbsent(
        ImageSpec(
            os,
            arch.get(),
            getString(item, "gadget_snap").getOrElse("generic"),
            getString(item, "kernel_snap").getOrElse("generic"),
            release,
            label),
        metadata);
    return;
  }

  const vector<string> subarches =
    strings::split(getString(item, "subarches").getOrElse("generic"), ",");

  foreach (const string& subarch, subarches) {
    mapping->setIfAbsent(
        ImageSpec(os, arch.get(), subarch, kflavor, release, label),
        metadata);
  }

  // The subarchitecture the item was built for always maps to the item
  // itself, not to whichever item supporting it came first.
  const string subarch = getString(item, "subarch").getOrElse("generic");

  mapping->set(
      ImageSpec(os, arch.get(), subarch, kflavor, release, label),
      metadata);

  // The generic kernel of a release owns the "generic" entry even if
  // a newer HWE kernel listing "generic" was inserted first. That is
  // ga-<version> since Xenial and hwe-<first letter> before.
  if (os == "ubuntu" && kflavor == "generic" && !release.empty() &&
      (strings::startsWith(subarch, "ga-") ||
       subarch == "hwe-" + release.substr(0, 1))) {
    mapping->set(
        ImageSpec(os, arch.get(), "generic", kflavor, release, label),
        metadata);
  }
}

} // namespace images {
} // namespace internal {
} // namespace bootsync {
