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

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/unreachable.hpp>

#include "storage/schema.hpp"

using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace storage {

namespace {

enum Kind
{
  OBJECT,
  ARRAY,
  STRING,
  BOOLEAN,
  INTEGER
};


string kindName(Kind kind)
{
  switch (kind) {
    case OBJECT:  return "object";
    case ARRAY:   return "array";
    case STRING:  return "string";
    case BOOLEAN: return "boolean";
    case INTEGER: return "integer";
  }

  UNREACHABLE();
}


bool isInteger(const JSON::Value& value)
{
  if (!value.is<JSON::Number>()) {
    return false;
  }

  const double number = value.as<JSON::Number>().as<double>();
  return std::floor(number) == number;
}


bool hasKind(const JSON::Value& value, Kind kind)
{
  switch (kind) {
    case OBJECT:  return value.is<JSON::Object>();
    case ARRAY:   return value.is<JSON::Array>();
    case STRING:  return value.is<JSON::String>();
    case BOOLEAN: return value.is<JSON::Boolean>();
    case INTEGER: return isInteger(value);
  }

  UNREACHABLE();
}


// Formats `value` for error messages: strings are quoted, integral
// numbers are printed without fraction.
string repr(const JSON::Value& value)
{
  if (value.is<JSON::String>()) {
    return "'" + value.as<JSON::String>().value + "'";
  }

  if (isInteger(value)) {
    return stringify(
        static_cast<int64_t>(value.as<JSON::Number>().as<double>()));
  }

  return stringify(value);
}


string child(const string& path, const string& key)
{
  return path.empty() ? key : path + "/" + key;
}


LayoutError invalid(const string& path, const string& reason)
{
  return LayoutError(
      LayoutError::CONFIG,
      "Invalid config at " + (path.empty() ? string("top level") : path) +
      ": " + reason);
}


Option<LayoutError> validateKind(
    const JSON::Value& value,
    const string& path,
    Kind kind)
{
  if (!hasKind(value, kind)) {
    return invalid(
        path, repr(value) + " is not of type '" + kindName(kind) + "'");
  }

  return None();
}


// The allowed values are given formatted with `repr`.
Option<LayoutError> validateChoice(
    const JSON::Value& value,
    const string& path,
    const vector<string>& choices)
{
  if (std::find(choices.begin(), choices.end(), repr(value)) !=
      choices.end()) {
    return None();
  }

  return invalid(
      path,
      repr(value) + " is not one of [" + strings::join(", ", choices) + "]");
}


// Checks that every key in `required` is present and that there is
// no key outside of `allowed`.
Option<LayoutError> validateKeys(
    const JSON::Object& object,
    const string& path,
    const vector<string>& required,
    const vector<string>& allowed)
{
  foreach (const string& key, required) {
    if (object.values.count(key) == 0) {
      return invalid(path, "'" + key + "' is a required property");
    }
  }

  foreachkey (const string& key, object.values) {
    if (std::find(allowed.begin(), allowed.end(), key) == allowed.end()) {
      return invalid(
          path,
          "Additional properties are not allowed ('" + key +
          "' was unexpected)");
    }
  }

  return None();
}


// Checks the type of `key` in `object`, if present.
Option<LayoutError> validateField(
    const JSON::Object& object,
    const string& path,
    const string& key,
    Kind kind)
{
  auto value = object.values.find(key);
  if (value == object.values.end()) {
    return None();
  }

  return validateKind(value->second, child(path, key), kind);
}


Option<LayoutError> validateChoiceField(
    const JSON::Object& object,
    const string& path,
    const string& key,
    Kind kind,
    const vector<string>& choices)
{
  auto value = object.values.find(key);
  if (value == object.values.end()) {
    return None();
  }

  Option<LayoutError> error =
    validateKind(value->second, child(path, key), kind);
  if (error.isSome()) {
    return error;
  }

  return validateChoice(value->second, child(path, key), choices);
}


// Checks that `key`, if present, is an array of strings.
Option<LayoutError> validateNames(
    const JSON::Object& object,
    const string& path,
    const string& key)
{
  Option<LayoutError> error = validateField(object, path, key, ARRAY);
  if (error.isSome() || object.values.count(key) == 0) {
    return error;
  }

  const JSON::Array& names = object.values.at(key).as<JSON::Array>();

  for (size_t i = 0; i < names.values.size(); i++) {
    error = validateKind(
        names.values[i], child(child(path, key), stringify(i)), STRING);

    if (error.isSome()) {
      return error;
    }
  }

  return None();
}


// Validates the objects of the array `key` of `object` with `f`.
template <typename F>
Option<LayoutError> validateItems(
    const JSON::Object& object,
    const string& path,
    const string& key,
    F f)
{
  Option<LayoutError> error = validateField(object, path, key, ARRAY);
  if (error.isSome() || object.values.count(key) == 0) {
    return error;
  }

  const JSON::Array& items = object.values.at(key).as<JSON::Array>();

  for (size_t i = 0; i < items.values.size(); i++) {
    const string itemPath = child(child(path, key), stringify(i));

    error = validateKind(items.values[i], itemPath, OBJECT);
    if (error.isSome()) {
      return error;
    }

    error = f(items.values[i].as<JSON::Object>(), itemPath);
    if (error.isSome()) {
      return error;
    }
  }

  return None();
}


// A partition of a disk or a logical volume of a volume group.
Option<LayoutError> validateVolume(
    const JSON::Object& volume,
    const string& path,
    bool partition)
{
  vector<string> allowed = {"name", "size", "fs"};
  if (partition) {
    allowed.push_back("bootable");
  }

  Option<LayoutError> error =
    validateKeys(volume, path, {"name", "size"}, allowed);

  if (error.isNone()) {
    error = validateField(volume, path, "name", STRING);
  }

  if (error.isNone()) {
    error = validateField(volume, path, "size", STRING);
  }

  if (error.isNone()) {
    error = validateField(volume, path, "fs", STRING);
  }

  if (error.isNone() && partition) {
    error = validateField(volume, path, "bootable", BOOLEAN);
  }

  return error;
}


Option<LayoutError> validateDisk(const JSON::Object& disk, const string& path)
{
  Option<LayoutError> error = validateKeys(
      disk, path, {"type"}, {"type", "ptable", "boot", "partitions", "fs"});

  if (error.isNone()) {
    error = validateChoiceField(
        disk, path, "ptable", STRING, {"'gpt'", "'mbr'"});
  }

  if (error.isNone()) {
    error = validateField(disk, path, "boot", BOOLEAN);
  }

  if (error.isNone()) {
    error = validateItems(
        disk,
        path,
        "partitions",
        [](const JSON::Object& partition, const string& path) {
          return validateVolume(partition, path, true);
        });
  }

  if (error.isNone()) {
    error = validateField(disk, path, "fs", STRING);
  }

  return error;
}


Option<LayoutError> validateRaid(const JSON::Object& raid, const string& path)
{
  Option<LayoutError> error = validateKeys(
      raid,
      path,
      {"type", "level", "members"},
      {"type", "level", "members", "spares", "fs"});

  if (error.isNone()) {
    error = validateChoiceField(
        raid,
        path,
        "level",
        INTEGER,
        {"0", "1", "5", "6", "10"});
  }

  if (error.isNone()) {
    error = validateNames(raid, path, "members");
  }

  if (error.isNone()) {
    error = validateNames(raid, path, "spares");
  }

  if (error.isNone()) {
    error = validateField(raid, path, "fs", STRING);
  }

  return error;
}


Option<LayoutError> validateLvm(const JSON::Object& lvm, const string& path)
{
  Option<LayoutError> error = validateKeys(
      lvm, path, {"type", "members"}, {"type", "members", "volumes"});

  if (error.isNone()) {
    error = validateNames(lvm, path, "members");
  }

  if (error.isNone()) {
    error = validateItems(
        lvm,
        path,
        "volumes",
        [](const JSON::Object& volume, const string& path) {
          return validateVolume(volume, path, false);
        });
  }

  return error;
}


Option<LayoutError> validateBcache(
    const JSON::Object& bcache,
    const string& path)
{
  Option<LayoutError> error = validateKeys(
      bcache,
      path,
      {"type", "backing-device", "cache-device"},
      {"type", "backing-device", "cache-device", "cache-mode", "fs"});

  if (error.isNone()) {
    error = validateField(bcache, path, "backing-device", STRING);
  }

  if (error.isNone()) {
    error = validateField(bcache, path, "cache-device", STRING);
  }

  if (error.isNone()) {
    error = validateChoiceField(
        bcache,
        path,
        "cache-mode",
        STRING,
        {"'writeback'", "'writethrough'", "'writearound'"});
  }

  if (error.isNone()) {
    error = validateField(bcache, path, "fs", STRING);
  }

  return error;
}


Option<LayoutError> validateSpecial(
    const JSON::Object& special,
    const string& path)
{
  Option<LayoutError> error =
    validateKeys(special, path, {"type", "fs"}, {"type", "fs"});

  if (error.isNone()) {
    error = validateField(special, path, "fs", STRING);
  }

  return error;
}


Option<LayoutError> validateEntry(const JSON::Value& value, const string& path)
{
  Option<LayoutError> error = validateKind(value, path, OBJECT);
  if (error.isSome()) {
    return error;
  }

  const JSON::Object& entry = value.as<JSON::Object>();

  if (entry.values.count("type") == 0) {
    return invalid(path, "'type' is a required property");
  }

  error = validateField(entry, path, "type", STRING);
  if (error.isSome()) {
    return error;
  }

  const string& type = entry.values.at("type").as<JSON::String>().value;

  if (type == "disk") {
    return validateDisk(entry, path);
  } else if (type == "raid") {
    return validateRaid(entry, path);
  } else if (type == "lvm") {
    return validateLvm(entry, path);
  } else if (type == "bcache") {
    return validateBcache(entry, path);
  } else if (type == "special") {
    return validateSpecial(entry, path);
  }

  // Unsupported types are reported when the layout is compiled.
  return None();
}


Option<LayoutError> validateMount(const JSON::Value& value, const string& path)
{
  Option<LayoutError> error = validateKind(value, path, OBJECT);
  if (error.isSome()) {
    return error;
  }

  const JSON::Object& mount = value.as<JSON::Object>();

  error = validateKeys(mount, path, {"device"}, {"device", "options"});

  if (error.isNone()) {
    error = validateField(mount, path, "device", STRING);
  }

  if (error.isNone()) {
    error = validateField(mount, path, "options", STRING);
  }

  return error;
}

} // namespace {


Option<LayoutError> validateConfig(const JSON::Object& config)
{
  Option<LayoutError> error =
    validateKeys(config, "", {"layout", "mounts"}, {"layout", "mounts"});

  if (error.isNone()) {
    error = validateField(config, "", "layout", OBJECT);
  }

  if (error.isNone()) {
    error = validateField(config, "", "mounts", OBJECT);
  }

  if (error.isSome()) {
    return error;
  }

  const JSON::Object& layout = config.values.at("layout").as<JSON::Object>();

  foreachpair (const string& name, const JSON::Value& entry, layout.values) {
    error = validateEntry(entry, child("layout", name));
    if (error.isSome()) {
      return error;
    }
  }

  const JSON::Object& mounts = config.values.at("mounts").as<JSON::Object>();

  foreachpair (const string& path, const JSON::Value& mount, mounts.values) {
    error = validateMount(mount, child("mounts", path));
    if (error.isSome()) {
      return error;
    }
  }

  return None();
}

} // namespace storage {
} // namespace internal {
} // namespace bootsync {
