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
#include <tuple>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/strings.hpp>

#include "images/product.hpp"
#include "images/validation.hpp"

using std::string;
using std::tuple;
using std::vector;

namespace bootsync {
namespace internal {
namespace images {

// Product name prefix of the MAAS image streams, e.g.
// "com.ubuntu.maas" or "com.ubuntu.maas.daily".
static bool isMaasPrefix(const string& prefix)
{
  return prefix == "com.ubuntu.maas" ||
         strings::startsWith(prefix, "com.ubuntu.maas.");
}


static bool validateBootloader(
    const JSON::Object& data,
    const vector<string>& parts)
{
  // (os, bootloader-type, arch).
  static const vector<tuple<string, string, string>> bootloaders = {
    std::make_tuple("pxelinux", "pxe", "i386"),
    std::make_tuple("grub-efi-signed", "uefi", "amd64"),
    std::make_tuple("grub-efi", "uefi", "arm64"),
    std::make_tuple("grub-ieee1275", "open-firmware", "ppc64el"),
  };

  if (parts.size() != 5 || !isMaasPrefix(parts[0]) || parts[1] != "1") {
    return false;
  }

  const Option<string> os = getString(data, "os");
  const Option<string> type = getString(data, "bootloader-type");
  const Option<string> arch = getString(data, "arch");

  if (os.isNone() || type.isNone() || arch.isNone()) {
    return false;
  }

  // The name is `<prefix>:1:<os>:<bootloader-type>:<arch>`.
  if (parts[2] != os.get() || parts[3] != type.get() ||
      parts[4] != arch.get()) {
    return false;
  }

  foreach (const auto& bootloader, bootloaders) {
    if (std::get<0>(bootloader) == os.get() &&
        std::get<1>(bootloader) == type.get() &&
        std::get<2>(bootloader) == arch.get()) {
      return true;
    }
  }

  return false;
}


bool validateProduct(const JSON::Object& data, const string& productName)
{
  const vector<string> parts = strings::split(productName, ":");

  if (data.values.count("bootloader-type") > 0) {
    return validateBootloader(data, parts);
  }

  const Option<string> os = getString(data, "os");

  if (os == "ubuntu") {
    return parts.size() == 6 &&
           isMaasPrefix(parts[0]) &&
           (parts[1] == "v2" || parts[1] == "v3" ||
            parts[1] == "v3+platform") &&
           parts[2] == "boot";
  }

  if (os == "ubuntu-core") {
    return parts.size() == 6 &&
           isMaasPrefix(parts[0]) &&
           parts[1] == "v4";
  }

  return true;
}

} // namespace images {
} // namespace internal {
} // namespace bootsync {
