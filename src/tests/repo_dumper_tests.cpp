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

#include <gtest/gtest.h>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/hashset.hpp>
#include <stout/json.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <stout/tests/utils.hpp>

#include "images/image_spec.hpp"
#include "images/mapping.hpp"
#include "images/product.hpp"
#include "images/repo_dumper.hpp"

using bootsync::internal::images::BootImageMapping;
using bootsync::internal::images::ImageSpec;
using bootsync::internal::images::LocalStreamReader;
using bootsync::internal::images::RepoDumper;
using bootsync::internal::images::cleanUpRepoItem;
using bootsync::internal::images::getString;

using std::pair;
using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace tests {

// Returns the image specs of `mapping`.
static hashset<ImageSpec> specs(const BootImageMapping& mapping)
{
  hashset<ImageSpec> result;

  typedef pair<ImageSpec, JSON::Object> Item;
  foreach (const Item& item, mapping.items()) {
    result.insert(item.first);
  }

  return result;
}


// A flattened simplestreams item, as returned by `productsExdata`.
static JSON::Object makeItem(
    const string& os,
    const string& release,
    const string& arch,
    const string& subarch,
    const vector<string>& subarches,
    const string& label,
    const Option<string>& version = None())
{
  JSON::Object item;
  item.values["content_id"] = "com.ubuntu.maas:stable:v3:download";
  item.values["product_name"] = "product-" + os + "-" + subarch;
  item.values["version_name"] = "20240301";
  item.values["path"] = path::join(release, arch, subarch, "boot-kernel");
  item.values["os"] = os;
  item.values["release"] = release;
  item.values["arch"] = arch;
  item.values["subarch"] = subarch;
  item.values["subarches"] = strings::join(",", subarches);
  item.values["label"] = label;

  if (version.isSome()) {
    item.values["version"] = version.get();
  }

  return item;
}


TEST(BootImageMappingTest, SetIfAbsent)
{
  BootImageMapping mapping;
  EXPECT_TRUE(mapping.empty());

  const ImageSpec spec("ubuntu", "amd64", "generic", "generic", "jammy", "*");

  JSON::Object first;
  first.values["path"] = "first";

  JSON::Object second;
  second.values["path"] = "second";

  EXPECT_TRUE(mapping.setIfAbsent(spec, first));
  EXPECT_FALSE(mapping.setIfAbsent(spec, second));
  EXPECT_SOME_EQ(first, mapping.get(spec));

  mapping.set(spec, second);
  EXPECT_SOME_EQ(second, mapping.get(spec));

  EXPECT_EQ(1u, mapping.size());
  EXPECT_TRUE(mapping.contains(spec));
  EXPECT_FALSE(mapping.contains(
      ImageSpec("ubuntu", "amd64", "generic", "generic", "noble", "*")));
}


TEST(BootImageMappingTest, DumpJson)
{
  BootImageMapping mapping;

  JSON::Object jammy;
  jammy.values["path"] = "jammy";

  JSON::Object noble;
  noble.values["path"] = "noble";

  mapping.set(
      ImageSpec("ubuntu", "amd64", "generic", "generic", "jammy", "stable"),
      jammy);

  mapping.set(
      ImageSpec("ubuntu", "amd64", "generic", "generic", "noble", "stable"),
      noble);

  Try<JSON::Object> expected = JSON::parse<JSON::Object>(
      "{"
      "  \"ubuntu\": {"
      "    \"amd64\": {"
      "      \"generic\": {"
      "        \"generic\": {"
      "          \"jammy\": {\"stable\": {\"path\": \"jammy\"}},"
      "          \"noble\": {\"stable\": {\"path\": \"noble\"}}"
      "        }"
      "      }"
      "    }"
      "  }"
      "}");

  ASSERT_SOME(expected);
  EXPECT_EQ(expected.get(), mapping.dumpJson());

  EXPECT_EQ(JSON::Object(), BootImageMapping().dumpJson());
}


TEST(RepoDumperTest, InsertItemAddsItemPerSubarch)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping);

  const JSON::Object item = makeItem(
      "centos", "centos70", "amd64", "hwe-x", {"generic", "hwe-x"}, "daily");

  dumper.insertItem(item, "centos:7");

  hashset<ImageSpec> expected;
  expected.insert(
      ImageSpec("centos", "amd64", "generic", "generic", "centos70", "daily"));
  expected.insert(
      ImageSpec("centos", "amd64", "hwe-x", "generic", "centos70", "daily"));

  EXPECT_EQ(expected, specs(mapping));

  EXPECT_SOME_EQ(
      cleanUpRepoItem(item),
      mapping.get(
          ImageSpec("centos", "amd64", "hwe-x", "generic", "centos70",
                    "daily")));
}


// The item built for a subarchitecture replaces the compatible item
// which was inserted first.
TEST(RepoDumperTest, InsertItemSetsCompatItemSpecificToSubarch)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping);

  const JSON::Object item = makeItem(
      "centos", "centos70", "amd64", "a", {"a", "b", "c"}, "daily");

  const JSON::Object compat = makeItem(
      "centos", "centos70", "amd64", "c", {"c"}, "daily");

  dumper.insertItem(item, "centos:7:a");
  dumper.insertItem(compat, "centos:7:c");

  const ImageSpec spec("centos", "amd64", "c", "generic", "centos70", "daily");

  EXPECT_SOME_EQ(cleanUpRepoItem(compat), mapping.get(spec));

  // The other subarchitectures still map to the first item.
  EXPECT_SOME_EQ(
      cleanUpRepoItem(item),
      mapping.get(
          ImageSpec("centos", "amd64", "b", "generic", "centos70", "daily")));
}


TEST(RepoDumperTest, InsertItemSetsGenericToReleaseItemForHweLetter)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping);

  const JSON::Object hwep = makeItem(
      "ubuntu", "precise", "amd64", "hwe-p", {"generic", "hwe-p"}, "release",
      string("12.04"));

  const JSON::Object hwes = makeItem(
      "ubuntu", "precise", "amd64", "hwe-s", {"generic", "hwe-p", "hwe-s"},
      "release", string("12.04"));

  const string productName = "com.ubuntu.maas.daily:v3:boot:12.04:amd64:hwe-p";

  dumper.insertItem(hwep, productName);
  dumper.insertItem(hwes, productName);

  const ImageSpec generic(
      "ubuntu", "amd64", "generic", "generic", "precise", "release");

  EXPECT_SOME_EQ(cleanUpRepoItem(hwep), mapping.get(generic));
}


// A newer HWE kernel supporting "generic" does not replace the kernel
// the release shipped with.
TEST(RepoDumperTest, InsertItemSetsGenericToReleaseItemForGaVersion)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping);

  const JSON::Object ga = makeItem(
      "ubuntu", "xenial", "amd64", "ga-16.04", {"generic", "ga-16.04"},
      "release", string("16.04"));

  const JSON::Object hwe = makeItem(
      "ubuntu", "xenial", "amd64", "hwe-16.10",
      {"generic", "ga-16.04", "hwe-16.10"}, "release", string("16.04"));

  dumper.insertItem(
      ga, "com.ubuntu.maas.daily:v3:boot:16.04:amd64:ga-16.04");
  dumper.insertItem(
      hwe, "com.ubuntu.maas.daily:v3:boot:16.04:amd64:hwe-16.10");

  EXPECT_SOME_EQ(
      cleanUpRepoItem(ga),
      mapping.get(ImageSpec(
          "ubuntu", "amd64", "generic", "generic", "xenial", "release")));

  EXPECT_SOME_EQ(
      cleanUpRepoItem(ga),
      mapping.get(ImageSpec(
          "ubuntu", "amd64", "ga-16.04", "generic", "xenial", "release")));

  EXPECT_SOME_EQ(
      cleanUpRepoItem(hwe),
      mapping.get(ImageSpec(
          "ubuntu", "amd64", "hwe-16.10", "generic", "xenial", "release")));
}


// The kernel the release shipped with takes "generic" over from a
// newer HWE kernel inserted before it.
TEST(RepoDumperTest, InsertItemReplacesGenericOfNewerHweKernel)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping);

  const JSON::Object hwe = makeItem(
      "ubuntu", "xenial", "amd64", "hwe-16.10",
      {"generic", "ga-16.04", "hwe-16.10"}, "release", string("16.04"));

  const JSON::Object ga = makeItem(
      "ubuntu", "xenial", "amd64", "ga-16.04", {"generic", "ga-16.04"},
      "release", string("16.04"));

  dumper.insertItem(
      hwe, "com.ubuntu.maas.daily:v3:boot:16.04:amd64:hwe-16.10");

  const ImageSpec generic(
      "ubuntu", "amd64", "generic", "generic", "xenial", "release");

  EXPECT_SOME_EQ(cleanUpRepoItem(hwe), mapping.get(generic));

  dumper.insertItem(
      ga, "com.ubuntu.maas.daily:v3:boot:16.04:amd64:ga-16.04");

  EXPECT_SOME_EQ(cleanUpRepoItem(ga), mapping.get(generic));

  EXPECT_SOME_EQ(
      cleanUpRepoItem(ga),
      mapping.get(ImageSpec(
          "ubuntu", "amd64", "ga-16.04", "generic", "xenial", "release")));

  EXPECT_SOME_EQ(
      cleanUpRepoItem(hwe),
      mapping.get(ImageSpec(
          "ubuntu", "amd64", "hwe-16.10", "generic", "xenial", "release")));
}


TEST(RepoDumperTest, InsertItemSetsReleaseToBootloaderType)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping);

  JSON::Object item = makeItem(
      "grub-efi-signed", "ignored", "amd64", "generic", {"generic"}, "stable");
  item.values["bootloader-type"] = "uefi";

  dumper.insertItem(
      item, "com.ubuntu.maas.daily:1:grub-efi-signed:uefi:amd64");

  hashset<ImageSpec> expected;
  expected.insert(ImageSpec(
      "grub-efi-signed", "amd64", "generic", "bootloader", "uefi", "stable"));

  EXPECT_EQ(expected, specs(mapping));
}


TEST(RepoDumperTest, InsertItemUbuntuCore)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping);

  JSON::Object item = makeItem(
      "ubuntu-core", "16", "amd64", "generic", {"generic"}, "stable");
  item.values["gadget_snap"] = "pc";
  item.values["kernel_snap"] = "pc-kernel";

  dumper.insertItem(item, "com.ubuntu.maas.daily:v4:16:amd64:pc:stable");

  hashset<ImageSpec> expected;
  expected.insert(
      ImageSpec("ubuntu-core", "amd64", "pc", "pc-kernel", "16", "stable"));

  EXPECT_EQ(expected, specs(mapping));
}


TEST(RepoDumperTest, InsertItemValidates)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping);

  const JSON::Object item = makeItem(
      "ubuntu", "jammy", "amd64", "ga-22.04", {"generic", "ga-22.04"},
      "stable");

  dumper.insertItem(item, "product_name-a1b2c3");

  EXPECT_TRUE(mapping.empty());
}


TEST(RepoDumperTest, InsertItemDoesntValidateWhenInstructed)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping, false);

  const JSON::Object item = makeItem(
      "ubuntu", "jammy", "amd64", "ga-22.04", {"generic", "ga-22.04"},
      "stable");

  dumper.insertItem(item, "product_name-a1b2c3");

  hashset<ImageSpec> expected;
  expected.insert(
      ImageSpec("ubuntu", "amd64", "generic", "generic", "jammy", "stable"));
  expected.insert(
      ImageSpec("ubuntu", "amd64", "ga-22.04", "generic", "jammy", "stable"));

  EXPECT_EQ(expected, specs(mapping));
}


TEST(RepoDumperTest, InsertItemDefaults)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping, false);

  JSON::Object item;
  item.values["arch"] = "amd64";
  item.values["release"] = "jammy";

  dumper.insertItem(item, "product");

  hashset<ImageSpec> expected;
  expected.insert(
      ImageSpec("ubuntu", "amd64", "generic", "generic", "jammy", "*"));

  EXPECT_EQ(expected, specs(mapping));
}


TEST(RepoDumperTest, InsertItemWithoutArchitecture)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping, false);

  JSON::Object item;
  item.values["release"] = "jammy";

  dumper.insertItem(item, "product");

  EXPECT_TRUE(mapping.empty());
}


class RepoDumperSyncTest : public TemporaryDirectoryTest {};


TEST_F(RepoDumperSyncTest, Sync)
{
  ASSERT_SOME(os::mkdir(path::join(sandbox.get(), "streams", "v1")));

  ASSERT_SOME(os::write(
      path::join(sandbox.get(), "streams", "v1", "index.json"),
      "{"
      "  \"format\": \"index:1.0\","
      "  \"index\": {"
      "    \"com.ubuntu.maas:stable:v3:download\": {"
      "      \"format\": \"products:1.0\","
      "      \"path\": \"streams/v1/download.json\""
      "    }"
      "  }"
      "}"));

  ASSERT_SOME(os::write(
      path::join(sandbox.get(), "streams", "v1", "download.json"),
      "{"
      "  \"content_id\": \"com.ubuntu.maas:stable:v3:download\","
      "  \"format\": \"products:1.0\","
      "  \"products\": {"
      "    \"com.ubuntu.maas.stable:v3:boot:22.04:amd64:ga-22.04\": {"
      "      \"arch\": \"amd64\","
      "      \"kflavor\": \"generic\","
      "      \"label\": \"stable\","
      "      \"os\": \"ubuntu\","
      "      \"release\": \"jammy\","
      "      \"subarch\": \"ga-22.04\","
      "      \"subarches\": \"generic,ga-22.04\","
      "      \"version\": \"22.04\","
      "      \"versions\": {"
      "        \"20240101\": {"
      "          \"items\": {"
      "            \"boot-kernel\": {\"path\": \"old/boot-kernel\"}"
      "          }"
      "        },"
      "        \"20240301\": {"
      "          \"items\": {"
      "            \"boot-kernel\": {\"path\": \"new/boot-kernel\"}"
      "          }"
      "        }"
      "      }"
      "    },"
      "    \"com.ubuntu.maas.stable:1:grub-efi-signed:uefi:amd64\": {"
      "      \"arch\": \"amd64\","
      "      \"bootloader-type\": \"uefi\","
      "      \"label\": \"stable\","
      "      \"os\": \"grub-efi-signed\","
      "      \"versions\": {"
      "        \"20240301\": {"
      "          \"items\": {"
      "            \"grub\": {\"path\": \"grub/grubx64.efi\"}"
      "          }"
      "        }"
      "      }"
      "    },"
      "    \"com.ubuntu.maas.stable:v5:boot:24.04:amd64:ga-24.04\": {"
      "      \"arch\": \"amd64\","
      "      \"os\": \"ubuntu\","
      "      \"release\": \"noble\","
      "      \"versions\": {"
      "        \"20240301\": {"
      "          \"items\": {"
      "            \"boot-kernel\": {\"path\": \"noble/boot-kernel\"}"
      "          }"
      "        }"
      "      }"
      "    }"
      "  }"
      "}"));

  BootImageMapping mapping;
  RepoDumper dumper(&mapping);
  LocalStreamReader reader(sandbox.get());

  ASSERT_SOME(dumper.sync(&reader, "streams/v1/index.json"));

  hashset<ImageSpec> expected;
  expected.insert(
      ImageSpec("ubuntu", "amd64", "generic", "generic", "jammy", "stable"));
  expected.insert(
      ImageSpec("ubuntu", "amd64", "ga-22.04", "generic", "jammy", "stable"));
  expected.insert(ImageSpec(
      "grub-efi-signed", "amd64", "generic", "bootloader", "uefi", "stable"));

  EXPECT_EQ(expected, specs(mapping));

  Option<JSON::Object> metadata = mapping.get(
      ImageSpec("ubuntu", "amd64", "generic", "generic", "jammy", "stable"));

  ASSERT_SOME(metadata);

  // Only the newest version is used.
  EXPECT_SOME_EQ("new/boot-kernel", getString(metadata.get(), "path"));
  EXPECT_SOME_EQ("20240301", getString(metadata.get(), "version_name"));
  EXPECT_SOME_EQ(
      "com.ubuntu.maas:stable:v3:download",
      getString(metadata.get(), "content_id"));
}


TEST_F(RepoDumperSyncTest, SyncPropagatesIOError)
{
  BootImageMapping mapping;
  RepoDumper dumper(&mapping);
  LocalStreamReader reader(sandbox.get());

  EXPECT_ERROR(dumper.sync(&reader, "streams/v1/index.json"));
  EXPECT_TRUE(mapping.empty());
}


TEST_F(RepoDumperSyncTest, SyncRejectsUnknownFormat)
{
  ASSERT_SOME(os::write(
      path::join(sandbox.get(), "index.json"),
      "{\"format\": \"index:2.0\"}"));

  BootImageMapping mapping;
  RepoDumper dumper(&mapping);
  LocalStreamReader reader(sandbox.get());

  EXPECT_ERROR(dumper.sync(&reader, "index.json"));
}


TEST_F(RepoDumperSyncTest, SyncRejectsInvalidJson)
{
  ASSERT_SOME(os::write(path::join(sandbox.get(), "index.json"), "{"));

  BootImageMapping mapping;
  RepoDumper dumper(&mapping);
  LocalStreamReader reader(sandbox.get());

  EXPECT_ERROR(dumper.sync(&reader, "index.json"));
}

} // namespace tests {
} // namespace internal {
} // namespace bootsync {
