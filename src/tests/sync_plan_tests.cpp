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

#include <stdint.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <bootsync/bootsync.hpp>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include "resources/sync_plan.hpp"

using bootsync::internal::resources::MAX_SOURCES;
using bootsync::internal::resources::bootloaderExtractPath;
using bootsync::internal::resources::downloadJobId;
using bootsync::internal::resources::makeDownloadParam;
using bootsync::internal::resources::mergeDownloads;
using bootsync::internal::resources::planRegionSync;
using bootsync::internal::resources::planUpstream;

using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace tests {

static const string SHA_A =
  "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";

static const string SHA_B =
  "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";


static ResourceDownloadParam makeParam(
    int64_t id,
    const string& sha256,
    const vector<string>& sources = vector<string>())
{
  ResourceDownloadParam param;
  param.add_rfile_ids(id);
  param.set_sha256(sha256);
  param.set_filename_on_disk(sha256.substr(0, 7));
  param.set_total_size(1024);

  foreach (const string& source, sources) {
    param.add_source_list(source);
  }

  return param;
}


static vector<string> sourceList(const ResourceDownloadParam& param)
{
  return vector<string>(
      param.source_list().begin(),
      param.source_list().end());
}


TEST(SyncPlanTest, BootloaderExtractPath)
{
  EXPECT_EQ("bootloaders/uefi/amd64", bootloaderExtractPath("uefi", "amd64"));
  EXPECT_EQ(
      "bootloaders/uefi/amd64",
      bootloaderExtractPath("uefi", "amd64/generic"));
  EXPECT_EQ(
      "bootloaders/open-firmware/ppc64el",
      bootloaderExtractPath("open-firmware", "ppc64el/generic"));
}


TEST(SyncPlanTest, MakeDownloadParam)
{
  BootResource resource;
  resource.set_id(1);
  resource.set_name("grub-efi-signed/uefi");
  resource.set_architecture("amd64/generic");
  resource.set_bootloader_type("uefi");

  BootResourceFile archive;
  archive.set_id(10);
  archive.set_resource_set_id(5);
  archive.set_filename("grub2-signed.tar.xz");
  archive.set_type(BootResourceFile::ARCHIVE_TAR_XZ);
  archive.set_sha256(SHA_A);
  archive.set_filename_on_disk(SHA_A.substr(0, 7));
  archive.set_size(2048);

  ResourceDownloadParam download =
    makeDownloadParam(resource, archive, {"http://images/a/"});

  ASSERT_EQ(1, download.rfile_ids_size());
  EXPECT_EQ(10, download.rfile_ids(0));
  EXPECT_EQ(SHA_A, download.sha256());
  EXPECT_EQ("aaaaaaa", download.filename_on_disk());
  EXPECT_EQ(2048u, download.total_size());
  EXPECT_EQ(vector<string>({"http://images/a/"}), sourceList(download));
  ASSERT_EQ(1, download.extract_paths_size());
  EXPECT_EQ("bootloaders/uefi/amd64", download.extract_paths(0));

  // Only bootloader archives are extracted.
  BootResourceFile kernel = archive;
  kernel.set_type(BootResourceFile::BOOT_KERNEL);

  EXPECT_EQ(
      0,
      makeDownloadParam(resource, kernel, {}).extract_paths_size());

  resource.clear_bootloader_type();

  EXPECT_EQ(
      0,
      makeDownloadParam(resource, archive, {}).extract_paths_size());
}


TEST(SyncPlanTest, MergeDownloads)
{
  vector<ResourceDownloadParam> params = {
    makeParam(1, SHA_A, {"http://upstream/a"}),
    makeParam(2, SHA_B, {"http://upstream/b"}),
    makeParam(3, SHA_A, {"http://mirror/a"}),
  };

  params[2].add_extract_paths("bootloaders/uefi/amd64");

  Try<vector<ResourceDownloadParam>> merged = mergeDownloads(params);
  ASSERT_SOME(merged);
  ASSERT_EQ(2u, merged->size());

  const ResourceDownloadParam& a = merged->at(0);
  EXPECT_EQ(SHA_A, a.sha256());
  ASSERT_EQ(2, a.rfile_ids_size());
  EXPECT_EQ(1, a.rfile_ids(0));
  EXPECT_EQ(3, a.rfile_ids(1));
  EXPECT_EQ(
      vector<string>({"http://upstream/a", "http://mirror/a"}),
      sourceList(a));
  ASSERT_EQ(1, a.extract_paths_size());

  const ResourceDownloadParam& b = merged->at(1);
  EXPECT_EQ(SHA_B, b.sha256());
  EXPECT_EQ(1, b.rfile_ids_size());
}


TEST(SyncPlanTest, MergeDownloadsFilenameCollision)
{
  ResourceDownloadParam a = makeParam(1, SHA_A);

  // Same short name, different content.
  ResourceDownloadParam b = makeParam(2, "aaaaaaab" + SHA_A.substr(8));

  Try<vector<ResourceDownloadParam>> merged = mergeDownloads({a, b});
  ASSERT_ERROR(merged);
  EXPECT_TRUE(strings::contains(merged.error(), "'aaaaaaa'"));
}


TEST(SyncPlanTest, DownloadJobId)
{
  EXPECT_EQ(
      "download-bootresource:upstream:aaaaaaaaaaaa",
      downloadJobId(None(), SHA_A));

  EXPECT_EQ(
      "download-bootresource:region-1:bbbbbbbbbbbb",
      downloadJobId(string("region-1"), SHA_B));
}


TEST(SyncPlanTest, PlanUpstream)
{
  vector<ResourceDownloadParam> params = {
    makeParam(1, SHA_A, {"http://upstream/a"}),
    makeParam(2, SHA_B),
  };

  vector<DownloadJob> jobs = planUpstream(params, string("http://proxy:3128"));

  // Files without a source are skipped.
  ASSERT_EQ(1u, jobs.size());
  EXPECT_EQ("download-bootresource:upstream:aaaaaaaaaaaa", jobs[0].id());
  EXPECT_FALSE(jobs[0].has_region());
  EXPECT_EQ(SHA_A, jobs[0].resource().sha256());
  EXPECT_EQ("http://proxy:3128", jobs[0].resource().http_proxy());

  jobs = planUpstream(params);

  ASSERT_EQ(1u, jobs.size());
  EXPECT_FALSE(jobs[0].resource().has_http_proxy());
}


TEST(SyncPlanTest, PlanRegionSyncSingleRegion)
{
  hashmap<string, vector<string>> endpoints;
  endpoints.put("region-1", {"http://10.0.0.1:5240/MAAS/boot-resources/"});

  hashmap<int64_t, hashset<string>> synced;

  EXPECT_TRUE(
      planRegionSync({makeParam(1, SHA_A)}, endpoints, synced, 0).empty());
}


TEST(SyncPlanTest, PlanRegionSync)
{
  hashmap<string, vector<string>> endpoints;
  endpoints.put("region-1", {"http://10.0.0.1:5240/MAAS/boot-resources/"});
  endpoints.put("region-2", {"http://10.0.0.2:5240/MAAS/boot-resources/"});
  endpoints.put("region-3", {"http://10.0.0.3:5240/MAAS/boot-resources/"});

  hashmap<int64_t, hashset<string>> synced;
  synced[1].insert("region-1");
  synced[2].insert("region-1");
  synced[2].insert("region-2");
  synced[2].insert("region-3");

  vector<ResourceDownloadParam> params = {
    makeParam(1, SHA_A),
    makeParam(2, SHA_B),
  };

  vector<DownloadJob> jobs = planRegionSync(params, endpoints, synced, 42);

  // The second file is on every region already.
  ASSERT_EQ(2u, jobs.size());

  EXPECT_EQ("download-bootresource:region-2:aaaaaaaaaaaa", jobs[0].id());
  EXPECT_EQ("region-2", jobs[0].region());
  EXPECT_EQ("download-bootresource:region-3:aaaaaaaaaaaa", jobs[1].id());
  EXPECT_EQ("region-3", jobs[1].region());

  foreach (const DownloadJob& job, jobs) {
    EXPECT_EQ(SHA_A, job.resource().sha256());
    EXPECT_EQ(
        vector<string>({
            "http://10.0.0.1:5240/MAAS/boot-resources/aaaaaaa/"}),
        sourceList(job.resource()));
  }
}


// A file made of several boot resource files is only complete on a
// region holding all of them.
TEST(SyncPlanTest, PlanRegionSyncMergedFiles)
{
  hashmap<string, vector<string>> endpoints;
  endpoints.put("region-1", {"http://10.0.0.1:5240/MAAS/boot-resources/"});
  endpoints.put("region-2", {"http://10.0.0.2:5240/MAAS/boot-resources/"});

  hashmap<int64_t, hashset<string>> synced;
  synced[1].insert("region-1");
  synced[1].insert("region-2");
  synced[2].insert("region-1");

  ResourceDownloadParam merged = makeParam(1, SHA_A);
  merged.add_rfile_ids(2);

  vector<DownloadJob> jobs = planRegionSync({merged}, endpoints, synced, 0);

  ASSERT_EQ(1u, jobs.size());
  EXPECT_EQ("region-2", jobs[0].region());
  ASSERT_EQ(2, jobs[0].resource().rfile_ids_size());
}


TEST(SyncPlanTest, PlanRegionSyncNoCompleteCopy)
{
  hashmap<string, vector<string>> endpoints;
  endpoints.put("region-1", {"http://10.0.0.1:5240/MAAS/boot-resources/"});
  endpoints.put("region-2", {"http://10.0.0.2:5240/MAAS/boot-resources/"});

  hashmap<int64_t, hashset<string>> synced;

  EXPECT_TRUE(
      planRegionSync({makeParam(1, SHA_A)}, endpoints, synced, 0).empty());
}


TEST(SyncPlanTest, PlanRegionSyncSamplesSources)
{
  hashmap<string, vector<string>> endpoints;
  hashmap<int64_t, hashset<string>> synced;

  // Eight regions with two endpoints each hold the file.
  for (int i = 0; i < 8; i++) {
    const string region = "region-" + std::to_string(i);
    endpoints.put(region, {
        "http://10.0." + std::to_string(i) + ".1:5240/",
        "http://10.0." + std::to_string(i) + ".2:5240/"});
    synced[1].insert(region);
  }

  endpoints.put("region-new", {"http://10.0.9.1:5240/"});

  vector<DownloadJob> first =
    planRegionSync({makeParam(1, SHA_A)}, endpoints, synced, 7);

  ASSERT_EQ(1u, first.size());
  EXPECT_EQ("region-new", first[0].region());
  EXPECT_EQ(
      static_cast<int>(MAX_SOURCES),
      first[0].resource().source_list_size());

  hashset<string> distinct;
  foreach (const string& source, first[0].resource().source_list()) {
    EXPECT_TRUE(strings::endsWith(source, ":5240/aaaaaaa/"));
    distinct.insert(source);
  }

  EXPECT_EQ(MAX_SOURCES, distinct.size());

  // The same seed gives the same plan.
  vector<DownloadJob> second =
    planRegionSync({makeParam(1, SHA_A)}, endpoints, synced, 7);

  ASSERT_EQ(1u, second.size());
  EXPECT_EQ(sourceList(first[0].resource()), sourceList(second[0].resource()));
}

} // namespace tests {
} // namespace internal {
} // namespace bootsync {
