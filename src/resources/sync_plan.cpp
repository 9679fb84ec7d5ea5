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
#include <random>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include "resources/sync_plan.hpp"

using std::string;
using std::vector;

namespace bootsync {
namespace internal {
namespace resources {

string bootloaderExtractPath(
    const string& bootloaderType,
    const string& architecture)
{
  const string arch = strings::split(architecture, "/", 2)[0];

  return path::join("bootloaders", bootloaderType, arch);
}


ResourceDownloadParam makeDownloadParam(
    const BootResource& resource,
    const BootResourceFile& file,
    const vector<string>& sources)
{
  ResourceDownloadParam param;
  param.add_rfile_ids(file.id());
  param.set_sha256(file.sha256());
  param.set_filename_on_disk(file.filename_on_disk());
  param.set_total_size(file.size());

  foreach (const string& source, sources) {
    param.add_source_list(source);
  }

  if (resource.has_bootloader_type() &&
      file.type() == BootResourceFile::ARCHIVE_TAR_XZ) {
    param.add_extract_paths(bootloaderExtractPath(
        resource.bootloader_type(),
        resource.architecture()));
  }

  return param;
}


Try<vector<ResourceDownloadParam>> mergeDownloads(
    const vector<ResourceDownloadParam>& params)
{
  vector<ResourceDownloadParam> result;

  // Index in `result` of the download of every SHA-256.
  hashmap<string, size_t> merged;

  // SHA-256 stored under every file name.
  hashmap<string, string> filenames;

  foreach (const ResourceDownloadParam& param, params) {
    const Option<string> existing = filenames.get(param.filename_on_disk());

    if (existing.isSome() && existing.get() != param.sha256()) {
      return Error(
          "Files " + existing.get() + " and " + param.sha256() +
          " would both be stored as '" + param.filename_on_disk() + "'");
    }

    if (!merged.contains(param.sha256())) {
      merged.put(param.sha256(), result.size());
      filenames.put(param.filename_on_disk(), param.sha256());
      result.push_back(param);
      continue;
    }

    ResourceDownloadParam& target = result[merged.at(param.sha256())];

    foreach (int64_t id, param.rfile_ids()) {
      target.add_rfile_ids(id);
    }

    foreach (const string& source, param.source_list()) {
      target.add_source_list(source);
    }

    foreach (const string& extract, param.extract_paths()) {
      target.add_extract_paths(extract);
    }
  }

  return result;
}


string downloadJobId(const Option<string>& region, const string& sha256)
{
  return "download-bootresource:" + region.getOrElse("upstream") + ":" +
         sha256.substr(0, 12);
}


vector<DownloadJob> planUpstream(
    const vector<ResourceDownloadParam>& params,
    const Option<string>& httpProxy)
{
  vector<DownloadJob> jobs;

  foreach (const ResourceDownloadParam& param, params) {
    if (param.source_list_size() == 0) {
      continue;
    }

    DownloadJob job;
    job.set_id(downloadJobId(None(), param.sha256()));
    job.mutable_resource()->CopyFrom(param);

    if (httpProxy.isSome()) {
      job.mutable_resource()->set_http_proxy(httpProxy.get());
    }

    jobs.push_back(job);
  }

  return jobs;
}


vector<DownloadJob> planRegionSync(
    const vector<ResourceDownloadParam>& params,
    const hashmap<string, vector<string>>& endpoints,
    const hashmap<int64_t, hashset<string>>& synced,
    uint32_t seed)
{
  vector<DownloadJob> jobs;

  if (endpoints.size() < 2) {
    return jobs;
  }

  // Sorted so that the plan only depends on the seed.
  vector<string> regions;
  foreachkey (const string& region, endpoints) {
    regions.push_back(region);
  }

  std::sort(regions.begin(), regions.end());

  std::mt19937 generator(seed);

  foreach (const ResourceDownloadParam& param, params) {
    vector<string> missing;
    vector<string> sources;

    foreach (const string& region, regions) {
      bool complete = true;

      foreach (int64_t id, param.rfile_ids()) {
        Option<hashset<string>> holders = synced.get(id);
        if (holders.isNone() || !holders->contains(region)) {
          complete = false;
          break;
        }
      }

      if (!complete) {
        missing.push_back(region);
        continue;
      }

      foreach (const string& endpoint, endpoints.at(region)) {
        sources.push_back(endpoint + param.filename_on_disk() + "/");
      }
    }

    if (missing.size() == regions.size()) {
      LOG(ERROR) << "File " << param.sha256()
                 << " has no complete copy available, skipping";
      continue;
    }

    // Spread the load over the regions holding the file.
    std::shuffle(sources.begin(), sources.end(), generator);
    if (sources.size() > MAX_SOURCES) {
      sources.resize(MAX_SOURCES);
    }

    foreach (const string& region, missing) {
      DownloadJob job;
      job.set_id(downloadJobId(region, param.sha256()));
      job.set_region(region);
      job.mutable_resource()->CopyFrom(param);
      job.mutable_resource()->clear_source_list();

      foreach (const string& source, sources) {
        job.mutable_resource()->add_source_list(source);
      }

      jobs.push_back(job);
    }
  }

  return jobs;
}

} // namespace resources {
} // namespace internal {
} // namespace bootsync {
