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

#ifndef __RESOURCES_SYNC_PLAN_HPP__
#define __RESOURCES_SYNC_PLAN_HPP__

#include <stdint.h>

#include <string>
#include <vector>

#include <bootsync/bootsync.hpp>

#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace bootsync {
namespace internal {
namespace resources {

// Maximum number of controllers a region downloads a file from.
constexpr size_t MAX_SOURCES = 5;


// Returns the directory, relative to the image storage, a bootloader
// archive is extracted into: `bootloaders/<type>/<arch>`, where
// `<arch>` is the architecture without its subarchitecture.
std::string bootloaderExtractPath(
    const std::string& bootloaderType,
    const std::string& architecture);


// Describes the download of `file` from the upstream `sources`.
// Archives of bootloader resources are extracted after download.
ResourceDownloadParam makeDownloadParam(
    const BootResource& resource,
    const BootResourceFile& file,
    const std::vector<std::string>& sources);


// Merges the downloads of the same content (same SHA-256) into the
// first of them, so that every piece of content is fetched once.
// Fails if two different contents would be stored under the same
// file name.
Try<std::vector<ResourceDownloadParam>> mergeDownloads(
    const std::vector<ResourceDownloadParam>& params);


// Returns the id of the job downloading `sha256` to `region`, or from
// the upstream source when `region` is none.
std::string downloadJobId(
    const Option<std::string>& region,
    const std::string& sha256);


// Plans the downloads from the upstream image source: one job for
// every param that has sources.
std::vector<DownloadJob> planUpstream(
    const std::vector<ResourceDownloadParam>& params,
    const Option<std::string>& httpProxy = None());


// Plans the copies between region controllers once the upstream
// downloads are done. `endpoints` maps every region to the URLs of
// its image storage; `synced` maps a boot resource file to the
// regions holding a complete copy. A region lacking any of the files
// of a param downloads it from a random sample of at most
// `MAX_SOURCES` endpoints of the regions that have all of them.
// Nothing is planned with fewer than two regions.
std::vector<DownloadJob> planRegionSync(
    const std::vector<ResourceDownloadParam>& params,
    const hashmap<std::string, std::vector<std::string>>& endpoints,
    const hashmap<int64_t, hashset<std::string>>& synced,
    uint32_t seed);

} // namespace resources {
} // namespace internal {
} // namespace bootsync {

#endif // __RESOURCES_SYNC_PLAN_HPP__
