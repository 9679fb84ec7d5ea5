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

#include <algorithm>
#include <vector>

#include <glog/logging.h>

#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>

#include "resources/boot_resource_sets.hpp"
#include "resources/file_types.hpp"

using process::Failure;
using process::Future;

using std::vector;

namespace bootsync {
namespace internal {
namespace resources {

class BootResourceSetsProcess
  : public process::Process<BootResourceSetsProcess>
{
public:
  explicit BootResourceSetsProcess(BootResourceRepository* _repository)
    : ProcessBase(process::ID::generate("boot-resource-sets")),
      repository(_repository) {}

  Future<double> getSyncProgress(int64_t setId)
  {
    return summarize(setId)
      .then([](const SyncSummary& summary) -> double {
        if (summary.expected == 0) {
          return 0.0;
        }

        if (summary.synced == summary.expected) {
          return 100.0;
        }

        return 100.0 * static_cast<double>(summary.synced) /
               static_cast<double>(summary.expected);
      });
  }

  Future<bool> isSyncComplete(int64_t setId)
  {
    return summarize(setId)
      .then([](const SyncSummary& summary) {
        return summary.expected > 0 && summary.synced == summary.expected;
      });
  }

  Future<Option<BootResourceSet>> getLatestCompleteSetForBootResource(
      int64_t resourceId)
  {
    return sets(resourceId)
      .then(defer(self(), [=](const vector<BootResourceSet>& sets) {
        return latestComplete(sets, 0);
      }));
  }

  Future<bool> isUsable(int64_t setId)
  {
    return files(setId)
      .then([](const vector<BootResourceFile>& files) {
        bool kernel = false;
        bool root = false;

        foreach (const BootResourceFile& file, files) {
          kernel = kernel || isKernel(file.type());
          root = root || isRoot(file.type());
        }

        return kernel && root;
      });
  }

  Future<bool> isXinstallable(int64_t setId)
  {
    return files(setId)
      .then([](const vector<BootResourceFile>& files) {
        foreach (const BootResourceFile& file, files) {
          if (resources::isXinstallable(file.type())) {
            return true;
          }
        }

        return false;
      });
  }

  Future<vector<BootResourceSet>> selectSetsToDelete(int64_t resourceId)
  {
    return sets(resourceId)
      .then(defer(self(), [=](const vector<BootResourceSet>& sets) {
        vector<Future<bool>> complete;
        foreach (const BootResourceSet& set, sets) {
          complete.push_back(isSyncComplete(set.id()));
        }

        return process::collect(complete)
          .then([=](const vector<bool>& completed) {
            vector<BootResourceSet> result;
            bool found = false;

            for (size_t i = 0; i < sets.size(); i++) {
              if (!found && completed[i]) {
                found = true;
                continue;
              }

              result.push_back(sets[i]);
            }

            return result;
          });
      }));
  }

private:
  struct SyncSummary
  {
    // Bytes reported by the regions for all files.
    uint64_t synced;

    // Size of all files times the number of regions.
    uint64_t expected;
  };

  // Returns the files of the set, failing if the set does not exist.
  Future<vector<BootResourceFile>> files(int64_t setId)
  {
    return repository->getSet(setId)
      .then(defer(self(), [=](const Option<BootResourceSet>& set)
                              -> Future<vector<BootResourceFile>> {
        if (set.isNone()) {
          return Failure(
              "Boot resource set " + stringify(setId) + " not found");
        }

        return repository->getFiles(setId);
      }));
  }

  // Returns the sets of the resource, newest first.
  Future<vector<BootResourceSet>> sets(int64_t resourceId)
  {
    return repository->getResource(resourceId)
      .then(defer(self(), [=](const Option<BootResource>& resource)
                              -> Future<vector<BootResourceSet>> {
        if (resource.isNone()) {
          return Failure(
              "Boot resource " + stringify(resourceId) + " not found");
        }

        return repository->getSetsForResource(resourceId)
          .then([](vector<BootResourceSet> sets) {
            std::sort(
                sets.begin(),
                sets.end(),
                [](const BootResourceSet& left, const BootResourceSet& right) {
                  return left.id() > right.id();
                });

            return sets;
          });
      }));
  }

  Future<SyncSummary> summarize(int64_t setId)
  {
    return files(setId)
      .then(defer(self(), [=](const vector<BootResourceFile>& files) {
        vector<int64_t> ids;
        uint64_t total = 0;

        foreach (const BootResourceFile& file, files) {
          ids.push_back(file.id());
          total += file.size();
        }

        return repository->getRegionCount()
          .then(defer(self(), [=](size_t regions) {
            return repository->getSyncStatus(ids)
              .then([=](const vector<FileSyncStatus>& statuses) {
                SyncSummary summary;
                summary.synced = 0;
                summary.expected = total * regions;

                foreach (const FileSyncStatus& status, statuses) {
                  summary.synced += status.size();
                }

                return summary;
              });
          }));
      }));
  }

  Future<Option<BootResourceSet>> latestComplete(
      const vector<BootResourceSet>& sets,
      size_t index)
  {
    if (index >= sets.size()) {
      return None();
    }

    return isSyncComplete(sets[index].id())
      .then(defer(self(), [=](bool complete)
                              -> Future<Option<BootResourceSet>> {
        if (complete) {
          return sets[index];
        }

        return latestComplete(sets, index + 1);
      }));
  }

  BootResourceRepository* repository;
};


BootResourceSets::BootResourceSets(BootResourceRepository* repository)
{
  process = new BootResourceSetsProcess(repository);
  spawn(process);
}


BootResourceSets::~BootResourceSets()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<double> BootResourceSets::getSyncProgress(int64_t setId)
{
  return dispatch(process, &BootResourceSetsProcess::getSyncProgress, setId);
}


Future<bool> BootResourceSets::isSyncComplete(int64_t setId)
{
  return dispatch(process, &BootResourceSetsProcess::isSyncComplete, setId);
}


Future<Option<BootResourceSet>>
BootResourceSets::getLatestCompleteSetForBootResource(int64_t resourceId)
{
  return dispatch(
      process,
      &BootResourceSetsProcess::getLatestCompleteSetForBootResource,
      resourceId);
}


Future<bool> BootResourceSets::isUsable(int64_t setId)
{
  return dispatch(process, &BootResourceSetsProcess::isUsable, setId);
}


Future<bool> BootResourceSets::isXinstallable(int64_t setId)
{
  return dispatch(process, &BootResourceSetsProcess::isXinstallable, setId);
}


Future<vector<BootResourceSet>> BootResourceSets::selectSetsToDelete(
    int64_t resourceId)
{
  return dispatch(
      process,
      &BootResourceSetsProcess::selectSetsToDelete,
      resourceId);
}

} // namespace resources {
} // namespace internal {
} // namespace bootsync {
