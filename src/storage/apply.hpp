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

#ifndef __STORAGE_APPLY_HPP__
#define __STORAGE_APPLY_HPP__

#include <stout/bytes.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "storage/layout.hpp"
#include "storage/machine.hpp"

namespace bootsync {
namespace internal {
namespace storage {

// Partitions and logical volumes are aligned to this size.
constexpr Bytes PARTITION_ALIGNMENT_SIZE = Megabytes(4);


// Rounds `size` down to a multiple of `PARTITION_ALIGNMENT_SIZE`.
// Returns an error if `size` is smaller than the alignment.
Try<Bytes> alignPartitionSize(uint64_t size);


// Replaces the storage configuration of `machine` with `layout`. The
// machine is left untouched if the layout uses a disk the machine
// does not have or sizes a partition or logical volume below
// `PARTITION_ALIGNMENT_SIZE`; errors are of type UNAPPLIABLE.
Try<Nothing, LayoutError> applyLayoutToMachine(
    const StorageLayout& layout,
    Machine* machine);

} // namespace storage {
} // namespace internal {
} // namespace bootsync {

#endif // __STORAGE_APPLY_HPP__
