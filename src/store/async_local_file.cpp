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

#include <process/dispatch.hpp>
#include <process/future.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "store/async_local_file.hpp"

using process::Failure;
using process::Future;

using std::string;

namespace bootsync {
namespace internal {
namespace store {

class LocalBootResourceFileProcess
  : public process::Process<LocalBootResourceFileProcess>
{
public:
  explicit LocalBootResourceFileProcess(const LocalBootResourceFile& _file)
    : ProcessBase(process::ID::generate("local-boot-resource-file")),
      file(_file) {}

  Bytes size()
  {
    return file.size();
  }

  bool complete()
  {
    return file.complete();
  }

  bool valid()
  {
    return file.valid();
  }

  Future<Nothing> unlink()
  {
    Try<Nothing> unlink = file.unlink();
    if (unlink.isError()) {
      return Failure(
          "Failed to remove '" + file.path() + "': " + unlink.error());
    }

    return Nothing();
  }

  Try<Nothing, LocalStoreError> appendChunk(const string& data)
  {
    return file.appendChunk(data);
  }

  Try<Nothing, LocalStoreError> commit()
  {
    return file.store().commit();
  }

  Future<Nothing> extractFile(const string& subdirectory)
  {
    Try<Nothing> extract = file.extractFile(subdirectory);
    if (extract.isError()) {
      return Failure(extract.error());
    }

    return Nothing();
  }

private:
  const LocalBootResourceFile file;
};


AsyncLocalBootResourceFile::AsyncLocalBootResourceFile(
    const LocalBootResourceFile& file)
{
  process = new LocalBootResourceFileProcess(file);
  spawn(process);
}


AsyncLocalBootResourceFile::~AsyncLocalBootResourceFile()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Bytes> AsyncLocalBootResourceFile::size()
{
  return dispatch(process, &LocalBootResourceFileProcess::size);
}


Future<bool> AsyncLocalBootResourceFile::complete()
{
  return dispatch(process, &LocalBootResourceFileProcess::complete);
}


Future<bool> AsyncLocalBootResourceFile::valid()
{
  return dispatch(process, &LocalBootResourceFileProcess::valid);
}


Future<Nothing> AsyncLocalBootResourceFile::unlink()
{
  return dispatch(process, &LocalBootResourceFileProcess::unlink);
}


Future<Try<Nothing, LocalStoreError>> AsyncLocalBootResourceFile::appendChunk(
    const string& data)
{
  return dispatch(process, &LocalBootResourceFileProcess::appendChunk, data);
}


Future<Try<Nothing, LocalStoreError>> AsyncLocalBootResourceFile::commit()
{
  return dispatch(process, &LocalBootResourceFileProcess::commit);
}


Future<Nothing> AsyncLocalBootResourceFile::extractFile(
    const string& subdirectory)
{
  return dispatch(
      process,
      &LocalBootResourceFileProcess::extractFile,
      subdirectory);
}

} // namespace store {
} // namespace internal {
} // namespace bootsync {
