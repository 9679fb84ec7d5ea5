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

#include <iostream>
#include <string>
#include <vector>

#include <stout/bytes.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/nothing.hpp>
#include <stout/numify.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include "common/flags.hpp"

#include "logging/logging.hpp"

#include "store/local_file.hpp"
#include "store/local_store.hpp"

using namespace bootsync::internal;

using bootsync::internal::store::LocalBootResourceFile;
using bootsync::internal::store::LocalStore;

using std::cerr;
using std::cout;
using std::endl;
using std::string;
using std::vector;


class StoreFlags : public virtual bootsync::internal::Flags
{
public:
  StoreFlags()
  {
    add(&StoreFlags::verify,
        "verify",
        "Checks a stored file, given as `<sha256>:<filename>:<size>`.");

    add(&StoreFlags::keep,
        "keep",
        "Comma separated list of the files to keep. Every other file\n"
        "of the image storage is removed.");
  }

  Option<string> verify;
  Option<string> keep;
};


static int verify(const LocalStore& store, const string& spec)
{
  const vector<string> tokens = strings::split(spec, ":");
  if (tokens.size() != 3) {
    cerr << "Invalid file '" << spec << "'" << endl;
    return EXIT_FAILURE;
  }

  Try<uint64_t> size = numify<uint64_t>(tokens[2]);
  if (size.isError()) {
    cerr << "Invalid size '" << tokens[2] << "': " << size.error() << endl;
    return EXIT_FAILURE;
  }

  const LocalBootResourceFile file =
    store.file(tokens[0], tokens[1], Bytes(size.get()));

  if (!file.complete()) {
    cout << file.filenameOnDisk() << ": incomplete ("
         << file.size() << " of " << file.totalSize() << ")" << endl;
    return EXIT_FAILURE;
  }

  if (!file.valid()) {
    cout << file.filenameOnDisk() << ": invalid" << endl;
    return EXIT_FAILURE;
  }

  cout << file.filenameOnDisk() << ": valid" << endl;

  return EXIT_SUCCESS;
}


int main(int argc, char** argv)
{
  StoreFlags flags;

  flags.setUsageMessage(
      "Usage: " + Path(argv[0]).basename() + " [--verify=<file>] "
      "[--keep=<files>] [...]\n\n" +
      "Maintains the boot resource image storage of a controller.");

  Try<flags::Warnings> load = flags.load("BOOTSYNC_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  if (flags.verify.isNone() && flags.keep.isNone()) {
    cerr << flags.usage("One of --verify or --keep is required") << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], false, flags);

  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  LocalStore store(imageStoragePath(flags.data_dir));

  Try<Nothing> initialize = store.initialize();
  if (initialize.isError()) {
    cerr << "Failed to initialize image storage '" << store.root() << "': "
         << initialize.error() << endl;
    return EXIT_FAILURE;
  }

  if (flags.keep.isSome()) {
    hashset<string> expected;
    const vector<string> filenames = strings::tokenize(flags.keep.get(), ",");
    foreach (const string& filename, filenames) {
      expected.insert(filename);
    }

    Try<Nothing> cleanup = store.cleanup(expected);
    if (cleanup.isError()) {
      cerr << "Failed to clean up image storage '" << store.root() << "': "
           << cleanup.error() << endl;
      return EXIT_FAILURE;
    }

    LOG(INFO) << "Cleaned up image storage '" << store.root() << "'";
  }

  if (flags.verify.isSome()) {
    return verify(store, flags.verify.get());
  }

  return EXIT_SUCCESS;
}
