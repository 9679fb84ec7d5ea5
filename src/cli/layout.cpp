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

#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/try.hpp>

#include "logging/flags.hpp"
#include "logging/logging.hpp"

#include "storage/layout.hpp"

using namespace bootsync::internal;

using bootsync::internal::storage::LayoutError;
using bootsync::internal::storage::StorageEntry;
using bootsync::internal::storage::StorageLayout;

using std::cerr;
using std::cout;
using std::endl;
using std::string;


class Flags : public virtual logging::Flags
{
public:
  Flags()
  {
    add(&Flags::layout,
        "layout",
        "Path to the JSON storage layout document to compile.");
  }

  Option<string> layout;
};


int main(int argc, char** argv)
{
  Flags flags;

  flags.setUsageMessage(
      "Usage: " + Path(argv[0]).basename() + " --layout=<path>\n\n" +
      "Compiles a custom storage layout and prints the devices in the\n" +
      "order they would be created.");

  Try<flags::Warnings> load = flags.load("BOOTSYNC_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  if (flags.layout.isNone()) {
    cerr << flags.usage("Missing required option --layout") << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], false, flags);

  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  Try<string> read = os::read(flags.layout.get());
  if (read.isError()) {
    cerr << "Failed to read layout '" << flags.layout.get() << "': "
         << read.error() << endl;
    return EXIT_FAILURE;
  }

  Try<StorageLayout, LayoutError> layout =
    storage::parseStorageLayout(read.get());

  if (layout.isError()) {
    cerr << layout.error().message << endl;
    return EXIT_FAILURE;
  }

  foreach (const StorageEntry& entry, layout->sortedEntries) {
    cout << entry << endl;
  }

  return EXIT_SUCCESS;
}
