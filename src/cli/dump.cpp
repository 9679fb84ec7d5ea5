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
#include <stout/json.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include "images/mapping.hpp"
#include "images/repo_dumper.hpp"

#include "logging/flags.hpp"
#include "logging/logging.hpp"

using namespace bootsync::internal;

using bootsync::internal::images::BootImageMapping;
using bootsync::internal::images::LocalStreamReader;
using bootsync::internal::images::RepoDumper;

using std::cerr;
using std::cout;
using std::endl;
using std::string;


class Flags : public virtual logging::Flags
{
public:
  Flags()
  {
    add(&Flags::root,
        "root",
        "Root directory of a local simplestreams mirror.");

    add(&Flags::index,
        "index",
        "Path of the index or products document, relative to --root.",
        "streams/v1/index.json");

    add(&Flags::validate_products,
        "validate_products",
        "Whether to drop the products this controller cannot boot.",
        true);
  }

  Option<string> root;
  string index;
  bool validate_products;
};


int main(int argc, char** argv)
{
  Flags flags;

  flags.setUsageMessage(
      "Usage: " + Path(argv[0]).basename() + " --root=<dir> [...]\n\n" +
      "Reads a simplestreams mirror and prints the boot images it\n" +
      "provides as JSON.");

  Try<flags::Warnings> load = flags.load("BOOTSYNC_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  if (flags.root.isNone()) {
    cerr << flags.usage("Missing required option --root") << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], false, flags);

  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  BootImageMapping mapping;
  RepoDumper dumper(&mapping, flags.validate_products);
  LocalStreamReader reader(flags.root.get());

  Try<Nothing> sync = dumper.sync(&reader, flags.index);
  if (sync.isError()) {
    cerr << "Failed to read '" << flags.index << "': "
         << sync.error() << endl;
    return EXIT_FAILURE;
  }

  LOG(INFO) << "Found " << mapping.size() << " boot image(s)";

  cout << stringify(JSON::Value(mapping.dumpJson())) << endl;

  return EXIT_SUCCESS;
}
