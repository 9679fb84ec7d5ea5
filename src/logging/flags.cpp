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

#include "logging/flags.hpp"

namespace bootsync {
namespace internal {
namespace logging {

Flags::Flags()
{
  add(&Flags::quiet,
      "quiet",
      "Do not write log messages to stderr.",
      false);

  add(&Flags::logging_level,
      "logging_level",
      "Lowest severity that gets logged: `INFO`, `WARNING` or `ERROR`.\n"
      "With `--quiet` it only applies to the files under `--log_dir`.",
      "INFO");

  add(&Flags::log_dir,
      "log_dir",
      "Directory for the log files of the tool. Nothing is written to\n"
      "disk unless it is set.");

  add(&Flags::logbufsecs,
      "logbufsecs",
      "How many seconds log messages may be buffered before they are\n"
      "flushed to the log files.",
      0);

  add(&Flags::verbosity,
      "verbosity",
      "Level of the `VLOG` messages to show. Level 1 reports every\n"
      "product dropped by the dumper and every storage object created\n"
      "for a layout.",
      0);
}

} // namespace logging {
} // namespace internal {
} // namespace bootsync {
