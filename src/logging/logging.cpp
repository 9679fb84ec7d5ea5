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

#include <signal.h>
#include <stdlib.h>

#include <glog/logging.h>
#include <glog/raw_logging.h>

#include <iostream>
#include <string>
#include <utility>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include <stout/os/signals.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::cerr;
using std::endl;
using std::pair;
using std::string;

namespace bootsync {
namespace internal {
namespace logging {

// glog keeps a pointer to the program name.
static string programName;


static const pair<const char*, google::LogSeverity> SEVERITIES[] = {
  {"INFO", google::INFO},
  {"WARNING", google::WARNING},
  {"ERROR", google::ERROR},
};


google::LogSeverity getLogSeverity(const string& logging_level)
{
  foreach (const auto& severity, SEVERITIES) {
    if (logging_level == severity.first) {
      return severity.second;
    }
  }

  return google::INFO;
}


static Option<Error> validate(const Flags& flags)
{
  bool known = false;
  foreach (const auto& severity, SEVERITIES) {
    known = known || flags.logging_level == severity.first;
  }

  if (!known) {
    return Error(
        "Invalid logging level '" + flags.logging_level + "', expected one "
        "of 'INFO', 'WARNING' or 'ERROR'");
  }

  if (flags.logbufsecs < 0) {
    return Error("Invalid --logbufsecs, it must not be negative");
  }

  if (flags.verbosity < 0) {
    return Error("Invalid --verbosity, it must not be negative");
  }

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      return Error(
          "Failed to create log directory '" + flags.log_dir.get() + "': " +
          mkdir.error());
    }
  }

  return None();
}


// A tool stopped with SIGTERM exits without the stack trace glog's
// failure handler would print. Only async-signal-safe calls are made.
static void terminate(int signal, siginfo_t* siginfo, void*)
{
  if (signal != SIGTERM) {
    RAW_LOG(FATAL, "Unexpected signal %d", signal);
  }

  RAW_LOG(WARNING, "Terminating on SIGTERM sent by pid %d",
          siginfo->si_pid);

  os::signals::reset(SIGTERM);
  raise(SIGTERM);
}


static void installSignalHandlers()
{
  google::InstallFailureSignalHandler();

  struct sigaction action;
  action.sa_sigaction = terminate;
  action.sa_flags = SA_SIGINFO;
  sigemptyset(&action.sa_mask);

  if (sigaction(SIGTERM, &action, nullptr) < 0) {
    PLOG(FATAL) << "Failed to install the SIGTERM handler";
  }
}


void initialize(
    const string& argv0,
    bool installFailureSignalHandler,
    const Option<Flags>& _flags)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  const Flags flags = _flags.isSome() ? _flags.get() : Flags();

  Option<Error> error = validate(flags);
  if (error.isSome()) {
    cerr << "Failed to initialize logging: " << error->message << endl;
    exit(EXIT_FAILURE);
  }

  FLAGS_minloglevel = getLogSeverity(flags.logging_level);
  FLAGS_logbufsecs = flags.logbufsecs;
  FLAGS_v = flags.verbosity;

  // Without a log directory everything goes to stderr, where
  // FLAGS_stderrthreshold has no effect.
  FLAGS_logtostderr = flags.log_dir.isNone();
  if (flags.log_dir.isSome()) {
    FLAGS_log_dir = flags.log_dir.get();
  }

  if (flags.quiet) {
    FLAGS_stderrthreshold = google::FATAL;
    if (FLAGS_logtostderr) {
      FLAGS_minloglevel = google::FATAL;
    }
  } else {
    FLAGS_stderrthreshold = FLAGS_minloglevel;
  }

  programName = argv0;
  google::InitGoogleLogging(programName.c_str());

  if (installFailureSignalHandler) {
    installSignalHandlers();
  }

  VLOG(1) << "Logging to "
          << (flags.log_dir.isSome() ? flags.log_dir.get() : "stderr")
          << " at level " << flags.logging_level;

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace bootsync {
