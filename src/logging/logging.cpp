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

#include <stdlib.h>

#include <iostream>
#include <string>

#include <glog/logging.h>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::cerr;
using std::endl;
using std::string;

namespace mastra {
namespace internal {
namespace logging {

Try<google::LogSeverity> parseLoggingLevel(const string& level)
{
  if (level == "INFO") {
    return google::INFO;
  } else if (level == "WARNING") {
    return google::WARNING;
  } else if (level == "ERROR") {
    return google::ERROR;
  }

  return Error(
      "'" + level + "' is not a valid logging level, expecting one of"
      " 'INFO', 'WARNING' or 'ERROR'");
}


void initialize(
    const string& argv0,
    const Flags& flags,
    bool installFailureSignalHandler)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  // Flags loaded through `FlagsBase::load` are already validated, a
  // default constructed `Flags` may still be edited by hand.
  Try<google::LogSeverity> severity = parseLoggingLevel(flags.logging_level);
  if (severity.isError()) {
    cerr << "Could not initialize logging: " << severity.error() << endl;
    exit(EXIT_FAILURE);
  }

  FLAGS_minloglevel = severity.get();
  FLAGS_v = flags.verbosity;
  FLAGS_logbufsecs = flags.logbufsecs;

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      cerr << "Could not initialize logging: Failed to create '"
           << flags.log_dir.get() << "': " << mkdir.error() << endl;
      exit(EXIT_FAILURE);
    }

    FLAGS_log_dir = flags.log_dir.get();
    FLAGS_logtostderr = false;
  } else {
    FLAGS_logtostderr = true;
  }

  if (!flags.quiet) {
    FLAGS_stderrthreshold = FLAGS_minloglevel;
  } else if (FLAGS_logtostderr) {
    // The stderr threshold does not apply without log files, hence
    // nothing below FATAL is logged at all.
    FLAGS_stderrthreshold = google::FATAL;
    FLAGS_minloglevel = google::FATAL;
  } else {
    FLAGS_stderrthreshold = google::FATAL;
  }

  google::InitGoogleLogging(argv0.c_str());

  if (installFailureSignalHandler) {
    google::InstallFailureSignalHandler();
  }

  VLOG(1) << "Logging to "
          << (flags.log_dir.isSome() ? "'" + flags.log_dir.get() + "'"
                                     : string("stderr"))
          << " at verbosity " << flags.verbosity;

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace mastra {
