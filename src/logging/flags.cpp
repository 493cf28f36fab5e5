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

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "logging/flags.hpp"
#include "logging/logging.hpp"

using std::string;

namespace mastra {
namespace internal {
namespace logging {

Flags::Flags()
{
  add(&Flags::quiet,
      "quiet",
      "Do not print sandbox logs to stderr. Command output is not\n"
      "affected.",
      false);

  add(&Flags::logging_level,
      "logging_level",
      "Lowest severity of the sandbox logs that are kept:\n"
      "'INFO', 'WARNING' or 'ERROR'. Lifecycle transitions and mounts\n"
      "are logged at 'INFO', skipped cleanup steps at 'WARNING'.",
      "INFO",
      [](const string& value) -> Option<Error> {
        Try<google::LogSeverity> severity = parseLoggingLevel(value);
        if (severity.isError()) {
          return Error(severity.error());
        }
        return None();
      });

  add(&Flags::verbosity,
      "verbosity",
      "Verbosity of the sandbox tracing. '1' logs every command a\n"
      "sandbox runs together with its exit code, every ownership check\n"
      "of a mount path and every marker file that is read.",
      0,
      [](int value) -> Option<Error> {
        if (value < 0) {
          return Error("Expected a non-negative verbosity");
        }
        return None();
      });

  add(&Flags::log_dir,
      "log_dir",
      "Directory for the log files of the sandbox. Logs go to stderr\n"
      "only when not set.");

  add(&Flags::logbufsecs,
      "logbufsecs",
      "Maximum number of seconds log messages are buffered for before\n"
      "they are written to '--log_dir'.",
      0);
}

} // namespace logging {
} // namespace internal {
} // namespace mastra {
