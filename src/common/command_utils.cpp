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

#include <list>
#include <map>
#include <tuple>
#include <vector>

#include <glog/logging.h>

#include <process/collect.hpp>
#include <process/io.hpp>
#include <process/subprocess.hpp>

#include <stout/os.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/constants.hpp>
#include <stout/os/killtree.hpp>

#include "common/command_utils.hpp"
#include "common/status_utils.hpp"

using std::map;
using std::string;
using std::tuple;
using std::vector;

using process::Failure;
using process::Future;
using process::Subprocess;

namespace mastra {
namespace internal {
namespace command {

Future<string> launch(
    const string& path,
    const vector<string>& argv,
    const Option<map<string, string>>& environment,
    const Duration& timeout)
{
  Try<Subprocess> s = process::subprocess(
      path,
      argv,
      Subprocess::PATH(os::DEV_NULL),
      Subprocess::PIPE(),
      Subprocess::PIPE(),
      nullptr,
      environment);

  const string command = strings::join(" ", argv);

  if (s.isError()) {
    return Failure(
        "Failed to execute the subprocess '" + command + "': " + s.error());
  }

  const pid_t pid = s->pid();

  return await(
      s->status(),
      process::io::read(s->out().get()),
      process::io::read(s->err().get()))
    .after(
        timeout,
        [timeout, pid, command](Future<tuple<Future<Option<int>>,
                                             Future<string>,
                                             Future<string>>> future)
    {
      future.discard();

      VLOG(1) << "Killing process " << pid << " ('" << command << "')";

      Try<std::list<os::ProcessTree>> kill = os::killtree(pid, SIGKILL);
      if (kill.isError()) {
        LOG(WARNING) << "Failed to kill process " << pid << " ('" << command
                     << "'): " << kill.error();
      }

      return Failure(
          "'" + command + "' timed out after " + stringify(timeout));
    })
    .then([command](const tuple<
        Future<Option<int>>,
        Future<string>,
        Future<string>>& t) -> Future<string> {
      const Future<Option<int>>& status = std::get<0>(t);
      if (!status.isReady()) {
        return Failure(
            "Failed to get the exit status of '" + command + "': " +
            (status.isFailed() ? status.failure() : "discarded"));
      }

      if (status->isNone()) {
        return Failure("Failed to reap '" + command + "'");
      }

      if (!WSUCCEEDED(status->get())) {
        const Future<string>& error = std::get<2>(t);
        return Failure(
            "'" + command + "' " + WSTRINGIFY(status->get()) +
            (error.isReady() && !error->empty()
               ? ": " + strings::trim(error.get())
               : ""));
      }

      const Future<string>& output = std::get<1>(t);
      if (!output.isReady()) {
        return Failure(
            "Failed to read stdout from '" + command + "': " +
            (output.isFailed() ? output.failure() : "discarded"));
      }

      return output;
    });
}


string shellQuote(const string& argument)
{
  static const string SAFE =
    "abcdefghijklmnopqrstuvwxyz"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "0123456789"
    "_-./=:,+@%";

  if (!argument.empty() &&
      argument.find_first_not_of(SAFE) == string::npos) {
    return argument;
  }

  // Close the quote, emit an escaped quote, and reopen.
  return "'" + strings::replace(argument, "'", "'\\''") + "'";
}

} // namespace command {
} // namespace internal {
} // namespace mastra {
