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

#include <mastra/mastra.hpp>
#include <mastra/sandbox.hpp>

#include <process/check.hpp>
#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#include "sandbox/flags.hpp"
#include "sandbox/local_filesystem.hpp"
#include "sandbox/local_sandbox.hpp"

using namespace mastra;
using namespace mastra::internal;

using std::cerr;
using std::cout;
using std::endl;
using std::flush;
using std::string;
using std::vector;

using process::Future;
using process::Owned;
using process::Shared;


class Flags : public virtual sandbox::Flags
{
public:
  Flags()
  {
    add(&Flags::command,
        "command",
        "Shell command to run in the sandbox.");

    add(&Flags::mount,
        "mount",
        "Host directory to mount into the sandbox before running the\n"
        "command, given as '<mount path>:<directory>'. Example:\n"
        "  --mount=/data:/srv/datasets");

    add(&Flags::destroy,
        "destroy",
        "Whether to destroy the sandbox once the command has exited.\n"
        "Otherwise the sandbox is only stopped, which unmounts its mounts.",
        false);
  }

  Option<string> command;
  Option<string> mount;
  bool destroy;
};


// Splits '<mount path>:<directory>' at the first ':'.
static Try<vector<string>> parseMount(const string& value)
{
  const size_t separator = value.find(':');
  if (separator == string::npos ||
      separator == 0 ||
      separator == value.size() - 1) {
    return Error(
        "Expecting '<mount path>:<directory>' but got '" + value + "'");
  }

  return vector<string>{
    value.substr(0, separator), value.substr(separator + 1)};
}


int main(int argc, char** argv)
{
  Flags flags;

  Try<flags::Warnings> load = flags.load("MASTRA_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  if (flags.command.isNone()) {
    cerr << flags.usage("Missing required option --command") << endl;
    return EXIT_FAILURE;
  }

  Option<vector<string>> mount;
  if (flags.mount.isSome()) {
    Try<vector<string>> parse = parseMount(flags.mount.get());
    if (parse.isError()) {
      cerr << flags.usage(parse.error()) << endl;
      return EXIT_FAILURE;
    }

    mount = parse.get();
  }

  logging::initialize(argv[0], flags);

  // Log any flag warnings.
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  Try<LocalSandbox*> create = LocalSandbox::create(flags);
  if (create.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to create sandbox: " << create.error();
  }

  Owned<LocalSandbox> sandbox(create.get());

  Future<Nothing> start = sandbox->start();
  start.await();

  if (!start.isReady()) {
    EXIT(EXIT_FAILURE)
      << "Failed to start sandbox '" << sandbox->id() << "': "
      << (start.isFailed() ? start.failure() : "discarded");
  }

  if (mount.isSome()) {
    Shared<Filesystem> filesystem(
        new LocalFilesystem(path::absolute(mount->at(1))
          ? mount->at(1)
          : path::join(os::getcwd(), mount->at(1))));

    Future<MountResult> mounted = sandbox->mount(filesystem, mount->at(0));
    mounted.await();

    if (!mounted.isReady()) {
      EXIT(EXIT_FAILURE)
        << "Failed to mount '" << mount->at(1) << "' at '" << mount->at(0)
        << "': " << (mounted.isFailed() ? mounted.failure() : "discarded");
    }

    if (!mounted->success) {
      EXIT(EXIT_FAILURE)
        << "Failed to mount '" << mount->at(1) << "' at '" << mount->at(0)
        << "': " << mounted->error.getOrElse("unknown error");
    }
  }

  ExecuteOptions options;
  options.onStdout = [](const string& data) { cout << data << flush; };
  options.onStderr = [](const string& data) { cerr << data << flush; };

  Future<CommandResult> result =
    sandbox->executeCommand(flags.command.get(), {}, options);

  result.await();

  // `executeCommand` reports every failure in its result.
  CHECK_READY(result);

  if (result->timedOut) {
    cerr << "Command timed out after " << flags.timeout << endl;
  }

  Future<Nothing> teardown =
    flags.destroy ? sandbox->destroy() : sandbox->stop();
  teardown.await();

  if (!teardown.isReady()) {
    LOG(ERROR) << "Failed to " << (flags.destroy ? "destroy" : "stop")
               << " sandbox '" << sandbox->id() << "': "
               << (teardown.isFailed() ? teardown.failure() : "discarded");
  }

  return result->exitCode;
}
