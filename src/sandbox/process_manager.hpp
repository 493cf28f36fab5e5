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

#ifndef __SANDBOX_PROCESS_MANAGER_HPP__
#define __SANDBOX_PROCESS_MANAGER_HPP__

#include <sys/types.h>

#include <map>
#include <string>
#include <vector>

#include <mastra/process.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include "sandbox/isolation.hpp"

namespace mastra {
namespace internal {

// Forward declaration.
class LocalProcessManagerProcess;


// What a process manager needs from the sandbox that owns it.
struct ProcessContext
{
  // Invoked before every spawn. A failure fails the spawn.
  lambda::function<process::Future<Nothing>()> ensureRunning;

  // Turns a shell command line into the command to execute, applying
  // the sandbox's isolation backend.
  lambda::function<process::Future<isolation::Command>(
      const std::string&)> wrap;

  // Default working directory of spawned commands.
  std::string workingDirectory;

  // Passed to every command, on top of the host's PATH.
  std::map<std::string, std::string> environment;
};


// Spawns commands on the local host, each as the leader of a new
// process group (session) so that the whole tree can be signaled at
// once. Every spawned process stays queryable after it exits.
class LocalProcessManager : public ProcessManager
{
public:
  explicit LocalProcessManager(const ProcessContext& context);

  ~LocalProcessManager() override;

  process::Future<process::Owned<ProcessHandle>> spawn(
      const std::string& command,
      const ExecuteOptions& options = ExecuteOptions()) override;

  process::Future<std::vector<ProcessInfo>> list() override;

  process::Future<Option<process::Owned<ProcessHandle>>> get(
      pid_t pid) override;

  process::Future<bool> kill(pid_t pid) override;

  // Kills every process that is still running.
  process::Future<Nothing> killAll();

private:
  LocalProcessManager(const LocalProcessManager&) = delete;
  LocalProcessManager& operator=(const LocalProcessManager&) = delete;

  process::Owned<LocalProcessManagerProcess> process;
};

} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_PROCESS_MANAGER_HPP__
