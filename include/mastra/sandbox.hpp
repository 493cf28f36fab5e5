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

#ifndef __MASTRA_SANDBOX_HPP__
#define __MASTRA_SANDBOX_HPP__

#include <map>
#include <string>
#include <vector>

#include <mastra/filesystem.hpp>
#include <mastra/mastra.hpp>
#include <mastra/process.hpp>

#include <process/future.hpp>
#include <process/shared.hpp>

#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

namespace mastra {

// Features a sandbox implementation declares up front.
struct Capabilities
{
  Capabilities() : mount(false) {}

  bool mount;
};


struct MountResult
{
  MountResult() : success(false), unavailable(false) {}

  bool success;
  std::string mountPath;
  Option<std::string> error;

  // Set when the tool needed for this mount is missing on the host.
  bool unavailable;
};


struct MountEntry
{
  process::Shared<Filesystem> filesystem;
  MountState state;
  Option<MountConfig> config;
  Option<std::string> configHash;
  Option<std::string> error;
};


// Outcome of an `onMount` hook for a queued mount.
struct MountDecision
{
  enum Kind
  {
    // Let the sandbox mount the filesystem itself.
    CONTINUE,

    // Do not mount; the entry is marked unsupported.
    SKIP,

    // The hook mounted (or failed to mount) the filesystem.
    HANDLED
  };

  static MountDecision proceed()
  {
    return MountDecision(CONTINUE, false, None());
  }

  static MountDecision skip()
  {
    return MountDecision(SKIP, false, None());
  }

  static MountDecision handled(
      bool success,
      const Option<std::string>& error = None())
  {
    return MountDecision(HANDLED, success, error);
  }

  Kind kind;
  bool success;
  Option<std::string> error;

private:
  MountDecision(Kind _kind, bool _success, const Option<std::string>& _error)
    : kind(_kind), success(_success), error(_error) {}
};


typedef lambda::function<process::Future<MountDecision>(
    const process::Shared<Filesystem>& filesystem,
    const std::string& mountPath,
    const Option<MountConfig>& config)> MountHook;


struct SandboxHooks
{
  // Called once the sandbox is running. Failures are logged only.
  Option<lambda::function<process::Future<Nothing>()>> onStart;

  // Called before the sandbox is stopped or destroyed. Failures fail
  // the transition.
  Option<lambda::function<process::Future<Nothing>()>> onStop;
  Option<lambda::function<process::Future<Nothing>()>> onDestroy;

  // Consulted for every mount queued before start.
  Option<MountHook> onMount;
};


// An isolated environment for running shell commands.
//
// Lifecycle: PENDING -> STARTING -> RUNNING -> STOPPING -> STOPPED ->
// DESTROYING -> DESTROYED, with ERROR reachable from any transition.
// `start`, `stop` and `destroy` are idempotent and concurrent calls
// of the same kind share a single execution.
class Sandbox
{
public:
  virtual ~Sandbox() {}

  virtual std::string id() const = 0;
  virtual std::string name() const = 0;
  virtual std::string provider() const = 0;
  virtual Capabilities capabilities() const = 0;

  virtual process::Future<SandboxStatus> status() = 0;

  virtual process::Future<Nothing> start() = 0;
  virtual process::Future<Nothing> stop() = 0;
  virtual process::Future<Nothing> destroy() = 0;

  // Starts the sandbox if needed. Fails with `SandboxNotReadyError`
  // if the sandbox is destroyed or cannot be started. Does nothing
  // while the sandbox is stopping or being destroyed.
  virtual process::Future<Nothing> ensureRunning() = 0;

  virtual process::Future<bool> isReady() = 0;

  virtual process::Future<SandboxInfo> info() = 0;

  // Describes the execution environment to an agent.
  virtual process::Future<std::string> instructions() = 0;

  // Runs `command` followed by the shell-quoted `args` and waits for
  // it to exit. Process failures are reported in the result, never as
  // a failed future.
  virtual process::Future<CommandResult> executeCommand(
      const std::string& command,
      const std::vector<std::string>& args = std::vector<std::string>(),
      const ExecuteOptions& options = ExecuteOptions()) = 0;

  virtual ProcessManager* processes() = 0;

  // Mounting is only available with `Capabilities::mount`.
  virtual process::Future<MountResult> mount(
      const process::Shared<Filesystem>& filesystem,
      const std::string& mountPath) = 0;

  // Unmounting a path that is not mounted is a no-op.
  virtual process::Future<Nothing> unmount(const std::string& mountPath) = 0;

  // Queues mounts. They are attached once the sandbox is running.
  virtual process::Future<Nothing> addMounts(
      const std::map<std::string, process::Shared<Filesystem>>& mounts) = 0;

  virtual process::Future<std::map<std::string, MountEntry>> mounts() = 0;
};

} // namespace mastra {

#endif // __MASTRA_SANDBOX_HPP__
