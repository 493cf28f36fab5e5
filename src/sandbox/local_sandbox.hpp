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

#ifndef __SANDBOX_LOCAL_SANDBOX_HPP__
#define __SANDBOX_LOCAL_SANDBOX_HPP__

#include <map>
#include <set>
#include <string>
#include <vector>

#include <mastra/sandbox.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/duration.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "sandbox/flags.hpp"
#include "sandbox/isolation.hpp"
#include "sandbox/lifecycle.hpp"
#include "sandbox/process_manager.hpp"

#include "sandbox/mounts/mounter.hpp"

namespace mastra {
namespace internal {

// Forward declaration.
class LocalSandboxProcess;


// Runs commands directly on the host, in a working directory that is
// created on start, optionally confined by a native isolation backend
// (seatbelt on macOS, bubblewrap on Linux).
//
// Filesystems are mounted beneath the working directory: local
// directories as symlinks, S3 and GCS buckets through FUSE. Every
// mount point created by a sandbox is recorded with a marker file in
// the (shared) marker directory; mount points without a marker are
// never modified.
class LocalSandbox : public Sandbox
{
public:
  // Fails if the requested isolation backend is not available. Mount
  // points are attached with the host's tools unless a `mounter` is
  // given.
  static Try<LocalSandbox*> create(
      const sandbox::Flags& flags,
      const SandboxHooks& hooks = SandboxHooks(),
      const Option<process::Owned<mounts::Mounter>>& mounter = None());

  // Returns the isolation backend recommended for this host.
  static isolation::Detection detectIsolation();

  ~LocalSandbox() override;

  std::string id() const override;
  std::string name() const override;
  std::string provider() const override;
  Capabilities capabilities() const override;

  process::Future<SandboxStatus> status() override;

  process::Future<Nothing> start() override;
  process::Future<Nothing> stop() override;
  process::Future<Nothing> destroy() override;
  process::Future<Nothing> ensureRunning() override;

  process::Future<bool> isReady() override;

  process::Future<SandboxInfo> info() override;

  process::Future<std::string> instructions() override;

  process::Future<CommandResult> executeCommand(
      const std::string& command,
      const std::vector<std::string>& args = std::vector<std::string>(),
      const ExecuteOptions& options = ExecuteOptions()) override;

  ProcessManager* processes() override;

  process::Future<MountResult> mount(
      const process::Shared<Filesystem>& filesystem,
      const std::string& mountPath) override;

  process::Future<Nothing> unmount(const std::string& mountPath) override;

  process::Future<Nothing> addMounts(
      const std::map<std::string, process::Shared<Filesystem>>& mounts)
    override;

  process::Future<std::map<std::string, MountEntry>> mounts() override;

  // Unmounts the mounts recorded by marker files beneath this
  // sandbox's working directory whose mount path is not in `expected`,
  // e.g. mounts left behind by an earlier run.
  process::Future<Nothing> reconcileMounts(
      const std::set<std::string>& expected);

  const std::string& workingDirectory() const;

private:
  LocalSandbox(
      const std::string& id,
      const sandbox::Flags& flags,
      const Isolation& isolation,
      const NativeSandboxConfig& config,
      const std::map<std::string, std::string>& environment,
      const SandboxHooks& hooks,
      const process::Owned<mounts::Mounter>& mounter);

  LocalSandbox(const LocalSandbox&) = delete;
  LocalSandbox& operator=(const LocalSandbox&) = delete;

  const std::string id_;
  const std::string name_;
  const std::string workingDirectory_;
  const Duration timeout;

  process::Owned<LocalSandboxProcess> process;
  process::Owned<Lifecycle> lifecycle;
  process::Owned<LocalProcessManager> processManager;
};

} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_LOCAL_SANDBOX_HPP__
