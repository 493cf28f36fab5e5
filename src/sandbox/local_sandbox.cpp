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

#include <string.h>

#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <mastra/errors.hpp>

#include <process/clock.hpp>
#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>
#include <process/sequence.hpp>
#include <process/time.hpp>

#include <stout/bytes.hpp>
#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/json.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/protobuf.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/unreachable.hpp>
#include <stout/uuid.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/ls.hpp>
#include <stout/os/read.hpp>
#include <stout/os/rm.hpp>
#include <stout/os/rmdir.hpp>
#include <stout/os/stat.hpp>
#include <stout/os/write.hpp>

#include "common/command_utils.hpp"
#include "common/hash.hpp"

#include "sandbox/constants.hpp"
#include "sandbox/local_sandbox.hpp"
#include "sandbox/mount_manager.hpp"
#include "sandbox/paths.hpp"

#include "sandbox/mounts/local.hpp"
#include "sandbox/mounts/mounter.hpp"
#include "sandbox/mounts/mounts.hpp"

using std::list;
using std::map;
using std::set;
using std::string;
using std::vector;

using process::Clock;
using process::defer;
using process::Failure;
using process::Future;
using process::Owned;
using process::PID;
using process::Sequence;
using process::Shared;
using process::Time;

namespace mastra {
namespace internal {

// What is found at a mount point before mounting, as far as the mounts
// recorded in the marker directory are concerned.
enum class Ownership
{
  // Nothing is mounted at the path.
  NOT_MOUNTED,

  // Mounted by a sandbox with the same config.
  MATCHING,

  // Mounted by a sandbox with another config.
  MISMATCHED,

  // Mounted (or linked) by somebody else.
  FOREIGN
};


static std::ostream& operator<<(std::ostream& stream, Ownership ownership)
{
  switch (ownership) {
    case Ownership::NOT_MOUNTED: return stream << "not mounted";
    case Ownership::MATCHING: return stream << "matching";
    case Ownership::MISMATCHED: return stream << "mismatched";
    case Ownership::FOREIGN: return stream << "foreign";
  }

  return stream;
}


class LocalSandboxProcess : public process::Process<LocalSandboxProcess>
{
public:
  LocalSandboxProcess(
      const string& _id,
      const sandbox::Flags& flags,
      const Isolation& _isolation,
      const NativeSandboxConfig& _config,
      const Option<MountHook>& _onMount,
      const Owned<mounts::Mounter>& _mounter)
    : ProcessBase(process::ID::generate("local-sandbox")),
      id(_id),
      name(flags.name),
      workingDirectory(flags.working_directory),
      isolation(_isolation),
      markerDir(flags.marker_dir),
      credentialsDir(flags.credentials_dir),
      profilesDir(flags.profiles_dir),
      instructionsOverride(flags.instructions),
      onMount(_onMount),
      mounter(_mounter),
      createdAt(Clock::now()),
      config(_config),
      userProvidedProfilePath(false),
      mountManager(self(), [this](const Shared<Filesystem>& filesystem,
                            const string& mountPath) {
        return mount(filesystem, mountPath);
      }) {}

  // Lifecycle transitions, see `Transitions`.
  Future<Nothing> start();
  Future<Nothing> stop();
  Future<Nothing> destroy();
  Future<Nothing> processPendingMounts();

  Future<isolation::Command> wrap(const string& command);

  Future<SandboxInfo> info(const SandboxStatus& status);

  Future<string> instructions();

  Future<MountResult> mount(
      const Shared<Filesystem>& filesystem,
      const string& mountPath);

  Future<Nothing> unmount(const string& mountPath);

  Future<Nothing> addMounts(const map<string, Shared<Filesystem>>& filesystems);

  Future<map<string, MountEntry>> entries();

  Future<Nothing> reconcileMounts(const set<string>& expected);

private:
  Try<Nothing> prepareSeatbeltProfile();

  void removeSeatbeltProfile();

  // Unmounts every active mount, ignoring failures.
  Future<Nothing> unmountAll();

  // Mount operations on the same path are run one at a time.
  Sequence* sequence(const string& mountPath);

  Future<MountResult> _mount(
      const Shared<Filesystem>& filesystem,
      const string& mountPath);

  Future<MountResult> __mount(
      const Shared<Filesystem>& filesystem,
      const string& mountPath,
      const string& hostPath,
      const MountConfig& config,
      const Ownership& ownership);

  Future<MountResult> attach(
      const Shared<Filesystem>& filesystem,
      const string& mountPath,
      const string& hostPath,
      const MountConfig& config);

  MountResult attached(
      const string& mountPath,
      const string& hostPath,
      const MountConfig& config);

  MountResult failed(
      const Shared<Filesystem>& filesystem,
      const string& mountPath,
      const Option<MountConfig>& config,
      const MountState& state,
      const string& error);

  Future<Nothing> _unmount(const string& mountPath);

  Future<Ownership> checkExistingMount(
      const string& hostPath,
      const MountConfig& config);

  Ownership checkMarkerFile(const string& hostPath, const MountConfig& config);

  void writeMarkerFile(const string& mountPath, const string& hostPath);

  void addMountPathToIsolation(const string& hostPath);

  const string id;
  const string name;
  const string workingDirectory;
  const Isolation isolation;
  const string markerDir;
  const string credentialsDir;
  const string profilesDir;
  const Option<string> instructionsOverride;
  const Option<MountHook> onMount;
  const Owned<mounts::Mounter> mounter;
  const Time createdAt;

  // Grows as mounts are added to the isolation allow-list.
  NativeSandboxConfig config;

  // The seatbelt profile in effect. The in-memory text is authoritative;
  // the file is only written on start.
  Option<string> seatbeltProfile;
  Option<string> seatbeltProfilePath;
  bool userProvidedProfilePath;

  MountManager mountManager;

  // Mount paths attached by this sandbox, torn down on stop and destroy.
  set<string> activeMountPaths;

  hashmap<string, Owned<Sequence>> sequences;
};


Future<Nothing> LocalSandboxProcess::start()
{
  VLOG(1) << "Creating working directory '" << workingDirectory << "'"
          << " for sandbox '" << id << "'";

  Try<Nothing> mkdir = os::mkdir(workingDirectory);
  if (mkdir.isError()) {
    return Failure(
        "Failed to create working directory '" + workingDirectory + "': " +
        mkdir.error());
  }

  if (isolation == SEATBELT) {
    Try<Nothing> prepare = prepareSeatbeltProfile();
    if (prepare.isError()) {
      return Failure(
          "Failed to prepare seatbelt profile: " + prepare.error());
    }
  }

  return Nothing();
}


Try<Nothing> LocalSandboxProcess::prepareSeatbeltProfile()
{
  if (config.has_seatbelt_profile_path()) {
    const string path = config.seatbelt_profile_path();

    seatbeltProfilePath = path;
    userProvidedProfilePath = true;

    if (os::exists(path)) {
      Try<string> read = os::read(path);
      if (read.isError()) {
        return Error("Failed to read '" + path + "': " + read.error());
      }

      LOG(INFO) << "Using seatbelt profile '" << path << "'";

      seatbeltProfile = read.get();
      return Nothing();
    }

    seatbeltProfile =
      isolation::generateSeatbeltProfile(workingDirectory, config);

    Try<Nothing> mkdir = os::mkdir(Path(path).dirname());
    if (mkdir.isError()) {
      return Error(
          "Failed to create directory for '" + path + "': " + mkdir.error());
    }

    Try<Nothing> write = os::write(path, seatbeltProfile.get());
    if (write.isError()) {
      return Error("Failed to write '" + path + "': " + write.error());
    }

    LOG(INFO) << "Wrote default seatbelt profile to '" << path << "'";

    return Nothing();
  }

  seatbeltProfile = isolation::generateSeatbeltProfile(workingDirectory, config);

  Try<Nothing> mkdir = os::mkdir(profilesDir);
  if (mkdir.isError()) {
    return Error(
        "Failed to create '" + profilesDir + "': " + mkdir.error());
  }

  const string path =
    paths::getSeatbeltProfilePath(profilesDir, workingDirectory, config);

  Try<Nothing> write = os::write(path, seatbeltProfile.get());
  if (write.isError()) {
    return Error("Failed to write '" + path + "': " + write.error());
  }

  VLOG(1) << "Wrote seatbelt profile '" << path << "'";

  seatbeltProfilePath = path;
  userProvidedProfilePath = false;

  return Nothing();
}


void LocalSandboxProcess::removeSeatbeltProfile()
{
  // A profile supplied by the user is never deleted.
  if (seatbeltProfilePath.isSome() && !userProvidedProfilePath) {
    Try<Nothing> rm = os::rm(seatbeltProfilePath.get());
    if (rm.isError()) {
      LOG(WARNING) << "Failed to remove seatbelt profile '"
                   << seatbeltProfilePath.get() << "': " << rm.error();
    }

    // Other sandboxes may still keep their profiles here.
    Try<Nothing> rmdir = os::rmdir(profilesDir, false);
    if (rmdir.isError()) {
      VLOG(1) << "Not removing '" << profilesDir << "': " << rmdir.error();
    }
  }

  seatbeltProfile = None();
  seatbeltProfilePath = None();
  userProvidedProfilePath = false;
}


Future<Nothing> LocalSandboxProcess::stop()
{
  return unmountAll();
}


Future<Nothing> LocalSandboxProcess::destroy()
{
  return unmountAll()
    .then(defer(self(), [this]() {
      activeMountPaths.clear();
      mountManager.clear();

      removeSeatbeltProfile();

      return Nothing();
    }));
}


Future<Nothing> LocalSandboxProcess::unmountAll()
{
  vector<Future<Nothing>> futures;

  // Copied, `unmount` modifies the set.
  const set<string> mountPaths = activeMountPaths;

  foreach (const string& mountPath, mountPaths) {
    futures.push_back(unmount(mountPath)
      .repair([mountPath](const Future<Nothing>& future) {
        LOG(WARNING) << "Failed to unmount '" << mountPath << "': "
                     << future.failure();
        return Nothing();
      }));
  }

  return process::collect(futures)
    .then([]() { return Nothing(); });
}


Future<Nothing> LocalSandboxProcess::processPendingMounts()
{
  return mountManager.processPending(onMount);
}


Future<isolation::Command> LocalSandboxProcess::wrap(const string& command)
{
  isolation::WrapOptions options;
  options.backend = isolation;
  options.workspacePath = workingDirectory;
  options.seatbeltProfile = seatbeltProfile;
  options.config = config;

  Try<isolation::Command> wrapped = isolation::wrap(command, options);
  if (wrapped.isError()) {
    return Failure(wrapped.error());
  }

  return wrapped.get();
}


Future<SandboxInfo> LocalSandboxProcess::info(const SandboxStatus& status)
{
  SandboxInfo info;
  info.set_id(id);
  info.set_name(name);
  info.set_provider(SANDBOX_PROVIDER);
  info.set_status(status);
  info.set_created_at(createdAt.secs());
  info.set_working_directory(workingDirectory);
  info.set_isolation(isolation);

  Try<os::Memory> memory = os::memory();
  if (memory.isSome()) {
    info.set_memory_mb(memory->total.megabytes());
  } else {
    LOG(WARNING) << "Failed to get the memory of the host: " << memory.error();
  }

  Try<long> cpus = os::cpus();
  if (cpus.isSome()) {
    info.set_cpu_cores(static_cast<uint32_t>(cpus.get()));
  } else {
    LOG(WARNING) << "Failed to get the CPUs of the host: " << cpus.error();
  }

  Try<os::UTSInfo> uname = os::uname();
  if (uname.isSome()) {
    info.set_platform(strings::lower(uname->sysname));
  } else {
    LOG(WARNING) << "Failed to get the platform of the host: "
                 << uname.error();
  }

  if (isolation != NONE) {
    SandboxInfo::IsolationConfig* isolationConfig =
      info.mutable_isolation_config();

    isolationConfig->set_allow_network(config.allow_network());
    isolationConfig->mutable_read_only_paths()->CopyFrom(
        config.read_only_paths());
    isolationConfig->mutable_read_write_paths()->CopyFrom(
        config.read_write_paths());
  }

  foreachpair (const string& mountPath,
               const MountEntry& entry,
               mountManager.entries()) {
    SandboxInfo::Mount* mount = info.add_mounts();
    mount->set_mount_path(mountPath);
    mount->set_state(entry.state);

    if (entry.error.isSome()) {
      mount->set_error(entry.error.get());
    }
  }

  return info;
}


Future<string> LocalSandboxProcess::instructions()
{
  if (instructionsOverride.isSome()) {
    return instructionsOverride.get();
  }

  return "Local command execution. Working directory: \"" +
         workingDirectory + "\".";
}


Sequence* LocalSandboxProcess::sequence(const string& mountPath)
{
  if (!sequences.contains(mountPath)) {
    sequences[mountPath] =
      Owned<Sequence>(new Sequence("local-sandbox-mount-sequence"));
  }

  return sequences.at(mountPath).get();
}


Future<MountResult> LocalSandboxProcess::mount(
    const Shared<Filesystem>& filesystem,
    const string& mountPath)
{
  return sequence(mountPath)->add(std::function<Future<MountResult>()>(
      defer(self(), &Self::_mount, filesystem, mountPath)));
}


Future<MountResult> LocalSandboxProcess::_mount(
    const Shared<Filesystem>& filesystem,
    const string& mountPath)
{
  Option<Error> error = paths::validateMountPath(mountPath);
  if (error.isSome()) {
    return Failure(error->message);
  }

  Try<string> hostPath = paths::getHostPath(workingDirectory, mountPath);
  if (hostPath.isError()) {
    return Failure(hostPath.error());
  }

  VLOG(1) << "Mounting '" << mountPath << "' at '" << hostPath.get() << "'";

  const Option<MountConfig> config = filesystem->getMountConfig();
  if (config.isNone()) {
    return failed(
        filesystem,
        mountPath,
        None(),
        MOUNT_ERROR,
        "Filesystem '" + filesystem->id() + "' does not provide a mount"
        " config");
  }

  error = mounts::validate(config.get());
  if (error.isSome()) {
    return failed(
        filesystem, mountPath, config, MOUNT_ERROR, error->message);
  }

  return checkExistingMount(hostPath.get(), config.get())
    .then(defer(self(),
                &Self::__mount,
                filesystem,
                mountPath,
                hostPath.get(),
                config.get(),
                lambda::_1));
}


Future<MountResult> LocalSandboxProcess::__mount(
    const Shared<Filesystem>& filesystem,
    const string& mountPath,
    const string& hostPath,
    const MountConfig& config,
    const Ownership& ownership)
{
  VLOG(1) << "Found " << ownership << " mount at '" << hostPath << "'";

  switch (ownership) {
    case Ownership::MATCHING: {
      LOG(INFO) << "Reusing existing mount of " << filesystem->provider()
                << " filesystem '" << filesystem->id() << "' at '"
                << hostPath << "'";

      mountManager.set(mountPath, MOUNT_MOUNTED, config, None(), filesystem);
      activeMountPaths.insert(mountPath);
      addMountPathToIsolation(hostPath);

      MountResult result;
      result.success = true;
      result.mountPath = mountPath;
      return result;
    }
    case Ownership::FOREIGN:
      return failed(
          filesystem,
          mountPath,
          config,
          MOUNT_ERROR,
          "Cannot mount at " + hostPath + ": path is already occupied by an"
          " existing mount or symlink that was not created by Mastra."
          " Unmount it manually or use a different mount path.");
    case Ownership::MISMATCHED: {
      LOG(INFO) << "Mount at '" << hostPath << "' has a different config,"
                << " remounting";

      // Already running in the sequence of `mountPath`.
      return _unmount(mountPath)
        .then(defer(self(),
                    &Self::attach,
                    filesystem,
                    mountPath,
                    hostPath,
                    config))
        .repair(defer(self(), [=](const Future<MountResult>& future) {
          return failed(
              filesystem,
              mountPath,
              config,
              MOUNT_ERROR,
              "Failed to unmount the previous mount: " + future.failure());
        }));
    }
    case Ownership::NOT_MOUNTED:
      return attach(filesystem, mountPath, hostPath, config);
  }

  UNREACHABLE();
}


Future<MountResult> LocalSandboxProcess::attach(
    const Shared<Filesystem>& filesystem,
    const string& mountPath,
    const string& hostPath,
    const MountConfig& config)
{
  mountManager.set(mountPath, MOUNT_MOUNTING, config, None(), filesystem);

  // Mounting would hide the files in the directory (dotfiles included).
  if (os::stat::isdir(hostPath)) {
    Try<list<string>> entries = os::ls(hostPath);
    if (entries.isError()) {
      return failed(
          filesystem,
          mountPath,
          config,
          MOUNT_ERROR,
          "Failed to list '" + hostPath + "': " + entries.error());
    }

    if (!entries->empty()) {
      return failed(
          filesystem,
          mountPath,
          config,
          MOUNT_ERROR,
          "Cannot mount at " + hostPath + ": directory exists and is not"
          " empty. Mounting would hide existing files. Use a different path"
          " or empty the directory first.");
    }
  }

  if (config.type() == MountConfig::UNKNOWN) {
    return failed(
        filesystem,
        mountPath,
        config,
        MOUNT_UNSUPPORTED,
        "Unsupported mount type: " + stringify(config.type()));
  }

  Option<MountToolNotFoundError> missing = mounter->checkInstalled(config);
  if (missing.isSome()) {
    return failed(
        filesystem, mountPath, config, MOUNT_UNAVAILABLE, missing->message);
  }

  // An empty directory that was already there is left in place when
  // the mount fails.
  const bool created = !os::exists(hostPath);

  Try<Nothing> mkdir = os::mkdir(hostPath);
  if (mkdir.isError()) {
    return failed(
        filesystem,
        mountPath,
        config,
        MOUNT_ERROR,
        "Failed to create mount point '" + hostPath + "': " + mkdir.error());
  }

  return mounter->attach(hostPath, config, credentialsDir)
    .then(defer(self(), &Self::attached, mountPath, hostPath, config))
    .repair(defer(self(), [=](const Future<MountResult>& future) {
      const string error =
        future.isFailed() ? future.failure() : string("discarded");

      // Remove the mount point created above. A symlink is left alone
      // in case it was created before the failure.
      if (created && !os::stat::islink(hostPath) && os::exists(hostPath)) {
        Try<Nothing> rmdir = os::rmdir(hostPath, false);
        if (rmdir.isError()) {
          LOG(WARNING) << "Failed to remove mount point '" << hostPath
                       << "' after a failed mount: " << rmdir.error();
        }
      }

      mounts::removeCredentials(credentialsDir, hostPath);

      // The helpers report tools going missing after the check above
      // the same way the check does.
      const MountState state = strings::contains(error, "is not installed")
        ? MOUNT_UNAVAILABLE
        : MOUNT_ERROR;

      return failed(filesystem, mountPath, config, state, error);
    }));
}


MountResult LocalSandboxProcess::attached(
    const string& mountPath,
    const string& hostPath,
    const MountConfig& config)
{
  mountManager.set(mountPath, MOUNT_MOUNTED, config);
  activeMountPaths.insert(mountPath);

  writeMarkerFile(mountPath, hostPath);
  addMountPathToIsolation(hostPath);

  LOG(INFO) << "Mounted " << config << " at '" << hostPath << "'";

  MountResult result;
  result.success = true;
  result.mountPath = mountPath;
  return result;
}


MountResult LocalSandboxProcess::failed(
    const Shared<Filesystem>& filesystem,
    const string& mountPath,
    const Option<MountConfig>& config,
    const MountState& state,
    const string& error)
{
  if (state == MOUNT_UNAVAILABLE) {
    LOG(WARNING) << "Cannot mount '" << mountPath << "': " << error;
  } else {
    LOG(ERROR) << "Failed to mount '" << mountPath << "': " << error;
  }

  mountManager.set(mountPath, state, config, error, filesystem);

  MountResult result;
  result.success = false;
  result.mountPath = mountPath;
  result.error = error;
  result.unavailable = state == MOUNT_UNAVAILABLE;
  return result;
}


Future<Ownership> LocalSandboxProcess::checkExistingMount(
    const string& hostPath,
    const MountConfig& config)
{
  const string markerPath = paths::getMarkerPath(markerDir, hostPath);

  if (os::stat::islink(hostPath)) {
    if (config.type() == MountConfig::LOCAL) {
      Result<string> target = mounts::local::readlink(hostPath);

      if (target.isSome() &&
          target.get() == mounts::local::target(config.local())) {
        return checkMarkerFile(hostPath, config);
      }

      // The link points elsewhere; it is ours to replace only if we
      // created it.
      return os::exists(markerPath)
        ? Ownership::MISMATCHED
        : Ownership::FOREIGN;
    }

    return checkMarkerFile(hostPath, config);
  }

  if (!os::exists(hostPath)) {
    return Ownership::NOT_MOUNTED;
  }

  return mounter->isMountPoint(hostPath)
    .repair([hostPath](const Future<bool>& future) {
      LOG(WARNING) << "Failed to check whether '" << hostPath << "' is a"
                   << " mount point: " << future.failure();
      return false;
    })
    .then(defer(self(), [=](bool mounted) -> Ownership {
      if (!mounted) {
        return Ownership::NOT_MOUNTED;
      }

      return checkMarkerFile(hostPath, config);
    }));
}


Ownership LocalSandboxProcess::checkMarkerFile(
    const string& hostPath,
    const MountConfig& config)
{
  const string markerPath = paths::getMarkerPath(markerDir, hostPath);

  if (!os::exists(markerPath)) {
    return Ownership::FOREIGN;
  }

  Try<string> content = os::read(markerPath);
  if (content.isError()) {
    LOG(WARNING) << "Failed to read marker file '" << markerPath << "': "
                 << content.error();
    return Ownership::FOREIGN;
  }

  // A malformed marker was still written by us.
  Option<Marker> marker =
    MountManager::parseMarkerContent(strings::trim(content.get()));
  if (marker.isNone()) {
    return Ownership::MISMATCHED;
  }

  const string configHash = MountManager::computeConfigHash(config);

  VLOG(1) << "Marker '" << markerPath << "' has config hash '"
          << marker->configHash << "', expecting '" << configHash << "'";

  if (marker->hostPath == hostPath && marker->configHash == configHash) {
    return Ownership::MATCHING;
  }

  return Ownership::MISMATCHED;
}


void LocalSandboxProcess::writeMarkerFile(
    const string& mountPath,
    const string& hostPath)
{
  Option<string> content = mountManager.markerContent(mountPath, hostPath);
  if (content.isNone()) {
    return;
  }

  const string markerPath = paths::getMarkerPath(markerDir, hostPath);

  Try<Nothing> mkdir = os::mkdir(markerDir);
  if (mkdir.isError()) {
    LOG(WARNING) << "Failed to create marker directory '" << markerDir
                 << "': " << mkdir.error();
    return;
  }

  Try<Nothing> write = os::write(markerPath, content.get());
  if (write.isError()) {
    LOG(WARNING) << "Failed to write marker file '" << markerPath << "': "
                 << write.error();
  }
}


void LocalSandboxProcess::addMountPathToIsolation(const string& hostPath)
{
  if (isolation == NONE) {
    return;
  }

  foreach (const string& path, config.read_write_paths()) {
    if (path == hostPath) {
      return;
    }
  }

  config.add_read_write_paths(hostPath);

  // bwrap reads the config on every command, seatbelt needs a new
  // profile for the next command.
  if (isolation == SEATBELT) {
    seatbeltProfile =
      isolation::generateSeatbeltProfile(workingDirectory, config);
  }
}


Future<Nothing> LocalSandboxProcess::unmount(const string& mountPath)
{
  return sequence(mountPath)->add(std::function<Future<Nothing>()>(
      defer(self(), &Self::_unmount, mountPath)));
}


Future<Nothing> LocalSandboxProcess::_unmount(const string& mountPath)
{
  Option<Error> error = paths::validateMountPath(mountPath);
  if (error.isSome()) {
    return Failure(error->message);
  }

  Try<string> hostPath_ = paths::getHostPath(workingDirectory, mountPath);
  if (hostPath_.isError()) {
    return Failure(hostPath_.error());
  }

  const string hostPath = hostPath_.get();
  const string markerPath = paths::getMarkerPath(markerDir, hostPath);

  // Only paths this sandbox mounted, or that a marker says some
  // sandbox mounted, are touched on the host.
  const bool owned =
    activeMountPaths.count(mountPath) > 0 || os::exists(markerPath);

  if (!owned) {
    if (mountManager.has(mountPath)) {
      // E.g. a mount refused because of a foreign symlink.
      VLOG(1) << "Forgetting mount '" << mountPath << "' without touching '"
              << hostPath << "': not mounted by Mastra";

      mountManager.remove(mountPath);
    } else {
      VLOG(1) << "Ignoring unmount of '" << mountPath << "': not mounted";
    }

    return Nothing();
  }

  LOG(INFO) << "Unmounting '" << mountPath << "' at '" << hostPath << "'";

  mountManager.remove(mountPath);
  activeMountPaths.erase(mountPath);

  // The marker goes first so that a failed unmount does not leave the
  // path claimed forever.
  if (os::exists(markerPath)) {
    Try<Nothing> rm = os::rm(markerPath);
    if (rm.isError()) {
      LOG(WARNING) << "Failed to remove marker file '" << markerPath
                   << "': " << rm.error();
    }
  }

  mounts::removeCredentials(credentialsDir, hostPath);

  // Only the link is removed, never what it points to.
  if (os::stat::islink(hostPath)) {
    Try<Nothing> rm = os::rm(hostPath);
    if (rm.isError()) {
      return Failure(
          "Failed to remove symlink '" + hostPath + "': " + rm.error());
    }

    return Nothing();
  }

  if (!os::exists(hostPath)) {
    return Nothing();
  }

  return mounter->isMountPoint(hostPath)
    .then(defer(self(), [this, hostPath](bool mounted) -> Future<Nothing> {
      if (!mounted) {
        return Nothing();
      }

      return mounter->unmount(hostPath);
    }))
    .then([hostPath]() {
      // Fails if something was left in the directory, which is kept.
      Try<Nothing> rmdir = os::rmdir(hostPath, false);
      if (rmdir.isError()) {
        VLOG(1) << "Not removing mount point '" << hostPath << "': "
                << rmdir.error();
      }

      return Nothing();
    });
}


Future<Nothing> LocalSandboxProcess::addMounts(
    const map<string, Shared<Filesystem>>& filesystems)
{
  mountManager.add(filesystems);
  return Nothing();
}


Future<map<string, MountEntry>> LocalSandboxProcess::entries()
{
  return mountManager.entries();
}


Future<Nothing> LocalSandboxProcess::reconcileMounts(
    const set<string>& expected)
{
  if (!os::exists(markerDir)) {
    return Nothing();
  }

  Try<list<string>> files = os::ls(markerDir);
  if (files.isError()) {
    return Failure(
        "Failed to list marker directory '" + markerDir + "': " +
        files.error());
  }

  const string prefix = strings::remove(
      workingDirectory, "/", strings::SUFFIX) + "/";

  vector<Future<Nothing>> futures;

  foreach (const string& file, files.get()) {
    if (!strings::startsWith(file, MARKER_FILE_PREFIX)) {
      continue;
    }

    const string markerPath = path::join(markerDir, file);

    Try<string> content = os::read(markerPath);
    if (content.isError()) {
      LOG(WARNING) << "Failed to read marker file '" << markerPath << "': "
                   << content.error();
      continue;
    }

    Option<Marker> marker =
      MountManager::parseMarkerContent(strings::trim(content.get()));

    // Markers of other sandboxes are left alone.
    if (marker.isNone() || !strings::startsWith(marker->hostPath, prefix)) {
      continue;
    }

    const string mountPath =
      "/" + marker->hostPath.substr(prefix.size());

    if (expected.count(mountPath) > 0) {
      continue;
    }

    LOG(INFO) << "Unmounting stale mount '" << mountPath << "' of sandbox '"
              << id << "'";

    futures.push_back(unmount(mountPath)
      .repair([mountPath](const Future<Nothing>& future) {
        LOG(WARNING) << "Failed to unmount stale mount '" << mountPath
                     << "': " << future.failure();
        return Nothing();
      }));
  }

  return process::collect(futures)
    .then([]() { return Nothing(); });
}


// Generates `local-sandbox-<base 36 time>-<6 random base 36 digits>`.
static string generateId()
{
  const id::UUID uuid = id::UUID::random();

  uint64_t random = 0;
  memcpy(&random, uuid.data, sizeof(random));

  const uint64_t now = static_cast<uint64_t>(Clock::now().duration().ms());

  return "local-sandbox-" + hash::base36(now) + "-" +
         hash::base36(random).substr(0, 6);
}


Try<LocalSandbox*> LocalSandbox::create(
    const sandbox::Flags& flags,
    const SandboxHooks& hooks,
    const Option<Owned<mounts::Mounter>>& mounter)
{
  Try<Isolation> isolation = isolation::parse(flags.isolation);
  if (isolation.isError()) {
    return Error(isolation.error());
  }

  // Nothing else is set up for a sandbox that could never run a command.
  if (!isolation::available(isolation.get())) {
    return IsolationUnavailableError(
        isolation.get(), isolation::detect().message);
  }

  NativeSandboxConfig config;
  if (flags.native_sandbox.isSome()) {
    Try<NativeSandboxConfig> parse =
      ::protobuf::parse<NativeSandboxConfig>(flags.native_sandbox.get());

    if (parse.isError()) {
      return Error("Invalid native sandbox config: " + parse.error());
    }

    config = parse.get();
  }

  map<string, string> environment;
  if (flags.env.isSome()) {
    foreachpair (const string& key,
                 const JSON::Value& value,
                 flags.env->values) {
      if (!value.is<JSON::String>()) {
        return Error(
            "Environment variable '" + key + "' must be a string");
      }

      environment[key] = value.as<JSON::String>().value;
    }
  }

  if (!path::absolute(flags.working_directory)) {
    return Error(
        "Working directory '" + flags.working_directory + "' must be an"
        " absolute path");
  }

  Owned<mounts::Mounter> _mounter;
  if (mounter.isSome()) {
    _mounter = mounter.get();
  } else {
    Try<mounts::Mounter*> create = mounts::HostMounter::create();
    if (create.isError()) {
      return Error("Failed to create mounter: " + create.error());
    }

    _mounter.reset(create.get());
  }

  const string id = flags.id.isSome() ? flags.id.get() : generateId();

  return new LocalSandbox(
      id, flags, isolation.get(), config, environment, hooks, _mounter);
}


isolation::Detection LocalSandbox::detectIsolation()
{
  return isolation::detect();
}


LocalSandbox::LocalSandbox(
    const string& id,
    const sandbox::Flags& flags,
    const Isolation& isolation,
    const NativeSandboxConfig& config,
    const map<string, string>& environment,
    const SandboxHooks& hooks,
    const Owned<mounts::Mounter>& mounter)
  : id_(id),
    name_(flags.name),
    workingDirectory_(flags.working_directory),
    timeout(flags.timeout)
{
  process.reset(new LocalSandboxProcess(
      id, flags, isolation, config, hooks.onMount, mounter));

  process::spawn(process.get());

  const PID<LocalSandboxProcess> pid = process->self();

  processManager.reset(new LocalProcessManager(ProcessContext{
      [this]() { return lifecycle->ensureRunning(); },
      [pid](const string& command) {
        return process::dispatch(pid, &LocalSandboxProcess::wrap, command);
      },
      workingDirectory_,
      environment}));

  LocalProcessManager* processes = processManager.get();

  Transitions transitions;

  transitions.start = [pid]() {
    return process::dispatch(pid, &LocalSandboxProcess::start);
  };

  transitions.stop = [pid]() {
    return process::dispatch(pid, &LocalSandboxProcess::stop);
  };

  transitions.destroy = [pid, processes]() {
    return processes->killAll()
      .repair([](const Future<Nothing>& future) {
        LOG(WARNING) << "Failed to kill processes: " << future.failure();
        return Nothing();
      })
      .then([pid]() {
        return process::dispatch(pid, &LocalSandboxProcess::destroy);
      });
  };

  transitions.started = [pid]() {
    return process::dispatch(pid, &LocalSandboxProcess::processPendingMounts);
  };

  lifecycle.reset(new Lifecycle(id, transitions, hooks));
}


LocalSandbox::~LocalSandbox()
{
  // The lifecycle and the process manager call into each other and
  // into the sandbox actor, so they are torn down first.
  lifecycle.reset();
  processManager.reset();

  process::terminate(process.get());
  process::wait(process.get());
}


string LocalSandbox::id() const
{
  return id_;
}


string LocalSandbox::name() const
{
  return name_;
}


string LocalSandbox::provider() const
{
  return SANDBOX_PROVIDER;
}


Capabilities LocalSandbox::capabilities() const
{
  Capabilities capabilities;
  capabilities.mount = true;
  return capabilities;
}


const string& LocalSandbox::workingDirectory() const
{
  return workingDirectory_;
}


Future<SandboxStatus> LocalSandbox::status()
{
  return lifecycle->status();
}


Future<Nothing> LocalSandbox::start()
{
  return lifecycle->start();
}


Future<Nothing> LocalSandbox::stop()
{
  return lifecycle->stop();
}


Future<Nothing> LocalSandbox::destroy()
{
  return lifecycle->destroy();
}


Future<Nothing> LocalSandbox::ensureRunning()
{
  return lifecycle->ensureRunning();
}


Future<bool> LocalSandbox::isReady()
{
  return lifecycle->status()
    .then([](const SandboxStatus& status) {
      return status == SANDBOX_RUNNING;
    });
}


Future<SandboxInfo> LocalSandbox::info()
{
  const PID<LocalSandboxProcess> pid = process->self();

  return lifecycle->status()
    .then([pid](const SandboxStatus& status) {
      return process::dispatch(pid, &LocalSandboxProcess::info, status);
    });
}


Future<string> LocalSandbox::instructions()
{
  return process::dispatch(
      process.get(), &LocalSandboxProcess::instructions);
}


Future<CommandResult> LocalSandbox::executeCommand(
    const string& command,
    const vector<string>& args,
    const ExecuteOptions& options)
{
  string line = command;
  foreach (const string& arg, args) {
    line += " " + command::shellQuote(arg);
  }

  ExecuteOptions _options = options;
  if (_options.timeout.isNone()) {
    _options.timeout = timeout;
  }

  VLOG(1) << "Executing '" << line << "' in sandbox '" << id_ << "'";

  const string sandbox = id_;

  LocalProcessManager* processes = processManager.get();

  // A sandbox that cannot be started fails the call. Only a command
  // that could not be spawned becomes a failed command result.
  return lifecycle->ensureRunning()
    .then([processes, line, _options, sandbox]() {
      return processes->spawn(line, _options)
        .then([](const Owned<ProcessHandle>& handle) {
          return handle->wait();
        })
        .then([line](CommandResult result) {
          result.command = line;
          return result;
        })
        .repair([line, sandbox](const Future<CommandResult>& future) {
          LOG(WARNING) << "Failed to execute '" << line << "' in sandbox '"
                       << sandbox << "': " << future.failure();

          CommandResult result;
          result.success = false;
          result.exitCode = 1;
          result.err = future.failure();
          result.command = line;
          return result;
        });
    });
}


ProcessManager* LocalSandbox::processes()
{
  return processManager.get();
}


Future<MountResult> LocalSandbox::mount(
    const Shared<Filesystem>& filesystem,
    const string& mountPath)
{
  return process::dispatch(
      process.get(),
      &LocalSandboxProcess::mount,
      filesystem,
      mountPath);
}


Future<Nothing> LocalSandbox::unmount(const string& mountPath)
{
  return process::dispatch(
      process.get(),
      &LocalSandboxProcess::unmount,
      mountPath);
}


Future<Nothing> LocalSandbox::addMounts(
    const map<string, Shared<Filesystem>>& mounts)
{
  const PID<LocalSandboxProcess> pid = process->self();

  // Mounts added to a running sandbox are attached right away, the
  // others once the sandbox has started.
  return process::dispatch(
      process.get(),
      &LocalSandboxProcess::addMounts,
      mounts)
    .then([this]() { return lifecycle->status(); })
    .then([pid](const SandboxStatus& status) -> Future<Nothing> {
      if (status != SANDBOX_RUNNING) {
        return Nothing();
      }

      return process::dispatch(
          pid, &LocalSandboxProcess::processPendingMounts);
    });
}


Future<map<string, MountEntry>> LocalSandbox::mounts()
{
  return process::dispatch(process.get(), &LocalSandboxProcess::entries);
}


Future<Nothing> LocalSandbox::reconcileMounts(const set<string>& expected)
{
  return process::dispatch(
      process.get(),
      &LocalSandboxProcess::reconcileMounts,
      expected);
}

} // namespace internal {
} // namespace mastra {
