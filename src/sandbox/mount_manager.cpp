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

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/defer.hpp>
#include <process/loop.hpp>

#include <stout/foreach.hpp>
#include <stout/protobuf.hpp>
#include <stout/stringify.hpp>
#include <stout/unreachable.hpp>

#include "common/hash.hpp"

#include "sandbox/constants.hpp"
#include "sandbox/mount_manager.hpp"

using std::map;
using std::string;
using std::vector;

using process::Break;
using process::Continue;
using process::ControlFlow;
using process::Future;
using process::Shared;
using process::UPID;

using process::defer;

namespace mastra {
namespace internal {

MountManager::MountManager(const UPID& _owner, const MountFn& _mount)
  : owner(_owner),
    mount(_mount) {}


const map<string, MountEntry>& MountManager::entries() const
{
  return entries_;
}


Option<MountEntry> MountManager::get(const string& mountPath) const
{
  map<string, MountEntry>::const_iterator it = entries_.find(mountPath);
  if (it == entries_.end()) {
    return None();
  }

  return it->second;
}


bool MountManager::has(const string& mountPath) const
{
  return entries_.count(mountPath) > 0;
}


void MountManager::add(const map<string, Shared<Filesystem>>& mounts)
{
  LOG(INFO) << "Adding " << mounts.size() << " pending mount(s)";

  foreachpair (const string& mountPath,
               const Shared<Filesystem>& filesystem,
               mounts) {
    MountEntry entry;
    entry.filesystem = filesystem;
    entry.state = MOUNT_PENDING;

    entries_[mountPath] = entry;
  }
}


void MountManager::set(
    const string& mountPath,
    const MountState& state,
    const Option<MountConfig>& config,
    const Option<string>& error,
    const Option<Shared<Filesystem>>& filesystem)
{
  map<string, MountEntry>::iterator it = entries_.find(mountPath);

  if (it == entries_.end()) {
    if (filesystem.isNone()) {
      VLOG(1) << "Ignoring update of unknown mount '" << mountPath
              << "' without a filesystem";
      return;
    }

    MountEntry entry;
    entry.filesystem = filesystem.get();
    it = entries_.insert(std::make_pair(mountPath, entry)).first;
  }

  MountEntry& entry = it->second;

  entry.state = state;
  entry.error = error;

  if (filesystem.isSome()) {
    entry.filesystem = filesystem.get();
  }

  if (config.isSome()) {
    entry.config = config.get();
    entry.configHash = computeConfigHash(config.get());
  }
}


bool MountManager::remove(const string& mountPath)
{
  return entries_.erase(mountPath) > 0;
}


void MountManager::clear()
{
  entries_.clear();
}


Future<Nothing> MountManager::processPending(const Option<MountHook>& hook)
{
  vector<string> pending;
  foreachpair (const string& mountPath, const MountEntry& entry, entries_) {
    if (entry.state == MOUNT_PENDING) {
      pending.push_back(mountPath);
    }
  }

  if (pending.empty()) {
    return Nothing();
  }

  LOG(INFO) << "Processing " << pending.size() << " pending mount(s)";

  std::shared_ptr<size_t> index(new size_t(0));

  return process::loop(
      owner,
      [=]() -> Future<Option<string>> {
        if (*index >= pending.size()) {
          return Option<string>::none();
        }

        return Option<string>(pending.at((*index)++));
      },
      [=](const Option<string>& mountPath)
          -> Future<ControlFlow<Nothing>> {
        if (mountPath.isNone()) {
          return Break();
        }

        return mountPending(mountPath.get(), hook)
          .then([]() -> ControlFlow<Nothing> { return Continue(); });
      });
}


Future<Nothing> MountManager::mountPending(
    const string& mountPath,
    const Option<MountHook>& hook)
{
  // The entry may have been removed or mounted directly since the
  // list of pending mounts was taken.
  Option<MountEntry> entry = get(mountPath);
  if (entry.isNone() || entry->state != MOUNT_PENDING) {
    return Nothing();
  }

  const Shared<Filesystem> filesystem = entry->filesystem;
  const Option<MountConfig> config = filesystem->getMountConfig();

  if (hook.isNone()) {
    return _mountPending(mountPath, config);
  }

  const string provider = filesystem->provider();

  return hook.get()(filesystem, mountPath, config)
    .then(defer(owner, [=](const MountDecision& decision) -> Future<Nothing> {
      if (!has(mountPath)) {
        return Nothing();
      }

      switch (decision.kind) {
        case MountDecision::SKIP:
          VLOG(1) << "Mount '" << mountPath << "' (" << provider
                  << ") skipped by onMount hook";
          set(mountPath, MOUNT_UNSUPPORTED, None(), "Skipped by onMount hook");
          return Nothing();
        case MountDecision::HANDLED:
          if (decision.success) {
            LOG(INFO) << "Mount '" << mountPath << "' (" << provider
                      << ") handled by onMount hook";
            set(mountPath, MOUNT_MOUNTED, config);
          } else {
            const string error = decision.error.getOrElse("Mount hook failed");
            LOG(ERROR) << "onMount hook failed to mount '" << mountPath
                       << "' (" << provider << "): " << error;
            set(mountPath, MOUNT_ERROR, None(), error);
          }
          return Nothing();
        case MountDecision::CONTINUE:
          return _mountPending(mountPath, config);
      }

      UNREACHABLE();
    }))
    .recover(defer(owner, [=](const Future<Nothing>& future) -> Future<Nothing> {
      const string error = "Mount hook error: " +
        (future.isFailed() ? future.failure() : string("discarded"));

      LOG(ERROR) << "onMount hook for '" << mountPath << "' (" << provider
                 << ") failed: " << error;

      set(mountPath, MOUNT_ERROR, None(), error);
      return Nothing();
    }));
}


Future<Nothing> MountManager::_mountPending(
    const string& mountPath,
    const Option<MountConfig>& config)
{
  Option<MountEntry> entry = get(mountPath);
  if (entry.isNone()) {
    return Nothing();
  }

  const Shared<Filesystem> filesystem = entry->filesystem;
  const string provider = filesystem->provider();

  if (config.isNone()) {
    VLOG(1) << "Filesystem '" << filesystem->id() << "' (" << provider
            << ") for '" << mountPath << "' does not support mounting";
    set(mountPath,
        MOUNT_UNSUPPORTED,
        None(),
        "Filesystem does not support mounting");
    return Nothing();
  }

  set(mountPath, MOUNT_MOUNTING, config);

  VLOG(1) << "Mounting '" << mountPath << "' (" << provider << ", "
          << config.get() << ")";

  return mount(filesystem, mountPath)
    .then(defer(owner, [=](const MountResult& result) -> Future<Nothing> {
      if (!has(mountPath)) {
        return Nothing();
      }

      if (result.success) {
        LOG(INFO) << "Mounted '" << mountPath << "' (" << provider << ")";
        set(mountPath, MOUNT_MOUNTED, config);
      } else if (result.unavailable) {
        const string error = result.error.getOrElse("FUSE tool not installed");
        LOG(WARNING) << "Mount '" << mountPath << "' (" << provider
                     << ") is unavailable: " << error;
        set(mountPath, MOUNT_UNAVAILABLE, config, error);
      } else {
        const string error = result.error.getOrElse("Mount failed");
        LOG(ERROR) << "Failed to mount '" << mountPath << "' (" << provider
                   << "): " << error;
        set(mountPath, MOUNT_ERROR, config, error);
      }

      return Nothing();
    }))
    .recover(defer(owner, [=](const Future<Nothing>& future) -> Future<Nothing> {
      const string error =
        future.isFailed() ? future.failure() : string("discarded");

      LOG(ERROR) << "Failed to mount '" << mountPath << "' (" << provider
                 << "): " << error;

      set(mountPath, MOUNT_ERROR, config, error);
      return Nothing();
    }));
}


Option<string> MountManager::markerContent(
    const string& mountPath,
    const string& hostPath) const
{
  Option<MountEntry> entry = get(mountPath);
  if (entry.isNone() || entry->configHash.isNone()) {
    return None();
  }

  return hostPath + "|" + entry->configHash.get();
}


string MountManager::markerFilename(const string& hostPath)
{
  const int64_t value = hash::rolling(hostPath);

  return MARKER_FILE_PREFIX + hash::base36(value < 0 ? -value : value);
}


Option<Marker> MountManager::parseMarkerContent(const string& content)
{
  const size_t separator = content.rfind('|');
  if (separator == string::npos || separator == 0) {
    return None();
  }

  Marker marker;
  marker.hostPath = content.substr(0, separator);
  marker.configHash = content.substr(separator + 1);

  if (marker.configHash.empty()) {
    return None();
  }

  return marker;
}


string MountManager::computeConfigHash(const MountConfig& config)
{
  return hash::sha256(stringify(JSON::protobuf(config))).substr(0, 16);
}

} // namespace internal {
} // namespace mastra {
