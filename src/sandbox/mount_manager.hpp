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

#ifndef __SANDBOX_MOUNT_MANAGER_HPP__
#define __SANDBOX_MOUNT_MANAGER_HPP__

#include <map>
#include <string>

#include <mastra/filesystem.hpp>
#include <mastra/mastra.hpp>
#include <mastra/sandbox.hpp>

#include <process/future.hpp>
#include <process/pid.hpp>
#include <process/shared.hpp>

#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

namespace mastra {
namespace internal {

// Content of a marker file: `<hostPath>|<configHash>`.
struct Marker
{
  std::string hostPath;
  std::string configHash;
};


// Registry of a sandbox's mounts, keyed by virtual mount path.
//
// NOTE: Not thread safe. A mount manager belongs to one sandbox actor
// (`owner`) and must only be used from that actor; the continuations
// of `processPending` run on it.
class MountManager
{
public:
  typedef lambda::function<process::Future<MountResult>(
      const process::Shared<Filesystem>&,
      const std::string&)> MountFn;

  MountManager(const process::UPID& owner, const MountFn& mount);

  const std::map<std::string, MountEntry>& entries() const;

  Option<MountEntry> get(const std::string& mountPath) const;

  bool has(const std::string& mountPath) const;

  // Registers filesystems as pending mounts, replacing existing entries.
  void add(const std::map<std::string, process::Shared<Filesystem>>& mounts);

  // Updates the state of an entry. A new entry is only created if a
  // filesystem is given. The config hash is recomputed whenever a
  // config is given and the error is always replaced.
  void set(
      const std::string& mountPath,
      const MountState& state,
      const Option<MountConfig>& config = None(),
      const Option<std::string>& error = None(),
      const Option<process::Shared<Filesystem>>& filesystem = None());

  bool remove(const std::string& mountPath);

  void clear();

  // Mounts every pending entry, one at a time. Failures are recorded
  // on the entries; the returned future never fails.
  process::Future<Nothing> processPending(const Option<MountHook>& hook);

  // Returns `<hostPath>|<configHash>` for a registered entry.
  Option<std::string> markerContent(
      const std::string& mountPath,
      const std::string& hostPath) const;

  // Deterministic marker filename for a host path: 'mount-' followed
  // by the base 36 absolute value of a 32-bit rolling hash.
  static std::string markerFilename(const std::string& hostPath);

  // Splits marker content at the last '|'. Returns none if either part
  // is empty.
  static Option<Marker> parseMarkerContent(const std::string& content);

  // First 16 hex digits of the SHA-256 of the config's JSON rendering
  // (object keys sorted).
  static std::string computeConfigHash(const MountConfig& config);

private:
  process::Future<Nothing> mountPending(
      const std::string& mountPath,
      const Option<MountHook>& hook);

  process::Future<Nothing> _mountPending(
      const std::string& mountPath,
      const Option<MountConfig>& config);

  const process::UPID owner;
  const MountFn mount;

  std::map<std::string, MountEntry> entries_;
};

} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_MOUNT_MANAGER_HPP__
