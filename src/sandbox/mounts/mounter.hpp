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

#ifndef __SANDBOX_MOUNTS_MOUNTER_HPP__
#define __SANDBOX_MOUNTS_MOUNTER_HPP__

#include <string>

#include <mastra/errors.hpp>
#include <mastra/mastra.hpp>

#include <process/future.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace mastra {
namespace internal {
namespace mounts {

// The host operations a sandbox performs on mount points. Everything
// the sandbox decides about ownership (marker files, foreign mounts)
// happens above this interface.
class Mounter
{
public:
  virtual ~Mounter() {}

  // Returns the error to report (as 'unavailable') if the host lacks
  // the tools needed to attach `config`.
  virtual Option<MountToolNotFoundError> checkInstalled(
      const MountConfig& config) = 0;

  // Attaches `config` at `hostPath`, an empty directory.
  virtual process::Future<Nothing> attach(
      const std::string& hostPath,
      const MountConfig& config,
      const std::string& credentialsDir) = 0;

  virtual process::Future<bool> isMountPoint(const std::string& path) = 0;

  // Detaches the FUSE mount at `path`. The mount point is kept.
  virtual process::Future<Nothing> unmount(const std::string& path) = 0;
};


// Mounts with the tools installed on this host, see `mounts::attach`
// and `mounts::fuse`.
class HostMounter : public Mounter
{
public:
  static Try<Mounter*> create();

  ~HostMounter() override {}

  Option<MountToolNotFoundError> checkInstalled(
      const MountConfig& config) override;

  process::Future<Nothing> attach(
      const std::string& hostPath,
      const MountConfig& config,
      const std::string& credentialsDir) override;

  process::Future<bool> isMountPoint(const std::string& path) override;

  process::Future<Nothing> unmount(const std::string& path) override;

private:
  HostMounter() {}
};

} // namespace mounts {
} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_MOUNTS_MOUNTER_HPP__
