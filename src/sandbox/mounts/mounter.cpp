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

#include "sandbox/mounts/fuse.hpp"
#include "sandbox/mounts/mounter.hpp"
#include "sandbox/mounts/mounts.hpp"

using std::string;

using process::Future;

namespace mastra {
namespace internal {
namespace mounts {

Try<Mounter*> HostMounter::create()
{
  return new HostMounter();
}


Option<MountToolNotFoundError> HostMounter::checkInstalled(
    const MountConfig& config)
{
  return mounts::checkInstalled(config);
}


Future<Nothing> HostMounter::attach(
    const string& hostPath,
    const MountConfig& config,
    const string& credentialsDir)
{
  return mounts::attach(hostPath, config, credentialsDir);
}


Future<bool> HostMounter::isMountPoint(const string& path)
{
  return fuse::isMountPoint(path);
}


Future<Nothing> HostMounter::unmount(const string& path)
{
  return fuse::unmount(path);
}

} // namespace mounts {
} // namespace internal {
} // namespace mastra {
