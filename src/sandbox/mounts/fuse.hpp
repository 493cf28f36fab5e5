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

#ifndef __SANDBOX_MOUNTS_FUSE_HPP__
#define __SANDBOX_MOUNTS_FUSE_HPP__

#include <string>
#include <vector>

#include <mastra/errors.hpp>

#include <process/future.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace mastra {
namespace internal {
namespace mounts {
namespace fuse {

// Returns an error naming what is missing if FUSE (fuse/fuse3 on
// Linux, macFUSE on macOS) cannot be used on this host.
Option<MountToolNotFoundError> checkInstalled();


// Looks up a FUSE client (e.g. `s3fs`) on the PATH. The returned
// error carries `hint` on how to install the tool.
Try<std::string, MountToolNotFoundError> which(
    const std::string& tool,
    const std::string& hint);


// Whether `path` is the target of an active mount. Linux consults the
// mount table in /proc, macOS parses the output of `mount`.
process::Future<bool> isMountPoint(const std::string& path);


// The commands tried in turn to unmount `path`:
//   Linux: fusermount -u, umount, umount -l
//   macOS: umount, diskutil unmount
std::vector<std::vector<std::string>> unmountCommands(const std::string& path);


// Runs `unmountCommands(path)` until one succeeds. Fails with the
// error of the last command otherwise.
process::Future<Nothing> unmount(const std::string& path);


// Writes `content` to `path` (creating parent directories) such that
// only the owner can read it.
Try<Nothing> writeCredentials(
    const std::string& path,
    const std::string& content);

} // namespace fuse {
} // namespace mounts {
} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_MOUNTS_FUSE_HPP__
