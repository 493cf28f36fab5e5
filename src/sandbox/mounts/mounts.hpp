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

#ifndef __SANDBOX_MOUNTS_MOUNTS_HPP__
#define __SANDBOX_MOUNTS_MOUNTS_HPP__

#include <string>

#include <mastra/errors.hpp>
#include <mastra/mastra.hpp>

#include <process/future.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

namespace mastra {
namespace internal {
namespace mounts {

// Validates the type specific part of a mount config. Nothing is
// touched on the host.
Option<Error> validate(const MountConfig& config);


// Returns the error to report (as 'unavailable') if the host lacks
// the tools needed to attach `config`.
Option<MountToolNotFoundError> checkInstalled(const MountConfig& config);


// Attaches `config` at `hostPath`, which must be an empty directory:
//   LOCAL: replaced by a symlink to the base path.
//   S3:    s3fs FUSE mount.
//   GCS:   gcsfuse FUSE mount.
// Credentials needed by the FUSE clients are written to
// `credentialsDir`.
process::Future<Nothing> attach(
    const std::string& hostPath,
    const MountConfig& config,
    const std::string& credentialsDir);


// Removes the credential files written for `hostPath`, if any.
void removeCredentials(
    const std::string& credentialsDir,
    const std::string& hostPath);

} // namespace mounts {
} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_MOUNTS_MOUNTS_HPP__
