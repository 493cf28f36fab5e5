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

#ifndef __SANDBOX_MOUNTS_GCS_HPP__
#define __SANDBOX_MOUNTS_GCS_HPP__

#include <string>
#include <vector>

#include <mastra/errors.hpp>
#include <mastra/mastra.hpp>

#include <process/future.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace mastra {
namespace internal {
namespace mounts {
namespace gcs {

// Checks the bucket name: 3 to 63 characters of [a-z0-9._-], starting
// and ending with a letter or digit.
Option<Error> validate(const MountConfig::GCS& config);


// Returns the path of `gcsfuse`, or the error to report if gcsfuse or
// FUSE is missing.
Try<std::string, MountToolNotFoundError> checkInstalled();


// Builds the gcsfuse argument vector (including argv[0]). `keyFile`
// is the service account key to use; none mounts the bucket with
// anonymous access.
std::vector<std::string> arguments(
    const std::string& hostPath,
    const MountConfig::GCS& config,
    const Option<std::string>& keyFile);


// Mounts the bucket at `hostPath` with gcsfuse. The service account
// key is written under `credentialsDir`.
process::Future<Nothing> mount(
    const std::string& hostPath,
    const MountConfig::GCS& config,
    const std::string& credentialsDir);

} // namespace gcs {
} // namespace mounts {
} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_MOUNTS_GCS_HPP__
