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

#ifndef __SANDBOX_MOUNTS_S3_HPP__
#define __SANDBOX_MOUNTS_S3_HPP__

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
namespace s3 {

// Checks the bucket name (3 to 63 characters of [a-z0-9.-], starting
// and ending with a letter or digit), the endpoint (an http(s) URL)
// and the region. All of them end up in `-o` options of s3fs, so
// commas and whitespace are rejected.
Option<Error> validate(const MountConfig::S3& config);


// Returns the path of `s3fs`, or the error to report if s3fs or FUSE
// is missing.
Try<std::string, MountToolNotFoundError> checkInstalled();


// Builds the s3fs argument vector (including argv[0]) to mount the
// bucket at `hostPath`. `credentials` is the passwd file to use; none
// mounts the bucket anonymously.
std::vector<std::string> arguments(
    const std::string& hostPath,
    const MountConfig::S3& config,
    const Option<std::string>& credentials);


// Mounts the bucket at `hostPath` with s3fs. Access keys are written
// to a passwd file under `credentialsDir`; a session token is passed
// through the environment instead since the passwd file cannot hold
// one.
process::Future<Nothing> mount(
    const std::string& hostPath,
    const MountConfig::S3& config,
    const std::string& credentialsDir);

} // namespace s3 {
} // namespace mounts {
} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_MOUNTS_S3_HPP__
