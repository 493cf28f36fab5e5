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

#ifndef __SANDBOX_MOUNTS_LOCAL_HPP__
#define __SANDBOX_MOUNTS_LOCAL_HPP__

#include <string>

#include <mastra/mastra.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

namespace mastra {
namespace internal {
namespace mounts {
namespace local {

Option<Error> validate(const MountConfig::Local& config);


// The absolute path a local mount links to. Relative base paths are
// resolved against the current working directory.
std::string target(const MountConfig::Local& config);


// Returns the absolute target of the symlink at `path`, none if
// `path` is not a symlink.
Result<std::string> readlink(const std::string& path);


// Replaces the (empty) directory at `hostPath` with a symlink to the
// base path.
Try<Nothing> mount(
    const std::string& hostPath,
    const MountConfig::Local& config);

} // namespace local {
} // namespace mounts {
} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_MOUNTS_LOCAL_HPP__
