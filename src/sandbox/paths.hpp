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

#ifndef __SANDBOX_PATHS_HPP__
#define __SANDBOX_PATHS_HPP__

#include <string>

#include <mastra/mastra.hpp>

#include <stout/error.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace mastra {
namespace internal {
namespace paths {

// Layout of the persisted sandbox state on the host:
//
//   <marker_dir>/mount-<hash of host path>    (one per mount, shared)
//   <profiles_dir>/seatbelt-<hash>.sb          (generated profiles)
//   <credentials_dir>/<kind>-<hash of host path>
//   <working_directory>/<mount path>          (mount points)


// Checks that `mountPath` is absolute, made of [a-zA-Z0-9_.-/] only,
// and has no '.' or '..' segments.
Option<Error> validateMountPath(const std::string& mountPath);


// Resolves a virtual mount path under the working directory. Fails if
// the result would escape the working directory.
Try<std::string> getHostPath(
    const std::string& workingDirectory,
    const std::string& mountPath);


std::string getMarkerPath(
    const std::string& markerDir,
    const std::string& hostPath);


std::string getSeatbeltProfilePath(
    const std::string& profilesDir,
    const std::string& workingDirectory,
    const NativeSandboxConfig& config);


std::string getCredentialsPath(
    const std::string& credentialsDir,
    const std::string& kind,
    const std::string& hostPath);

} // namespace paths {
} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_PATHS_HPP__
