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
#include <vector>

#include <stout/foreach.hpp>
#include <stout/path.hpp>
#include <stout/protobuf.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "common/hash.hpp"

#include "sandbox/mount_manager.hpp"
#include "sandbox/paths.hpp"

using std::string;
using std::vector;

namespace mastra {
namespace internal {
namespace paths {

Option<Error> validateMountPath(const string& mountPath)
{
  static const string ALLOWED =
    "abcdefghijklmnopqrstuvwxyz"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "0123456789"
    "_.-/";

  if (mountPath.size() < 2 ||
      mountPath[0] != '/' ||
      mountPath.find_first_not_of(ALLOWED) != string::npos) {
    return Error(
        "Invalid mount path: " + mountPath + ". Must be an absolute path"
        " with alphanumeric, dash, dot, underscore, or slash characters"
        " only.");
  }

  foreach (const string& segment, strings::tokenize(mountPath, "/")) {
    if (segment == "." || segment == "..") {
      return Error(
          "Invalid mount path: " + mountPath + ". Path segments cannot"
          " be \".\" or \"..\".");
    }
  }

  return None();
}


Try<string> getHostPath(
    const string& workingDirectory,
    const string& mountPath)
{
  const string relative = strings::trim(mountPath, strings::ANY, "/");

  if (relative.empty()) {
    return Error("Mount path '" + mountPath + "' resolves to the working"
                 " directory itself");
  }

  foreach (const string& segment, strings::tokenize(relative, "/")) {
    if (segment == "..") {
      return Error("Mount path '" + mountPath + "' escapes the working"
                   " directory");
    }
  }

  return path::join(workingDirectory, relative);
}


string getMarkerPath(const string& markerDir, const string& hostPath)
{
  return path::join(markerDir, MountManager::markerFilename(hostPath));
}


string getSeatbeltProfilePath(
    const string& profilesDir,
    const string& workingDirectory,
    const NativeSandboxConfig& config)
{
  const string digest = hash::sha256(
      workingDirectory + stringify(JSON::protobuf(config)));

  return path::join(profilesDir, "seatbelt-" + digest.substr(0, 8) + ".sb");
}


string getCredentialsPath(
    const string& credentialsDir,
    const string& kind,
    const string& hostPath)
{
  return path::join(
      credentialsDir,
      kind + "-" + MountManager::markerFilename(hostPath));
}

} // namespace paths {
} // namespace internal {
} // namespace mastra {
