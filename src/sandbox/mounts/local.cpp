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

#include <limits.h>
#include <unistd.h>

#include <string>

#include <stout/fs.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include <stout/os/stat.hpp>

#include "sandbox/mounts/local.hpp"

using std::string;

namespace mastra {
namespace internal {
namespace mounts {
namespace local {

// Drops trailing slashes so that '/data/' and '/data' compare equal.
static string strip(const string& path)
{
  const string stripped = strings::trim(path, strings::SUFFIX, "/");
  return stripped.empty() ? path : stripped;
}


Option<Error> validate(const MountConfig::Local& config)
{
  if (config.base_path().empty()) {
    return Error("Local mount requires a non-empty 'base_path'");
  }

  return None();
}


string target(const MountConfig::Local& config)
{
  if (path::absolute(config.base_path())) {
    return strip(config.base_path());
  }

  return strip(path::join(os::getcwd(), config.base_path()));
}


Result<string> readlink(const string& path)
{
  if (!os::stat::islink(path)) {
    return None();
  }

  char buffer[PATH_MAX];
  const ssize_t length = ::readlink(path.c_str(), buffer, sizeof(buffer));
  if (length < 0) {
    return ErrnoError("Failed to read link '" + path + "'");
  }

  const string link(buffer, length);

  if (path::absolute(link)) {
    return strip(link);
  }

  return strip(path::join(Path(path).dirname(), link));
}


Try<Nothing> mount(const string& hostPath, const MountConfig::Local& config)
{
  // The symlink replaces the mount point created by the caller.
  Try<Nothing> rmdir = os::rmdir(hostPath, false);
  if (rmdir.isError()) {
    return Error(
        "Failed to remove mount point '" + hostPath + "': " + rmdir.error());
  }

  Try<Nothing> symlink = fs::symlink(target(config), hostPath);
  if (symlink.isError()) {
    return Error(
        "Failed to link '" + hostPath + "' to '" + target(config) + "': " +
        symlink.error());
  }

  return Nothing();
}

} // namespace local {
} // namespace mounts {
} // namespace internal {
} // namespace mastra {
