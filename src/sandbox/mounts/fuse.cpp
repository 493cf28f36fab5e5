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

#include <fcntl.h>
#include <limits.h>

#include <sys/stat.h>

#ifdef __linux__
#include <mntent.h>
#include <stdio.h>
#endif // __linux__

#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/loop.hpp>

#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include <stout/os/close.hpp>
#include <stout/os/exists.hpp>
#include <stout/os/open.hpp>
#include <stout/os/which.hpp>
#include <stout/os/write.hpp>

#include "common/command_utils.hpp"

#include "sandbox/mounts/fuse.hpp"

using std::string;
using std::vector;

using process::Break;
using process::Continue;
using process::ControlFlow;
using process::Failure;
using process::Future;

namespace mastra {
namespace internal {
namespace mounts {
namespace fuse {

Option<MountToolNotFoundError> checkInstalled()
{
#if defined(__linux__)
  if (os::which("fusermount").isNone() && os::which("fusermount3").isNone()) {
    return MountToolNotFoundError(
        "FUSE",
        "Install it with your package manager"
        " (e.g. 'apt install fuse3' or 'dnf install fuse3').");
  }

  if (!os::exists("/dev/fuse")) {
    return MountToolNotFoundError(
        "FUSE",
        "The '/dev/fuse' device is missing; load the 'fuse' kernel module"
        " or, in a container, expose the device to it.");
  }

  return None();
#elif defined(__APPLE__)
  if (!os::exists("/Library/Filesystems/macfuse.fs") &&
      !os::exists("/Library/Filesystems/osxfuse.fs")) {
    return MountToolNotFoundError(
        "macFUSE",
        "Install it with 'brew install --cask macfuse' and allow its"
        " kernel extension in System Settings.");
  }

  return None();
#else
  return MountToolNotFoundError(
      "FUSE",
      "FUSE mounts are not supported on this platform.");
#endif
}


Try<string, MountToolNotFoundError> which(
    const string& tool,
    const string& hint)
{
  Option<string> path = os::which(tool);
  if (path.isNone()) {
    return MountToolNotFoundError(tool, hint);
  }

  return path.get();
}


Future<bool> isMountPoint(const string& path)
{
#ifdef __linux__
  // Same approach as reading a mount table with `getmntent_r`, which
  // also decodes the octal escapes used for spaces in paths.
  FILE* file = ::setmntent("/proc/self/mounts", "r");
  if (file == nullptr) {
    return Failure("Failed to open '/proc/self/mounts'");
  }

  bool found = false;

  struct mntent mntentBuffer;
  char strBuffer[PATH_MAX * 2];
  while (struct mntent* mntent =
           ::getmntent_r(file, &mntentBuffer, strBuffer, sizeof(strBuffer))) {
    if (path == mntent->mnt_dir) {
      found = true;
      break;
    }
  }

  ::endmntent(file);

  return found;
#else
  // Lines look like: '<source> on <target> (<type>, <options>)'.
  const string needle = " on " + path + " (";

  return command::launch("mount", {"mount"})
    .then([needle](const string& output) {
      foreach (const string& line, strings::tokenize(output, "\n")) {
        if (strings::contains(line, needle)) {
          return true;
        }
      }
      return false;
    });
#endif // __linux__
}


vector<vector<string>> unmountCommands(const string& path)
{
  vector<vector<string>> commands;

#ifdef __APPLE__
  commands.push_back({"umount", path});
  commands.push_back({"diskutil", "unmount", path});
#else
  if (os::which("fusermount").isSome()) {
    commands.push_back({"fusermount", "-u", path});
  } else if (os::which("fusermount3").isSome()) {
    commands.push_back({"fusermount3", "-u", path});
  }

  commands.push_back({"umount", path});
  commands.push_back({"umount", "-l", path});
#endif // __APPLE__

  return commands;
}


Future<Nothing> unmount(const string& path)
{
  const vector<vector<string>> commands = unmountCommands(path);

  std::shared_ptr<size_t> index(new size_t(0));
  std::shared_ptr<string> error(new string("no unmount command available"));

  return process::loop(
      None(),
      [=]() -> Future<bool> {
        if (*index >= commands.size()) {
          return Failure(
              "Failed to unmount '" + path + "': " + *error);
        }

        const vector<string>& argv = commands.at((*index)++);

        VLOG(1) << "Unmounting '" << path << "' with '"
                << strings::join(" ", argv) << "'";

        return command::launch(argv.front(), argv)
          .then([]() { return true; })
          .repair([=](const Future<bool>& future) -> Future<bool> {
            *error = future.failure();

            LOG(WARNING) << "'" << strings::join(" ", argv) << "' failed: "
                         << future.failure();

            return false;
          });
      },
      [](bool unmounted) -> ControlFlow<Nothing> {
        if (unmounted) {
          return Break();
        }
        return Continue();
      });
}


Try<Nothing> writeCredentials(const string& path, const string& content)
{
  Try<Nothing> mkdir = os::mkdir(Path(path).dirname());
  if (mkdir.isError()) {
    return Error(
        "Failed to create directory for '" + path + "': " + mkdir.error());
  }

  Try<int_fd> fd = os::open(
      path,
      O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
      S_IRUSR | S_IWUSR);

  if (fd.isError()) {
    return Error("Failed to open '" + path + "': " + fd.error());
  }

  Try<Nothing> write = os::write(fd.get(), content);
  os::close(fd.get());

  if (write.isError()) {
    return Error("Failed to write '" + path + "': " + write.error());
  }

  // An existing file keeps its mode on `O_TRUNC`.
  Try<Nothing> chmod = os::chmod(path, S_IRUSR | S_IWUSR);
  if (chmod.isError()) {
    return Error("Failed to chmod '" + path + "': " + chmod.error());
  }

  return Nothing();
}

} // namespace fuse {
} // namespace mounts {
} // namespace internal {
} // namespace mastra {
