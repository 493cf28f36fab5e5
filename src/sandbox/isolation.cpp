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
#include <stout/os.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/which.hpp>

#include "sandbox/constants.hpp"
#include "sandbox/isolation.hpp"

using std::string;
using std::vector;

namespace mastra {
namespace internal {
namespace isolation {

static Option<string> bwrap()
{
  return os::which("bwrap");
}


Detection detect()
{
  Detection detection;

#if defined(__APPLE__)
  detection.backend = SEATBELT;
  detection.available = available(SEATBELT);
  detection.message = detection.available
    ? "seatbelt (sandbox-exec) is built into macOS"
    : "sandbox-exec was not found at '" + string(SEATBELT_EXECUTABLE) + "'";
#elif defined(__linux__)
  detection.backend = BWRAP;
  detection.available = available(BWRAP);
  detection.message = detection.available
    ? "bubblewrap (bwrap) is installed"
    : "bubblewrap (bwrap) is not installed. Install it with your package"
      " manager (e.g. 'apt install bubblewrap' or 'dnf install bubblewrap')";
#else
  detection.backend = NONE;
  detection.available = false;
  detection.message = "Native isolation is not supported on this platform";
#endif

  return detection;
}


bool available(const Isolation& backend)
{
  switch (backend) {
    case NONE:
      return true;
    case SEATBELT:
#ifdef __APPLE__
      return os::exists(SEATBELT_EXECUTABLE);
#else
      return false;
#endif
    case BWRAP:
#ifdef __linux__
      return bwrap().isSome();
#else
      return false;
#endif
  }

  return false;
}


Try<Isolation> parse(const string& name)
{
  Isolation isolation;
  if (!Isolation_Parse(strings::upper(name), &isolation)) {
    return Error(
        "Unknown isolation backend '" + name + "'; possible values are"
        " 'none', 'seatbelt' and 'bwrap'");
  }

  return isolation;
}


// Quotes a path as an SBPL string literal.
static string literal(const string& path)
{
  string escaped = strings::replace(path, "\\", "\\\\");
  escaped = strings::replace(escaped, "\"", "\\\"");
  return "\"" + escaped + "\"";
}


string generateSeatbeltProfile(
    const string& workingDirectory,
    const NativeSandboxConfig& config)
{
  vector<string> lines = {
    "(version 1)",
    "(deny default)",
    "",
    "(allow process-exec)",
    "(allow process-fork)",
    "(allow signal (target same-sandbox))",
    "(allow sysctl-read)",
    "(allow mach-lookup)",
    "(allow ipc-posix-shm)",
    "",
    "(allow file-read*)",
    "",
    "(allow file-write*",
    "    (subpath " + literal(workingDirectory) + ")",
    "    (subpath \"/private/tmp\")",
    "    (subpath \"/private/var/folders\")",
    "    (subpath \"/dev/fd\")",
    "    (literal \"/dev/null\")",
    "    (literal \"/dev/tty\")",
  };

  foreach (const string& path, config.read_write_paths()) {
    lines.push_back("    (subpath " + literal(path) + ")");
  }

  lines.back() += ")";

  if (config.allow_network()) {
    lines.push_back("");
    lines.push_back("(allow network*)");
  }

  return strings::join("\n", lines) + "\n";
}


Try<Command> wrap(const string& command, const WrapOptions& options)
{
  Command wrapped;

  switch (options.backend) {
    case NONE: {
      wrapped.path = SHELL_EXECUTABLE;
      wrapped.argv = {"sh", "-c", command};
      return wrapped;
    }
    case SEATBELT: {
      const string profile = options.seatbeltProfile.isSome()
        ? options.seatbeltProfile.get()
        : generateSeatbeltProfile(options.workspacePath, options.config);

      wrapped.path = SEATBELT_EXECUTABLE;
      wrapped.argv = {
        "sandbox-exec", "-p", profile, SHELL_EXECUTABLE, "-c", command};
      return wrapped;
    }
    case BWRAP: {
      Option<string> path = bwrap();
      if (path.isNone()) {
        return Error("bubblewrap (bwrap) is not installed");
      }

      wrapped.path = path.get();
      wrapped.argv = {
        "bwrap",
        "--ro-bind", "/", "/",
        "--dev", "/dev",
        "--proc", "/proc",
        "--bind", "/tmp", "/tmp",
        "--bind", options.workspacePath, options.workspacePath,
      };

      // Read live so that paths added after start (e.g. mounts) take
      // effect on the next command.
      foreach (const string& path, options.config.read_write_paths()) {
        wrapped.argv.insert(wrapped.argv.end(), {"--bind", path, path});
      }

      foreach (const string& path, options.config.read_only_paths()) {
        wrapped.argv.insert(wrapped.argv.end(), {"--ro-bind", path, path});
      }

      wrapped.argv.insert(
          wrapped.argv.end(),
          {"--unshare-pid", "--unshare-ipc", "--unshare-uts"});

      if (!options.config.allow_network()) {
        wrapped.argv.push_back("--unshare-net");
      }

      wrapped.argv.insert(
          wrapped.argv.end(),
          {"--die-with-parent", "--", SHELL_EXECUTABLE, "-c", command});

      return wrapped;
    }
  }

  return Error("Unknown isolation backend " + stringify(options.backend));
}

} // namespace isolation {
} // namespace internal {
} // namespace mastra {
