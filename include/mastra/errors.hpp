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

#ifndef __MASTRA_ERRORS_HPP__
#define __MASTRA_ERRORS_HPP__

#include <sys/types.h>

#include <string>

#include <mastra/mastra.hpp>

#include <stout/error.hpp>
#include <stout/stringify.hpp>

namespace mastra {

// An operation needed a running sandbox but the sandbox is destroyed
// or could not be started.
class SandboxNotReadyError : public Error
{
public:
  SandboxNotReadyError(const std::string& id, const SandboxStatus& status)
    : Error("Sandbox '" + id + "' is not ready (status: " +
            stringify(status) + ")") {}
};


class ProcessNotRunningError : public Error
{
public:
  explicit ProcessNotRunningError(pid_t pid)
    : Error("Process " + stringify(pid) + " is not running") {}
};


class StdinUnavailableError : public Error
{
public:
  explicit StdinUnavailableError(pid_t pid)
    : Error("Process " + stringify(pid) + " has no writable stdin") {}
};


// The host is missing the tool needed to attach a filesystem (s3fs,
// gcsfuse, macFUSE). Mounts failing with this error are reported as
// 'unavailable' rather than 'error'.
class MountToolNotFoundError : public Error
{
public:
  MountToolNotFoundError(const std::string& tool, const std::string& hint)
    : Error(tool + " is not installed. " + hint), tool(tool) {}

  std::string tool;
};


class IsolationUnavailableError : public Error
{
public:
  IsolationUnavailableError(
      const Isolation& isolation,
      const std::string& reason)
    : Error("Isolation backend '" + stringify(isolation) +
            "' is not available: " + reason) {}
};

} // namespace mastra {

#endif // __MASTRA_ERRORS_HPP__
