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

#ifndef __MASTRA_PROCESS_HPP__
#define __MASTRA_PROCESS_HPP__

#include <sys/types.h>

#include <map>
#include <string>
#include <vector>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/duration.hpp>
#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

namespace mastra {

// Exit code reported for a command killed by its timeout.
constexpr int TIMEOUT_EXIT_CODE = 124;

// Exit code reported for a command terminated by a signal.
constexpr int SIGNAL_EXIT_CODE = 128;


struct ExecuteOptions
{
  // Defaults to the sandbox working directory.
  Option<std::string> cwd;

  // Merged over the sandbox environment, later values win.
  std::map<std::string, std::string> env;

  Option<Duration> timeout;

  // Invoked with every chunk of output as it is read. The callbacks
  // run on the process manager's actor and must not block.
  Option<lambda::function<void(const std::string&)>> onStdout;
  Option<lambda::function<void(const std::string&)>> onStderr;
};


struct CommandResult
{
  CommandResult()
    : success(false),
      exitCode(0),
      executionTime(Duration::zero()),
      killed(false),
      timedOut(false) {}

  bool success;
  int exitCode;
  std::string out;
  std::string err;
  Duration executionTime;
  bool killed;
  bool timedOut;
  Option<std::string> command;
};


struct ProcessInfo
{
  pid_t pid;
  std::string command;
  bool running;

  // None while the process is running.
  Option<int> exitCode;
};


// A spawned command. The process is the leader of its own process
// group and every signal is delivered to the whole group.
class ProcessHandle
{
public:
  virtual ~ProcessHandle() {}

  virtual pid_t pid() const = 0;

  virtual std::string command() const = 0;

  // None while the process is running.
  virtual process::Future<Option<int>> exitCode() const = 0;

  // Output accumulated so far.
  virtual process::Future<std::string> out() const = 0;
  virtual process::Future<std::string> err() const = 0;

  // Completes once the process has exited and its output has been
  // drained. May be called any number of times.
  virtual process::Future<CommandResult> wait() const = 0;

  // Kills the process group with SIGKILL. Returns false if the
  // process had already exited.
  virtual process::Future<bool> kill() const = 0;

  // Fails with `ProcessNotRunningError` once the process has exited,
  // or `StdinUnavailableError` if its stdin is closed.
  virtual process::Future<Nothing> sendStdin(const std::string& data) const = 0;
};


class ProcessManager
{
public:
  virtual ~ProcessManager() {}

  virtual process::Future<process::Owned<ProcessHandle>> spawn(
      const std::string& command,
      const ExecuteOptions& options = ExecuteOptions()) = 0;

  // Every process spawned by this manager, including exited ones.
  virtual process::Future<std::vector<ProcessInfo>> list() = 0;

  virtual process::Future<Option<process::Owned<ProcessHandle>>> get(
      pid_t pid) = 0;

  virtual process::Future<bool> kill(pid_t pid) = 0;
};

} // namespace mastra {

#endif // __MASTRA_PROCESS_HPP__
