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

#include <errno.h>
#include <signal.h>

#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <glog/logging.h>

#include <mastra/errors.hpp>

#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/delay.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/io.hpp>
#include <process/process.hpp>
#include <process/subprocess.hpp>
#include <process/timer.hpp>

#include <stout/check.hpp>
#include <stout/foreach.hpp>
#include <stout/stopwatch.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/getenv.hpp>
#include <stout/os/stat.hpp>
#include <stout/os/strerror.hpp>

#include "common/status_utils.hpp"

#include "sandbox/constants.hpp"
#include "sandbox/process_manager.hpp"

using std::map;
using std::string;
using std::tuple;
using std::vector;

using process::Clock;
using process::defer;
using process::Failure;
using process::Future;
using process::Owned;
using process::PID;
using process::Promise;
using process::Subprocess;
using process::Timer;

namespace mastra {
namespace internal {

// Time a timed out process group is given to exit after SIGTERM
// before it is sent SIGKILL.
constexpr Duration KILL_GRACE_PERIOD = Seconds(5);


// Signals the process group led by `pid`, falling back to the leader
// alone if the group cannot be signaled.
static bool signal(pid_t pid, int signal)
{
  if (::kill(-pid, signal) == 0) {
    return true;
  }

  return ::kill(pid, signal) == 0;
}


class LocalProcessManagerProcess
  : public process::Process<LocalProcessManagerProcess>
{
public:
  explicit LocalProcessManagerProcess(const ProcessContext& _context)
    : ProcessBase(process::ID::generate("local-process-manager")),
      context(_context) {}

  ~LocalProcessManagerProcess() override {}

  Future<pid_t> spawn(const string& command, const ExecuteOptions& options);

  Future<vector<ProcessInfo>> list();

  Future<Option<string>> command(pid_t pid);

  Future<Option<int>> exitCode(pid_t pid);

  Future<string> out(pid_t pid);

  Future<string> err(pid_t pid);

  Future<CommandResult> wait(pid_t pid);

  Future<bool> kill(pid_t pid);

  Future<Nothing> sendStdin(pid_t pid, const string& data);

  Future<Nothing> killAll();

protected:
  void finalize() override;

private:
  enum Stream
  {
    STDOUT,
    STDERR
  };

  struct Child
  {
    Child(const string& _command,
          const Subprocess& _subprocess,
          const ExecuteOptions& options)
      : command(_command),
        subprocess(_subprocess),
        onStdout(options.onStdout),
        onStderr(options.onStderr),
        timeout(options.timeout),
        timedOut(false),
        killed(false),
        completed(false)
    {
      stopwatch.start();
    }

    const string command;
    const Subprocess subprocess;
    const Option<lambda::function<void(const string&)>> onStdout;
    const Option<lambda::function<void(const string&)>> onStderr;
    const Option<Duration> timeout;

    Stopwatch stopwatch;

    string out;
    string err;

    Option<int> exitCode;

    bool timedOut;
    bool killed;

    // Set once the process has been reaped and both of its output
    // streams have reached EOF.
    bool completed;

    Option<Timer> timer;
    Option<Timer> escalation;

    Promise<CommandResult> promise;
  };

  Future<pid_t> _spawn(
      const string& command,
      const ExecuteOptions& options,
      const isolation::Command& wrapped);

  void output(pid_t pid, Stream stream, const string& data);

  void timeout(pid_t pid);

  void escalate(pid_t pid);

  void reaped(
      pid_t pid,
      const Future<tuple<
          Future<Option<int>>, Future<Nothing>, Future<Nothing>>>& future);

  // Returns none if `pid` was not spawned by this manager.
  Option<Child*> find(pid_t pid);

  const ProcessContext context;

  map<pid_t, Owned<Child>> children;
};


Future<pid_t> LocalProcessManagerProcess::spawn(
    const string& command,
    const ExecuteOptions& options)
{
  return context.ensureRunning()
    .then(defer(self(), [=]() {
      return context.wrap(command);
    }))
    .then(defer(self(), &Self::_spawn, command, options, lambda::_1));
}


Future<pid_t> LocalProcessManagerProcess::_spawn(
    const string& command,
    const ExecuteOptions& options,
    const isolation::Command& wrapped)
{
  const string cwd = options.cwd.getOrElse(context.workingDirectory);

  if (!os::stat::isdir(cwd)) {
    return Failure("Working directory '" + cwd + "' does not exist");
  }

  // Later sources win: host PATH, then the sandbox environment, then
  // the per-command environment.
  map<string, string> environment;

  Option<string> path = os::getenv("PATH");
  if (path.isSome()) {
    environment["PATH"] = path.get();
  }

  foreachpair (const string& key, const string& value, context.environment) {
    environment[key] = value;
  }

  foreachpair (const string& key, const string& value, options.env) {
    environment[key] = value;
  }

  Try<Subprocess> s = process::subprocess(
      wrapped.path,
      wrapped.argv,
      Subprocess::PIPE(),
      Subprocess::PIPE(),
      Subprocess::PIPE(),
      nullptr,
      environment,
      None(),
      {},
      {Subprocess::ChildHook::SETSID(),
       Subprocess::ChildHook::CHDIR(cwd)});

  if (s.isError()) {
    return Failure("Failed to spawn '" + command + "': " + s.error());
  }

  const pid_t pid = s->pid();

  CHECK_SOME(s->out());
  CHECK_SOME(s->err());

  Owned<Child> child(new Child(command, s.get(), options));
  children[pid] = child;

  VLOG(1) << "Spawned process " << pid << " for '" << command << "'"
          << " in '" << cwd << "'";

  // The redirect hooks are invoked from whichever thread completes the
  // read, so they hand the chunk over to this actor.
  const PID<LocalProcessManagerProcess> manager = self();

  Future<Nothing> out = process::io::redirect(
      s->out().get(),
      None(),
      READ_BUFFER_SIZE,
      {[manager, pid](const string& data) {
        process::dispatch(manager, &Self::output, pid, STDOUT, data);
      }});

  Future<Nothing> err = process::io::redirect(
      s->err().get(),
      None(),
      READ_BUFFER_SIZE,
      {[manager, pid](const string& data) {
        process::dispatch(manager, &Self::output, pid, STDERR, data);
      }});

  if (options.timeout.isSome()) {
    child->timer = process::delay(
        options.timeout.get(), manager, &Self::timeout, pid);
  }

  process::await(s->status(), out, err)
    .onAny(defer(manager, &Self::reaped, pid, lambda::_1));

  return pid;
}


void LocalProcessManagerProcess::output(
    pid_t pid,
    Stream stream,
    const string& data)
{
  Option<Child*> child = find(pid);
  if (child.isNone()) {
    return;
  }

  if (stream == STDOUT) {
    child.get()->out += data;
    if (child.get()->onStdout.isSome()) {
      child.get()->onStdout.get()(data);
    }
  } else {
    child.get()->err += data;
    if (child.get()->onStderr.isSome()) {
      child.get()->onStderr.get()(data);
    }
  }
}


void LocalProcessManagerProcess::timeout(pid_t pid)
{
  Option<Child*> child = find(pid);

  // The process exited before the timer could be cancelled.
  if (child.isNone() || child.get()->completed) {
    return;
  }

  LOG(WARNING) << "Process " << pid << " ('" << child.get()->command << "')"
               << " timed out after " << child.get()->timeout.get()
               << ", sending SIGTERM";

  child.get()->timedOut = true;
  child.get()->timer = None();

  if (!signal(pid, SIGTERM)) {
    LOG(WARNING) << "Failed to send SIGTERM to process " << pid << ": "
                 << os::strerror(errno);
  }

  child.get()->escalation = process::delay(
      KILL_GRACE_PERIOD, self(), &Self::escalate, pid);
}


void LocalProcessManagerProcess::escalate(pid_t pid)
{
  Option<Child*> child = find(pid);
  if (child.isNone() || child.get()->completed) {
    return;
  }

  LOG(WARNING) << "Process " << pid << " did not exit within "
               << KILL_GRACE_PERIOD << " of SIGTERM, sending SIGKILL";

  child.get()->escalation = None();

  signal(pid, SIGKILL);
}


void LocalProcessManagerProcess::reaped(
    pid_t pid,
    const Future<tuple<
        Future<Option<int>>, Future<Nothing>, Future<Nothing>>>& future)
{
  Option<Child*> found = find(pid);
  if (found.isNone()) {
    return;
  }

  Child* child = found.get();

  if (child->timer.isSome()) {
    Clock::cancel(child->timer.get());
    child->timer = None();
  }

  if (child->escalation.isSome()) {
    Clock::cancel(child->escalation.get());
    child->escalation = None();
  }

  child->completed = true;

  CommandResult result;
  result.command = child->command;
  result.executionTime = child->stopwatch.elapsed();
  result.killed = child->killed;
  result.timedOut = child->timedOut;

  Option<int> status;

  if (future.isReady()) {
    const Future<Option<int>>& reap = std::get<0>(future.get());
    const Future<Nothing>& out = std::get<1>(future.get());
    const Future<Nothing>& err = std::get<2>(future.get());

    if (reap.isReady()) {
      status = reap.get();
    } else {
      LOG(ERROR) << "Failed to reap process " << pid << ": "
                 << (reap.isFailed() ? reap.failure() : "discarded");
    }

    if (!out.isReady()) {
      LOG(WARNING) << "Failed to read stdout of process " << pid << ": "
                   << (out.isFailed() ? out.failure() : "discarded");
    }

    if (!err.isReady()) {
      LOG(WARNING) << "Failed to read stderr of process " << pid << ": "
                   << (err.isFailed() ? err.failure() : "discarded");
    }
  }

  if (child->timedOut) {
    result.exitCode = TIMEOUT_EXIT_CODE;

    if (!child->err.empty() && !strings::endsWith(child->err, "\n")) {
      child->err += "\n";
    }
    child->err +=
      "Process timed out after " + stringify(child->timeout.get()) + "\n";
  } else if (status.isSome()) {
    result.exitCode = WEXITCODE(status.get());
  } else {
    // The exit status is unknown, e.g. the process was reaped by
    // somebody else.
    result.exitCode = SIGNAL_EXIT_CODE;
  }

  child->exitCode = result.exitCode;

  result.success = result.exitCode == 0 && !child->timedOut;
  result.out = child->out;
  result.err = child->err;

  VLOG(1) << "Process " << pid << " exited with code " << result.exitCode
          << " after " << result.executionTime;

  child->promise.set(result);
}


Future<vector<ProcessInfo>> LocalProcessManagerProcess::list()
{
  vector<ProcessInfo> infos;

  foreachpair (pid_t pid, const Owned<Child>& child, children) {
    ProcessInfo info;
    info.pid = pid;
    info.command = child->command;
    info.running = !child->completed;
    info.exitCode = child->exitCode;

    infos.push_back(info);
  }

  return infos;
}


Future<Option<string>> LocalProcessManagerProcess::command(pid_t pid)
{
  Option<Child*> child = find(pid);
  if (child.isNone()) {
    return None();
  }

  return child.get()->command;
}


Future<Option<int>> LocalProcessManagerProcess::exitCode(pid_t pid)
{
  Option<Child*> child = find(pid);
  if (child.isNone()) {
    return Failure("Unknown process " + stringify(pid));
  }

  return child.get()->exitCode;
}


Future<string> LocalProcessManagerProcess::out(pid_t pid)
{
  Option<Child*> child = find(pid);
  if (child.isNone()) {
    return Failure("Unknown process " + stringify(pid));
  }

  return child.get()->out;
}


Future<string> LocalProcessManagerProcess::err(pid_t pid)
{
  Option<Child*> child = find(pid);
  if (child.isNone()) {
    return Failure("Unknown process " + stringify(pid));
  }

  return child.get()->err;
}


Future<CommandResult> LocalProcessManagerProcess::wait(pid_t pid)
{
  Option<Child*> child = find(pid);
  if (child.isNone()) {
    return Failure("Unknown process " + stringify(pid));
  }

  return child.get()->promise.future();
}


Future<bool> LocalProcessManagerProcess::kill(pid_t pid)
{
  Option<Child*> child = find(pid);
  if (child.isNone() || child.get()->completed) {
    return false;
  }

  VLOG(1) << "Killing process " << pid << " ('" << child.get()->command << "')";

  child.get()->killed = true;

  if (!signal(pid, SIGKILL)) {
    return Failure(
        "Failed to kill process " + stringify(pid) + ": " +
        os::strerror(errno));
  }

  return true;
}


Future<Nothing> LocalProcessManagerProcess::sendStdin(
    pid_t pid,
    const string& data)
{
  Option<Child*> child = find(pid);
  if (child.isNone() || child.get()->completed) {
    return Failure(ProcessNotRunningError(pid).message);
  }

  const Option<int_fd> in = child.get()->subprocess.in();
  if (in.isNone()) {
    return Failure(StdinUnavailableError(pid).message);
  }

  return process::io::write(in.get(), data)
    .repair([pid](const Future<Nothing>& future) -> Future<Nothing> {
      LOG(WARNING) << "Failed to write to stdin of process " << pid << ": "
                   << future.failure();

      return Failure(StdinUnavailableError(pid).message);
    });
}


Future<Nothing> LocalProcessManagerProcess::killAll()
{
  vector<Future<bool>> kills;

  foreachkey (pid_t pid, children) {
    if (!children.at(pid)->completed) {
      kills.push_back(kill(pid));
    }
  }

  return process::await(kills)
    .then([]() { return Nothing(); });
}


void LocalProcessManagerProcess::finalize()
{
  foreachpair (pid_t pid, const Owned<Child>& child, children) {
    if (child->timer.isSome()) {
      Clock::cancel(child->timer.get());
    }

    if (child->escalation.isSome()) {
      Clock::cancel(child->escalation.get());
    }

    if (!child->completed) {
      LOG(INFO) << "Killing process " << pid << " ('" << child->command
                << "') on shutdown";

      signal(pid, SIGKILL);

      child->promise.fail("Process manager terminated");
    }
  }
}


Option<LocalProcessManagerProcess::Child*> LocalProcessManagerProcess::find(
    pid_t pid)
{
  auto it = children.find(pid);
  if (it == children.end()) {
    return None();
  }

  return it->second.get();
}


// A handle is a view onto the process manager's record of a child; it
// holds no state of its own and outlives neither the manager nor the
// record (records are never removed).
class LocalProcessHandle : public ProcessHandle
{
public:
  LocalProcessHandle(
      const PID<LocalProcessManagerProcess>& _manager,
      pid_t _pid,
      const string& _command)
    : manager(_manager), pid_(_pid), command_(_command) {}

  pid_t pid() const override { return pid_; }

  string command() const override { return command_; }

  Future<Option<int>> exitCode() const override
  {
    return process::dispatch(
        manager, &LocalProcessManagerProcess::exitCode, pid_);
  }

  Future<string> out() const override
  {
    return process::dispatch(manager, &LocalProcessManagerProcess::out, pid_);
  }

  Future<string> err() const override
  {
    return process::dispatch(manager, &LocalProcessManagerProcess::err, pid_);
  }

  Future<CommandResult> wait() const override
  {
    return process::dispatch(manager, &LocalProcessManagerProcess::wait, pid_);
  }

  Future<bool> kill() const override
  {
    return process::dispatch(manager, &LocalProcessManagerProcess::kill, pid_);
  }

  Future<Nothing> sendStdin(const string& data) const override
  {
    return process::dispatch(
        manager, &LocalProcessManagerProcess::sendStdin, pid_, data);
  }

private:
  const PID<LocalProcessManagerProcess> manager;
  const pid_t pid_;
  const string command_;
};


LocalProcessManager::LocalProcessManager(const ProcessContext& context)
  : process(new LocalProcessManagerProcess(context))
{
  process::spawn(process.get());
}


LocalProcessManager::~LocalProcessManager()
{
  process::terminate(process.get());
  process::wait(process.get());
}


Future<Owned<ProcessHandle>> LocalProcessManager::spawn(
    const string& command,
    const ExecuteOptions& options)
{
  const PID<LocalProcessManagerProcess> pid = process->self();

  return process::dispatch(
      process.get(),
      &LocalProcessManagerProcess::spawn,
      command,
      options)
    .then([pid, command](pid_t child) -> Owned<ProcessHandle> {
      return Owned<ProcessHandle>(
          new LocalProcessHandle(pid, child, command));
    });
}


Future<vector<ProcessInfo>> LocalProcessManager::list()
{
  return process::dispatch(process.get(), &LocalProcessManagerProcess::list);
}


Future<Option<Owned<ProcessHandle>>> LocalProcessManager::get(pid_t pid)
{
  const PID<LocalProcessManagerProcess> manager = process->self();

  return process::dispatch(
      process.get(),
      &LocalProcessManagerProcess::command,
      pid)
    .then([manager, pid](const Option<string>& command)
        -> Option<Owned<ProcessHandle>> {
      if (command.isNone()) {
        return None();
      }

      return Owned<ProcessHandle>(
          new LocalProcessHandle(manager, pid, command.get()));
    });
}


Future<bool> LocalProcessManager::kill(pid_t pid)
{
  return process::dispatch(
      process.get(),
      &LocalProcessManagerProcess::kill,
      pid);
}


Future<Nothing> LocalProcessManager::killAll()
{
  return process::dispatch(
      process.get(),
      &LocalProcessManagerProcess::killAll);
}

} // namespace internal {
} // namespace mastra {
