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

#include <glog/logging.h>

#include <mastra/errors.hpp>

#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/option.hpp>

#include "sandbox/lifecycle.hpp"

using std::string;
using std::vector;

using process::defer;
using process::Failure;
using process::Future;

namespace mastra {
namespace internal {

class LifecycleProcess : public process::Process<LifecycleProcess>
{
public:
  LifecycleProcess(
      const string& _id,
      const Transitions& _transitions,
      const SandboxHooks& _hooks)
    : ProcessBase(process::ID::generate("sandbox-lifecycle")),
      id(_id),
      transitions(_transitions),
      hooks(_hooks),
      status_(SANDBOX_PENDING) {}

  Future<SandboxStatus> status()
  {
    return status_;
  }

  Future<Nothing> start();
  Future<Nothing> stop();
  Future<Nothing> destroy();
  Future<Nothing> ensureRunning();

private:
  Future<Nothing> _start();
  Future<Nothing> _stop();
  Future<Nothing> _destroy();

  Future<Nothing> executeStart();
  Future<Nothing> executeStop();
  Future<Nothing> executeDestroy();

  // Marks the sandbox errored and passes the failure on.
  Future<Nothing> failed(const string& transition, const Future<Nothing>& f);

  const string id;
  const Transitions transitions;
  const SandboxHooks hooks;

  SandboxStatus status_;

  // In-flight transitions. Cleared once the transition completes.
  Option<Future<Nothing>> starting;
  Option<Future<Nothing>> stopping;
  Option<Future<Nothing>> destroying;
};


// Returns a future that completes with `future`, whatever its outcome.
static Future<Nothing> settled(const Future<Nothing>& future)
{
  return future
    .repair([](const Future<Nothing>&) { return Nothing(); });
}


Future<Nothing> LifecycleProcess::start()
{
  if (status_ == SANDBOX_RUNNING) {
    return Nothing();
  }

  // Starting on top of a broken teardown is refused, hence the
  // failures of `stop` and `destroy` are propagated.
  vector<Future<Nothing>> teardown;
  if (stopping.isSome()) {
    teardown.push_back(stopping.get());
  }
  if (destroying.isSome()) {
    teardown.push_back(destroying.get());
  }

  if (teardown.empty()) {
    return _start();
  }

  return process::collect(teardown)
    .then(defer(self(), [this]() { return _start(); }));
}


Future<Nothing> LifecycleProcess::_start()
{
  if (status_ == SANDBOX_RUNNING) {
    return Nothing();
  }

  if (status_ == SANDBOX_DESTROYED) {
    return Failure("Cannot start a destroyed sandbox");
  }

  if (starting.isSome()) {
    return starting.get();
  }

  const Future<Nothing> future = executeStart();
  starting = future;

  future.onAny(defer(self(), [this, future]() {
    if (starting.isSome() && starting.get() == future) {
      starting = None();
    }
  }));

  return future;
}


Future<Nothing> LifecycleProcess::executeStart()
{
  LOG(INFO) << "Starting sandbox '" << id << "'";

  status_ = SANDBOX_STARTING;

  return transitions.start()
    .repair(defer(self(), [this](const Future<Nothing>& future) {
      return failed("start", future);
    }))
    .then(defer(self(), [this]() -> Future<Nothing> {
      status_ = SANDBOX_RUNNING;

      LOG(INFO) << "Sandbox '" << id << "' is running";

      if (hooks.onStart.isNone()) {
        return Nothing();
      }

      // A failing hook does not take down an otherwise healthy sandbox.
      return hooks.onStart.get()()
        .repair(defer(self(), [this](const Future<Nothing>& future) {
          LOG(WARNING) << "onStart hook of sandbox '" << id << "' failed: "
                       << future.failure();
          return Nothing();
        }));
    }))
    .then(defer(self(), [this]() -> Future<Nothing> {
      // Mount failures are recorded on the mounts themselves and never
      // affect the sandbox status.
      return transitions.started()
        .repair(defer(self(), [this](const Future<Nothing>& future) {
          LOG(WARNING) << "Failed to process pending mounts of sandbox '"
                       << id << "': " << future.failure();
          return Nothing();
        }));
    }));
}


Future<Nothing> LifecycleProcess::stop()
{
  if (status_ == SANDBOX_STOPPED || status_ == SANDBOX_DESTROYED) {
    return Nothing();
  }

  if (starting.isNone()) {
    return _stop();
  }

  return settled(starting.get())
    .then(defer(self(), [this]() { return _stop(); }));
}


Future<Nothing> LifecycleProcess::_stop()
{
  if (status_ == SANDBOX_STOPPED || status_ == SANDBOX_DESTROYED) {
    return Nothing();
  }

  if (stopping.isSome()) {
    return stopping.get();
  }

  const Future<Nothing> future = executeStop();
  stopping = future;

  future.onAny(defer(self(), [this, future]() {
    if (stopping.isSome() && stopping.get() == future) {
      stopping = None();
    }
  }));

  return future;
}


Future<Nothing> LifecycleProcess::executeStop()
{
  LOG(INFO) << "Stopping sandbox '" << id << "'";

  status_ = SANDBOX_STOPPING;

  Future<Nothing> hook =
    hooks.onStop.isSome() ? hooks.onStop.get()() : Future<Nothing>(Nothing());

  return hook
    .then(defer(self(), [this]() { return transitions.stop(); }))
    .then(defer(self(), [this]() {
      status_ = SANDBOX_STOPPED;

      LOG(INFO) << "Sandbox '" << id << "' stopped";

      return Nothing();
    }))
    .repair(defer(self(), [this](const Future<Nothing>& future) {
      return failed("stop", future);
    }));
}


Future<Nothing> LifecycleProcess::destroy()
{
  if (status_ == SANDBOX_DESTROYED) {
    return Nothing();
  }

  // Nothing to clean up for a sandbox that was never started.
  if (status_ == SANDBOX_PENDING) {
    LOG(INFO) << "Destroying sandbox '" << id << "' that was never started";

    status_ = SANDBOX_DESTROYED;
    return Nothing();
  }

  vector<Future<Nothing>> pending;
  if (starting.isSome()) {
    pending.push_back(settled(starting.get()));
  }
  if (stopping.isSome()) {
    pending.push_back(settled(stopping.get()));
  }

  if (pending.empty()) {
    return _destroy();
  }

  return process::collect(pending)
    .then(defer(self(), [this]() { return _destroy(); }));
}


Future<Nothing> LifecycleProcess::_destroy()
{
  if (status_ == SANDBOX_DESTROYED) {
    return Nothing();
  }

  if (destroying.isSome()) {
    return destroying.get();
  }

  const Future<Nothing> future = executeDestroy();
  destroying = future;

  future.onAny(defer(self(), [this, future]() {
    if (destroying.isSome() && destroying.get() == future) {
      destroying = None();
    }
  }));

  return future;
}


Future<Nothing> LifecycleProcess::executeDestroy()
{
  LOG(INFO) << "Destroying sandbox '" << id << "'";

  status_ = SANDBOX_DESTROYING;

  Future<Nothing> hook = hooks.onDestroy.isSome()
    ? hooks.onDestroy.get()()
    : Future<Nothing>(Nothing());

  return hook
    .then(defer(self(), [this]() { return transitions.destroy(); }))
    .then(defer(self(), [this]() {
      status_ = SANDBOX_DESTROYED;

      LOG(INFO) << "Sandbox '" << id << "' destroyed";

      return Nothing();
    }))
    .repair(defer(self(), [this](const Future<Nothing>& future) {
      return failed("destroy", future);
    }));
}


Future<Nothing> LifecycleProcess::ensureRunning()
{
  switch (status_) {
    case SANDBOX_DESTROYED:
      return Failure(SandboxNotReadyError(id, status_).message);
    case SANDBOX_STOPPING:
    case SANDBOX_DESTROYING:
    case SANDBOX_RUNNING:
      return Nothing();
    case SANDBOX_PENDING:
    case SANDBOX_STARTING:
    case SANDBOX_STOPPED:
    case SANDBOX_ERROR:
      break;
  }

  return start()
    .then(defer(self(), [this]() -> Future<Nothing> {
      if (status_ != SANDBOX_RUNNING) {
        return Failure(SandboxNotReadyError(id, status_).message);
      }

      return Nothing();
    }));
}


Future<Nothing> LifecycleProcess::failed(
    const string& transition,
    const Future<Nothing>& future)
{
  status_ = SANDBOX_ERROR;

  LOG(ERROR) << "Failed to " << transition << " sandbox '" << id << "': "
             << (future.isFailed() ? future.failure() : "discarded");

  return future;
}


Lifecycle::Lifecycle(
    const string& id,
    const Transitions& transitions,
    const SandboxHooks& hooks)
  : process(new LifecycleProcess(id, transitions, hooks))
{
  process::spawn(process.get());
}


Lifecycle::~Lifecycle()
{
  process::terminate(process.get());
  process::wait(process.get());
}


Future<SandboxStatus> Lifecycle::status() const
{
  return process::dispatch(process.get(), &LifecycleProcess::status);
}


Future<Nothing> Lifecycle::start()
{
  return process::dispatch(process.get(), &LifecycleProcess::start);
}


Future<Nothing> Lifecycle::stop()
{
  return process::dispatch(process.get(), &LifecycleProcess::stop);
}


Future<Nothing> Lifecycle::destroy()
{
  return process::dispatch(process.get(), &LifecycleProcess::destroy);
}


Future<Nothing> Lifecycle::ensureRunning()
{
  return process::dispatch(process.get(), &LifecycleProcess::ensureRunning);
}

} // namespace internal {
} // namespace mastra {
