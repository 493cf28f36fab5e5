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

#ifndef __SANDBOX_LIFECYCLE_HPP__
#define __SANDBOX_LIFECYCLE_HPP__

#include <string>

#include <mastra/mastra.hpp>
#include <mastra/sandbox.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/lambda.hpp>
#include <stout/nothing.hpp>

namespace mastra {
namespace internal {

// Forward declaration.
class LifecycleProcess;


// The work a sandbox does for each lifecycle transition. The lifecycle
// only tracks status and guarantees that each transition runs once at
// a time; it never touches the sandbox itself.
struct Transitions
{
  lambda::function<process::Future<Nothing>()> start;
  lambda::function<process::Future<Nothing>()> stop;
  lambda::function<process::Future<Nothing>()> destroy;

  // Invoked once the sandbox is running, e.g. to attach the mounts
  // queued before start. Failures are logged only.
  lambda::function<process::Future<Nothing>()> started;
};


// Race-safe sandbox lifecycle:
//
//   PENDING -> STARTING -> RUNNING -> STOPPING -> STOPPED ->
//   DESTROYING -> DESTROYED
//
// with ERROR entered whenever a transition fails.
//
// The in-flight transition of each kind is memoized, so concurrent
// callers of `start`, `stop` or `destroy` share one execution and
// observe the same outcome. `start` waits for (and propagates the
// failure of) an in-flight `stop` or `destroy`; `stop` and `destroy`
// wait for an in-flight `start` but ignore its failure.
class Lifecycle
{
public:
  Lifecycle(
      const std::string& id,
      const Transitions& transitions,
      const SandboxHooks& hooks = SandboxHooks());

  ~Lifecycle();

  process::Future<SandboxStatus> status() const;

  process::Future<Nothing> start();
  process::Future<Nothing> stop();
  process::Future<Nothing> destroy();

  // Fails with `SandboxNotReadyError` once destroyed. Does nothing
  // while stopping or destroying; starts the sandbox otherwise.
  process::Future<Nothing> ensureRunning();

private:
  Lifecycle(const Lifecycle&) = delete;
  Lifecycle& operator=(const Lifecycle&) = delete;

  process::Owned<LifecycleProcess> process;
};

} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_LIFECYCLE_HPP__
