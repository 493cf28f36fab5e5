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

#ifndef __SANDBOX_ISOLATION_HPP__
#define __SANDBOX_ISOLATION_HPP__

#include <string>
#include <vector>

#include <mastra/mastra.hpp>

#include <stout/option.hpp>
#include <stout/try.hpp>

namespace mastra {
namespace internal {
namespace isolation {

// An executable and its full argument vector (including argv[0]).
struct Command
{
  std::string path;
  std::vector<std::string> argv;
};


struct Detection
{
  Isolation backend;
  bool available;
  std::string message;
};


// Returns the native backend for this platform: seatbelt on macOS,
// bwrap on Linux, none elsewhere.
Detection detect();


// Authoritative availability check. NONE is always available.
bool available(const Isolation& backend);


// Parses 'none', 'seatbelt' or 'bwrap'.
Try<Isolation> parse(const std::string& name);


// Generates a seatbelt (SBPL) profile that denies everything by
// default, allows reading the whole filesystem, allows writing to
// `workingDirectory`, the configured read-write paths and the standard
// temporary directories, and allows network access only if
// `config.allow_network()` is set.
std::string generateSeatbeltProfile(
    const std::string& workingDirectory,
    const NativeSandboxConfig& config);


struct WrapOptions
{
  Isolation backend;
  std::string workspacePath;

  // Seatbelt profile text. Generated from `config` when none.
  Option<std::string> seatbeltProfile;

  NativeSandboxConfig config;
};


// Wraps a shell command line so that it runs under `options.backend`.
// The bwrap arguments are derived from `options.config` on every call.
Try<Command> wrap(const std::string& command, const WrapOptions& options);

} // namespace isolation {
} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_ISOLATION_HPP__
