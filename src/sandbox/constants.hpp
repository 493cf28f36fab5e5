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

#ifndef __SANDBOX_CONSTANTS_HPP__
#define __SANDBOX_CONSTANTS_HPP__

#include <stddef.h>

#include <stout/duration.hpp>

namespace mastra {
namespace internal {

constexpr char SANDBOX_NAME[] = "LocalSandbox";
constexpr char SANDBOX_PROVIDER[] = "local";

constexpr char SHELL_EXECUTABLE[] = "/bin/sh";
constexpr char SEATBELT_EXECUTABLE[] = "/usr/bin/sandbox-exec";

// Directories created under the current working directory when no
// explicit location is configured. Profiles live outside the sandbox
// working directory so that a sandboxed process cannot tamper with
// its own policy.
constexpr char WORKING_DIRECTORY_NAME[] = ".sandbox";
constexpr char PROFILES_DIRECTORY_NAME[] = ".sandbox-profiles";

// Shared location of mount marker files. The location is outside of
// any sandbox working directory and common to every sandbox on the
// host.
constexpr char DEFAULT_MARKER_DIR[] = "/tmp/.mastra-mounts";

// Where FUSE credentials (s3fs passwd files, GCS keys) are written.
constexpr char DEFAULT_CREDENTIALS_DIR[] = "/tmp/.mastra-credentials";

constexpr char MARKER_FILE_PREFIX[] = "mount-";

// Timeout applied by `executeCommand` when the caller sets none.
constexpr Duration DEFAULT_EXECUTE_TIMEOUT = Seconds(30);

// Size of the chunks read from a child's stdout and stderr.
constexpr size_t READ_BUFFER_SIZE = 4096;

} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_CONSTANTS_HPP__
