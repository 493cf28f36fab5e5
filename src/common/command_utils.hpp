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

#ifndef __COMMON_COMMAND_UTILS_HPP__
#define __COMMON_COMMAND_UTILS_HPP__

#include <map>
#include <string>
#include <vector>

#include <process/future.hpp>

#include <stout/duration.hpp>
#include <stout/option.hpp>

namespace mastra {
namespace internal {
namespace command {

// Upper bound for helper tools like `mount` or `fusermount`, which
// may block on an unresponsive FUSE server.
constexpr Duration DEFAULT_LAUNCH_TIMEOUT = Minutes(1);


/**
 * Runs a helper tool to completion and returns its stdout.
 *
 * The tool is looked up on the PATH when `path` is not absolute.
 * Fails if the tool cannot be started or exits with a non-zero status,
 * in which case the failure includes the tool's stderr. A tool still
 * running after `timeout` is killed together with its children.
 *
 * @param path the executable to run.
 * @param argv the full argument vector, including argv[0].
 * @param environment the environment of the tool; inherited when none.
 * @param timeout how long the tool may run.
 */
process::Future<std::string> launch(
    const std::string& path,
    const std::vector<std::string>& argv,
    const Option<std::map<std::string, std::string>>& environment = None(),
    const Duration& timeout = DEFAULT_LAUNCH_TIMEOUT);


/**
 * Quotes `argument` for a POSIX shell. Arguments made of safe
 * characters only are returned unchanged.
 */
std::string shellQuote(const std::string& argument);

} // namespace command {
} // namespace internal {
} // namespace mastra {

#endif // __COMMON_COMMAND_UTILS_HPP__
