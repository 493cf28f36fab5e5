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

#ifndef __LOGGING_LOGGING_HPP__
#define __LOGGING_LOGGING_HPP__

#include <string>

#include <glog/logging.h> // Includes LOG(*), PLOG(*), CHECK, etc.

#include <stout/try.hpp>

#include "logging/flags.hpp"

namespace mastra {
namespace internal {
namespace logging {

// Maps the value of `--logging_level` to a glog severity.
Try<google::LogSeverity> parseLoggingLevel(const std::string& level);


// Configures glog from `flags`. Only the first call has an effect, so
// the test runner and the CLI can both call it unconditionally.
void initialize(
    const std::string& argv0,
    const Flags& flags,
    bool installFailureSignalHandler = false);

} // namespace logging {
} // namespace internal {
} // namespace mastra {

#endif // __LOGGING_LOGGING_HPP__
