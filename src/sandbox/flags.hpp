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

#ifndef __SANDBOX_FLAGS_HPP__
#define __SANDBOX_FLAGS_HPP__

#include <string>

#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/json.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

namespace mastra {
namespace internal {
namespace sandbox {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  Option<std::string> id;
  std::string name;
  std::string working_directory;
  std::string isolation;
  Option<JSON::Object> native_sandbox;
  Option<JSON::Object> env;
  Duration timeout;
  std::string marker_dir;
  std::string credentials_dir;
  std::string profiles_dir;
  Option<std::string> instructions;
};

} // namespace sandbox {
} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_FLAGS_HPP__
