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

#ifndef __MASTRA_FILESYSTEM_HPP__
#define __MASTRA_FILESYSTEM_HPP__

#include <string>

#include <mastra/mastra.hpp>

#include <stout/option.hpp>

namespace mastra {

// A storage backend that can be attached to a sandbox. The sandbox
// never reads or writes file contents through this interface; it only
// asks how the storage can be mounted on the host.
class Filesystem
{
public:
  virtual ~Filesystem() {}

  virtual std::string id() const = 0;

  virtual std::string provider() const = 0;

  // Returns none if this filesystem cannot be mounted.
  virtual Option<MountConfig> getMountConfig() const
  {
    return None();
  }
};

} // namespace mastra {

#endif // __MASTRA_FILESYSTEM_HPP__
