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

#ifndef __SANDBOX_LOCAL_FILESYSTEM_HPP__
#define __SANDBOX_LOCAL_FILESYSTEM_HPP__

#include <string>

#include <mastra/filesystem.hpp>
#include <mastra/mastra.hpp>

#include <stout/option.hpp>

#include "sandbox/constants.hpp"

namespace mastra {
namespace internal {

// A directory on the host, mounted into a sandbox as a symlink.
class LocalFilesystem : public Filesystem
{
public:
  explicit LocalFilesystem(const std::string& _basePath)
    : basePath(_basePath) {}

  std::string id() const override
  {
    return "local:" + basePath;
  }

  std::string provider() const override
  {
    return SANDBOX_PROVIDER;
  }

  Option<MountConfig> getMountConfig() const override
  {
    MountConfig config;
    config.set_type(MountConfig::LOCAL);
    config.mutable_local()->set_base_path(basePath);
    return config;
  }

private:
  const std::string basePath;
};

} // namespace internal {
} // namespace mastra {

#endif // __SANDBOX_LOCAL_FILESYSTEM_HPP__
