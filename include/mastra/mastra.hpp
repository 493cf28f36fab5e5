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

#ifndef __MASTRA_HPP__
#define __MASTRA_HPP__

#include <ostream>

#include <mastra/mastra.pb.h> // ONLY USEFUL AFTER RUNNING PROTOC.

namespace mastra {

bool operator==(const MountConfig& left, const MountConfig& right);
bool operator!=(const MountConfig& left, const MountConfig& right);

bool operator==(
    const NativeSandboxConfig& left,
    const NativeSandboxConfig& right);


std::ostream& operator<<(std::ostream& stream, const SandboxStatus& status);
std::ostream& operator<<(std::ostream& stream, const Isolation& isolation);
std::ostream& operator<<(std::ostream& stream, const MountState& state);
std::ostream& operator<<(std::ostream& stream, const MountConfig::Type& type);
std::ostream& operator<<(std::ostream& stream, const MountConfig& config);

} // namespace mastra {

#endif // __MASTRA_HPP__
