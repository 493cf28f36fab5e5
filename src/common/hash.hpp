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

#ifndef __COMMON_HASH_HPP__
#define __COMMON_HASH_HPP__

#include <stdint.h>

#include <string>

namespace mastra {
namespace internal {
namespace hash {

// Returns the lowercase hex SHA-256 digest of `data`.
std::string sha256(const std::string& data);


// A 32-bit rolling string hash (h = h * 31 + c, wrapping).
int32_t rolling(const std::string& data);


// Renders `value` in lowercase base 36.
std::string base36(uint64_t value);

} // namespace hash {
} // namespace internal {
} // namespace mastra {

#endif // __COMMON_HASH_HPP__
