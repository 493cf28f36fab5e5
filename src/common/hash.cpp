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

#include <openssl/evp.h>

#include <string>

#include <glog/logging.h>

#include <stout/foreach.hpp>

#include "common/hash.hpp"

using std::string;

namespace mastra {
namespace internal {
namespace hash {

string sha256(const string& data)
{
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;

  // EVP_Digest only fails on allocation failure.
  CHECK_EQ(1, EVP_Digest(
      data.data(),
      data.size(),
      digest,
      &length,
      EVP_sha256(),
      nullptr));

  static const char hex[] = "0123456789abcdef";

  string result;
  result.reserve(length * 2);
  for (unsigned int i = 0; i < length; i++) {
    result.push_back(hex[digest[i] >> 4]);
    result.push_back(hex[digest[i] & 0x0f]);
  }

  return result;
}


int32_t rolling(const string& data)
{
  uint32_t hash = 0;
  foreach (char c, data) {
    hash = (hash << 5) - hash + static_cast<unsigned char>(c);
  }

  return static_cast<int32_t>(hash);
}


string base36(uint64_t value)
{
  static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";

  if (value == 0) {
    return "0";
  }

  string result;
  while (value > 0) {
    result.insert(result.begin(), digits[value % 36]);
    value /= 36;
  }

  return result;
}

} // namespace hash {
} // namespace internal {
} // namespace mastra {
