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

#ifndef __TESTS_UTILS_HPP__
#define __TESTS_UTILS_HPP__

#include <gtest/gtest.h>

#include <string>

#include <stout/option.hpp>

namespace mastra {
namespace internal {
namespace tests {

// Runs each test inside a fresh temporary directory which is removed
// when the test finishes. The directory is also the current working
// directory for the duration of the test.
class TemporaryDirectoryTest : public ::testing::Test
{
protected:
  void SetUp() override;
  void TearDown() override;

  Option<std::string> sandbox;

private:
  std::string cwd;
};

} // namespace tests {
} // namespace internal {
} // namespace mastra {

#endif // __TESTS_UTILS_HPP__
