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

#ifndef __TESTS_ENVIRONMENT_HPP__
#define __TESTS_ENVIRONMENT_HPP__

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace mastra {
namespace internal {
namespace tests {

// A filter decides whether a test can run on this host. Tests that
// need a tool or a privilege carry a prefix naming it, e.g.
// `IsolationTest.BWRAP_Wrap`.
class TestFilter
{
public:
  virtual ~TestFilter() {}

  virtual bool disable(const ::testing::TestInfo* test) const = 0;

protected:
  // Returns true if the test case or the test name contains `pattern`.
  static bool matches(
      const ::testing::TestInfo* test,
      const std::string& pattern);
};


// Used to set up and manage the test environment.
class Environment : public ::testing::Environment
{
public:
  Environment();

  // Appends the tests disabled by the filters to the negative patterns
  // of `--gtest_filter`. Must be called before `RUN_ALL_TESTS`.
  void disableFilteredTests();

private:
  std::vector<std::shared_ptr<TestFilter>> filters;
};


// Global environment instance.
extern Environment* environment;

} // namespace tests {
} // namespace internal {
} // namespace mastra {

#endif // __TESTS_ENVIRONMENT_HPP__
