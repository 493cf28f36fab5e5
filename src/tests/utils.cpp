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

#include "tests/utils.hpp"

#include <gtest/gtest.h>

#include <string>

#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <stout/os/realpath.hpp>

using std::string;

namespace mastra {
namespace internal {
namespace tests {

void TemporaryDirectoryTest::SetUp()
{
  // Save the current working directory.
  cwd = os::getcwd();

  const ::testing::TestInfo* const testInfo =
    ::testing::UnitTest::GetInstance()->current_test_info();

  // Create a temporary directory for the test. The real path is used
  // since symlinks in the temporary directory (e.g. '/tmp' on macOS)
  // would otherwise leak into paths compared by the tests.
  Try<string> directory = os::mkdtemp(path::join(
      os::temp(),
      strings::replace(testInfo->test_case_name(), "/", "_") + "_" +
        strings::replace(testInfo->name(), "/", "_") + "_XXXXXX"));

  ASSERT_SOME(directory) << "Failed to mkdtemp";

  Result<string> realpath = os::realpath(directory.get());
  ASSERT_SOME(realpath);

  sandbox = realpath.get();

  // Run the test out of the temporary directory we created.
  ASSERT_SOME(os::chdir(sandbox.get()))
    << "Failed to chdir into '" << sandbox.get() << "'";
}


void TemporaryDirectoryTest::TearDown()
{
  // Return to previous working directory and cleanup the sandbox.
  ASSERT_SOME(os::chdir(cwd));

  if (sandbox.isSome()) {
    ASSERT_SOME(os::rmdir(sandbox.get()));
    sandbox = None();
  }
}

} // namespace tests {
} // namespace internal {
} // namespace mastra {
