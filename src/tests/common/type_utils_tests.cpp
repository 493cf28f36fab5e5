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

#include <gtest/gtest.h>

#include <mastra/mastra.hpp>

#include <stout/stringify.hpp>

namespace mastra {
namespace internal {
namespace tests {

TEST(TypeUtilsTest, Stringify)
{
  EXPECT_EQ("running", stringify(SANDBOX_RUNNING));
  EXPECT_EQ("destroyed", stringify(SANDBOX_DESTROYED));
  EXPECT_EQ("mounted", stringify(MOUNT_MOUNTED));
  EXPECT_EQ("unavailable", stringify(MOUNT_UNAVAILABLE));
  EXPECT_EQ("bwrap", stringify(BWRAP));

  MountConfig config;
  config.set_type(MountConfig::S3);
  config.mutable_s3()->set_bucket("logs");

  EXPECT_EQ("s3 (s3://logs)", stringify(config));
}


TEST(TypeUtilsTest, MountConfigEquality)
{
  MountConfig left;
  left.set_type(MountConfig::LOCAL);
  left.mutable_local()->set_base_path("/data");

  MountConfig right = left;
  EXPECT_EQ(left, right);

  right.mutable_local()->set_base_path("/other");
  EXPECT_NE(left, right);
}

} // namespace tests {
} // namespace internal {
} // namespace mastra {
