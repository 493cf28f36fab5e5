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

#include <string>

#include <gtest/gtest.h>

#include <mastra/mastra.hpp>

#include <stout/gtest.hpp>
#include <stout/strings.hpp>

#include "sandbox/mount_manager.hpp"
#include "sandbox/paths.hpp"

using std::string;

namespace mastra {
namespace internal {
namespace tests {

TEST(PathsTest, ValidateMountPath)
{
  EXPECT_NONE(paths::validateMountPath("/data"));
  EXPECT_NONE(paths::validateMountPath("/data/sub-dir_1.v2"));

  EXPECT_SOME(paths::validateMountPath(""));
  EXPECT_SOME(paths::validateMountPath("/"));
  EXPECT_SOME(paths::validateMountPath("data"));
  EXPECT_SOME(paths::validateMountPath("/a b"));
  EXPECT_SOME(paths::validateMountPath("/data;rm"));
  EXPECT_SOME(paths::validateMountPath("/a/./b"));
  EXPECT_SOME(paths::validateMountPath("/a/../b"));
  EXPECT_SOME(paths::validateMountPath("/.."));
}


TEST(PathsTest, HostPath)
{
  EXPECT_SOME_EQ("/work/data", paths::getHostPath("/work", "/data"));
  EXPECT_SOME_EQ("/work/data/sub", paths::getHostPath("/work", "/data/sub/"));
  EXPECT_SOME_EQ("/work/data", paths::getHostPath("/work/", "/data"));

  EXPECT_ERROR(paths::getHostPath("/work", "/"));
  EXPECT_ERROR(paths::getHostPath("/work", "/../etc"));
}


TEST(PathsTest, MarkerPath)
{
  const string markerPath = paths::getMarkerPath("/markers", "/work/data");

  EXPECT_EQ(
      "/markers/" + MountManager::markerFilename("/work/data"),
      markerPath);

  EXPECT_NE(markerPath, paths::getMarkerPath("/markers", "/work/other"));
}


TEST(PathsTest, SeatbeltProfilePath)
{
  NativeSandboxConfig config;

  const string path =
    paths::getSeatbeltProfilePath("/profiles", "/work", config);

  EXPECT_TRUE(strings::startsWith(path, "/profiles/seatbelt-")) << path;
  EXPECT_TRUE(strings::endsWith(path, ".sb")) << path;

  EXPECT_EQ(path, paths::getSeatbeltProfilePath("/profiles", "/work", config));
  EXPECT_NE(path, paths::getSeatbeltProfilePath("/profiles", "/other", config));

  config.set_allow_network(true);
  EXPECT_NE(path, paths::getSeatbeltProfilePath("/profiles", "/work", config));
}


TEST(PathsTest, CredentialsPath)
{
  EXPECT_EQ(
      "/credentials/s3-" + MountManager::markerFilename("/work/data"),
      paths::getCredentialsPath("/credentials", "s3", "/work/data"));

  EXPECT_NE(
      paths::getCredentialsPath("/credentials", "s3", "/work/data"),
      paths::getCredentialsPath("/credentials", "gcs", "/work/data"));
}

} // namespace tests {
} // namespace internal {
} // namespace mastra {
