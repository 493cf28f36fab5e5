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

#include <ostream>

#include <google/protobuf/util/message_differencer.h>

#include <mastra/mastra.hpp>

#include <stout/strings.hpp>

using std::ostream;
using std::string;

namespace mastra {

bool operator==(const MountConfig& left, const MountConfig& right)
{
  return google::protobuf::util::MessageDifferencer::Equals(left, right);
}


bool operator!=(const MountConfig& left, const MountConfig& right)
{
  return !(left == right);
}


bool operator==(
    const NativeSandboxConfig& left,
    const NativeSandboxConfig& right)
{
  return google::protobuf::util::MessageDifferencer::Equals(left, right);
}


// The prefixes only keep the enum values unique within the package.
ostream& operator<<(ostream& stream, const SandboxStatus& status)
{
  return stream << strings::lower(
      strings::remove(SandboxStatus_Name(status), "SANDBOX_", strings::PREFIX));
}


ostream& operator<<(ostream& stream, const Isolation& isolation)
{
  return stream << strings::lower(Isolation_Name(isolation));
}


ostream& operator<<(ostream& stream, const MountState& state)
{
  return stream << strings::lower(
      strings::remove(MountState_Name(state), "MOUNT_", strings::PREFIX));
}


ostream& operator<<(ostream& stream, const MountConfig::Type& type)
{
  return stream << strings::lower(MountConfig::Type_Name(type));
}


// NOTE: Credentials are never printed.
ostream& operator<<(ostream& stream, const MountConfig& config)
{
  stream << config.type();

  switch (config.type()) {
    case MountConfig::LOCAL:
      return stream << " (" << config.local().base_path() << ")";
    case MountConfig::S3:
      return stream << " (s3://" << config.s3().bucket() << ")";
    case MountConfig::GCS:
      return stream << " (gs://" << config.gcs().bucket() << ")";
    case MountConfig::UNKNOWN:
      break;
  }

  return stream;
}

} // namespace mastra {
