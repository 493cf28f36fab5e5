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
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/rm.hpp>

#include "sandbox/paths.hpp"

#include "sandbox/mounts/gcs.hpp"
#include "sandbox/mounts/local.hpp"
#include "sandbox/mounts/mounts.hpp"
#include "sandbox/mounts/s3.hpp"

using std::string;
using std::vector;

using process::Failure;
using process::Future;

namespace mastra {
namespace internal {
namespace mounts {

Option<Error> validate(const MountConfig& config)
{
  switch (config.type()) {
    case MountConfig::LOCAL:
      if (!config.has_local()) {
        return Error("Local mount config is missing 'local'");
      }
      return local::validate(config.local());
    case MountConfig::S3:
      if (!config.has_s3()) {
        return Error("S3 mount config is missing 's3'");
      }
      return s3::validate(config.s3());
    case MountConfig::GCS:
      if (!config.has_gcs()) {
        return Error("GCS mount config is missing 'gcs'");
      }
      return gcs::validate(config.gcs());
    case MountConfig::UNKNOWN:
      break;
  }

  return None();
}


Option<MountToolNotFoundError> checkInstalled(const MountConfig& config)
{
  switch (config.type()) {
    case MountConfig::S3: {
      Try<string, MountToolNotFoundError> s3fs = s3::checkInstalled();
      if (s3fs.isError()) {
        return s3fs.error();
      }
      return None();
    }
    case MountConfig::GCS: {
      Try<string, MountToolNotFoundError> gcsfuse = gcs::checkInstalled();
      if (gcsfuse.isError()) {
        return gcsfuse.error();
      }
      return None();
    }
    case MountConfig::LOCAL:
    case MountConfig::UNKNOWN:
      break;
  }

  return None();
}


Future<Nothing> attach(
    const string& hostPath,
    const MountConfig& config,
    const string& credentialsDir)
{
  switch (config.type()) {
    case MountConfig::LOCAL: {
      Try<Nothing> mount = local::mount(hostPath, config.local());
      if (mount.isError()) {
        return Failure(mount.error());
      }

      VLOG(1) << "Linked '" << hostPath << "' to '"
              << local::target(config.local()) << "'";

      return Nothing();
    }
    case MountConfig::S3:
      return s3::mount(hostPath, config.s3(), credentialsDir);
    case MountConfig::GCS:
      return gcs::mount(hostPath, config.gcs(), credentialsDir);
    case MountConfig::UNKNOWN:
      break;
  }

  return Failure("Unsupported mount type: " + stringify(config.type()));
}


void removeCredentials(const string& credentialsDir, const string& hostPath)
{
  const vector<string> kinds = {"s3", "gcs"};

  foreach (const string& kind, kinds) {
    const string path =
      paths::getCredentialsPath(credentialsDir, kind, hostPath);

    if (!os::exists(path)) {
      continue;
    }

    Try<Nothing> rm = os::rm(path);
    if (rm.isError()) {
      LOG(WARNING) << "Failed to remove credentials '" << path << "': "
                   << rm.error();
    }
  }
}

} // namespace mounts {
} // namespace internal {
} // namespace mastra {
