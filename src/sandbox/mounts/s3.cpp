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

#include <ctype.h>

#include <map>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/future.hpp>

#include <stout/os.hpp>
#include <stout/strings.hpp>

#include "common/command_utils.hpp"

#include "sandbox/paths.hpp"

#include "sandbox/mounts/fuse.hpp"
#include "sandbox/mounts/s3.hpp"

using std::map;
using std::string;
using std::vector;

using process::Failure;
using process::Future;

namespace mastra {
namespace internal {
namespace mounts {
namespace s3 {

static const char S3FS_HINT[] =
  "Install it with 'apt install s3fs' (Linux) or"
  " 'brew install gromgit/fuse/s3fs-mac' (macOS).";


Option<Error> validate(const MountConfig::S3& config)
{
  const string& bucket = config.bucket();

  if (bucket.size() < 3 || bucket.size() > 63 ||
      bucket.find_first_not_of("abcdefghijklmnopqrstuvwxyz0123456789.-") !=
        string::npos ||
      !isalnum(bucket.front()) ||
      !isalnum(bucket.back())) {
    return Error(
        "Invalid S3 bucket name '" + bucket + "': must be 3-63 lowercase"
        " letters, digits, dots or hyphens, starting and ending with a"
        " letter or digit");
  }

  if (config.has_endpoint()) {
    const string& endpoint = config.endpoint();

    if ((!strings::startsWith(endpoint, "http://") &&
         !strings::startsWith(endpoint, "https://")) ||
        endpoint.find_first_of(", \t\n") != string::npos) {
      return Error(
          "Invalid S3 endpoint '" + endpoint + "': must be an http:// or"
          " https:// URL");
    }
  }

  if (config.has_region() &&
      (config.region().empty() ||
       config.region().find_first_not_of(
           "abcdefghijklmnopqrstuvwxyz0123456789-") != string::npos)) {
    return Error("Invalid S3 region '" + config.region() + "'");
  }

  if (config.has_prefix() &&
      config.prefix().find_first_of(", \t\n") != string::npos) {
    return Error("Invalid S3 prefix '" + config.prefix() + "'");
  }

  if (config.has_access_key_id() != config.has_secret_access_key()) {
    return Error(
        "Both 'access_key_id' and 'secret_access_key' must be set to"
        " mount a private S3 bucket");
  }

  return None();
}


Try<string, MountToolNotFoundError> checkInstalled()
{
  Option<MountToolNotFoundError> fuse = fuse::checkInstalled();
  if (fuse.isSome()) {
    return fuse.get();
  }

  return fuse::which("s3fs", S3FS_HINT);
}


vector<string> arguments(
    const string& hostPath,
    const MountConfig::S3& config,
    const Option<string>& credentials)
{
  string source = config.bucket();

  const string prefix = strings::trim(config.prefix(), strings::ANY, "/");
  if (!prefix.empty()) {
    source += ":/" + prefix;
  }

  vector<string> argv = {"s3fs", source, hostPath};

  if (credentials.isSome()) {
    argv.insert(argv.end(), {"-o", "passwd_file=" + credentials.get()});
  } else if (!config.has_access_key_id()) {
    argv.insert(argv.end(), {"-o", "public_bucket=1"});
  }

  if (config.has_endpoint()) {
    argv.insert(argv.end(), {"-o", "url=" + config.endpoint()});

    // S3 compatible stores (MinIO, R2, ...) rarely support virtual
    // hosted buckets.
    argv.insert(argv.end(), {"-o", "use_path_request_style"});
  }

  if (config.has_region()) {
    argv.insert(argv.end(), {"-o", "endpoint=" + config.region()});
  }

  if (config.read_only()) {
    argv.insert(argv.end(), {"-o", "ro"});
  }

  return argv;
}


Future<Nothing> mount(
    const string& hostPath,
    const MountConfig::S3& config,
    const string& credentialsDir)
{
  Option<Error> error = validate(config);
  if (error.isSome()) {
    return Failure(error->message);
  }

  Try<string, MountToolNotFoundError> s3fs = checkInstalled();
  if (s3fs.isError()) {
    return Failure(s3fs.error().message);
  }

  Option<string> credentials;
  Option<map<string, string>> environment;

  if (config.has_access_key_id()) {
    if (config.has_session_token()) {
      map<string, string> variables = os::environment();
      variables["AWSACCESSKEYID"] = config.access_key_id();
      variables["AWSSECRETACCESSKEY"] = config.secret_access_key();
      variables["AWSSESSIONTOKEN"] = config.session_token();

      environment = variables;
    } else {
      const string path =
        paths::getCredentialsPath(credentialsDir, "s3", hostPath);

      Try<Nothing> write = fuse::writeCredentials(
          path,
          config.access_key_id() + ":" + config.secret_access_key() + "\n");

      if (write.isError()) {
        return Failure(
            "Failed to write s3fs credentials: " + write.error());
      }

      credentials = path;
    }
  }

  const vector<string> argv = arguments(hostPath, config, credentials);

  LOG(INFO) << "Mounting s3://" << config.bucket() << " at '" << hostPath
            << "'";

  return command::launch(s3fs.get(), argv, environment)
    .then([]() { return Nothing(); })
    .repair([config, hostPath](
        const Future<Nothing>& future) -> Future<Nothing> {
      return Failure(
          "Failed to mount s3://" + config.bucket() + " at '" + hostPath +
          "': " + future.failure());
    });
}

} // namespace s3 {
} // namespace mounts {
} // namespace internal {
} // namespace mastra {
