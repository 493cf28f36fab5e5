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

#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/strings.hpp>

#include "common/command_utils.hpp"

#include "sandbox/paths.hpp"

#include "sandbox/mounts/fuse.hpp"
#include "sandbox/mounts/gcs.hpp"

using std::string;
using std::vector;

using process::Failure;
using process::Future;

namespace mastra {
namespace internal {
namespace mounts {
namespace gcs {

static const char GCSFUSE_HINT[] =
  "See https://cloud.google.com/storage/docs/gcsfuse-install for"
  " installation instructions.";


Option<Error> validate(const MountConfig::GCS& config)
{
  const string& bucket = config.bucket();

  if (bucket.size() < 3 || bucket.size() > 63 ||
      bucket.find_first_not_of("abcdefghijklmnopqrstuvwxyz0123456789._-") !=
        string::npos ||
      !isalnum(bucket.front()) ||
      !isalnum(bucket.back())) {
    return Error(
        "Invalid GCS bucket name '" + bucket + "': must be 3-63 lowercase"
        " letters, digits, dots, underscores or hyphens, starting and"
        " ending with a letter or digit");
  }

  if (config.has_prefix() &&
      config.prefix().find_first_of(" \t\n") != string::npos) {
    return Error("Invalid GCS prefix '" + config.prefix() + "'");
  }

  return None();
}


Try<string, MountToolNotFoundError> checkInstalled()
{
  Option<MountToolNotFoundError> fuse = fuse::checkInstalled();
  if (fuse.isSome()) {
    return fuse.get();
  }

  return fuse::which("gcsfuse", GCSFUSE_HINT);
}


vector<string> arguments(
    const string& hostPath,
    const MountConfig::GCS& config,
    const Option<string>& keyFile)
{
  vector<string> argv = {"gcsfuse"};

  if (keyFile.isSome()) {
    argv.push_back("--key-file=" + keyFile.get());
  } else {
    argv.push_back("--anonymous-access");
  }

  const string prefix = strings::trim(config.prefix(), strings::ANY, "/");
  if (!prefix.empty()) {
    argv.push_back("--only-dir=" + prefix);
  }

  if (config.read_only()) {
    argv.insert(argv.end(), {"-o", "ro"});
  }

  argv.insert(argv.end(), {config.bucket(), hostPath});

  return argv;
}


Future<Nothing> mount(
    const string& hostPath,
    const MountConfig::GCS& config,
    const string& credentialsDir)
{
  Option<Error> error = validate(config);
  if (error.isSome()) {
    return Failure(error->message);
  }

  Try<string, MountToolNotFoundError> gcsfuse = checkInstalled();
  if (gcsfuse.isError()) {
    return Failure(gcsfuse.error().message);
  }

  Option<string> keyFile;

  if (config.has_service_account_key()) {
    const string path =
      paths::getCredentialsPath(credentialsDir, "gcs", hostPath);

    Try<Nothing> write =
      fuse::writeCredentials(path, config.service_account_key());

    if (write.isError()) {
      return Failure("Failed to write gcsfuse key file: " + write.error());
    }

    keyFile = path;
  }

  LOG(INFO) << "Mounting gs://" << config.bucket() << " at '" << hostPath
            << "'";

  return command::launch(gcsfuse.get(), arguments(hostPath, config, keyFile))
    .then([]() { return Nothing(); })
    .repair([config, hostPath](
        const Future<Nothing>& future) -> Future<Nothing> {
      return Failure(
          "Failed to mount gs://" + config.bucket() + " at '" + hostPath +
          "': " + future.failure());
    });
}

} // namespace gcs {
} // namespace mounts {
} // namespace internal {
} // namespace mastra {
