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

#include <mastra/mastra.hpp>

#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/protobuf.hpp>

#include "sandbox/constants.hpp"
#include "sandbox/flags.hpp"
#include "sandbox/isolation.hpp"

namespace mastra {
namespace internal {
namespace sandbox {

Flags::Flags()
{
  add(&Flags::id,
      "id",
      "Unique identifier of the sandbox. A random identifier of the form\n"
      "'local-sandbox-<time>-<random>' is generated when not set.");

  add(&Flags::name,
      "name",
      "Human readable name of the sandbox.",
      SANDBOX_NAME);

  add(&Flags::working_directory,
      "working_directory",
      "Absolute path of the directory commands run in. Created on start.\n"
      "Mounts are attached beneath it.",
      path::join(os::getcwd(), WORKING_DIRECTORY_NAME));

  add(&Flags::isolation,
      "isolation",
      "Native isolation backend used for every command:\n"
      "'none', 'seatbelt' (macOS) or 'bwrap' (Linux). The backend must\n"
      "be available on the host.",
      "none",
      [](const std::string& value) -> Option<Error> {
        Try<Isolation> isolation = isolation::parse(value);
        if (isolation.isError()) {
          return Error(isolation.error());
        }
        return None();
      });

  add(&Flags::native_sandbox,
      "native_sandbox",
      "JSON object with the isolation policy. Example:\n"
      "{\n"
      "  \"allow_network\": false,\n"
      "  \"read_write_paths\": [\"/var/cache/app\"],\n"
      "  \"read_only_paths\": [\"/opt/data\"],\n"
      "  \"seatbelt_profile_path\": \"/etc/app/profile.sb\"\n"
      "}",
      [](const Option<JSON::Object>& object) -> Option<Error> {
        if (object.isSome()) {
          Try<NativeSandboxConfig> config =
            ::protobuf::parse<NativeSandboxConfig>(object.get());
          if (config.isError()) {
            return Error(
                "Invalid `--native_sandbox`: " + config.error());
          }
        }
        return None();
      });

  add(&Flags::env,
      "env",
      "JSON object of environment variables passed to every command.\n"
      "The host environment is not inherited, except for 'PATH'.\n"
      "Example:\n"
      "{\n"
      "  \"HOME\": \"/home/agent\",\n"
      "  \"LANG\": \"C.UTF-8\"\n"
      "}",
      [](const Option<JSON::Object>& object) -> Option<Error> {
        if (object.isSome()) {
          foreachvalue (const JSON::Value& value, object->values) {
            if (!value.is<JSON::String>()) {
              return Error("`env` must only contain string values");
            }
          }
        }
        return None();
      });

  add(&Flags::timeout,
      "timeout",
      "Timeout applied to `executeCommand` when the caller sets none.",
      DEFAULT_EXECUTE_TIMEOUT);

  add(&Flags::marker_dir,
      "marker_dir",
      "Directory holding the marker files that record which mounts were\n"
      "created by a sandbox. Shared by all sandboxes on the host.",
      DEFAULT_MARKER_DIR);

  add(&Flags::credentials_dir,
      "credentials_dir",
      "Directory where FUSE credentials are written for S3 and GCS mounts.",
      DEFAULT_CREDENTIALS_DIR);

  add(&Flags::profiles_dir,
      "profiles_dir",
      "Directory for generated seatbelt profiles. Must be outside of the\n"
      "working directory.",
      path::join(os::getcwd(), PROFILES_DIRECTORY_NAME));

  add(&Flags::instructions,
      "instructions",
      "Overrides the description of the sandbox given to agents.");
}

} // namespace sandbox {
} // namespace internal {
} // namespace mastra {
