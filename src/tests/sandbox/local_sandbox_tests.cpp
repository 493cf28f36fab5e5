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

#include <map>
#include <set>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <gtest/gtest.h>

#include <mastra/errors.hpp>
#include <mastra/mastra.hpp>
#include <mastra/sandbox.hpp>

#include <process/future.hpp>
#include <process/gmock.hpp>
#include <process/gtest.hpp>
#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/fs.hpp>
#include <stout/gtest.hpp>
#include <stout/json.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/ls.hpp>
#include <stout/os/stat.hpp>

#include "sandbox/isolation.hpp"
#include "sandbox/local_filesystem.hpp"
#include "sandbox/local_sandbox.hpp"
#include "sandbox/mount_manager.hpp"
#include "sandbox/paths.hpp"

#include "sandbox/mounts/local.hpp"

#include "tests/mastra.hpp"

using std::map;
using std::set;
using std::string;
using std::vector;

using process::Future;
using process::Owned;
using process::Shared;

using testing::_;
using testing::Return;

namespace mastra {
namespace internal {
namespace tests {

class LocalSandboxTest : public SandboxTest
{
protected:
  void SetUp() override
  {
    SandboxTest::SetUp();

    flags = CreateSandboxFlags();
  }

  string root() const
  {
    return sandbox.get();
  }

  string hostPath(const string& mountPath) const
  {
    return path::join(flags.working_directory, mountPath);
  }

  string markerPath(const string& mountPath) const
  {
    return paths::getMarkerPath(flags.marker_dir, hostPath(mountPath));
  }

  // Creates a directory holding a single file to be mounted.
  string createDirectory(const string& name)
  {
    const string directory = path::join(sandbox.get(), name);

    CHECK_SOME(os::mkdir(directory));
    CHECK_SOME(os::write(path::join(directory, "file"), name));

    return directory;
  }

  sandbox::Flags flags;
};


TEST_F(LocalSandboxTest, Create)
{
  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  EXPECT_EQ("test-sandbox", sandbox.get()->id());
  EXPECT_EQ("LocalSandbox", sandbox.get()->name());
  EXPECT_EQ("local", sandbox.get()->provider());
  EXPECT_TRUE(sandbox.get()->capabilities().mount);
  EXPECT_EQ(flags.working_directory, sandbox.get()->workingDirectory());

  AWAIT_EXPECT_EQ(SANDBOX_PENDING, sandbox.get()->status());
  AWAIT_EXPECT_FALSE(sandbox.get()->isReady());

  // The working directory is only created on start.
  EXPECT_FALSE(os::exists(flags.working_directory));
}


TEST_F(LocalSandboxTest, GeneratedId)
{
  flags.id = None();

  Try<Owned<LocalSandbox>> first = CreateSandbox(flags);
  ASSERT_SOME(first);

  Try<Owned<LocalSandbox>> second = CreateSandbox(flags);
  ASSERT_SOME(second);

  EXPECT_TRUE(strings::startsWith(first.get()->id(), "local-sandbox-"))
    << first.get()->id();

  EXPECT_NE(first.get()->id(), second.get()->id());
}


TEST_F(LocalSandboxTest, CreateInvalid)
{
  sandbox::Flags relative = flags;
  relative.working_directory = "workspace";
  EXPECT_ERROR(CreateSandbox(relative));

  sandbox::Flags unknown = flags;
  unknown.isolation = "docker";
  EXPECT_ERROR(CreateSandbox(unknown));

  JSON::Object env;
  env.values["NUMBER"] = 1;

  sandbox::Flags numeric = flags;
  numeric.env = env;
  EXPECT_ERROR(CreateSandbox(numeric));
}


TEST_F(LocalSandboxTest, UnavailableIsolation)
{
#ifdef __APPLE__
  const Isolation unavailable = BWRAP;
#else
  const Isolation unavailable = SEATBELT;
#endif // __APPLE__

  ASSERT_FALSE(isolation::available(unavailable));

  flags.isolation = stringify(unavailable);

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_ERROR(sandbox);
  EXPECT_TRUE(strings::contains(sandbox.error(), "is not available"))
    << sandbox.error();
}


TEST_F(LocalSandboxTest, ExecuteCommand)
{
  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  AWAIT_READY(sandbox.get()->start());
  AWAIT_EXPECT_EQ(SANDBOX_RUNNING, sandbox.get()->status());
  AWAIT_EXPECT_TRUE(sandbox.get()->isReady());

  EXPECT_TRUE(os::stat::isdir(flags.working_directory));

  Future<CommandResult> result =
    sandbox.get()->executeCommand("echo", {"hi"});

  AWAIT_READY(result);
  EXPECT_TRUE(result->success);
  EXPECT_EQ(0, result->exitCode);
  EXPECT_EQ("hi\n", result->out);
  EXPECT_SOME_EQ("echo hi", result->command);

  // Arguments are passed as single words.
  result = sandbox.get()->executeCommand(
      "printf", {"%s|", "a b", "$HOME", "it's"});

  AWAIT_READY(result);
  EXPECT_EQ("a b|$HOME|it's|", result->out);

  result = sandbox.get()->executeCommand("pwd");

  AWAIT_READY(result);
  EXPECT_EQ(flags.working_directory + "\n", result->out);
}


// Commands start the sandbox on demand.
TEST_F(LocalSandboxTest, ExecuteCommandStarts)
{
  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<CommandResult> result = sandbox.get()->executeCommand("true");

  AWAIT_READY(result);
  EXPECT_TRUE(result->success);

  AWAIT_EXPECT_EQ(SANDBOX_RUNNING, sandbox.get()->status());
}


TEST_F(LocalSandboxTest, ExecuteCommandFailure)
{
  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<CommandResult> result =
    sandbox.get()->executeCommand("echo oops >&2; exit 7");

  AWAIT_READY(result);
  EXPECT_FALSE(result->success);
  EXPECT_EQ(7, result->exitCode);
  EXPECT_EQ("oops\n", result->err);

  ExecuteOptions options;
  options.timeout = Milliseconds(100);

  result = sandbox.get()->executeCommand("sleep 30", {}, options);

  AWAIT_READY(result);
  EXPECT_FALSE(result->success);
  EXPECT_TRUE(result->timedOut);
  EXPECT_EQ(TIMEOUT_EXIT_CODE, result->exitCode);

  // A command that can not be started is reported as failed.
  options = ExecuteOptions();
  options.cwd = path::join(root(), "missing");

  result = sandbox.get()->executeCommand("true", {}, options);

  AWAIT_READY(result);
  EXPECT_FALSE(result->success);
  EXPECT_EQ(1, result->exitCode);
  EXPECT_FALSE(result->err.empty());
}


TEST_F(LocalSandboxTest, Environment)
{
  JSON::Object env;
  env.values["GREETING"] = "hello";
  env.values["NAME"] = "sandbox";

  flags.env = env;

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  ExecuteOptions options;
  options.env["NAME"] = "command";

  Future<CommandResult> result = sandbox.get()->executeCommand(
      "echo $GREETING $NAME",
      {},
      options);

  AWAIT_READY(result);
  EXPECT_EQ("hello command\n", result->out);

  // The host environment is not inherited, except for the PATH.
  os::setenv("MASTRA_LEAKED", "leaked");

  result = sandbox.get()->executeCommand("echo \"[$MASTRA_LEAKED]\"");

  os::unsetenv("MASTRA_LEAKED");

  AWAIT_READY(result);
  EXPECT_EQ("[]\n", result->out);
}


TEST_F(LocalSandboxTest, Processes)
{
  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  ProcessManager* processes = sandbox.get()->processes();
  ASSERT_NE(nullptr, processes);

  Future<Owned<ProcessHandle>> handle = processes->spawn("sleep 30");
  AWAIT_READY(handle);

  AWAIT_EXPECT_EQ(SANDBOX_RUNNING, sandbox.get()->status());

  Future<vector<ProcessInfo>> infos = processes->list();
  AWAIT_READY(infos);
  ASSERT_EQ(1u, infos->size());
  EXPECT_TRUE(infos->front().running);

  // Destroying the sandbox kills its processes.
  AWAIT_READY(sandbox.get()->destroy());

  Future<CommandResult> result = handle.get()->wait();
  AWAIT_READY(result);
  EXPECT_TRUE(result->killed);

  // Nothing runs in a destroyed sandbox.
  AWAIT_FAILED(processes->spawn("true"));

  Future<CommandResult> command = sandbox.get()->executeCommand("true");
  AWAIT_FAILED(command);
  EXPECT_TRUE(strings::contains(command.failure(), "is not ready"))
    << command.failure();
}


TEST_F(LocalSandboxTest, Info)
{
  flags.instructions = "Use the sandbox wisely.";

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  AWAIT_READY(sandbox.get()->start());

  Future<SandboxInfo> info = sandbox.get()->info();
  AWAIT_READY(info);

  EXPECT_EQ("test-sandbox", info->id());
  EXPECT_EQ("LocalSandbox", info->name());
  EXPECT_EQ("local", info->provider());
  EXPECT_EQ(SANDBOX_RUNNING, info->status());
  EXPECT_EQ(flags.working_directory, info->working_directory());
  EXPECT_EQ(NONE, info->isolation());
  EXPECT_FALSE(info->has_isolation_config());
  EXPECT_GT(info->created_at(), 0);
  EXPECT_GT(info->cpu_cores(), 0u);
  EXPECT_GT(info->memory_mb(), 0u);
  EXPECT_FALSE(info->platform().empty());
  EXPECT_EQ(0, info->mounts_size());

  AWAIT_EXPECT_EQ("Use the sandbox wisely.", sandbox.get()->instructions());

  AWAIT_READY(sandbox.get()->stop());

  info = sandbox.get()->info();
  AWAIT_READY(info);
  EXPECT_EQ(SANDBOX_STOPPED, info->status());
}


TEST_F(LocalSandboxTest, Instructions)
{
  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  AWAIT_EXPECT_EQ(
      "Local command execution. Working directory: \"" +
        flags.working_directory + "\".",
      sandbox.get()->instructions());
}


TEST_F(LocalSandboxTest, Hooks)
{
  int started = 0;
  int stopped = 0;
  int destroyed = 0;

  SandboxHooks hooks;
  hooks.onStart = [&started]() -> Future<Nothing> {
    started++;
    return Nothing();
  };
  hooks.onStop = [&stopped]() -> Future<Nothing> {
    stopped++;
    return Nothing();
  };
  hooks.onDestroy = [&destroyed]() -> Future<Nothing> {
    destroyed++;
    return Nothing();
  };

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags, hooks);
  ASSERT_SOME(sandbox);

  AWAIT_READY(sandbox.get()->start());
  AWAIT_READY(sandbox.get()->stop());
  AWAIT_READY(sandbox.get()->start());
  AWAIT_READY(sandbox.get()->destroy());

  EXPECT_EQ(2, started);
  EXPECT_EQ(1, stopped);
  EXPECT_EQ(1, destroyed);
}


TEST_F(LocalSandboxTest, LocalMount)
{
  const string data = createDirectory("data");

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  AWAIT_READY(sandbox.get()->start());

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(data)),
      "/data");

  AWAIT_READY(mount);
  EXPECT_TRUE(mount->success);
  EXPECT_EQ("/data", mount->mountPath);
  EXPECT_NONE(mount->error);

  EXPECT_TRUE(os::stat::islink(hostPath("/data")));
  EXPECT_SOME_EQ("data", os::read(path::join(hostPath("/data"), "file")));

  // The marker records the host path and the config hash.
  Try<string> marker = os::read(markerPath("/data"));
  ASSERT_SOME(marker);
  EXPECT_EQ(
      hostPath("/data") + "|" +
        MountManager::computeConfigHash(createLocalMountConfig(data)),
      marker.get());

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  ASSERT_EQ(1u, mounts->count("/data"));
  EXPECT_EQ(MOUNT_MOUNTED, mounts->at("/data").state);
  EXPECT_SOME(mounts->at("/data").configHash);

  Future<CommandResult> result = sandbox.get()->executeCommand("cat data/file");
  AWAIT_READY(result);
  EXPECT_EQ("data", result->out);

  Future<SandboxInfo> info = sandbox.get()->info();
  AWAIT_READY(info);
  ASSERT_EQ(1, info->mounts_size());
  EXPECT_EQ("/data", info->mounts(0).mount_path());
  EXPECT_EQ(MOUNT_MOUNTED, info->mounts(0).state());
}


// Mounting the same filesystem twice reuses the existing mount.
TEST_F(LocalSandboxTest, Remount)
{
  const string data = createDirectory("data");

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Shared<Filesystem> filesystem(new LocalFilesystem(data));

  Future<MountResult> mount = sandbox.get()->mount(filesystem, "/data");
  AWAIT_READY(mount);
  ASSERT_TRUE(mount->success);

  Try<string> marker = os::read(markerPath("/data"));
  ASSERT_SOME(marker);

  mount = sandbox.get()->mount(filesystem, "/data");
  AWAIT_READY(mount);
  EXPECT_TRUE(mount->success);

  EXPECT_SOME_EQ(data, mounts::local::readlink(hostPath("/data")));
  EXPECT_SOME_EQ(marker.get(), os::read(markerPath("/data")));

  // A new sandbox on the same working directory reuses it as well.
  sandbox.get().reset();

  sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  mount = sandbox.get()->mount(filesystem, "/data");
  AWAIT_READY(mount);
  EXPECT_TRUE(mount->success);
  EXPECT_SOME_EQ(data, mounts::local::readlink(hostPath("/data")));
}


// A mount with a different config replaces the previous mount.
TEST_F(LocalSandboxTest, RemountDifferentConfig)
{
  const string first = createDirectory("first");
  const string second = createDirectory("second");

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(first)),
      "/data");

  AWAIT_READY(mount);
  ASSERT_TRUE(mount->success);

  mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(second)),
      "/data");

  AWAIT_READY(mount);
  EXPECT_TRUE(mount->success);

  EXPECT_SOME_EQ(second, mounts::local::readlink(hostPath("/data")));
  EXPECT_SOME_EQ("second", os::read(path::join(hostPath("/data"), "file")));

  // The previous target is left untouched.
  EXPECT_SOME_EQ("first", os::read(path::join(first, "file")));

  Try<string> marker = os::read(markerPath("/data"));
  ASSERT_SOME(marker);
  EXPECT_TRUE(strings::endsWith(
      marker.get(),
      MountManager::computeConfigHash(createLocalMountConfig(second))));
}


// Paths that were not mounted by a sandbox are never taken over.
TEST_F(LocalSandboxTest, ForeignSymlink)
{
  const string data = createDirectory("data");
  const string other = createDirectory("other");

  ASSERT_SOME(os::mkdir(flags.working_directory));
  ASSERT_SOME(fs::symlink(other, hostPath("/data")));

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(data)),
      "/data");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);
  EXPECT_FALSE(mount->unavailable);
  ASSERT_SOME(mount->error);
  EXPECT_TRUE(strings::contains(
      mount->error.get(), "not created by Mastra")) << mount->error.get();

  EXPECT_SOME_EQ(other, mounts::local::readlink(hostPath("/data")));
  EXPECT_FALSE(os::exists(markerPath("/data")));

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  ASSERT_EQ(1u, mounts->count("/data"));
  EXPECT_EQ(MOUNT_ERROR, mounts->at("/data").state);

  // Even a link to the requested directory needs a marker.
  mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(other)),
      "/data");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);
}


// Unmounting a path whose mount was refused leaves the foreign
// symlink and its target alone.
TEST_F(LocalSandboxTest, ForeignSymlinkUnmount)
{
  const string data = createDirectory("data");
  const string other = createDirectory("other");

  ASSERT_SOME(os::mkdir(flags.working_directory));
  ASSERT_SOME(fs::symlink(other, hostPath("/data")));

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(data)),
      "/data");

  AWAIT_READY(mount);
  ASSERT_FALSE(mount->success);

  AWAIT_READY(sandbox.get()->unmount("/data"));

  EXPECT_TRUE(os::stat::islink(hostPath("/data")));
  EXPECT_SOME_EQ(other, mounts::local::readlink(hostPath("/data")));
  EXPECT_SOME_EQ("other", os::read(path::join(other, "file")));

  // Only the record of the refused mount is gone.
  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  EXPECT_TRUE(mounts->empty());
}


// A FUSE mount without a marker belongs to somebody else: it is
// neither taken over nor unmounted.
TEST_F(LocalSandboxTest, ForeignFuseMount)
{
  ASSERT_SOME(os::mkdir(hostPath("/bucket")));

  TestMounter* mounter = createTestMounter();

  EXPECT_CALL(*mounter, isMountPoint(hostPath("/bucket")))
    .WillRepeatedly(Return(true));

  EXPECT_CALL(*mounter, attach(_, _, _))
    .Times(0);

  EXPECT_CALL(*mounter, unmount(_))
    .Times(0);

  Try<Owned<LocalSandbox>> sandbox =
    CreateSandbox(flags, SandboxHooks(), Owned<mounts::Mounter>(mounter));
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(
          new StaticFilesystem("bucket", createS3MountConfig("bucket"))),
      "/bucket");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);
  ASSERT_SOME(mount->error);
  EXPECT_TRUE(strings::contains(
      mount->error.get(), "not created by Mastra")) << mount->error.get();

  AWAIT_READY(sandbox.get()->unmount("/bucket"));

  EXPECT_TRUE(os::stat::isdir(hostPath("/bucket")));
  EXPECT_FALSE(os::exists(markerPath("/bucket")));
}


TEST_F(LocalSandboxTest, NonEmptyDirectory)
{
  const string data = createDirectory("data");

  ASSERT_SOME(os::mkdir(hostPath("/data")));
  ASSERT_SOME(os::write(path::join(hostPath("/data"), ".hidden"), "keep"));

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(data)),
      "/data");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);
  ASSERT_SOME(mount->error);
  EXPECT_TRUE(strings::contains(
      mount->error.get(), "directory exists and is not empty"))
    << mount->error.get();

  EXPECT_TRUE(os::stat::isdir(hostPath("/data")));
  EXPECT_FALSE(os::stat::islink(hostPath("/data")));
  EXPECT_SOME_EQ("keep", os::read(path::join(hostPath("/data"), ".hidden")));
}


TEST_F(LocalSandboxTest, EmptyDirectory)
{
  const string data = createDirectory("data");

  ASSERT_SOME(os::mkdir(hostPath("/data")));

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(data)),
      "/data");

  AWAIT_READY(mount);
  EXPECT_TRUE(mount->success);
  EXPECT_TRUE(os::stat::islink(hostPath("/data")));
}


// A failed mount removes the mount point only if it created it.
TEST_F(LocalSandboxTest, FailedMountKeepsDirectory)
{
  ASSERT_SOME(os::mkdir(hostPath("/existing")));

  TestMounter* mounter = createTestMounter();

  EXPECT_CALL(*mounter, checkInstalled(_))
    .WillRepeatedly(Return(None()));

  EXPECT_CALL(*mounter, attach(_, _, _))
    .WillRepeatedly(Return(process::Failure("Transport endpoint")));

  Try<Owned<LocalSandbox>> sandbox =
    CreateSandbox(flags, SandboxHooks(), Owned<mounts::Mounter>(mounter));
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(
          new StaticFilesystem("existing", createS3MountConfig("bucket"))),
      "/existing");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);
  EXPECT_FALSE(mount->unavailable);
  ASSERT_SOME(mount->error);
  EXPECT_TRUE(strings::contains(mount->error.get(), "Transport endpoint"))
    << mount->error.get();

  EXPECT_TRUE(os::stat::isdir(hostPath("/existing")));

  mount = sandbox.get()->mount(
      Shared<Filesystem>(
          new StaticFilesystem("created", createS3MountConfig("bucket"))),
      "/created");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);

  EXPECT_FALSE(os::exists(hostPath("/created")));
}


TEST_F(LocalSandboxTest, InvalidMountPath)
{
  const string data = createDirectory("data");

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Shared<Filesystem> filesystem(new LocalFilesystem(data));

  AWAIT_FAILED(sandbox.get()->mount(filesystem, "/a/../b"));
  AWAIT_FAILED(sandbox.get()->mount(filesystem, "relative"));
  AWAIT_FAILED(sandbox.get()->mount(filesystem, "/a b"));
  AWAIT_FAILED(sandbox.get()->unmount("/a/../b"));

  EXPECT_FALSE(os::exists(path::join(root(), "b")));
  EXPECT_FALSE(os::exists(path::join(flags.working_directory, "b")));
}


TEST_F(LocalSandboxTest, Unmount)
{
  const string data = createDirectory("data");

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(data)),
      "/data");

  AWAIT_READY(mount);
  ASSERT_TRUE(mount->success);

  AWAIT_READY(sandbox.get()->unmount("/data"));

  EXPECT_FALSE(os::exists(hostPath("/data")));
  EXPECT_FALSE(os::stat::islink(hostPath("/data")));
  EXPECT_FALSE(os::exists(markerPath("/data")));

  // Only the link is removed.
  EXPECT_SOME_EQ("data", os::read(path::join(data, "file")));

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  EXPECT_TRUE(mounts->empty());

  // Unmounting is idempotent.
  AWAIT_READY(sandbox.get()->unmount("/data"));
  AWAIT_READY(sandbox.get()->unmount("/never-mounted"));
}


// The marker is removed before the FUSE unmount, so a path stays
// unclaimed even if the unmount fails.
TEST_F(LocalSandboxTest, UnmountRemovesMarkerOnFailure)
{
  TestMounter* mounter = createTestMounter();

  EXPECT_CALL(*mounter, checkInstalled(_))
    .WillRepeatedly(Return(None()));

  EXPECT_CALL(*mounter, attach(hostPath("/bucket"), _, _))
    .WillOnce(Return(Nothing()));

  EXPECT_CALL(*mounter, isMountPoint(hostPath("/bucket")))
    .WillRepeatedly(Return(true));

  EXPECT_CALL(*mounter, unmount(hostPath("/bucket")))
    .WillOnce(Return(process::Failure("Device or resource busy")));

  Try<Owned<LocalSandbox>> sandbox =
    CreateSandbox(flags, SandboxHooks(), Owned<mounts::Mounter>(mounter));
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(
          new StaticFilesystem("bucket", createS3MountConfig("bucket"))),
      "/bucket");

  AWAIT_READY(mount);
  ASSERT_TRUE(mount->success);
  ASSERT_TRUE(os::exists(markerPath("/bucket")));

  Future<Nothing> unmount = sandbox.get()->unmount("/bucket");
  AWAIT_FAILED(unmount);
  EXPECT_TRUE(strings::contains(unmount.failure(), "resource busy"))
    << unmount.failure();

  EXPECT_FALSE(os::exists(markerPath("/bucket")));

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  EXPECT_TRUE(mounts->empty());
}


TEST_F(LocalSandboxTest, MissingMountConfig)
{
  MockFilesystem* filesystem = new MockFilesystem();

  EXPECT_CALL(*filesystem, getMountConfig())
    .WillRepeatedly(Return(None()));

  EXPECT_CALL(*filesystem, id())
    .WillRepeatedly(Return("opaque"));

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount =
    sandbox.get()->mount(Shared<Filesystem>(filesystem), "/opaque");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);
  ASSERT_SOME(mount->error);
  EXPECT_TRUE(strings::contains(mount->error.get(), "'opaque'"));

  EXPECT_FALSE(os::exists(hostPath("/opaque")));
}


TEST_F(LocalSandboxTest, UnsupportedMountType)
{
  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new StaticFilesystem("unknown", MountConfig())),
      "/unknown");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  ASSERT_EQ(1u, mounts->count("/unknown"));
  EXPECT_EQ(MOUNT_UNSUPPORTED, mounts->at("/unknown").state);
}


TEST_F(LocalSandboxTest, S3MountUnavailable)
{
  TestMounter* mounter = createTestMounter();

  EXPECT_CALL(*mounter, checkInstalled(_))
    .WillRepeatedly(Return(Option<MountToolNotFoundError>(
        MountToolNotFoundError("s3fs", "Install s3fs-fuse."))));

  EXPECT_CALL(*mounter, attach(_, _, _))
    .Times(0);

  Try<Owned<LocalSandbox>> sandbox =
    CreateSandbox(flags, SandboxHooks(), Owned<mounts::Mounter>(mounter));
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(
          new StaticFilesystem("bucket", createS3MountConfig("bucket"))),
      "/bucket");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);
  EXPECT_TRUE(mount->unavailable);
  ASSERT_SOME(mount->error);
  EXPECT_TRUE(strings::contains(mount->error.get(), "is not installed"))
    << mount->error.get();

  EXPECT_FALSE(os::exists(hostPath("/bucket")));

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  ASSERT_EQ(1u, mounts->count("/bucket"));
  EXPECT_EQ(MOUNT_UNAVAILABLE, mounts->at("/bucket").state);
}


TEST_F(LocalSandboxTest, InvalidS3Config)
{
  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(
          new StaticFilesystem("bucket", createS3MountConfig("Not A Bucket"))),
      "/bucket");

  AWAIT_READY(mount);
  EXPECT_FALSE(mount->success);
  EXPECT_FALSE(mount->unavailable);

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  ASSERT_EQ(1u, mounts->count("/bucket"));
  EXPECT_EQ(MOUNT_ERROR, mounts->at("/bucket").state);
}


// Mounts added before the start are attached when the sandbox starts.
TEST_F(LocalSandboxTest, PendingMounts)
{
  const string data = createDirectory("data");
  const string late = createDirectory("late");

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  AWAIT_READY(sandbox.get()->addMounts({
    {"/data", Shared<Filesystem>(new LocalFilesystem(data))}}));

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  ASSERT_EQ(1u, mounts->count("/data"));
  EXPECT_EQ(MOUNT_PENDING, mounts->at("/data").state);
  EXPECT_FALSE(os::exists(hostPath("/data")));

  AWAIT_READY(sandbox.get()->start());

  mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  EXPECT_EQ(MOUNT_MOUNTED, mounts->at("/data").state);
  EXPECT_TRUE(os::stat::islink(hostPath("/data")));

  // A running sandbox mounts right away.
  AWAIT_READY(sandbox.get()->addMounts({
    {"/late", Shared<Filesystem>(new LocalFilesystem(late))}}));

  mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  EXPECT_EQ(MOUNT_MOUNTED, mounts->at("/late").state);
  EXPECT_TRUE(os::stat::islink(hostPath("/late")));
}


TEST_F(LocalSandboxTest, MountHook)
{
  const string data = createDirectory("data");
  const string skipped = createDirectory("skipped");

  SandboxHooks hooks;
  hooks.onMount = [](
      const Shared<Filesystem>& filesystem,
      const string& mountPath,
      const Option<MountConfig>& config) -> Future<MountDecision> {
    if (mountPath == "/skipped") {
      return MountDecision::skip();
    }

    return MountDecision::proceed();
  };

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags, hooks);
  ASSERT_SOME(sandbox);

  AWAIT_READY(sandbox.get()->addMounts({
    {"/data", Shared<Filesystem>(new LocalFilesystem(data))},
    {"/skipped", Shared<Filesystem>(new LocalFilesystem(skipped))}}));

  AWAIT_READY(sandbox.get()->start());

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);

  EXPECT_EQ(MOUNT_MOUNTED, mounts->at("/data").state);
  EXPECT_EQ(MOUNT_UNSUPPORTED, mounts->at("/skipped").state);

  EXPECT_TRUE(os::stat::islink(hostPath("/data")));
  EXPECT_FALSE(os::exists(hostPath("/skipped")));
}


TEST_F(LocalSandboxTest, StopUnmounts)
{
  const string data = createDirectory("data");

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  AWAIT_READY(sandbox.get()->start());

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(data)),
      "/data");

  AWAIT_READY(mount);
  ASSERT_TRUE(mount->success);

  AWAIT_READY(sandbox.get()->stop());
  AWAIT_EXPECT_EQ(SANDBOX_STOPPED, sandbox.get()->status());

  EXPECT_FALSE(os::exists(hostPath("/data")));
  EXPECT_FALSE(os::exists(markerPath("/data")));
  EXPECT_SOME_EQ("data", os::read(path::join(data, "file")));

  // The working directory is kept.
  EXPECT_TRUE(os::stat::isdir(flags.working_directory));
}


TEST_F(LocalSandboxTest, Destroy)
{
  const string data = createDirectory("data");

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  AWAIT_READY(sandbox.get()->start());

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(data)),
      "/data");

  AWAIT_READY(mount);
  ASSERT_TRUE(mount->success);

  AWAIT_READY(sandbox.get()->destroy());
  AWAIT_EXPECT_EQ(SANDBOX_DESTROYED, sandbox.get()->status());

  EXPECT_FALSE(os::exists(hostPath("/data")));
  EXPECT_FALSE(os::exists(markerPath("/data")));
  EXPECT_SOME_EQ("data", os::read(path::join(data, "file")));

  Future<map<string, MountEntry>> mounts = sandbox.get()->mounts();
  AWAIT_READY(mounts);
  EXPECT_TRUE(mounts->empty());

  Future<Nothing> start = sandbox.get()->start();
  AWAIT_FAILED(start);

  Future<Nothing> ensure = sandbox.get()->ensureRunning();
  AWAIT_FAILED(ensure);
  EXPECT_EQ(
      SandboxNotReadyError("test-sandbox", SANDBOX_DESTROYED).message,
      ensure.failure());

  // The sandbox failing to start is not reported as a failed command.
  Future<CommandResult> command = sandbox.get()->executeCommand("true");
  AWAIT_FAILED(command);
  EXPECT_EQ(
      SandboxNotReadyError("test-sandbox", SANDBOX_DESTROYED).message,
      command.failure());

  AWAIT_READY(sandbox.get()->destroy());
}


// Mounts left behind by an earlier sandbox are cleaned up, except for
// the expected ones.
TEST_F(LocalSandboxTest, ReconcileMounts)
{
  const string stale = createDirectory("stale");
  const string kept = createDirectory("kept");

  Try<Owned<LocalSandbox>> sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  Future<MountResult> mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(stale)),
      "/stale");

  AWAIT_READY(mount);
  ASSERT_TRUE(mount->success);

  mount = sandbox.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(kept)),
      "/kept");

  AWAIT_READY(mount);
  ASSERT_TRUE(mount->success);

  // Markers of other sandboxes are left alone.
  sandbox::Flags otherFlags = flags;
  otherFlags.id = "other-sandbox";
  otherFlags.working_directory = path::join(root(), "other");

  Try<Owned<LocalSandbox>> other = CreateSandbox(otherFlags);
  ASSERT_SOME(other);

  mount = other.get()->mount(
      Shared<Filesystem>(new LocalFilesystem(stale)),
      "/stale");

  AWAIT_READY(mount);
  ASSERT_TRUE(mount->success);

  // Simulate a restart, the mounts outlive the sandbox.
  sandbox.get().reset();

  sandbox = CreateSandbox(flags);
  ASSERT_SOME(sandbox);

  AWAIT_READY(sandbox.get()->reconcileMounts({"/kept"}));

  EXPECT_FALSE(os::exists(hostPath("/stale")));
  EXPECT_FALSE(os::exists(markerPath("/stale")));

  EXPECT_TRUE(os::stat::islink(hostPath("/kept")));
  EXPECT_TRUE(os::exists(markerPath("/kept")));

  const string otherHostPath = path::join(otherFlags.working_directory, "stale");
  EXPECT_TRUE(os::stat::islink(otherHostPath));
  EXPECT_TRUE(os::exists(paths::getMarkerPath(flags.marker_dir, otherHostPath)));
}

} // namespace tests {
} // namespace internal {
} // namespace mastra {
