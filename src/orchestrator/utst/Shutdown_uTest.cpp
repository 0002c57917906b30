/**
 * @file Shutdown_uTest.cpp
 * @brief Unit tests for keeper::orchestrator (ShutdownRoutine, KernelHook).
 */

#include "src/config/utst/FakeHost.hpp"
#include "src/lock/inc/SingletonLock.hpp"
#include "src/orchestrator/inc/KernelHook.hpp"
#include "src/orchestrator/inc/Shutdown.hpp"
#include "src/system/inc/Command.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h> // stat

#include <string>
#include <utility>

using keeper::helpers::status::Status;
using keeper::lock::acquireLock;
using keeper::lock::LockHandle;
using keeper::lock::LockResult;
using keeper::orchestrator::kernelHookPath;
using keeper::orchestrator::renderKernelHook;
using keeper::orchestrator::shellQuote;
using keeper::orchestrator::ShutdownRoutine;
using keeper::orchestrator::writeKernelUpdateHook;
using keeper::test::FakeHost;

class ShutdownTest : public ::testing::Test {
protected:
  FakeHost host_;
  LockHandle lock_{};

  void SetUp() override {
    LockResult res = acquireLock(host_.cfg.lockFile);
    ASSERT_EQ(res.status, Status::OK);
    lock_ = std::move(res.handle);
  }
};

/* ----------------------------- ShutdownRoutine ----------------------------- */

/** @test Unarmed routine does nothing. */
TEST_F(ShutdownTest, UnarmedDoesNothing) {
  host_.loadAll();
  ShutdownRoutine routine(host_.cfg, lock_);
  EXPECT_FALSE(routine.armed());
  EXPECT_EQ(routine.run(), Status::INTERRUPTED);
  EXPECT_EQ(routine.attempts(), 0);
  EXPECT_TRUE(host_.allLoaded());
  EXPECT_TRUE(lock_.held());
}

/** @test Armed routine unloads and releases the lock exactly once. */
TEST_F(ShutdownTest, CompletesOnce) {
  host_.loadAll();
  ShutdownRoutine routine(host_.cfg, lock_);
  routine.arm();
  EXPECT_EQ(routine.run(), Status::OK);
  EXPECT_TRUE(routine.completed());
  EXPECT_TRUE(host_.noneLoaded());
  EXPECT_FALSE(lock_.held());
  EXPECT_FALSE(host_.tree.exists("run/nvidia/driver-keeper.pid"));

  host_.clearCalls();
  EXPECT_EQ(routine.run(), Status::OK);
  EXPECT_EQ(routine.attempts(), 1);
  EXPECT_TRUE(host_.calls().empty());
}

/** @test In use: lock kept, a later attempt succeeds. */
TEST_F(ShutdownTest, InUseKeepsLockThenRetries) {
  host_.loadAll();
  host_.setLoaded("nvidia_modeset", 3);
  ShutdownRoutine routine(host_.cfg, lock_);
  routine.arm();

  EXPECT_EQ(routine.run(), Status::IN_USE);
  EXPECT_FALSE(routine.completed());
  EXPECT_TRUE(lock_.held());
  EXPECT_TRUE(host_.allLoaded());

  host_.setLoaded("nvidia_modeset", 1);
  EXPECT_EQ(routine.run(), Status::OK);
  EXPECT_EQ(routine.attempts(), 2);
  EXPECT_FALSE(lock_.held());
  EXPECT_TRUE(host_.noneLoaded());
}

/** @test Nothing loaded still completes. */
TEST_F(ShutdownTest, NothingLoaded) {
  ShutdownRoutine routine(host_.cfg, lock_);
  routine.arm();
  EXPECT_EQ(routine.run(), Status::OK);
  EXPECT_FALSE(lock_.held());
}

/* ----------------------------- KernelHook ----------------------------- */

/** @test Single quotes survive quoting. */
TEST(KernelHookTest, ShellQuote) {
  EXPECT_EQ(shellQuote("plain"), "'plain'");
  EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
  EXPECT_EQ(shellQuote(""), "''");
}

/** @test No hook directory: skipped without error. */
TEST(KernelHookTest, NoHookDir) {
  FakeHost host;
  EXPECT_TRUE(kernelHookPath(host.cfg).empty());
  EXPECT_TRUE(writeKernelUpdateHook(host.cfg));

  host.cfg.hookDir = host.tree.path("etc/kernel/postinst.d");
  EXPECT_TRUE(writeKernelUpdateHook(host.cfg));
  EXPECT_FALSE(host.tree.exists("etc/kernel/postinst.d/update-nvidia-driver"));
}

/** @test Hook is executable and calls update for the new kernel. */
TEST(KernelHookTest, HookRunsUpdate) {
  FakeHost host;
  host.cfg.hookDir = host.tree.mkdir("etc/kernel/postinst.d");
  host.cfg.selfPath = host.tree.script(
      "bin/driver keeper", "echo \"self $* $DRIVER_VERSION $KEEPER_CACHE_DIR\" >> '" +
                               host.tree.path("calls.log") + "'\n");
  ASSERT_TRUE(writeKernelUpdateHook(host.cfg));

  const std::string HOOK = kernelHookPath(host.cfg);
  EXPECT_EQ(HOOK, host.cfg.hookDir + "/update-nvidia-driver");
  struct stat st{};
  ASSERT_EQ(::stat(HOOK.c_str(), &st), 0);
  EXPECT_NE(st.st_mode & S_IXUSR, 0U);

  ASSERT_TRUE(keeper::system::runCommand({HOOK, "6.1.0-13-amd64"}).ok());
  EXPECT_EQ(host.countCalls("self update --kernel 6.1.0-13-amd64 550.54.14 " + host.cfg.cacheDir),
            1U);

  // Without a kernel argument the hook does nothing.
  host.clearCalls();
  ASSERT_TRUE(keeper::system::runCommand({HOOK}).ok());
  EXPECT_TRUE(host.calls().empty());
}

/** @test A failing update never fails the package manager. */
TEST(KernelHookTest, HookSwallowsUpdateFailure) {
  FakeHost host;
  host.cfg.hookDir = host.tree.mkdir("etc/kernel/postinst.d");
  host.cfg.selfPath = "/bin/false";
  ASSERT_TRUE(writeKernelUpdateHook(host.cfg));
  EXPECT_TRUE(keeper::system::runCommand({kernelHookPath(host.cfg), "6.1.0"}).ok());
  EXPECT_NE(renderKernelHook(host.cfg).find("'/bin/false' update --kernel"), std::string::npos);
}
