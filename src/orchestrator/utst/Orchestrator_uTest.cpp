/**
 * @file Orchestrator_uTest.cpp
 * @brief Lifecycle scenarios for keeper::orchestrator against a scratch host.
 *
 * Notes:
 *  - Every collaborator is scripted (see FakeHost.hpp); rootfs publishing is
 *    off because it needs real mounts.
 *  - init tests block termination signals in the test thread and restore the
 *    original mask afterwards. The shutdown signal is sent to the test thread
 *    once the kernel hook (the last bring-up step) exists.
 *  - A signal between load and publish is raised by the persistence daemon
 *    script (the last load step) at its parent, the test process.
 */

#include "src/config/utst/FakeHost.hpp"
#include "src/lock/inc/SingletonLock.hpp"
#include "src/orchestrator/inc/Orchestrator.hpp"
#include "src/orchestrator/inc/Signals.hpp"
#include "src/package/inc/PackageCache.hpp"

#include <gtest/gtest.h>

#include <pthread.h>
#include <signal.h>

#include <chrono>
#include <string>
#include <thread>

using keeper::helpers::status::Status;
using keeper::orchestrator::bringUp;
using keeper::orchestrator::EnsureResult;
using keeper::orchestrator::ensurePackage;
using keeper::orchestrator::exitCodeFor;
using keeper::orchestrator::runInit;
using keeper::orchestrator::runUpdate;
using keeper::orchestrator::statusReport;
using keeper::package::lookup;
using keeper::test::FakeHost;

class OrchestratorTest : public ::testing::Test {
protected:
  FakeHost host_;
  sigset_t previous_{};

  void SetUp() override { ASSERT_EQ(::pthread_sigmask(SIG_BLOCK, nullptr, &previous_), 0); }

  void TearDown() override {
    sigset_t current;
    ::pthread_sigmask(SIG_BLOCK, nullptr, &current);
    if (sigismember(&current, SIGTERM) == 1) {
      while (keeper::orchestrator::takePendingTerminationSignal() != 0) {
      }
    }
    keeper::orchestrator::restoreSignalMask(previous_);
  }

  /// Send SIGTERM to this thread once bring-up has written the kernel hook.
  std::thread signalAfterBringUp() {
    host_.cfg.hookDir = host_.tree.mkdir("etc/kernel/postinst.d");
    const pthread_t SELF = ::pthread_self();
    const std::string HOOK = "etc/kernel/postinst.d/update-nvidia-driver";
    return std::thread([this, SELF, HOOK]() {
      for (int i = 0; i < 1000 && !host_.tree.exists(HOOK); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      ::pthread_kill(SELF, SIGTERM);
    });
  }
};

/* ----------------------------- ensurePackage ----------------------------- */

/** @test First call builds, second reuses the cached entry. */
TEST_F(OrchestratorTest, EnsureBuildsThenReuses) {
  const EnsureResult FIRST = ensurePackage(host_.cfg, "5.10.0");
  ASSERT_EQ(FIRST.status, Status::OK);
  EXPECT_TRUE(FIRST.rebuilt);

  host_.clearCalls();
  const EnsureResult SECOND = ensurePackage(host_.cfg, "5.10.0");
  ASSERT_EQ(SECOND.status, Status::OK);
  EXPECT_FALSE(SECOND.rebuilt);
  EXPECT_TRUE(SECOND.package.sameContent(FIRST.package));
  EXPECT_EQ(host_.countCalls("mkprecompiled --pack"), 0U);
  EXPECT_EQ(host_.countCalls("make"), 0U);
}

/** @test Interface mismatch rebuilds. */
TEST_F(OrchestratorTest, EnsureRebuildsOnMismatch) {
  ASSERT_EQ(ensurePackage(host_.cfg, "5.10.0").status, Status::OK);
  host_.fail("match");
  const EnsureResult RES = ensurePackage(host_.cfg, "5.10.0");
  ASSERT_EQ(RES.status, Status::OK);
  EXPECT_TRUE(RES.rebuilt);
}

/** @test Build failure propagates. */
TEST_F(OrchestratorTest, EnsureBuildFailure) {
  host_.fail("make");
  EXPECT_EQ(ensurePackage(host_.cfg, "5.10.0").status, Status::BUILD_ERROR);
}

/* ----------------------------- bringUp ----------------------------- */

/** @test Fresh host: build, cache, install, load. */
TEST_F(OrchestratorTest, BringUpFreshHost) {
  ASSERT_EQ(bringUp(host_.cfg), Status::OK);
  EXPECT_TRUE(host_.allLoaded());
  EXPECT_TRUE(lookup(host_.cfg, "5.10.0").has_value());
  EXPECT_EQ(host_.countCalls("mkprecompiled --pack"), 1U);
  EXPECT_EQ(host_.countCalls("mkprecompiled --unpack"), 1U);
  EXPECT_EQ(host_.countCalls("insmod"), 4U);
  EXPECT_EQ(host_.countCalls("persistenced --persistence-mode"), 1U);
}

/** @test Restart over a running driver reuses the cache. */
TEST_F(OrchestratorTest, BringUpCachedRestart) {
  ASSERT_EQ(bringUp(host_.cfg), Status::OK);
  host_.clearCalls();

  ASSERT_EQ(bringUp(host_.cfg), Status::OK);
  EXPECT_TRUE(host_.allLoaded());
  EXPECT_EQ(host_.countCalls("rmmod"), 1U);
  EXPECT_EQ(host_.countCalls("mkprecompiled --pack"), 0U);
  EXPECT_EQ(host_.countCalls("make"), 0U);
  EXPECT_EQ(host_.countCalls("insmod"), 4U);
}

/** @test Driver in use: refused before any build or install. */
TEST_F(OrchestratorTest, BringUpInUse) {
  host_.loadAll();
  host_.setLoaded("nvidia", 3);
  EXPECT_EQ(bringUp(host_.cfg), Status::IN_USE);
  EXPECT_EQ(host_.countCalls("make"), 0U);
  EXPECT_EQ(host_.countCalls("rmmod"), 0U);
  EXPECT_FALSE(lookup(host_.cfg, "5.10.0").has_value());
}

/** @test License not accepted: package is built but nothing is installed or loaded. */
TEST_F(OrchestratorTest, BringUpLicenseRefused) {
  host_.cfg.acceptLicense = false;
  EXPECT_EQ(bringUp(host_.cfg), Status::INSTALL_ERROR);
  EXPECT_TRUE(host_.noneLoaded());
  EXPECT_EQ(host_.countCalls("mkprecompiled --unpack"), 0U);
}

/** @test Loaded flag is set only once every module is in. */
TEST_F(OrchestratorTest, BringUpReportsDriverLoaded) {
  bool loaded = true;
  host_.cfg.acceptLicense = false;
  EXPECT_EQ(bringUp(host_.cfg, &loaded), Status::INSTALL_ERROR);
  EXPECT_FALSE(loaded);

  host_.cfg.acceptLicense = true;
  ASSERT_EQ(bringUp(host_.cfg, &loaded), Status::OK);
  EXPECT_TRUE(loaded);
}

/** @test Load failure is reported as such. */
TEST_F(OrchestratorTest, BringUpLoadFailure) {
  host_.fail("insmod-nvidia_uvm");
  EXPECT_EQ(bringUp(host_.cfg), Status::LOAD_ERROR);
  EXPECT_TRUE(host_.isLoaded("nvidia"));
  EXPECT_FALSE(host_.isLoaded("nvidia_uvm"));
}

/* ----------------------------- runUpdate ----------------------------- */

/** @test Update builds for another kernel without touching modules. */
TEST_F(OrchestratorTest, UpdateOtherKernel) {
  host_.loadAll();
  host_.cfg.kernelVersion = "6.1.0-13-amd64";
  host_.clearCalls();

  EXPECT_EQ(runUpdate(host_.cfg), Status::OK);
  EXPECT_TRUE(lookup(host_.cfg, "6.1.0-13-amd64").has_value());
  EXPECT_TRUE(host_.allLoaded());
  EXPECT_EQ(host_.countCalls("rmmod"), 0U);
  EXPECT_EQ(host_.countCalls("insmod"), 0U);
  EXPECT_EQ(host_.countCalls("make -s -j 2 SYSSRC=" + host_.cfg.kernelBuildDir("6.1.0-13-amd64")),
            1U);
}

/** @test Update for a kernel with a valid entry is a no-op. */
TEST_F(OrchestratorTest, UpdateAlreadyCached) {
  ASSERT_EQ(runUpdate(host_.cfg), Status::OK);
  host_.clearCalls();
  EXPECT_EQ(runUpdate(host_.cfg), Status::OK);
  EXPECT_EQ(host_.countCalls("mkprecompiled --pack"), 0U);
}

/** @test Update does not contend for the init lock. */
TEST_F(OrchestratorTest, UpdateWhileInitHoldsLock) {
  keeper::lock::LockResult held = keeper::lock::acquireLock(host_.cfg.lockFile);
  ASSERT_EQ(held.status, Status::OK);
  EXPECT_EQ(runUpdate(host_.cfg), Status::OK);
  EXPECT_TRUE(held.handle.held());
}

/** @test Build failure makes update fail. */
TEST_F(OrchestratorTest, UpdateBuildFailure) {
  host_.fail("ld");
  EXPECT_EQ(runUpdate(host_.cfg), Status::BUILD_ERROR);
  EXPECT_EQ(exitCodeFor(Status::BUILD_ERROR), 1);
}

/* ----------------------------- runInit ----------------------------- */

/** @test Full lifecycle: bring-up, wait, SIGTERM, teardown. */
TEST_F(OrchestratorTest, InitLifecycle) {
  std::thread sender = signalAfterBringUp();
  const Status RC = runInit(host_.cfg);
  sender.join();

  EXPECT_EQ(RC, Status::OK);
  EXPECT_EQ(exitCodeFor(RC), 0);
  EXPECT_TRUE(host_.noneLoaded());
  EXPECT_FALSE(host_.tree.exists("run/nvidia/driver-keeper.pid"));
  EXPECT_TRUE(lookup(host_.cfg, "5.10.0").has_value());
  EXPECT_TRUE(host_.tree.exists("etc/kernel/postinst.d/update-nvidia-driver"));
}

/** @test Second instance is refused without side effects. */
TEST_F(OrchestratorTest, InitAlreadyRunning) {
  keeper::lock::LockResult held = keeper::lock::acquireLock(host_.cfg.lockFile);
  ASSERT_EQ(held.status, Status::OK);
  const std::string BEFORE = host_.tree.read("run/nvidia/driver-keeper.pid");

  EXPECT_EQ(runInit(host_.cfg), Status::ALREADY_RUNNING);
  EXPECT_EQ(host_.tree.read("run/nvidia/driver-keeper.pid"), BEFORE);
  EXPECT_TRUE(host_.calls().empty());
}

/** @test Signal during bring-up aborts and releases the lock. */
TEST_F(OrchestratorTest, InitInterruptedBeforeWait) {
  ASSERT_TRUE(keeper::orchestrator::blockTerminationSignals());
  ASSERT_EQ(::pthread_kill(::pthread_self(), SIGINT), 0);

  EXPECT_EQ(runInit(host_.cfg), Status::INTERRUPTED);
  EXPECT_FALSE(host_.tree.exists("run/nvidia/driver-keeper.pid"));
  EXPECT_EQ(host_.countCalls("make"), 0U);
  EXPECT_TRUE(host_.noneLoaded());
}

/** @test Signal between load and publish: driver is torn down before the lock goes. */
TEST_F(OrchestratorTest, InitInterruptedAfterLoadTearsDown) {
  host_.cfg.hookDir = host_.tree.mkdir("etc/kernel/postinst.d");
  host_.cfg.tools.persistenced = host_.tree.script(
      "bin/nvidia-persistenced", "echo \"persistenced $*\" >> '" + host_.tree.path("calls.log") +
                                     "'\nkill -TERM $PPID\nexit 0\n");

  EXPECT_EQ(runInit(host_.cfg), Status::INTERRUPTED);
  EXPECT_EQ(host_.countCalls("persistenced --persistence-mode"), 1U);
  EXPECT_EQ(host_.countCalls("rmmod"), 1U);
  EXPECT_TRUE(host_.noneLoaded());
  EXPECT_FALSE(host_.tree.exists("run/nvidia/driver-keeper.pid"));
  EXPECT_FALSE(host_.tree.exists("etc/kernel/postinst.d/update-nvidia-driver"));
}

/** @test Refused teardown after a failed bring-up keeps the lock until a later signal. */
TEST_F(OrchestratorTest, InitTeardownRefusedKeepsLock) {
  host_.cfg.tools.persistenced = host_.tree.script(
      "bin/nvidia-persistenced", "echo \"persistenced $*\" >> '" + host_.tree.path("calls.log") +
                                     "'\nkill -TERM $PPID\nexit 0\n");
  host_.fail("rmmod-nvidia_uvm");
  // The daemon signals the process; the helper thread must not take it.
  ASSERT_TRUE(keeper::orchestrator::blockTerminationSignals());

  const pthread_t SELF = ::pthread_self();
  bool lockHeldAfterRefusal = false;
  std::thread retry([this, SELF, &lockHeldAfterRefusal]() {
    // The refused batch removes drm and modeset, then fails on uvm.
    for (int i = 0; i < 1000; ++i) {
      if (host_.countCalls("rmmod") > 0 && !host_.isLoaded("nvidia_modeset")) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    lockHeldAfterRefusal = keeper::lock::readLockOwner(host_.cfg.lockFile).held;
    host_.heal("rmmod-nvidia_uvm");
    ::pthread_kill(SELF, SIGTERM);
  });

  const Status RC = runInit(host_.cfg);
  retry.join();

  EXPECT_EQ(RC, Status::INTERRUPTED);
  EXPECT_TRUE(lockHeldAfterRefusal);
  EXPECT_EQ(host_.countCalls("rmmod"), 2U);
  EXPECT_TRUE(host_.noneLoaded());
  EXPECT_FALSE(host_.tree.exists("run/nvidia/driver-keeper.pid"));
}

/** @test Failed bring-up exits non-zero and releases the lock. */
TEST_F(OrchestratorTest, InitBringUpFailure) {
  host_.fail("pack");
  const Status RC = runInit(host_.cfg);
  EXPECT_EQ(RC, Status::BUILD_ERROR);
  EXPECT_EQ(exitCodeFor(RC), 1);
  EXPECT_FALSE(host_.tree.exists("run/nvidia/driver-keeper.pid"));
}

/* ----------------------------- statusReport ----------------------------- */

/** @test Report covers modules, cache and lock. */
TEST_F(OrchestratorTest, StatusReport) {
  ASSERT_EQ(bringUp(host_.cfg), Status::OK);
  host_.tree.write("proc/modules", "nvidia_drm 69632 0 - Live 0x0\n"
                                   "nvidia 56442880 2 nvidia_modeset,nvidia_uvm, Live 0x0\n"
                                   "ext4 1 1 - Live 0x0\n");
  const std::string REPORT = statusReport(host_.cfg);
  EXPECT_NE(REPORT.find("Driver modules (4/4 loaded)"), std::string::npos) << REPORT;
  EXPECT_NE(REPORT.find("nvidia-modules-5.10.0"), std::string::npos);
  EXPECT_NE(REPORT.find("[nvidia_modeset,nvidia_uvm]"), std::string::npos);
  EXPECT_EQ(REPORT.find("ext4"), std::string::npos);
  EXPECT_NE(REPORT.find("Lock:        free"), std::string::npos);
  EXPECT_NE(REPORT.find("Rootfs:      not mounted"), std::string::npos);
}
