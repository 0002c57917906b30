/**
 * @file Config_uTest.cpp
 * @brief Unit tests for keeper::config.
 *
 * Notes:
 *  - loadConfig tests mutate the process environment and restore it.
 *  - The running kernel comes from uname and is only checked for non-empty.
 */

#include "src/config/inc/Config.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib> // setenv, unsetenv
#include <string>
#include <utility>
#include <vector>

using keeper::config::Config;
using keeper::config::defaultModuleSet;
using keeper::config::dependencyOrder;
using keeper::config::loadConfig;
using keeper::config::ModuleSpec;
using keeper::config::parseFlag;
using keeper::config::setMaxThreads;
using keeper::helpers::status::Status;

namespace {

const char* const MANAGED_VARS[] = {
    "DRIVER_VERSION",  "DRIVER_NAME",          "KERNEL_VERSION",      "ACCEPT_LICENSE",
    "PRIVATE_KEY",     "PACKAGE_TAG",          "MAX_THREADS",         "KEEPER_RUN_DIR",
    "KEEPER_LOCK_FILE", "KEEPER_SOURCE_DIR",   "KEEPER_CACHE_DIR",    "KEEPER_PUBLISH_ROOTFS",
    "KEEPER_AUX_MODULES", "KEEPER_PROVISIONER", "KEEPER_PERSISTENCED", "KEEPER_PUBLISH_TARGET",
};

class ConfigEnvTest : public ::testing::Test {
protected:
  void SetUp() override {
    for (const char* name : MANAGED_VARS) {
      const char* v = std::getenv(name);
      saved_.emplace_back(name, v != nullptr ? v : "", v != nullptr);
      ::unsetenv(name);
    }
  }

  void TearDown() override {
    for (const Saved& s : saved_) {
      if (s.wasSet) {
        ::setenv(s.name.c_str(), s.value.c_str(), 1);
      } else {
        ::unsetenv(s.name.c_str());
      }
    }
  }

private:
  struct Saved {
    Saved(std::string n, std::string v, bool set)
        : name(std::move(n)), value(std::move(v)), wasSet(set) {}
    std::string name;
    std::string value;
    bool wasSet;
  };
  std::vector<Saved> saved_;
};

std::vector<std::string> names(const std::vector<ModuleSpec>& mods) {
  std::vector<std::string> out;
  for (const ModuleSpec& M : mods) {
    out.push_back(M.name);
  }
  return out;
}

} // namespace

/* ----------------------------- Module Graph ----------------------------- */

/** @test Default set is already dependency ordered. */
TEST(ModuleGraphTest, DefaultSetOrdered) {
  const std::vector<ModuleSpec> SET = defaultModuleSet();
  std::vector<ModuleSpec> ordered;
  ASSERT_TRUE(dependencyOrder(SET, ordered));
  EXPECT_EQ(names(ordered), names(SET));
  EXPECT_EQ(names(ordered),
            (std::vector<std::string>{"nvidia", "nvidia_uvm", "nvidia_modeset", "nvidia_drm"}));
}

/** @test Reversed input is reordered so dependencies come first. */
TEST(ModuleGraphTest, ReversedInputReordered) {
  std::vector<ModuleSpec> set = defaultModuleSet();
  std::reverse(set.begin(), set.end());
  std::vector<ModuleSpec> ordered;
  ASSERT_TRUE(dependencyOrder(set, ordered));
  ASSERT_EQ(ordered.size(), 4U);
  EXPECT_EQ(ordered.front().name, "nvidia");
  const std::vector<std::string> N = names(ordered);
  const auto POS = [&N](const char* n) { return std::find(N.begin(), N.end(), n) - N.begin(); };
  EXPECT_LT(POS("nvidia_modeset"), POS("nvidia_drm"));
}

/** @test Undeclared dependency is rejected. */
TEST(ModuleGraphTest, UndeclaredDependencyRejected) {
  std::vector<ModuleSpec> set = defaultModuleSet();
  set.back().deps.push_back("drm_kms_helper");
  std::vector<ModuleSpec> ordered;
  EXPECT_FALSE(dependencyOrder(set, ordered));
}

/** @test Cycles are rejected and leave the output empty. */
TEST(ModuleGraphTest, CycleRejected) {
  std::vector<ModuleSpec> set = defaultModuleSet();
  set.front().deps.push_back("nvidia_drm");
  std::vector<ModuleSpec> ordered;
  EXPECT_FALSE(dependencyOrder(set, ordered));
  EXPECT_TRUE(ordered.empty());
}

/** @test Linked modules carry an interface object. */
TEST(ModuleGraphTest, LinkedModules) {
  Config cfg;
  cfg.modules = defaultModuleSet();
  ASSERT_NE(cfg.findModule("nvidia"), nullptr);
  EXPECT_TRUE(cfg.findModule("nvidia")->isLinked());
  EXPECT_FALSE(cfg.findModule("nvidia_uvm")->isLinked());
  EXPECT_EQ(cfg.findModule("nouveau"), nullptr);
  EXPECT_EQ(cfg.dependentsOf("nvidia"),
            (std::vector<std::string>{"nvidia_uvm", "nvidia_modeset"}));
  EXPECT_TRUE(cfg.dependentsOf("nvidia_drm").empty());
}

/* ----------------------------- Parsing ----------------------------- */

/** @test Boolean-ish values. */
TEST(ConfigParseTest, ParseFlag) {
  EXPECT_TRUE(parseFlag("1"));
  EXPECT_TRUE(parseFlag("yes"));
  EXPECT_TRUE(parseFlag(" true\n"));
  EXPECT_FALSE(parseFlag(""));
  EXPECT_FALSE(parseFlag("0"));
  EXPECT_FALSE(parseFlag("no"));
}

/** @test Thread count must be a positive integer. */
TEST(ConfigParseTest, SetMaxThreads) {
  Config cfg;
  EXPECT_TRUE(setMaxThreads(cfg, "8"));
  EXPECT_EQ(cfg.maxThreads, 8U);
  EXPECT_FALSE(setMaxThreads(cfg, "0"));
  EXPECT_FALSE(setMaxThreads(cfg, "-2"));
  EXPECT_FALSE(setMaxThreads(cfg, "four"));
  EXPECT_FALSE(setMaxThreads(cfg, ""));
  EXPECT_EQ(cfg.maxThreads, 8U);
}

/** @test Derived paths follow the kernel argument. */
TEST(ConfigParseTest, DerivedPaths) {
  Config cfg;
  cfg.modulesRoot = "/lib/modules";
  cfg.runningKernel = "5.10.0";
  cfg.driverVersion = "550.54.14";
  EXPECT_EQ(cfg.kernelBuildDir("6.1.0"), "/lib/modules/6.1.0/build");
  EXPECT_EQ(cfg.procMountPoint("6.1.0"), "/lib/modules/6.1.0/proc");
  EXPECT_EQ(cfg.targetDir(), "/lib/modules/5.10.0/kernel/drivers/video/nvidia-550.54.14");
}

/* ----------------------------- loadConfig ----------------------------- */

/** @test Missing DRIVER_VERSION is a configuration error. */
TEST_F(ConfigEnvTest, MissingDriverVersion) {
  Config cfg;
  std::string error;
  EXPECT_EQ(loadConfig(cfg, error), Status::CONFIG_ERROR);
  EXPECT_NE(error.find("DRIVER_VERSION"), std::string::npos);
}

/** @test Defaults derive from driver name and version. */
TEST_F(ConfigEnvTest, Defaults) {
  ::setenv("DRIVER_VERSION", "550.54.14", 1);
  Config cfg;
  std::string error;
  ASSERT_EQ(loadConfig(cfg, error), Status::OK) << error;

  EXPECT_EQ(cfg.driverName, "nvidia");
  EXPECT_FALSE(cfg.runningKernel.empty());
  EXPECT_EQ(cfg.kernelVersion, cfg.runningKernel);
  EXPECT_FALSE(cfg.acceptLicense);
  EXPECT_GE(cfg.maxThreads, 1U);
  EXPECT_EQ(cfg.lockFile, "/run/nvidia/driver-keeper.pid");
  EXPECT_EQ(cfg.sourceDir, "/usr/src/nvidia-550.54.14");
  EXPECT_EQ(cfg.cacheDir, "/usr/src/nvidia-550.54.14/precompiled");
  EXPECT_TRUE(cfg.publishRootfs);
  EXPECT_EQ(cfg.tools.persistenced, "nvidia-persistenced");
  EXPECT_EQ(cfg.auxModules, (std::vector<std::string>{"ipmi_msghandler"}));
  EXPECT_EQ(cfg.modules.size(), 4U);
}

/** @test Environment overrides are applied. */
TEST_F(ConfigEnvTest, Overrides) {
  ::setenv("DRIVER_VERSION", "535.0", 1);
  ::setenv("KERNEL_VERSION", "6.1.0-13-amd64", 1);
  ::setenv("ACCEPT_LICENSE", "yes", 1);
  ::setenv("PACKAGE_TAG", "builder", 1);
  ::setenv("MAX_THREADS", "3", 1);
  ::setenv("KEEPER_RUN_DIR", "/tmp/keeper-run", 1);
  ::setenv("KEEPER_PUBLISH_ROOTFS", "0", 1);
  ::setenv("KEEPER_PROVISIONER", "", 1);
  ::setenv("KEEPER_AUX_MODULES", "", 1);

  Config cfg;
  std::string error;
  ASSERT_EQ(loadConfig(cfg, error), Status::OK) << error;
  EXPECT_EQ(cfg.kernelVersion, "6.1.0-13-amd64");
  EXPECT_TRUE(cfg.acceptLicense);
  EXPECT_EQ(cfg.packageTag, "builder");
  EXPECT_EQ(cfg.maxThreads, 3U);
  EXPECT_EQ(cfg.lockFile, "/tmp/keeper-run/driver-keeper.pid");
  EXPECT_EQ(cfg.publishTarget, "/tmp/keeper-run/driver");
  EXPECT_FALSE(cfg.publishRootfs);
  EXPECT_TRUE(cfg.tools.provisioner.empty());
  EXPECT_TRUE(cfg.auxModules.empty());
}

/** @test Invalid MAX_THREADS is rejected. */
TEST_F(ConfigEnvTest, InvalidThreads) {
  ::setenv("DRIVER_VERSION", "550.54.14", 1);
  ::setenv("MAX_THREADS", "many", 1);
  Config cfg;
  std::string error;
  EXPECT_EQ(loadConfig(cfg, error), Status::CONFIG_ERROR);
  EXPECT_NE(error.find("MAX_THREADS"), std::string::npos);
}
