/**
 * @file PackageCache_uTest.cpp
 * @brief Unit tests for keeper::package::PackageCache.
 *
 * Notes:
 *  - The packager is a script; "fail-match" makes --match report a mismatch.
 */

#include "src/config/utst/FakeHost.hpp"
#include "src/package/inc/PackageCache.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h> // stat, chmod
#include <unistd.h>   // getpid

#include <optional>
#include <string>

using keeper::helpers::status::Status;
using keeper::package::DriverPackage;
using keeper::package::entryDirectory;
using keeper::package::formatManifest;
using keeper::package::lookup;
using keeper::package::packageNameFor;
using keeper::package::parseManifest;
using keeper::package::pruneStaging;
using keeper::package::requiresRebuild;
using keeper::package::store;
using keeper::test::FakeHost;

namespace {

/// Build artifacts for a package in <tree>/work; returns the package.
DriverPackage writeWorkDir(FakeHost& host, const std::string& kernel) {
  DriverPackage pkg{};
  pkg.description = kernel;
  pkg.driverVersion = host.cfg.driverVersion;
  pkg.packageName = packageNameFor(host.cfg, kernel);
  pkg.interfaces = {"nv-linux.o", "nv-modeset-linux.o"};
  pkg.modules = {"nvidia", "nvidia_uvm", "nvidia_modeset", "nvidia_drm"};
  pkg.linker = "toolchain/ld";

  host.tree.write("work/" + pkg.packageName, "packed " + kernel + "\n");
  host.tree.write("work/nv-linux.o", "iface\n");
  host.tree.write("work/nv-modeset-linux.o", "iface\n");
  host.tree.write("work/toolchain/ld", "#!/bin/sh\n", 0644);
  return pkg;
}

} // namespace

class PackageCacheTest : public ::testing::Test {
protected:
  FakeHost host_;
  std::string work_;

  void SetUp() override {
    ASSERT_TRUE(host_.tree.valid());
    work_ = host_.tree.path("work");
  }

  void storeFor(const std::string& kernel) {
    const DriverPackage PKG = writeWorkDir(host_, kernel);
    std::string error;
    ASSERT_EQ(store(host_.cfg, kernel, PKG, work_, error), Status::OK) << error;
  }
};

/* ----------------------------- Naming ----------------------------- */

/** @test Package name strips the kernel flavour and appends the tag. */
TEST_F(PackageCacheTest, PackageName) {
  EXPECT_EQ(packageNameFor(host_.cfg, "5.10.0-21-amd64"), "nvidia-modules-5.10.0");
  EXPECT_EQ(packageNameFor(host_.cfg, "5.10.0"), "nvidia-modules-5.10.0");
  host_.cfg.packageTag = "builder";
  EXPECT_EQ(packageNameFor(host_.cfg, "6.1.0-13-amd64"), "nvidia-modules-6.1.0-builder");
  EXPECT_EQ(entryDirectory(host_.cfg, "5.10.0"), host_.cfg.cacheDir + "/5.10.0");
}

/* ----------------------------- Manifest ----------------------------- */

/** @test Manifest text keeps every field; directory is not persisted. */
TEST_F(PackageCacheTest, ManifestFields) {
  DriverPackage pkg = writeWorkDir(host_, "5.10.0");
  pkg.signatures = {"nvidia.ko.sign"};
  pkg.directory = "/somewhere";

  DriverPackage parsed{};
  ASSERT_TRUE(parseManifest(formatManifest(pkg), parsed));
  EXPECT_TRUE(parsed.sameContent(pkg));
  EXPECT_TRUE(parsed.directory.empty());
}

/** @test Comments, blanks and unknown keys are skipped; required keys enforced. */
TEST_F(PackageCacheTest, ManifestParsing) {
  DriverPackage pkg{};
  ASSERT_TRUE(parseManifest("# entry\n\ndescription=5.10.0\nfuture=x\npackage=p\n", pkg));
  EXPECT_EQ(pkg.description, "5.10.0");
  EXPECT_EQ(pkg.packageName, "p");
  EXPECT_TRUE(pkg.modules.empty());

  EXPECT_FALSE(parseManifest("package=p\n", pkg));
  EXPECT_FALSE(parseManifest("description=5.10.0\n", pkg));
  EXPECT_FALSE(parseManifest("", pkg));
}

/* ----------------------------- store / lookup ----------------------------- */

/** @test Stored entry reads back with the same content. */
TEST_F(PackageCacheTest, StoreThenLookup) {
  const DriverPackage PKG = writeWorkDir(host_, "5.10.0");
  std::string error;
  ASSERT_EQ(store(host_.cfg, "5.10.0", PKG, work_, error), Status::OK) << error;

  const std::optional<DriverPackage> FOUND = lookup(host_.cfg, "5.10.0");
  ASSERT_TRUE(FOUND.has_value());
  EXPECT_TRUE(FOUND->sameContent(PKG));
  EXPECT_EQ(FOUND->directory, entryDirectory(host_.cfg, "5.10.0"));
  EXPECT_TRUE(host_.tree.exists("usr/src/nvidia-550.54.14/precompiled/5.10.0/nv-linux.o"));

  struct stat st{};
  ASSERT_EQ(::stat(FOUND->linkerPath().c_str(), &st), 0);
  EXPECT_NE(st.st_mode & S_IXUSR, 0U);
}

/** @test Absent and malformed entries are not found. */
TEST_F(PackageCacheTest, LookupMissingOrMalformed) {
  EXPECT_FALSE(lookup(host_.cfg, "5.10.0").has_value());
  host_.tree.write("usr/src/nvidia-550.54.14/precompiled/5.10.0/manifest", "junk\n");
  EXPECT_FALSE(lookup(host_.cfg, "5.10.0").has_value());
}

/** @test Storing again replaces the entry and leaves no temporaries. */
TEST_F(PackageCacheTest, StoreSupersedes) {
  storeFor("5.10.0");
  host_.tree.write("usr/src/nvidia-550.54.14/precompiled/5.10.0/leftover", "old\n");

  DriverPackage pkg = writeWorkDir(host_, "5.10.0");
  pkg.interfaces = {"nv-linux.o"};
  std::string error;
  ASSERT_EQ(store(host_.cfg, "5.10.0", pkg, work_, error), Status::OK) << error;

  const std::optional<DriverPackage> FOUND = lookup(host_.cfg, "5.10.0");
  ASSERT_TRUE(FOUND.has_value());
  EXPECT_EQ(FOUND->interfaces.size(), 1U);
  EXPECT_FALSE(host_.tree.exists("usr/src/nvidia-550.54.14/precompiled/5.10.0/leftover"));
  EXPECT_EQ(pruneStaging(host_.cfg), 0U);
}

/** @test Missing artifact fails and keeps the previous entry intact. */
TEST_F(PackageCacheTest, StoreFailureKeepsOldEntry) {
  storeFor("5.10.0");

  DriverPackage broken = writeWorkDir(host_, "5.10.0");
  broken.interfaces.push_back("missing.o");
  std::string error;
  EXPECT_EQ(store(host_.cfg, "5.10.0", broken, work_, error), Status::BUILD_ERROR);
  EXPECT_FALSE(error.empty());

  const std::optional<DriverPackage> FOUND = lookup(host_.cfg, "5.10.0");
  ASSERT_TRUE(FOUND.has_value());
  EXPECT_EQ(FOUND->interfaces.size(), 2U);
  EXPECT_EQ(pruneStaging(host_.cfg), 0U);
}

/** @test Entries for different kernels are independent. */
TEST_F(PackageCacheTest, IndependentKernels) {
  storeFor("5.10.0");
  storeFor("6.1.0-13-amd64");
  ASSERT_TRUE(lookup(host_.cfg, "5.10.0").has_value());
  ASSERT_TRUE(lookup(host_.cfg, "6.1.0-13-amd64").has_value());
  EXPECT_EQ(lookup(host_.cfg, "6.1.0-13-amd64")->packageName, "nvidia-modules-6.1.0");
}

/* ----------------------------- requiresRebuild ----------------------------- */

/** @test No entry needs a build. */
TEST_F(PackageCacheTest, RebuildWhenAbsent) {
  EXPECT_TRUE(requiresRebuild(host_.cfg, "5.10.0", host_.cfg.modules));
}

/** @test Complete matching entry is reused; one match per fragment. */
TEST_F(PackageCacheTest, ReuseMatchingEntry) {
  storeFor("5.10.0");
  host_.clearCalls();
  EXPECT_FALSE(requiresRebuild(host_.cfg, "5.10.0", host_.cfg.modules));
  EXPECT_EQ(host_.countCalls("mkprecompiled --match"), 2U);
}

/** @test Interface mismatch forces a rebuild. */
TEST_F(PackageCacheTest, RebuildOnMismatch) {
  storeFor("5.10.0");
  host_.fail("match");
  EXPECT_TRUE(requiresRebuild(host_.cfg, "5.10.0", host_.cfg.modules));
}

/** @test Missing module or missing package file forces a rebuild. */
TEST_F(PackageCacheTest, RebuildOnIncompleteEntry) {
  storeFor("5.10.0");
  std::vector<keeper::config::ModuleSpec> wider = host_.cfg.modules;
  wider.push_back({"nvidia_peermem", "nvidia-peermem.ko", "", "", {"nvidia"}});
  EXPECT_TRUE(requiresRebuild(host_.cfg, "5.10.0", wider));

  host_.tree.remove("usr/src/nvidia-550.54.14/precompiled/5.10.0/nvidia-modules-5.10.0");
  EXPECT_TRUE(requiresRebuild(host_.cfg, "5.10.0", host_.cfg.modules));
}

/* ----------------------------- pruneStaging ----------------------------- */

/** @test Dead-owner temporaries go; live-owner ones and entries stay. */
TEST_F(PackageCacheTest, PruneStaging) {
  storeFor("5.10.0");
  host_.tree.mkdir("usr/src/nvidia-550.54.14/precompiled/.staging-5.10.0-999999999");
  host_.tree.mkdir("usr/src/nvidia-550.54.14/precompiled/.retired-5.10.0-999999998");
  host_.tree.mkdir("usr/src/nvidia-550.54.14/precompiled/.staging-5.10.0-" +
                   std::to_string(::getpid()));
  host_.tree.mkdir("usr/src/nvidia-550.54.14/precompiled/.staging-5.10.0-1");

  // pid 1 is alive; our own pid is never considered a live owner.
  EXPECT_EQ(pruneStaging(host_.cfg), 3U);
  EXPECT_TRUE(host_.tree.exists("usr/src/nvidia-550.54.14/precompiled/.staging-5.10.0-1"));
  EXPECT_TRUE(lookup(host_.cfg, "5.10.0").has_value());
}

/** @test Missing cache root is fine. */
TEST_F(PackageCacheTest, PruneWithoutCache) { EXPECT_EQ(pruneStaging(host_.cfg), 0U); }

/** @test Unreadable cache root: scan error is reported, nothing removed, no throw. */
TEST_F(PackageCacheTest, PruneUnreadableCache) {
  if (FakeHost::isRoot()) {
    GTEST_SKIP() << "root bypasses directory permissions";
  }
  host_.tree.mkdir("usr/src/nvidia-550.54.14/precompiled/.staging-5.10.0-999999999");
  const std::string ROOT = host_.cfg.cacheDir;
  ASSERT_EQ(::chmod(ROOT.c_str(), 0300), 0);

  EXPECT_EQ(pruneStaging(host_.cfg), 0U);

  ASSERT_EQ(::chmod(ROOT.c_str(), 0755), 0);
  EXPECT_TRUE(host_.tree.exists("usr/src/nvidia-550.54.14/precompiled/.staging-5.10.0-999999999"));
}
