/**
 * @file BuildPipeline.cpp
 * @brief Implementation of the package build pipeline.
 */

#include "src/package/inc/BuildPipeline.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/system/inc/Command.hpp"

#include <filesystem> // std::filesystem
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace keeper {

namespace package {

namespace fs = std::filesystem;
namespace log = helpers::log;
using helpers::status::Status;

namespace {

/// Record a failed step and return the result.
BuildResult fail(BuildResult& result, BuildStep step, std::string detail) {
  log::error("Build step {} failed: {}", toString(step), detail);
  result.status = Status::BUILD_ERROR;
  result.failedStep = step;
  result.detail = std::move(detail);
  result.package = DriverPackage{};
  return result;
}

/// Run one collaborator in the work directory.
system::CommandResult runIn(const std::string& workDir, const std::vector<std::string>& argv,
                            bool quiet = false) {
  system::RunOptions opts{};
  opts.workDir = workDir;
  opts.discardOutput = quiet;
  log::debug("{}", system::formatCommand(argv));
  return system::runCommand(argv, opts);
}

} // namespace

/* ----------------------------- BuildStep ----------------------------- */

const char* toString(BuildStep step) noexcept {
  switch (step) {
  case BuildStep::NONE:
    return "none";
  case BuildStep::PROVISION:
    return "provision";
  case BuildStep::COMPILE:
    return "compile";
  case BuildStep::LINK:
    return "link";
  case BuildStep::SIGN:
    return "sign";
  case BuildStep::PACK:
    return "pack";
  case BuildStep::ARCHIVE:
    return "archive";
  case BuildStep::STORE:
    return "store";
  }
  return "unknown";
}

std::string BuildResult::toString() const {
  if (ok()) {
    return fmt::format("build: OK {}", package.packageName);
  }
  return fmt::format("build: {} at {} ({})", helpers::status::toString(status),
                     package::toString(failedStep), detail);
}

/* ----------------------------- Arguments ----------------------------- */

std::vector<std::string> compileTargets(const std::vector<config::ModuleSpec>& modules) {
  std::vector<std::string> targets;
  targets.reserve(modules.size());
  for (const config::ModuleSpec& MOD : modules) {
    targets.push_back(MOD.isLinked() ? MOD.kernelInterface : MOD.fileName);
  }
  return targets;
}

std::vector<std::string> packArguments(const config::Config& cfg,
                                       const std::string& kernelVersion,
                                       const std::string& packageName, bool signedBuild) {
  std::vector<std::string> argv{cfg.tools.packager, "--pack",         packageName,
                                "--description",    kernelVersion,    "--driver-version",
                                cfg.driverVersion};

  for (const config::ModuleSpec& MOD : cfg.modules) {
    if (MOD.isLinked()) {
      argv.insert(argv.end(), {"--kernel-interface", MOD.kernelInterface, "--linked-module-name",
                               MOD.fileName, "--core-object-name", MOD.coreObject});
      if (signedBuild) {
        argv.insert(argv.end(), {"--linked-module", MOD.fileName, "--signed-module",
                                 MOD.fileName + ".sign"});
      }
    } else {
      argv.insert(argv.end(), {"--kernel-module", MOD.fileName});
    }
    argv.insert(argv.end(), {"--target-directory", "."});
  }
  return argv;
}

/* ----------------------------- Pipeline ----------------------------- */

BuildResult build(const config::Config& cfg, const std::string& kernelVersion) noexcept {
  BuildResult result{};
  const std::string WORK_DIR = (fs::path(cfg.sourceDir) / "kernel").string();
  const bool SIGNED = !cfg.signingKey.empty();
  std::error_code ec;

  if (!helpers::files::isDirectory(WORK_DIR.c_str())) {
    return fail(result, BuildStep::COMPILE, fmt::format("missing source tree {}", WORK_DIR));
  }

  // 1. Provision
  if (!cfg.tools.provisioner.empty()) {
    log::info("Provisioning build environment for kernel {}...", kernelVersion);
    const system::CommandResult RES = runIn(WORK_DIR, {cfg.tools.provisioner, kernelVersion});
    if (!RES.ok()) {
      return fail(result, BuildStep::PROVISION,
                  fmt::format("{} {}: {}", cfg.tools.provisioner, kernelVersion, RES.toString()));
    }
  }

  // 2. Compile
  log::info("Compiling {} driver kernel modules for {}...", cfg.driverName, kernelVersion);
  std::vector<std::string> makeArgv{cfg.tools.make, "-s", "-j", std::to_string(cfg.maxThreads),
                                    "SYSSRC=" + cfg.kernelBuildDir(kernelVersion)};
  for (const std::string& T : compileTargets(cfg.modules)) {
    makeArgv.push_back(T);
  }
  {
    const system::CommandResult RES = runIn(WORK_DIR, makeArgv, true);
    if (!RES.ok()) {
      return fail(result, BuildStep::COMPILE,
                  fmt::format("{}: {}", system::formatCommand(makeArgv), RES.toString()));
    }
  }

  // 3. Link
  log::info("Relinking {} driver kernel modules...", cfg.driverName);
  for (const config::ModuleSpec& MOD : cfg.modules) {
    if (!MOD.isLinked()) {
      continue;
    }
    fs::remove(fs::path(WORK_DIR) / MOD.fileName, ec);
    const std::vector<std::string> ARGV{cfg.tools.linker, "-d", "-r", "-o", MOD.fileName,
                                        "./" + MOD.kernelInterface, "./" + MOD.coreObject};
    const system::CommandResult RES = runIn(WORK_DIR, ARGV);
    if (!RES.ok()) {
      return fail(result, BuildStep::LINK,
                  fmt::format("{}: {}", system::formatCommand(ARGV), RES.toString()));
    }
  }

  // 4. Sign
  std::vector<std::string> signatures;
  if (SIGNED) {
    log::info("Signing {} driver kernel modules...", cfg.driverName);
    for (const config::ModuleSpec& MOD : cfg.modules) {
      if (!MOD.isLinked()) {
        continue;
      }
      const std::string SIG = MOD.fileName + ".sign";
      const system::CommandResult RES =
          runIn(WORK_DIR, {cfg.tools.signer, cfg.signingKey, MOD.fileName, SIG});
      if (!RES.ok()) {
        return fail(result, BuildStep::SIGN,
                    fmt::format("{} {}: {}", cfg.tools.signer, MOD.fileName, RES.toString()));
      }
      signatures.push_back(SIG);
    }
  }

  // 5. Pack
  const std::string PKG_NAME = packageNameFor(cfg, kernelVersion);
  log::info("Building {} driver package {}...", cfg.driverName, PKG_NAME);
  fs::remove(fs::path(WORK_DIR) / PKG_NAME, ec);
  {
    const std::vector<std::string> ARGV = packArguments(cfg, kernelVersion, PKG_NAME, SIGNED);
    const system::CommandResult RES = runIn(WORK_DIR, ARGV);
    const std::string OUT = (fs::path(WORK_DIR) / PKG_NAME).string();
    if (!RES.ok() || !helpers::files::isRegularFile(OUT.c_str())) {
      return fail(result, BuildStep::PACK, fmt::format("{}: {}", cfg.tools.packager,
                                                       RES.ok() ? "no output" : RES.toString()));
    }
  }

  // 6. Archive the linker used for the package
  const std::string LINKER = system::findExecutable(cfg.tools.linker);
  if (LINKER.empty()) {
    return fail(result, BuildStep::ARCHIVE, fmt::format("cannot locate {}", cfg.tools.linker));
  }
  const fs::path ARCHIVED = fs::path(WORK_DIR) / ARCHIVED_LINKER_PATH;
  fs::create_directories(ARCHIVED.parent_path(), ec);
  fs::copy_file(LINKER, ARCHIVED, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return fail(result, BuildStep::ARCHIVE, fmt::format("{}: {}", LINKER, ec.message()));
  }

  DriverPackage pkg{};
  pkg.description = kernelVersion;
  pkg.driverVersion = cfg.driverVersion;
  pkg.packageName = PKG_NAME;
  pkg.signatures = std::move(signatures);
  pkg.linker = ARCHIVED_LINKER_PATH;
  for (const config::ModuleSpec& MOD : cfg.modules) {
    pkg.modules.push_back(MOD.name);
    if (MOD.isLinked()) {
      pkg.interfaces.push_back(MOD.kernelInterface);
    }
  }

  // 7. Store
  std::string error;
  if (store(cfg, kernelVersion, pkg, WORK_DIR, error) != Status::OK) {
    return fail(result, BuildStep::STORE, error);
  }

  pkg.directory = entryDirectory(cfg, kernelVersion);
  result.package = std::move(pkg);
  return result;
}

} // namespace package

} // namespace keeper
