/**
 * @file InstallPipeline.cpp
 * @brief Implementation of the package install pipeline.
 */

#include "src/package/inc/InstallPipeline.hpp"
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

InstallResult fail(InstallResult& result, InstallFailure failure, std::string detail) {
  log::error("Install failed ({}): {}", toString(failure), detail);
  result.status = Status::INSTALL_ERROR;
  result.failure = failure;
  result.detail = std::move(detail);
  result.modules.clear();
  return result;
}

bool isFile(const fs::path& p) {
  return helpers::files::isRegularFile(p.c_str());
}

/// Regenerate every linked module in staging with the archived linker.
bool relink(const config::Config& cfg, const DriverPackage& pkg, const fs::path& staging,
            std::string& detail) {
  const std::string LINKER = pkg.linkerPath();
  if (LINKER.empty() || !isFile(LINKER)) {
    detail = fmt::format("package {} carries no archived linker", pkg.packageName);
    return false;
  }

  std::error_code ec;
  for (const config::ModuleSpec& MOD : cfg.modules) {
    if (!MOD.isLinked()) {
      continue;
    }

    // Interface objects are also kept beside the package in the cache entry.
    const fs::path IFACE = staging / MOD.kernelInterface;
    if (!isFile(IFACE)) {
      fs::copy_file(fs::path(pkg.directory) / MOD.kernelInterface, IFACE,
                    fs::copy_options::overwrite_existing, ec);
    }

    fs::remove(staging / MOD.fileName, ec);
    const std::vector<std::string> ARGV{LINKER, "-d", "-r", "-o", MOD.fileName,
                                        "./" + MOD.kernelInterface, "./" + MOD.coreObject};
    system::RunOptions opts{};
    opts.workDir = staging.string();
    log::debug("{}", system::formatCommand(ARGV));
    const system::CommandResult RES = system::runCommand(ARGV, opts);
    if (!RES.ok() || !isFile(staging / MOD.fileName)) {
      detail = fmt::format("{}: {}", system::formatCommand(ARGV), RES.toString());
      return false;
    }
  }
  return true;
}

} // namespace

/* ----------------------------- InstallFailure ----------------------------- */

const char* toString(InstallFailure failure) noexcept {
  switch (failure) {
  case InstallFailure::NONE:
    return "none";
  case InstallFailure::LICENSE_NOT_ACCEPTED:
    return "license not accepted";
  case InstallFailure::UNPACK_FAILED:
    return "unpack failed";
  case InstallFailure::RELINK_FAILED:
    return "relink failed";
  case InstallFailure::PLACE_FAILED:
    return "place failed";
  }
  return "unknown";
}

std::string InstallResult::toString() const {
  if (ok()) {
    return fmt::format("install: OK {} modules in {}{}", modules.size(), targetDir,
                       relinked ? " (relinked)" : "");
  }
  return fmt::format("install: {} ({}) {}", helpers::status::toString(status),
                     package::toString(failure), detail);
}

/* ----------------------------- API ----------------------------- */

InstallResult install(const config::Config& cfg, const DriverPackage& pkg,
                      bool licenseAccepted) noexcept {
  InstallResult result{};
  result.targetDir = cfg.targetDir();

  if (!licenseAccepted) {
    return fail(result, InstallFailure::LICENSE_NOT_ACCEPTED,
                "the driver license must be accepted (--accept-license)");
  }

  std::error_code ec;
  const fs::path TARGET(result.targetDir);
  fs::remove_all(TARGET, ec);
  if (ec) {
    return fail(result, InstallFailure::PLACE_FAILED,
                fmt::format("cannot clear {}: {}", TARGET.string(), ec.message()));
  }

  // Unpack
  const fs::path STAGING = fs::path(cfg.stagingDir) / pkg.description;
  fs::remove_all(STAGING, ec);
  fs::create_directories(STAGING, ec);
  if (ec) {
    return fail(result, InstallFailure::UNPACK_FAILED,
                fmt::format("cannot create {}: {}", STAGING.string(), ec.message()));
  }

  log::info("Installing {} driver package {}...", cfg.driverName, pkg.packageName);
  {
    const std::vector<std::string> ARGV{cfg.tools.packager, "--unpack", pkg.packagePath(),
                                        "--output", STAGING.string()};
    log::debug("{}", system::formatCommand(ARGV));
    const system::CommandResult RES = system::runCommand(ARGV);
    if (!RES.ok()) {
      return fail(result, InstallFailure::UNPACK_FAILED,
                  fmt::format("{}: {}", system::formatCommand(ARGV), RES.toString()));
    }
  }

  // Relink
  bool needRelink = cfg.runningKernel != pkg.description;
  for (const config::ModuleSpec& MOD : cfg.modules) {
    if (MOD.isLinked() && !isFile(STAGING / MOD.fileName)) {
      needRelink = true;
    }
  }
  if (needRelink) {
    log::info("Relinking {} driver kernel modules for kernel {}...", cfg.driverName,
              cfg.runningKernel);
    std::string detail;
    if (!relink(cfg, pkg, STAGING, detail)) {
      return fail(result, InstallFailure::RELINK_FAILED, detail);
    }
    result.relinked = true;
  }

  for (const config::ModuleSpec& MOD : cfg.modules) {
    if (!isFile(STAGING / MOD.fileName)) {
      return fail(result, InstallFailure::UNPACK_FAILED,
                  fmt::format("{} missing from package {}", MOD.fileName, pkg.packageName));
    }
  }

  // Place
  fs::create_directories(TARGET, ec);
  if (ec) {
    return fail(result, InstallFailure::PLACE_FAILED,
                fmt::format("cannot create {}: {}", TARGET.string(), ec.message()));
  }

  std::string order;
  for (const config::ModuleSpec& MOD : cfg.modules) {
    const fs::path DST = TARGET / MOD.fileName;
    fs::copy_file(STAGING / MOD.fileName, DST, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      const std::string DETAIL = fmt::format("cannot place {}: {}", DST.string(), ec.message());
      std::error_code cleanup;
      fs::remove_all(TARGET, cleanup);
      return fail(result, InstallFailure::PLACE_FAILED, DETAIL);
    }
    result.modules.push_back({MOD.name, DST.string()});
    order += MOD.fileName;
    order += '\n';
  }

  const std::string ORDER_PATH = (TARGET / MODULES_ORDER_FILE).string();
  if (!helpers::files::writeFile(ORDER_PATH.c_str(), order)) {
    std::error_code cleanup;
    fs::remove_all(TARGET, cleanup);
    return fail(result, InstallFailure::PLACE_FAILED, fmt::format("cannot write {}", ORDER_PATH));
  }

  // Refresh the module index (best effort)
  if (!cfg.tools.depmod.empty()) {
    const system::CommandResult RES = system::runCommand({cfg.tools.depmod, "-a",
                                                          cfg.runningKernel});
    if (!RES.ok()) {
      log::warn("{} -a {} failed ({})", cfg.tools.depmod, cfg.runningKernel, RES.toString());
    }
  }

  fs::remove_all(STAGING, ec);
  return result;
}

} // namespace package

} // namespace keeper
