/**
 * @file Orchestrator.cpp
 * @brief Implementation of the init / update / status commands.
 */

#include "src/orchestrator/inc/Orchestrator.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/module/inc/ModuleControl.hpp"
#include "src/module/inc/ModuleState.hpp"
#include "src/mount/inc/Publisher.hpp"
#include "src/orchestrator/inc/KernelHook.hpp"
#include "src/orchestrator/inc/Shutdown.hpp"
#include "src/orchestrator/inc/Signals.hpp"
#include "src/package/inc/BuildPipeline.hpp"
#include "src/package/inc/InstallPipeline.hpp"

#include <optional>
#include <utility>

#include <fmt/core.h>

namespace keeper {

namespace orchestrator {

namespace log = helpers::log;
using helpers::status::Status;

namespace {

/// True (and logged) if a termination signal is pending at a step boundary.
bool interrupted(const char* nextStep) {
  const int SIG = takePendingTerminationSignal();
  if (SIG == 0) {
    return false;
  }
  log::warn("Caught {} before {}, aborting", signalName(SIG), nextStep);
  return true;
}

} // namespace

/* ----------------------------- Package ----------------------------- */

EnsureResult ensurePackage(const config::Config& cfg, const std::string& kernelVersion) noexcept {
  EnsureResult result{};

  if (!package::requiresRebuild(cfg, kernelVersion, cfg.modules)) {
    std::optional<package::DriverPackage> cached = package::lookup(cfg, kernelVersion);
    if (cached) {
      result.package = std::move(*cached);
      return result;
    }
  }

  const package::BuildResult BUILT = package::build(cfg, kernelVersion);
  if (!BUILT.ok()) {
    result.status = BUILT.status;
    return result;
  }
  result.package = BUILT.package;
  result.rebuilt = true;
  return result;
}

/* ----------------------------- init ----------------------------- */

Status bringUp(const config::Config& cfg, bool* driverLoaded) noexcept {
  if (driverLoaded != nullptr) {
    *driverLoaded = false;
  }
  const module::UnloadResult STALE = module::unloadModules(cfg);
  if (STALE.status != Status::OK) {
    log::error("Cannot start on top of loaded modules: {}", STALE.toString());
    return STALE.status;
  }
  if (interrupted("unmount")) {
    return Status::INTERRUPTED;
  }

  if (cfg.publishRootfs && mount::unpublish(cfg) != Status::OK) {
    return Status::MOUNT_ERROR;
  }
  if (interrupted("package check")) {
    return Status::INTERRUPTED;
  }

  const EnsureResult PKG = ensurePackage(cfg, cfg.kernelVersion);
  if (PKG.status != Status::OK) {
    return PKG.status;
  }
  if (interrupted("install")) {
    return Status::INTERRUPTED;
  }

  const package::InstallResult INSTALLED = package::install(cfg, PKG.package, cfg.acceptLicense);
  if (!INSTALLED.ok()) {
    return INSTALLED.status;
  }
  log::debug("{}", INSTALLED.toString());
  if (interrupted("load")) {
    return Status::INTERRUPTED;
  }

  const module::LoadResult LOADED = module::loadModules(cfg, INSTALLED.targetDir);
  if (LOADED.status != Status::OK) {
    log::error("{}", LOADED.toString());
    return LOADED.status;
  }
  if (driverLoaded != nullptr) {
    *driverLoaded = true;
  }
  if (interrupted("publish")) {
    return Status::INTERRUPTED;
  }

  if (cfg.publishRootfs && mount::publish(cfg) != Status::OK) {
    return Status::MOUNT_ERROR;
  }

  (void)writeKernelUpdateHook(cfg);
  return Status::OK;
}

Status awaitShutdown(ShutdownRoutine& shutdown) noexcept {
  for (;;) {
    const int SIG = waitForTerminationSignal();
    if (SIG < 0) {
      log::error("Waiting for termination signals failed");
      return Status::INTERRUPTED;
    }

    log::info("Caught {}, shutting down", signalName(SIG));
    const Status RC = shutdown.run();
    if (RC == Status::OK) {
      return RC;
    }
    log::error("Shutdown refused ({}); keeping the lock and waiting for the next signal",
               helpers::status::toString(RC));
  }
}

Status runInit(const config::Config& cfg) noexcept {
  if (!blockTerminationSignals()) {
    log::error("Could not block termination signals");
    return Status::INTERRUPTED;
  }

  lock::LockResult acquired = lock::acquireLock(cfg.lockFile);
  if (acquired.status == Status::ALREADY_RUNNING) {
    log::error("An instance of driver-keeper is already running ({}), aborting", cfg.lockFile);
    return acquired.status;
  }
  if (acquired.status != Status::OK) {
    log::error("Could not take lock {}: errno {}", cfg.lockFile, acquired.sysErrno);
    return acquired.status;
  }
  lock::LockHandle held = std::move(acquired.handle);

  log::info("Starting {} driver {} for kernel {}", cfg.driverName, cfg.driverVersion,
            cfg.runningKernel);
  (void)package::pruneStaging(cfg);

  bool driverLoaded = false;
  const Status UP = bringUp(cfg, &driverLoaded);
  ShutdownRoutine shutdown(cfg, held);
  shutdown.arm();
  if (UP == Status::OK) {
    log::info("Done, now waiting for signal");
    return awaitShutdown(shutdown);
  }
  if (!driverLoaded) {
    return UP;
  }

  // The driver is up: the lock goes only with a completed teardown.
  log::warn("Bring-up failed after loading the driver ({}), tearing down",
            helpers::status::toString(UP));
  Status down = shutdown.run();
  if (down != Status::OK) {
    log::error("Teardown refused ({}); keeping the lock and waiting for a signal",
               helpers::status::toString(down));
    down = awaitShutdown(shutdown);
  }
  return down == Status::OK ? UP : down;
}

/* ----------------------------- update ----------------------------- */

Status runUpdate(const config::Config& cfg) noexcept {
  if (!blockTerminationSignals()) {
    log::error("Could not block termination signals");
    return Status::INTERRUPTED;
  }

  const lock::LockOwner OWNER = lock::readLockOwner(cfg.lockFile);
  if (OWNER.held) {
    log::info("driver-keeper init is active (pid {})", OWNER.pid);
  }

  (void)package::pruneStaging(cfg);
  if (interrupted("package check")) {
    return Status::INTERRUPTED;
  }

  const EnsureResult PKG = ensurePackage(cfg, cfg.kernelVersion);
  if (PKG.status != Status::OK) {
    return PKG.status;
  }
  log::info("Package {} for kernel {} is ready{}", PKG.package.packageName, cfg.kernelVersion,
            PKG.rebuilt ? " (rebuilt)" : "");
  return Status::OK;
}

/* ----------------------------- status ----------------------------- */

std::string statusReport(const config::Config& cfg) {
  std::string out;
  out.reserve(1024);
  out += cfg.toString();
  out += "\n";

  out += module::queryModuleSet(cfg).toString();
  for (const module::LoadedModule& MOD : module::readLoadedModules(cfg.procModules.c_str())) {
    if (cfg.findModule(MOD.name.data()) == nullptr) {
      continue;
    }
    out += fmt::format("  {} {} bytes, used by {}", MOD.name.data(), MOD.sizeBytes, MOD.useCount);
    for (std::size_t i = 0; i < MOD.holderCount; ++i) {
      out += i == 0 ? " [" : ",";
      out += MOD.holders[i].data();
    }
    out += MOD.holderCount > 0 ? "] " : " ";
    out += MOD.state.data();
    out += "\n";
  }
  out += "\n";

  const std::optional<package::DriverPackage> PKG = package::lookup(cfg, cfg.kernelVersion);
  if (PKG) {
    out += PKG->toString();
  } else {
    out += fmt::format("Package:     none cached for {}\n", cfg.kernelVersion);
  }

  const lock::LockOwner OWNER = lock::readLockOwner(cfg.lockFile);
  if (OWNER.held) {
    out += fmt::format("Lock:        held by pid {}\n", OWNER.pid);
  } else if (OWNER.fileExists) {
    out += fmt::format("Lock:        stale file (pid {})\n", OWNER.pid);
  } else {
    out += "Lock:        free\n";
  }

  out += fmt::format("Rootfs:      {}\n",
                     mount::isPublished(cfg) ? fmt::format("mounted at {}", cfg.publishTarget)
                                             : std::string("not mounted"));
  return out;
}

int exitCodeFor(Status status) noexcept { return status == Status::OK ? 0 : 1; }

} // namespace orchestrator

} // namespace keeper
