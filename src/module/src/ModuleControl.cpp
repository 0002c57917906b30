/**
 * @file ModuleControl.cpp
 * @brief Implementation of module load/unload.
 */

#include "src/module/inc/ModuleControl.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/module/inc/Persistence.hpp"
#include "src/system/inc/Command.hpp"

#include <vector>

#include <fmt/core.h>

namespace keeper {

namespace module {

namespace log = helpers::log;
using helpers::status::Status;

namespace {

/// Best-effort load of helper modules the driver expects (e.g. ipmi_msghandler).
void loadAuxModules(const config::Config& cfg) {
  if (cfg.tools.modprobe.empty()) {
    return;
  }
  for (const std::string& AUX : cfg.auxModules) {
    log::info("Loading {} kernel module...", AUX);
    const system::CommandResult RES = system::runCommand({cfg.tools.modprobe, AUX});
    if (!RES.ok()) {
      log::warn("Could not load {} ({}), continuing", AUX, RES.toString());
    }
  }
}

} // namespace

/* ----------------------------- Result Methods ----------------------------- */

std::string UnloadResult::toString() const {
  std::string out =
      fmt::format("unload: {} removed={}", helpers::status::toString(status), unloadedCount);
  if (!blockingModule.empty()) {
    out += fmt::format(" blocking={}", blockingModule);
  }
  return out;
}

std::string LoadResult::toString() const {
  std::string out =
      fmt::format("load: {} inserted={}", helpers::status::toString(status), loadedCount);
  if (!failedModule.empty()) {
    out += fmt::format(" failed={}", failedModule);
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

UnloadResult unloadModules(const config::Config& cfg) noexcept {
  UnloadResult result{};

  if (stopPersistenceDaemon(cfg) != Status::OK) {
    result.status = Status::UNLOAD_FAILED;
    return result;
  }

  log::info("Unloading {} driver kernel modules...", cfg.driverName);
  result.observed = queryModuleSet(cfg);
  if (result.observed.noneLoaded()) {
    return result;
  }

  const ModuleRecord* busy = result.observed.firstInUse();
  if (busy != nullptr) {
    log::error("Could not unload {} driver kernel modules, driver is in use ({})", cfg.driverName,
               busy->toString());
    result.status = Status::IN_USE;
    result.blockingModule = busy->name.data();
    return result;
  }

  std::vector<std::string> argv{cfg.tools.rmmod};
  for (auto it = cfg.modules.rbegin(); it != cfg.modules.rend(); ++it) {
    const ModuleRecord* rec = result.observed.find(it->name.c_str());
    if (rec != nullptr && rec->state.loaded) {
      argv.push_back(it->name);
    }
  }

  log::debug("{}", system::formatCommand(argv));
  const system::CommandResult RES = system::runCommand(argv);
  if (!RES.ok()) {
    log::warn("{} reported failure ({})", cfg.tools.rmmod, RES.toString());
  }

  const ModuleSnapshot AFTER = queryModuleSet(cfg);
  for (const ModuleRecord& REC : AFTER.records) {
    const ModuleRecord* before = result.observed.find(REC.name.data());
    if (before != nullptr && before->state.loaded && !REC.state.loaded) {
      ++result.unloadedCount;
    }
    if (REC.state.loaded && result.blockingModule.empty()) {
      result.blockingModule = REC.name.data();
    }
  }

  if (!result.blockingModule.empty()) {
    log::error("Module {} is still loaded after {}", result.blockingModule, cfg.tools.rmmod);
    result.status = Status::UNLOAD_FAILED;
  }
  return result;
}

LoadResult loadModules(const config::Config& cfg, const std::string& moduleDir) noexcept {
  LoadResult result{};

  loadAuxModules(cfg);

  log::info("Loading {} driver kernel modules...", cfg.driverName);
  for (const config::ModuleSpec& MOD : cfg.modules) {
    if (queryModule(cfg, MOD.name.c_str()).loaded) {
      log::debug("{} already loaded", MOD.name);
      continue;
    }

    for (const std::string& DEP : MOD.deps) {
      if (!queryModule(cfg, DEP.c_str()).loaded) {
        log::error("Refusing to load {}: dependency {} is absent", MOD.name, DEP);
        result.status = Status::LOAD_ERROR;
        result.failedModule = MOD.name;
        result.observed = queryModuleSet(cfg);
        return result;
      }
    }

    const std::string PATH = fmt::format("{}/{}", moduleDir, MOD.fileName);
    const system::CommandResult RES = system::runCommand({cfg.tools.insmod, PATH});
    if (!RES.ok() || !queryModule(cfg, MOD.name.c_str()).loaded) {
      log::error("Kernel refused to load {} ({})", PATH, RES.toString());
      result.status = Status::LOAD_ERROR;
      result.failedModule = MOD.name;
      result.observed = queryModuleSet(cfg);
      return result;
    }
    ++result.loadedCount;
  }

  result.observed = queryModuleSet(cfg);
  if (!result.observed.allLoaded()) {
    result.status = Status::LOAD_ERROR;
    return result;
  }

  if (startPersistenceDaemon(cfg) != Status::OK) {
    result.status = Status::LOAD_ERROR;
  }
  return result;
}

} // namespace module

} // namespace keeper
