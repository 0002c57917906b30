/**
 * @file Shutdown.cpp
 * @brief Implementation of the lifecycle teardown routine.
 */

#include "src/orchestrator/inc/Shutdown.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/module/inc/ModuleControl.hpp"
#include "src/mount/inc/Publisher.hpp"

namespace keeper {

namespace orchestrator {

namespace log = helpers::log;
using helpers::status::Status;

ShutdownRoutine::ShutdownRoutine(const config::Config& cfg, lock::LockHandle& lock) noexcept
    : cfg_(cfg), lock_(lock) {}

Status ShutdownRoutine::run() noexcept {
  if (completed_) {
    return Status::OK;
  }
  if (!armed_) {
    return Status::INTERRUPTED;
  }
  ++attempts_;

  const module::UnloadResult UNLOAD = module::unloadModules(cfg_);
  if (UNLOAD.status != Status::OK) {
    log::error("Shutdown stopped: {}", UNLOAD.toString());
    return UNLOAD.status;
  }

  if (cfg_.publishRootfs && mount::unpublish(cfg_) != Status::OK) {
    log::warn("Continuing shutdown with {} still mounted", cfg_.publishTarget);
  }

  lock_.release();
  completed_ = true;
  log::info("Shutdown complete");
  return Status::OK;
}

} // namespace orchestrator

} // namespace keeper
