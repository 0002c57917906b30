#ifndef KEEPER_MODULE_MODULE_CONTROL_HPP
#define KEEPER_MODULE_MODULE_CONTROL_HPP
/**
 * @file ModuleControl.hpp
 * @brief Dependency-ordered load and in-use-safe unload of the driver modules.
 * @note Linux-only. Mutations go through Config::tools.insmod / rmmod; state
 *       is re-read from sysfs before and after every mutation.
 *
 * Load order is Config::modules order (dependencies first); unload order is
 * the reverse. Neither operation rolls back on failure: the partial state is
 * reported to the caller.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/module/inc/ModuleState.hpp"

#include <cstddef>
#include <string>

namespace keeper {

namespace module {

/* ----------------------------- Results ----------------------------- */

/**
 * @brief Outcome of unloadModules().
 */
struct UnloadResult {
  helpers::status::Status status{helpers::status::Status::OK};

  /// Modules removed by this call.
  std::size_t unloadedCount{0};

  /// IN_USE: first module in use. UNLOAD_FAILED: first module still loaded.
  std::string blockingModule{};

  /// State observed by the pre-check.
  ModuleSnapshot observed{};

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Outcome of loadModules().
 */
struct LoadResult {
  helpers::status::Status status{helpers::status::Status::OK};

  /// Modules inserted by this call (already loaded ones are not counted).
  std::size_t loadedCount{0};

  /// Module whose load failed (LOAD_ERROR only; empty if the daemon failed).
  std::string failedModule{};

  /// State after the call, including any partial load.
  ModuleSnapshot observed{};

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Stop the persistence daemon, then unload every loaded driver module.
 *
 * Refuses with IN_USE, without touching any module, if a loaded module's
 * refcount exceeds its number of loaded dependents. Otherwise removes all
 * loaded modules in one batch (dependents first) and verifies they are gone.
 *
 * @return OK (including nothing loaded), IN_USE, or UNLOAD_FAILED.
 */
[[nodiscard]] UnloadResult unloadModules(const config::Config& cfg) noexcept;

/**
 * @brief Load the declared module set from a directory, then start the
 *        persistence daemon.
 * @param cfg Module set and tools.
 * @param moduleDir Directory containing each ModuleSpec::fileName.
 *
 * Auxiliary modules are requested first (best effort). A module is only
 * inserted once all its dependencies are loaded. Stops at the first failure.
 *
 * @return OK or LOAD_ERROR.
 */
[[nodiscard]] LoadResult loadModules(const config::Config& cfg,
                                     const std::string& moduleDir) noexcept;

} // namespace module

} // namespace keeper

#endif // KEEPER_MODULE_MODULE_CONTROL_HPP
