#ifndef KEEPER_ORCHESTRATOR_ORCHESTRATOR_HPP
#define KEEPER_ORCHESTRATOR_ORCHESTRATOR_HPP
/**
 * @file Orchestrator.hpp
 * @brief The init / update / status commands.
 * @note Linux-only. Single-threaded; termination signals are blocked on entry
 *       (see Signals.hpp).
 *
 * init:
 *   lock -> unload stale modules -> unpublish stale mount -> ensure package
 *   -> install -> load -> publish -> write kernel hook -> wait for a signal
 *   -> ShutdownRoutine (unload -> unpublish -> unlock)
 *
 * A termination signal that arrives before the wait aborts bring-up at the
 * next step boundary. Before the modules are loaded the lock is simply
 * released. Once they are loaded, any bring-up failure runs the shutdown
 * routine first and the lock is released only when it completes.
 *
 * update:
 *   ensure a valid package for the target kernel; nothing is loaded,
 *   unloaded or mounted, and no lock is held.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/lock/inc/SingletonLock.hpp"
#include "src/package/inc/PackageCache.hpp"

#include <string>

namespace keeper {

namespace orchestrator {

class ShutdownRoutine;

/* ----------------------------- Results ----------------------------- */

/**
 * @brief Outcome of ensurePackage().
 */
struct EnsureResult {
  helpers::status::Status status{helpers::status::Status::OK};
  package::DriverPackage package{};
  bool rebuilt{false}; ///< The cache entry was (re)built by this call
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Return a valid cached package for a kernel, building it if required.
 * @return OK with the package, or BUILD_ERROR.
 */
[[nodiscard]] EnsureResult ensurePackage(const config::Config& cfg,
                                         const std::string& kernelVersion) noexcept;

/**
 * @brief Everything init does between taking the lock and the active wait.
 * @param driverLoaded Optional; set true once every module has been loaded.
 * @return OK, INTERRUPTED (signal pending at a step boundary), or the status
 *         of the failing step.
 */
[[nodiscard]] helpers::status::Status bringUp(const config::Config& cfg,
                                              bool* driverLoaded = nullptr) noexcept;

/**
 * @brief Consume termination signals and run the shutdown routine until it completes.
 * @return OK once shutdown completed; INTERRUPTED if waiting failed.
 */
[[nodiscard]] helpers::status::Status awaitShutdown(ShutdownRoutine& shutdown) noexcept;

/**
 * @brief init command. Returns only after a completed shutdown or a failure.
 */
[[nodiscard]] helpers::status::Status runInit(const config::Config& cfg) noexcept;

/**
 * @brief update command.
 */
[[nodiscard]] helpers::status::Status runUpdate(const config::Config& cfg) noexcept;

/**
 * @brief status command report (modules, cache, lock, publish state).
 */
[[nodiscard]] std::string statusReport(const config::Config& cfg);

/**
 * @brief Process exit code for a command status (0 or 1).
 */
[[nodiscard]] int exitCodeFor(helpers::status::Status status) noexcept;

} // namespace orchestrator

} // namespace keeper

#endif // KEEPER_ORCHESTRATOR_ORCHESTRATOR_HPP
