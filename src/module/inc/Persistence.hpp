#ifndef KEEPER_MODULE_PERSISTENCE_HPP
#define KEEPER_MODULE_PERSISTENCE_HPP
/**
 * @file Persistence.hpp
 * @brief Start and stop the driver persistence daemon.
 * @note Linux-only. The daemon forks itself and records its pid in
 *       Config::persistencedPidFile; it normally removes that file on SIGTERM.
 *
 * Both operations are no-ops when Config::tools.persistenced is empty.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Status.hpp"

#include <chrono>

namespace keeper {

namespace module {

/* ----------------------------- Constants ----------------------------- */

/// Number of polls for the pid file to disappear after SIGTERM.
inline constexpr int PERSISTENCED_STOP_POLLS = 50;

/// Delay between polls.
inline constexpr std::chrono::milliseconds PERSISTENCED_POLL_INTERVAL{100};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Launch the persistence daemon in persistence mode.
 * @return OK, or LOAD_ERROR if the launcher exits non-zero.
 */
[[nodiscard]] helpers::status::Status startPersistenceDaemon(const config::Config& cfg) noexcept;

/**
 * @brief Signal the daemon and wait for the process to exit.
 * @param cfg Supplies the pid file.
 * @param polls Number of checks before giving up.
 * @param interval Delay between checks.
 * @return OK if no daemon is running or it stopped; UNLOAD_FAILED otherwise.
 *
 * Liveness is checked on the process, not the pid file: a daemon that exits
 * without removing its pid file counts as stopped, and the file is removed.
 */
[[nodiscard]] helpers::status::Status
stopPersistenceDaemon(const config::Config& cfg, int polls = PERSISTENCED_STOP_POLLS,
                      std::chrono::milliseconds interval = PERSISTENCED_POLL_INTERVAL) noexcept;

} // namespace module

} // namespace keeper

#endif // KEEPER_MODULE_PERSISTENCE_HPP
