#ifndef KEEPER_ORCHESTRATOR_SHUTDOWN_HPP
#define KEEPER_ORCHESTRATOR_SHUTDOWN_HPP
/**
 * @file Shutdown.hpp
 * @brief Reverse-order teardown of an active driver lifecycle.
 *
 * One routine exists per init run. It is armed once bring-up has reached the
 * active wait (or has failed after loading the driver) and is run from the
 * signal wait loop. Steps:
 *  1. unload the driver modules (stops the persistence daemon first)
 *  2. unpublish the rootfs (a failure is logged, teardown continues)
 *  3. release the lock
 *
 * An unload failure stops the routine before step 2 and keeps the lock, so a
 * later run reports ALREADY_RUNNING instead of re-entering a driver that is
 * still in use. Once the routine has completed, further runs do nothing.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/lock/inc/SingletonLock.hpp"

namespace keeper {

namespace orchestrator {

class ShutdownRoutine {
public:
  /**
   * @param cfg Configuration of the run (must outlive the routine).
   * @param lock Lock held by the run (must outlive the routine).
   */
  ShutdownRoutine(const config::Config& cfg, lock::LockHandle& lock) noexcept;

  ShutdownRoutine(const ShutdownRoutine&) = delete;
  ShutdownRoutine& operator=(const ShutdownRoutine&) = delete;

  /// @brief Mark bring-up complete. Subsequent calls do nothing.
  void arm() noexcept { armed_ = true; }

  [[nodiscard]] bool armed() const noexcept { return armed_; }

  /// @brief True once every step has run.
  [[nodiscard]] bool completed() const noexcept { return completed_; }

  /// @brief Number of times run() executed the teardown steps.
  [[nodiscard]] int attempts() const noexcept { return attempts_; }

  /**
   * @brief Run the teardown.
   * @return OK when complete (or already complete), INTERRUPTED if not
   *         armed, or the unload status (IN_USE / UNLOAD_FAILED) with the lock
   *         still held.
   */
  [[nodiscard]] helpers::status::Status run() noexcept;

private:
  const config::Config& cfg_;
  lock::LockHandle& lock_;
  bool armed_{false};
  bool completed_{false};
  int attempts_{0};
};

} // namespace orchestrator

} // namespace keeper

#endif // KEEPER_ORCHESTRATOR_SHUTDOWN_HPP
