#ifndef KEEPER_ORCHESTRATOR_SIGNALS_HPP
#define KEEPER_ORCHESTRATOR_SIGNALS_HPP
/**
 * @file Signals.hpp
 * @brief Synchronous handling of termination signals.
 * @note Linux-only. No asynchronous handlers are installed: the termination
 *       set is blocked at startup, polled between pipeline steps and
 *       consumed with sigwait() during the active wait.
 *
 * Block before creating any thread so every thread inherits the mask.
 */

#include <signal.h> // sigset_t, SIG*

#include <array>

namespace keeper {

namespace orchestrator {

/// Signals that request shutdown.
inline constexpr std::array<int, 5> TERMINATION_SIGNALS{SIGHUP, SIGINT, SIGQUIT, SIGPIPE,
                                                        SIGTERM};

/**
 * @brief Signal set containing TERMINATION_SIGNALS.
 */
[[nodiscard]] sigset_t terminationSignalSet() noexcept;

/**
 * @brief Block the termination set in the calling thread.
 * @param previous Receives the prior mask (optional).
 * @return false if the mask could not be changed.
 */
[[nodiscard]] bool blockTerminationSignals(sigset_t* previous = nullptr) noexcept;

/**
 * @brief Restore a mask saved by blockTerminationSignals().
 */
void restoreSignalMask(const sigset_t& previous) noexcept;

/**
 * @brief Consume one pending termination signal without waiting.
 * @return Signal number, or 0 if none is pending.
 */
[[nodiscard]] int takePendingTerminationSignal() noexcept;

/**
 * @brief Wait until a termination signal arrives and consume it.
 * @return Signal number, or -1 on failure.
 */
[[nodiscard]] int waitForTerminationSignal() noexcept;

/**
 * @brief Short name of a signal ("SIGTERM").
 */
[[nodiscard]] const char* signalName(int signo) noexcept;

} // namespace orchestrator

} // namespace keeper

#endif // KEEPER_ORCHESTRATOR_SIGNALS_HPP
