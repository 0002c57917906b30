#ifndef KEEPER_SYSTEM_COMMAND_HPP
#define KEEPER_SYSTEM_COMMAND_HPP
/**
 * @file Command.hpp
 * @brief Run external collaborator programs (fork/execvp/waitpid).
 * @note Linux-only.
 *
 * Every collaborator (provisioner, make, ld, signer, packager, insmod, rmmod,
 * modprobe, depmod, persistence daemon) is invoked through runCommand().
 * Children start with an empty signal mask and default dispositions, so the
 * caller may keep termination signals blocked while it waits.
 *
 * Invocations are not cancellable once started.
 */

#include <string>
#include <vector>

namespace keeper {

namespace system {

/* ----------------------------- Constants ----------------------------- */

/// Exit code reported when the program could not be executed.
inline constexpr int EXIT_EXEC_FAILED = 127;

/// Offset added to the signal number when the child was killed by a signal.
inline constexpr int EXIT_SIGNAL_BASE = 128;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief How to run a command.
 */
struct RunOptions {
  std::string workDir{};      ///< Directory to chdir into (empty: inherit)
  bool captureOutput{false};  ///< Collect stdout into CommandResult::output
  bool discardOutput{false};  ///< Send stdout to /dev/null (ignored when capturing)
};

/**
 * @brief Outcome of one command invocation.
 */
struct CommandResult {
  /// False if fork/pipe failed or argv was empty.
  bool started{false};

  /// Exit status; EXIT_SIGNAL_BASE + N if killed by signal N.
  int exitCode{-1};

  /// Captured stdout (only with RunOptions::captureOutput).
  std::string output{};

  /// @brief True if the program ran and exited with status 0.
  [[nodiscard]] bool ok() const noexcept { return started && exitCode == 0; }

  /// @brief Human-readable single-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run a program and wait for it.
 * @param argv Program (resolved through PATH) followed by its arguments.
 * @param opts Working directory and output handling.
 * @return Exit information; never throws.
 */
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       const RunOptions& opts = {}) noexcept;

/**
 * @brief Render argv as a shell-like string for log messages.
 */
[[nodiscard]] std::string formatCommand(const std::vector<std::string>& argv);

/**
 * @brief Resolve a program name through PATH.
 * @param program Name or path; names containing '/' are returned as-is if executable.
 * @return Absolute path, empty if not found.
 */
[[nodiscard]] std::string findExecutable(const std::string& program);

} // namespace system

} // namespace keeper

#endif // KEEPER_SYSTEM_COMMAND_HPP
