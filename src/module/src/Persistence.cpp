/**
 * @file Persistence.cpp
 * @brief Implementation of persistence daemon start/stop.
 */

#include "src/module/inc/Persistence.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/system/inc/Command.hpp"

#include <signal.h> // kill, SIGTERM
#include <unistd.h> // unlink

#include <array>
#include <cerrno>
#include <cstring> // strrchr
#include <thread>

#include <fmt/core.h>

namespace keeper {

namespace module {

namespace log = helpers::log;
using helpers::status::Status;

namespace {

/// True while @p pid names a process that has not exited (zombies count as exited).
bool processRunning(pid_t pid) noexcept {
  if (::kill(pid, 0) != 0 && errno == ESRCH) {
    return false;
  }
  std::array<char, 64> path{};
  std::array<char, 512> buf{};
  (void)fmt::format_to_n(path.data(), path.size() - 1, "/proc/{}/stat", pid);
  if (helpers::files::readFileToBuffer(path.data(), buf.data(), buf.size()) == 0) {
    return ::kill(pid, 0) == 0 || errno == EPERM;
  }
  // "pid (comm) S ...": the state follows the last ')'.
  const char* paren = std::strrchr(buf.data(), ')');
  return paren == nullptr || paren[1] == '\0' || paren[2] != 'Z';
}

} // namespace

Status startPersistenceDaemon(const config::Config& cfg) noexcept {
  if (cfg.tools.persistenced.empty()) {
    return Status::OK;
  }

  log::info("Starting {} persistence daemon...", cfg.driverName);
  const system::CommandResult RES =
      system::runCommand({cfg.tools.persistenced, "--persistence-mode"});
  if (!RES.ok()) {
    log::error("{} --persistence-mode failed ({})", cfg.tools.persistenced, RES.toString());
    return Status::LOAD_ERROR;
  }
  return Status::OK;
}

Status stopPersistenceDaemon(const config::Config& cfg, int polls,
                             std::chrono::milliseconds interval) noexcept {
  const char* pidFile = cfg.persistencedPidFile.c_str();
  if (cfg.persistencedPidFile.empty() || !helpers::files::pathExists(pidFile)) {
    return Status::OK;
  }

  const std::int32_t PID = helpers::files::readFileInt(pidFile, 0);
  if (PID <= 0) {
    log::warn("Ignoring unreadable persistence daemon pid file {}", cfg.persistencedPidFile);
    return Status::OK;
  }

  log::info("Stopping {} persistence daemon (pid {})...", cfg.driverName, PID);
  if (::kill(static_cast<pid_t>(PID), SIGTERM) != 0) {
    if (errno == ESRCH) {
      ::unlink(pidFile);
      return Status::OK;
    }
    log::error("Could not signal persistence daemon pid {}", PID);
    return Status::UNLOAD_FAILED;
  }

  for (int i = 0; i < polls && processRunning(static_cast<pid_t>(PID)); ++i) {
    std::this_thread::sleep_for(interval);
  }

  if (processRunning(static_cast<pid_t>(PID))) {
    log::error("Could not stop {} persistence daemon (pid {})", cfg.driverName, PID);
    return Status::UNLOAD_FAILED;
  }
  ::unlink(pidFile);
  return Status::OK;
}

} // namespace module

} // namespace keeper
