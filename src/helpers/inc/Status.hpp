#ifndef KEEPER_HELPERS_STATUS_HPP
#define KEEPER_HELPERS_STATUS_HPP
/**
 * @file Status.hpp
 * @brief Outcome codes shared by every lifecycle stage.
 *
 * Recoverable: ALREADY_RUNNING, IN_USE, UNLOAD_FAILED, MOUNT_ERROR.
 * Fatal to the current command: everything else except OK.
 */

#include <cstdint>

namespace keeper {
namespace helpers {
namespace status {

/* ----------------------------- Status ----------------------------- */

enum class Status : std::uint8_t {
  OK = 0,
  CONFIG_ERROR,    ///< Missing or invalid configuration
  LOCK_ERROR,      ///< Lock file could not be opened or written
  ALREADY_RUNNING, ///< Another instance holds the lock
  BUILD_ERROR,     ///< Provision, compile, link, sign, pack or store failed
  INSTALL_ERROR,   ///< License gate, unpack, relink or placement failed
  LOAD_ERROR,      ///< Kernel refused a module or persistence daemon failed
  IN_USE,          ///< Unload refused: live references or dependents
  UNLOAD_FAILED,   ///< Unload attempted but modules or daemon remain
  MOUNT_ERROR,     ///< Publish or unpublish failed
  INTERRUPTED,     ///< Termination signal arrived before the active wait
};

/// Static label for a status.
[[nodiscard]] constexpr const char* toString(Status status) noexcept {
  switch (status) {
  case Status::OK:
    return "OK";
  case Status::CONFIG_ERROR:
    return "CONFIG_ERROR";
  case Status::LOCK_ERROR:
    return "LOCK_ERROR";
  case Status::ALREADY_RUNNING:
    return "ALREADY_RUNNING";
  case Status::BUILD_ERROR:
    return "BUILD_ERROR";
  case Status::INSTALL_ERROR:
    return "INSTALL_ERROR";
  case Status::LOAD_ERROR:
    return "LOAD_ERROR";
  case Status::IN_USE:
    return "IN_USE";
  case Status::UNLOAD_FAILED:
    return "UNLOAD_FAILED";
  case Status::MOUNT_ERROR:
    return "MOUNT_ERROR";
  case Status::INTERRUPTED:
    return "INTERRUPTED";
  }
  return "UNKNOWN";
}

/// True for outcomes an operator may retry without intervention on the host.
[[nodiscard]] constexpr bool isRecoverable(Status status) noexcept {
  return status == Status::ALREADY_RUNNING || status == Status::IN_USE ||
         status == Status::UNLOAD_FAILED || status == Status::MOUNT_ERROR;
}

} // namespace status
} // namespace helpers
} // namespace keeper

#endif // KEEPER_HELPERS_STATUS_HPP
