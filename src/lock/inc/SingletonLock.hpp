#ifndef KEEPER_LOCK_SINGLETON_LOCK_HPP
#define KEEPER_LOCK_SINGLETON_LOCK_HPP
/**
 * @file SingletonLock.hpp
 * @brief Host-wide single-instance lock on a well-known pid file (Linux).
 * @note Linux-only. Uses flock(2), which conflicts across open file
 *       descriptions, including two opens inside the same process.
 *
 * The file is opened without truncation so a losing contender never clobbers
 * the holder's pid. Only the winner truncates and writes its own pid.
 */

#include "src/helpers/inc/Status.hpp"

#include <sys/types.h> // pid_t

#include <string>

namespace keeper {

namespace lock {

/* ----------------------------- LockHandle ----------------------------- */

/**
 * @brief Exclusive ownership of the lock file.
 *
 * Move-only. The destructor releases, so every exit path that unwinds the
 * owning scope removes the file. A process that keeps running (e.g. after a
 * refused shutdown) keeps the lock.
 */
class LockHandle {
public:
  LockHandle() noexcept = default;
  LockHandle(int fd, pid_t owner, std::string path) noexcept;
  ~LockHandle();

  LockHandle(const LockHandle&) = delete;
  LockHandle& operator=(const LockHandle&) = delete;
  LockHandle(LockHandle&& other) noexcept;
  LockHandle& operator=(LockHandle&& other) noexcept;

  /// @brief True while the lock is held.
  [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }

  /// @brief Pid recorded in the file.
  [[nodiscard]] pid_t owner() const noexcept { return owner_; }

  /// @brief Lock file path.
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  /**
   * @brief Remove the lock file and drop the lock.
   *
   * Idempotent: a second call does nothing.
   */
  void release() noexcept;

private:
  int fd_{-1};
  pid_t owner_{0};
  std::string path_{};
};

/* ----------------------------- Results ----------------------------- */

/**
 * @brief Outcome of acquireLock().
 */
struct LockResult {
  helpers::status::Status status{helpers::status::Status::LOCK_ERROR};
  LockHandle handle{};
  int sysErrno{0}; ///< errno of the failing call (LOCK_ERROR only)
};

/**
 * @brief Recorded owner of a lock file.
 */
struct LockOwner {
  bool fileExists{false}; ///< Lock file is present
  bool held{false};       ///< Another descriptor currently holds the lock
  pid_t pid{0};           ///< Pid recorded in the file (0 if unreadable)
};

/* ----------------------------- Constants ----------------------------- */

/// Reopen attempts when the locked file was unlinked by the previous holder.
inline constexpr int LOCK_REOPEN_ATTEMPTS = 8;

/* ----------------------------- API ----------------------------- */

/**
 * @brief True if @p fd refers to the file currently named by @p path.
 *
 * A descriptor opened before the holder released (and unlinked) the file can
 * still be flocked afterwards; such a lock guards nothing.
 */
[[nodiscard]] bool isCurrentLockFile(int fd, const std::string& path) noexcept;

/**
 * @brief Try to take the lock without blocking.
 * @param path Lock file path; parent directory is created if needed.
 * @return OK with a held handle, ALREADY_RUNNING if another holder exists
 *         (no side effects), or LOCK_ERROR.
 */
[[nodiscard]] LockResult acquireLock(const std::string& path) noexcept;

/**
 * @brief Inspect a lock file without taking it.
 * @param path Lock file path.
 */
[[nodiscard]] LockOwner readLockOwner(const std::string& path) noexcept;

} // namespace lock

} // namespace keeper

#endif // KEEPER_LOCK_SINGLETON_LOCK_HPP
