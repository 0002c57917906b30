/**
 * @file SingletonLock.cpp
 * @brief Implementation of the host-wide pid-file lock.
 */

#include "src/lock/inc/SingletonLock.hpp"
#include "src/helpers/inc/Files.hpp"

#include <fcntl.h>    // open, O_RDWR, O_CREAT, O_CLOEXEC
#include <sys/file.h> // flock, LOCK_EX, LOCK_NB
#include <sys/stat.h> // fstat, stat
#include <unistd.h>   // getpid, ftruncate, close, unlink

#include <array>
#include <cerrno>
#include <cstdlib> // strtol
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace keeper {

namespace lock {

using helpers::status::Status;

/* ----------------------------- LockHandle Methods ----------------------------- */

LockHandle::LockHandle(int fd, pid_t owner, std::string path) noexcept
    : fd_(fd), owner_(owner), path_(std::move(path)) {}

LockHandle::~LockHandle() { release(); }

LockHandle::LockHandle(LockHandle&& other) noexcept
    : fd_(other.fd_), owner_(other.owner_), path_(std::move(other.path_)) {
  other.fd_ = -1;
  other.owner_ = 0;
}

LockHandle& LockHandle::operator=(LockHandle&& other) noexcept {
  if (this != &other) {
    release();
    fd_ = other.fd_;
    owner_ = other.owner_;
    path_ = std::move(other.path_);
    other.fd_ = -1;
    other.owner_ = 0;
  }
  return *this;
}

void LockHandle::release() noexcept {
  if (fd_ < 0) {
    return;
  }
  // A contender that opened this inode before the unlink can still lock it
  // afterwards; acquireLock() detects that through isCurrentLockFile().
  ::unlink(path_.c_str());
  ::close(fd_);
  fd_ = -1;
}

/* ----------------------------- API ----------------------------- */

bool isCurrentLockFile(int fd, const std::string& path) noexcept {
  struct stat held{};
  struct stat named{};
  if (::fstat(fd, &held) != 0 || ::stat(path.c_str(), &named) != 0) {
    return false;
  }
  return held.st_dev == named.st_dev && held.st_ino == named.st_ino;
}

LockResult acquireLock(const std::string& path) noexcept {
  LockResult result{};

  std::error_code ec;
  const std::filesystem::path PARENT = std::filesystem::path(path).parent_path();
  if (!PARENT.empty()) {
    std::filesystem::create_directories(PARENT, ec);
  }

  for (int attempt = 0; attempt < LOCK_REOPEN_ATTEMPTS; ++attempt) {
    const int FD = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (FD < 0) {
      result.sysErrno = errno;
      return result;
    }

    if (::flock(FD, LOCK_EX | LOCK_NB) != 0) {
      const int ERR = errno;
      ::close(FD);
      if (ERR == EWOULDBLOCK) {
        result.status = Status::ALREADY_RUNNING;
      } else {
        result.sysErrno = ERR;
      }
      return result;
    }

    // The previous holder unlinked the file between our open and flock.
    if (!isCurrentLockFile(FD, path)) {
      ::close(FD);
      continue;
    }

    const pid_t PID = ::getpid();
    const std::string TEXT = fmt::format("{}\n", PID);
    if (::ftruncate(FD, 0) != 0 || ::pwrite(FD, TEXT.data(), TEXT.size(), 0) !=
                                       static_cast<ssize_t>(TEXT.size())) {
      result.sysErrno = errno;
      ::unlink(path.c_str());
      ::close(FD);
      return result;
    }

    result.status = Status::OK;
    result.handle = LockHandle(FD, PID, path);
    return result;
  }

  result.sysErrno = EAGAIN;
  return result;
}

LockOwner readLockOwner(const std::string& path) noexcept {
  LockOwner owner{};

  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return owner;
  }
  owner.fileExists = true;

  if (::flock(FD, LOCK_SH | LOCK_NB) != 0) {
    owner.held = (errno == EWOULDBLOCK);
  } else {
    ::flock(FD, LOCK_UN);
  }
  ::close(FD);

  owner.pid = static_cast<pid_t>(helpers::files::readFileInt(path.c_str(), 0));
  return owner;
}

} // namespace lock

} // namespace keeper
