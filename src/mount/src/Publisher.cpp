/**
 * @file Publisher.cpp
 * @brief Implementation of rootfs publish/unpublish.
 */

#include "src/mount/inc/Publisher.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/mount/inc/MountTable.hpp"

#include <sys/mount.h> // mount, umount2, MS_*, MNT_DETACH

#include <cerrno>
#include <cstring>
#include <filesystem> // std::filesystem
#include <system_error>

namespace keeper {

namespace mount {

namespace log = helpers::log;
using helpers::status::Status;

namespace {

/// Change propagation of a mount point; logs on failure.
bool setPropagation(const std::string& path, unsigned long flags, const char* what) {
  if (::mount(nullptr, path.c_str(), nullptr, flags, nullptr) != 0) {
    log::error("Could not make {} {}: {}", path, what, std::strerror(errno));
    return false;
  }
  return true;
}

} // namespace

Status publish(const config::Config& cfg) noexcept {
  const std::string TARGET = normalizePath(cfg.publishTarget);
  if (TARGET.empty() || cfg.publishSource.empty()) {
    log::error("Publish source and target must be set");
    return Status::MOUNT_ERROR;
  }

  log::info("Mounting {} driver rootfs...", cfg.driverName);

  if (!cfg.privateHierarchy.empty()) {
    if (!setPropagation(cfg.privateHierarchy, MS_UNBINDABLE | MS_REC, "runbindable") ||
        !setPropagation(cfg.privateHierarchy, MS_PRIVATE, "private")) {
      return Status::MOUNT_ERROR;
    }
  }

  std::error_code ec;
  std::filesystem::create_directories(TARGET, ec);
  if (ec) {
    log::error("Could not create {}: {}", TARGET, ec.message());
    return Status::MOUNT_ERROR;
  }

  if (::mount(cfg.publishSource.c_str(), TARGET.c_str(), nullptr, MS_BIND | MS_REC, nullptr) !=
      0) {
    log::error("Could not bind {} onto {}: {}", cfg.publishSource, TARGET, std::strerror(errno));
    return Status::MOUNT_ERROR;
  }
  return Status::OK;
}

Status unpublish(const config::Config& cfg) noexcept {
  const std::string TARGET = normalizePath(cfg.publishTarget);
  if (TARGET.empty()) {
    return Status::OK;
  }

  for (int i = 0; i < MAX_STACKED_MOUNTS; ++i) {
    if (!isMounted(cfg.mountsFile.c_str(), TARGET)) {
      return Status::OK;
    }
    if (i == 0) {
      log::info("Unmounting {} driver rootfs...", cfg.driverName);
    }
    if (::umount2(TARGET.c_str(), MNT_DETACH) != 0) {
      if (errno == EINVAL || errno == ENOENT) {
        return Status::OK;
      }
      log::error("Could not unmount {}: {}", TARGET, std::strerror(errno));
      return Status::MOUNT_ERROR;
    }
  }

  if (isMounted(cfg.mountsFile.c_str(), TARGET)) {
    log::error("{} is still mounted", TARGET);
    return Status::MOUNT_ERROR;
  }
  return Status::OK;
}

bool isPublished(const config::Config& cfg) noexcept {
  return isMounted(cfg.mountsFile.c_str(), cfg.publishTarget);
}

} // namespace mount

} // namespace keeper
