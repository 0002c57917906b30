#ifndef KEEPER_MOUNT_PUBLISHER_HPP
#define KEEPER_MOUNT_PUBLISHER_HPP
/**
 * @file Publisher.hpp
 * @brief Expose the driver root filesystem at the run-time publish target.
 * @note Linux-only. Requires CAP_SYS_ADMIN in the mount namespace.
 *
 * publish():
 *  1. Config::privateHierarchy is made recursively unbindable, then private,
 *     so the recursive bind below cannot loop back through it.
 *  2. Config::publishTarget is created.
 *  3. Config::publishSource is bind-mounted recursively onto the target.
 *
 * unpublish() lazily detaches the target (and everything below it) until the
 * mount table no longer lists it. A target that is not mounted is a no-op.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Status.hpp"

namespace keeper {

namespace mount {

/// Upper bound on stacked mounts removed from the target by one unpublish().
inline constexpr int MAX_STACKED_MOUNTS = 16;

/**
 * @brief Bind the driver rootfs onto the publish target.
 * @return OK, or MOUNT_ERROR (logged with errno).
 */
[[nodiscard]] helpers::status::Status publish(const config::Config& cfg) noexcept;

/**
 * @brief Remove the publish mount if present.
 * @return OK (including nothing mounted, EINVAL or ENOENT), or MOUNT_ERROR.
 */
[[nodiscard]] helpers::status::Status unpublish(const config::Config& cfg) noexcept;

/**
 * @brief True if the publish target is currently a mount point.
 */
[[nodiscard]] bool isPublished(const config::Config& cfg) noexcept;

} // namespace mount

} // namespace keeper

#endif // KEEPER_MOUNT_PUBLISHER_HPP
