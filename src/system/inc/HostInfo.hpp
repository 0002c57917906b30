#ifndef KEEPER_SYSTEM_HOST_INFO_HPP
#define KEEPER_SYSTEM_HOST_INFO_HPP
/**
 * @file HostInfo.hpp
 * @brief Running kernel release and CPU count (Linux).
 * @note Linux-only. Uses uname(2) with /proc/sys/kernel/osrelease fallback.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 */

#include <cstddef> // std::size_t
#include <string>  // std::string

namespace keeper {

namespace system {

/* ----------------------------- Constants ----------------------------- */

/// Buffer size for kernel release string (e.g., "5.10.0-21-amd64").
inline constexpr std::size_t KERNEL_RELEASE_SIZE = 128;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Release string of the running kernel.
 * @return Release (e.g., "5.10.0-21-amd64"), empty if it cannot be read.
 */
[[nodiscard]] std::string getKernelRelease() noexcept;

/**
 * @brief Number of online CPUs.
 * @return CPU count (>= 1).
 */
[[nodiscard]] std::size_t getOnlineCpuCount() noexcept;

} // namespace system

} // namespace keeper

#endif // KEEPER_SYSTEM_HOST_INFO_HPP
