#ifndef KEEPER_MOUNT_MOUNT_TABLE_HPP
#define KEEPER_MOUNT_MOUNT_TABLE_HPP
/**
 * @file MountTable.hpp
 * @brief Mount table queries used to decide publish/unpublish state.
 * @note Linux-only. Reads /proc/self/mounts (or Config::mountsFile).
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Mount points in the kernel table escape space, tab, newline and backslash
 * as three-digit octal sequences ("\040"); entries are stored decoded.
 */

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace keeper {

namespace mount {

/* ----------------------------- Constants ----------------------------- */

/// Maximum path length for mount points and sources.
inline constexpr std::size_t PATH_SIZE = 4096;

/// Maximum filesystem type length.
inline constexpr std::size_t FSTYPE_SIZE = 32;

/// Maximum mount options string length.
inline constexpr std::size_t MOUNT_OPTIONS_SIZE = 512;

/* ----------------------------- MountEntry ----------------------------- */

/**
 * @brief One line of the mount table:
 *   source mountpoint fstype options dump pass
 */
struct MountEntry {
  std::array<char, PATH_SIZE> source{};           ///< Mount source (device, "none", ...)
  std::array<char, PATH_SIZE> mountPoint{};       ///< Decoded mount point
  std::array<char, FSTYPE_SIZE> fsType{};         ///< Filesystem type
  std::array<char, MOUNT_OPTIONS_SIZE> options{}; ///< Comma-separated options
};

/* ----------------------------- MountTable ----------------------------- */

/**
 * @brief All entries of one mount table read.
 */
struct MountTable {
  std::vector<MountEntry> mounts{};

  /// @brief Number of entries.
  [[nodiscard]] std::size_t count() const noexcept { return mounts.size(); }

  /// @brief Last entry mounted exactly at path (top of a stack), or nullptr.
  [[nodiscard]] const MountEntry* findByMountPoint(const char* path) const noexcept;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Decode the octal escapes of a mount table field.
 */
[[nodiscard]] std::string decodeMountField(const char* field);

/**
 * @brief Normalize a path for comparison: collapse repeated '/', drop trailing '/'.
 */
[[nodiscard]] std::string normalizePath(const std::string& path);

/**
 * @brief Parse one mount table line.
 * @return false if the line has fewer than four fields.
 */
[[nodiscard]] bool parseMountLine(const char* line, MountEntry& out) noexcept;

/**
 * @brief Read and parse a mount table file.
 * @param path Table to read (e.g., "/proc/self/mounts").
 * @return Parsed entries (empty if unreadable).
 */
[[nodiscard]] MountTable readMountTable(const char* path) noexcept;

/**
 * @brief True if something is mounted exactly at target.
 */
[[nodiscard]] bool isMounted(const char* tablePath, const std::string& target) noexcept;

} // namespace mount

} // namespace keeper

#endif // KEEPER_MOUNT_MOUNT_TABLE_HPP
