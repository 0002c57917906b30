#ifndef KEEPER_PACKAGE_PACKAGE_CACHE_HPP
#define KEEPER_PACKAGE_PACKAGE_CACHE_HPP
/**
 * @file PackageCache.hpp
 * @brief Kernel-version keyed store of prebuilt driver packages.
 *
 * Layout under Config::cacheDir:
 *
 *   <kernel>/manifest                 key=value description of the entry
 *   <kernel>/<package>                packed artifact
 *   <kernel>/<fragment>.o             kernel-interface objects
 *   <kernel>/<module>.ko.sign         signature sidecars (signed builds)
 *   <kernel>/toolchain/ld             linker used to build the package
 *
 * Entries are written to a sibling staging directory and renamed into place,
 * so a reader never observes a partial entry. Stale staging directories from
 * interrupted runs are removed by pruneStaging().
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Status.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace keeper {

namespace package {

/* ----------------------------- Constants ----------------------------- */

/// Manifest file name inside a cache entry.
inline constexpr const char* MANIFEST_FILE_NAME = "manifest";

/// Relative path of the archived linker inside a cache entry.
inline constexpr const char* ARCHIVED_LINKER_PATH = "toolchain/ld";

/// Packager output line for a matching kernel interface.
inline constexpr const char* MATCH_MARKER = "kernel interface matches.";

/// Prefix of in-progress entry directories.
inline constexpr const char* STAGING_PREFIX = ".staging-";

/// Prefix of superseded entry directories awaiting removal.
inline constexpr const char* RETIRED_PREFIX = ".retired-";

/* ----------------------------- DriverPackage ----------------------------- */

/**
 * @brief A built driver package and its auxiliary artifacts.
 *
 * All file names are relative to the cache entry (or, before store(), to the
 * build work directory).
 */
struct DriverPackage {
  std::string description{};              ///< Kernel version the package was built for
  std::string driverVersion{};
  std::string packageName{};              ///< Packed artifact file name
  std::vector<std::string> interfaces{};  ///< Kernel-interface object fragments
  std::vector<std::string> signatures{};  ///< Detached signature sidecars
  std::vector<std::string> modules{};     ///< Module names contained
  std::string linker{};                   ///< Archived linker (relative), empty if none

  /// Entry directory the package was read from (not persisted).
  std::string directory{};

  /// @brief Absolute path of the packed artifact.
  [[nodiscard]] std::string packagePath() const;

  /// @brief Absolute path of the archived linker, empty if none.
  [[nodiscard]] std::string linkerPath() const;

  /// @brief True if the manifest lists the module.
  [[nodiscard]] bool hasModule(const std::string& name) const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;

  /// @brief Structural equality (ignores directory).
  [[nodiscard]] bool sameContent(const DriverPackage& other) const noexcept;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Package file name for a kernel: "<driver>-modules-<K up to '-'>[-<tag>]".
 */
[[nodiscard]] std::string packageNameFor(const config::Config& cfg,
                                         const std::string& kernelVersion);

/**
 * @brief Cache entry directory for a kernel version.
 */
[[nodiscard]] std::string entryDirectory(const config::Config& cfg,
                                         const std::string& kernelVersion);

/**
 * @brief Serialize a package manifest.
 */
[[nodiscard]] std::string formatManifest(const DriverPackage& pkg);

/**
 * @brief Parse a package manifest.
 * @return false if description or package name is missing.
 */
[[nodiscard]] bool parseManifest(const std::string& text, DriverPackage& out);

/**
 * @brief Read the cache entry for a kernel version.
 * @return Package, or nullopt if absent or unreadable.
 */
[[nodiscard]] std::optional<DriverPackage> lookup(const config::Config& cfg,
                                                  const std::string& kernelVersion) noexcept;

/**
 * @brief Decide whether the entry for a kernel must be rebuilt.
 * @param cfg Supplies cache root, packager and proc mount point.
 * @param kernelVersion Cache key.
 * @param moduleSet Modules the installed driver must provide.
 * @return true if the entry is absent, lacks a module from the set, or any
 *         of its kernel-interface fragments fails the packager match check.
 */
[[nodiscard]] bool requiresRebuild(const config::Config& cfg, const std::string& kernelVersion,
                                   const std::vector<config::ModuleSpec>& moduleSet) noexcept;

/**
 * @brief Atomically store a package for a kernel, superseding any entry.
 * @param cfg Supplies the cache root.
 * @param kernelVersion Cache key.
 * @param pkg Package whose file names are relative to workDir.
 * @param workDir Directory holding the built artifacts.
 * @param error Receives a diagnostic on failure.
 * @return OK, or BUILD_ERROR (cache left as it was).
 */
[[nodiscard]] helpers::status::Status store(const config::Config& cfg,
                                            const std::string& kernelVersion,
                                            const DriverPackage& pkg, const std::string& workDir,
                                            std::string& error) noexcept;

/**
 * @brief Remove staging and retired directories left by interrupted runs.
 * Directories whose recorded pid is still alive are left alone.
 * @return Number of directories removed.
 */
std::size_t pruneStaging(const config::Config& cfg) noexcept;

} // namespace package

} // namespace keeper

#endif // KEEPER_PACKAGE_PACKAGE_CACHE_HPP
