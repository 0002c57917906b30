#ifndef KEEPER_PACKAGE_INSTALL_PIPELINE_HPP
#define KEEPER_PACKAGE_INSTALL_PIPELINE_HPP
/**
 * @file InstallPipeline.hpp
 * @brief Unpack a cached package, relink if needed, place the module files.
 * @note Linux-only.
 *
 * The target directory (Config::targetDir()) is emptied first and only
 * populated once every module file exists in staging, so a failed unpack or
 * relink leaves no module files behind. The placed directory holds the .ko
 * files and a "modules.order" listing them in dependency order.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/package/inc/PackageCache.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace keeper {

namespace package {

/// Dependency-order manifest written beside the installed modules.
inline constexpr const char* MODULES_ORDER_FILE = "modules.order";

/* ----------------------------- InstallFailure ----------------------------- */

/**
 * @brief Detail for an INSTALL_ERROR.
 */
enum class InstallFailure : std::uint8_t {
  NONE = 0,
  LICENSE_NOT_ACCEPTED,
  UNPACK_FAILED,
  RELINK_FAILED,
  PLACE_FAILED,
};

/// @brief Human-readable failure name.
[[nodiscard]] const char* toString(InstallFailure failure) noexcept;

/* ----------------------------- InstallResult ----------------------------- */

/**
 * @brief One module file placed in the target directory.
 */
struct InstalledModule {
  std::string name{};  ///< Kernel module name
  std::string path{};  ///< Absolute path of the .ko file
};

/**
 * @brief Outcome of install().
 */
struct InstallResult {
  helpers::status::Status status{helpers::status::Status::OK};
  InstallFailure failure{InstallFailure::NONE};
  std::string targetDir{};
  std::vector<InstalledModule> modules{};  ///< Dependency order
  bool relinked{false};                    ///< Linked modules were regenerated
  std::string detail{};

  /// @brief True if every module was placed.
  [[nodiscard]] bool ok() const noexcept { return status == helpers::status::Status::OK; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Install a package's modules for the running kernel.
 * @param cfg Running kernel, staging root, tools and module set.
 * @param pkg Package as returned by lookup() (directory set).
 * @param licenseAccepted License gate; nothing is touched when false.
 * @return OK, or INSTALL_ERROR with an InstallFailure.
 *
 * Linked modules are regenerated with the package's archived linker when the
 * running kernel differs from the package description or a linked module is
 * missing after unpack.
 */
[[nodiscard]] InstallResult install(const config::Config& cfg, const DriverPackage& pkg,
                                    bool licenseAccepted) noexcept;

} // namespace package

} // namespace keeper

#endif // KEEPER_PACKAGE_INSTALL_PIPELINE_HPP
