#ifndef KEEPER_PACKAGE_BUILD_PIPELINE_HPP
#define KEEPER_PACKAGE_BUILD_PIPELINE_HPP
/**
 * @file BuildPipeline.hpp
 * @brief Build a driver package for one kernel version and store it in the cache.
 * @note Linux-only. Every step is an external collaborator run through
 *       system::runCommand() inside <sourceDir>/kernel.
 *
 * Steps (each requires the previous one to succeed):
 *  1. PROVISION  <provisioner> <K>                        (skipped if unset)
 *  2. COMPILE    make -s -j N SYSSRC=<modulesRoot>/<K>/build <targets>
 *  3. LINK       ld -d -r -o <module.ko> <interface.o> <core object>
 *  4. SIGN       <signer> <key> <module.ko> <module.ko>.sign (only with a key)
 *  5. PACK       <packager> --pack <name> ...
 *  6. ARCHIVE    copy the linker to toolchain/ld
 *  7. STORE      package::store()
 *
 * The cache is written only by STORE, so a failure at any earlier step
 * leaves it untouched.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/package/inc/PackageCache.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace keeper {

namespace package {

/* ----------------------------- BuildStep ----------------------------- */

/**
 * @brief Build pipeline stage.
 */
enum class BuildStep : std::uint8_t {
  NONE = 0,
  PROVISION,
  COMPILE,
  LINK,
  SIGN,
  PACK,
  ARCHIVE,
  STORE,
};

/// @brief Human-readable step name.
[[nodiscard]] const char* toString(BuildStep step) noexcept;

/* ----------------------------- BuildResult ----------------------------- */

/**
 * @brief Outcome of build().
 */
struct BuildResult {
  helpers::status::Status status{helpers::status::Status::OK};
  BuildStep failedStep{BuildStep::NONE};
  DriverPackage package{};  ///< Stored package (OK only)
  std::string detail{};     ///< Failing command or diagnostic

  /// @brief True if the package was built and stored.
  [[nodiscard]] bool ok() const noexcept { return status == helpers::status::Status::OK; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief make targets for a module set: interface objects of linked modules,
 *        module files of the rest.
 */
[[nodiscard]] std::vector<std::string>
compileTargets(const std::vector<config::ModuleSpec>& modules);

/**
 * @brief Packager argument list for a built module set.
 * @param cfg Driver identity and module set.
 * @param kernelVersion Package description.
 * @param packageName Output file name.
 * @param signedBuild Add --linked-module/--signed-module groups.
 */
[[nodiscard]] std::vector<std::string> packArguments(const config::Config& cfg,
                                                     const std::string& kernelVersion,
                                                     const std::string& packageName,
                                                     bool signedBuild);

/**
 * @brief Run the full pipeline for a kernel version.
 * @param cfg Tools, paths, signing key, thread count and module set.
 * @param kernelVersion Kernel to build for (package cache key).
 * @return OK with the stored package, or BUILD_ERROR with the failing step.
 */
[[nodiscard]] BuildResult build(const config::Config& cfg,
                                const std::string& kernelVersion) noexcept;

} // namespace package

} // namespace keeper

#endif // KEEPER_PACKAGE_BUILD_PIPELINE_HPP
