#ifndef KEEPER_CONFIG_CONFIG_HPP
#define KEEPER_CONFIG_CONFIG_HPP
/**
 * @file Config.hpp
 * @brief Run configuration: driver identity, kernel versions, paths, tools.
 *
 * A Config is built once from the environment (loadConfig), adjusted by CLI
 * flags, and passed by const reference to every lifecycle stage. Nothing in
 * the library reads the environment after that.
 *
 * Environment:
 *  - DRIVER_VERSION (required), DRIVER_NAME
 *  - KERNEL_VERSION, ACCEPT_LICENSE, PRIVATE_KEY, PACKAGE_TAG, MAX_THREADS
 *  - KEEPER_* path and tool overrides (see loadConfig)
 */

#include "src/helpers/inc/Status.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace keeper {

namespace config {

/* ----------------------------- Constants ----------------------------- */

/// Default driver name.
inline constexpr const char* DEFAULT_DRIVER_NAME = "nvidia";

/// Default run-time directory (lock file and publish target live here).
inline constexpr const char* DEFAULT_RUN_DIR = "/run/nvidia";

/// Lock file name inside the run directory.
inline constexpr const char* LOCK_FILE_NAME = "driver-keeper.pid";

/* ----------------------------- ModuleSpec ----------------------------- */

/**
 * @brief Static description of one kernel module of the driver.
 *
 * Modules with a kernel interface are linked from the interface object and a
 * prebuilt core object; the rest are compiled whole.
 */
struct ModuleSpec {
  std::string name;                 ///< Kernel name (e.g., "nvidia_modeset")
  std::string fileName;             ///< Module file (e.g., "nvidia-modeset.ko")
  std::string kernelInterface{};    ///< Interface object (e.g., "nv-modeset-linux.o")
  std::string coreObject{};         ///< Prebuilt core (e.g., "nvidia/nv-kernel.o_binary")
  std::vector<std::string> deps{};  ///< Modules this one depends on

  /// @brief True if this module is produced by linking interface + core.
  [[nodiscard]] bool isLinked() const noexcept { return !kernelInterface.empty(); }
};

/// Default module set: core, uvm, modeset, drm (declared in dependency order).
[[nodiscard]] std::vector<ModuleSpec> defaultModuleSet();

/**
 * @brief Order modules so every dependency precedes its dependents.
 * @param modules Module set (any order).
 * @param ordered Receives the sorted set; stable for already ordered input.
 * @return false if a dependency is undeclared or the graph has a cycle.
 */
[[nodiscard]] bool dependencyOrder(const std::vector<ModuleSpec>& modules,
                                   std::vector<ModuleSpec>& ordered);

/* ----------------------------- Tools ----------------------------- */

/**
 * @brief External collaborator programs. Empty entries disable optional steps.
 */
struct Tools {
  std::string provisioner{};             ///< Build environment provisioner (optional)
  std::string make{"make"};              ///< Kernel module build
  std::string linker{"ld"};              ///< Linker archived with each package
  std::string signer{"sign-module"};     ///< Detached signature producer
  std::string packager{"mkprecompiled"}; ///< pack / unpack / match
  std::string insmod{"insmod"};
  std::string rmmod{"rmmod"};
  std::string modprobe{"modprobe"};      ///< Auxiliary module loads (optional)
  std::string depmod{"depmod"};          ///< Module index refresh (optional)
  std::string persistenced{};            ///< Persistence daemon (optional)
};

/* ----------------------------- Config ----------------------------- */

/**
 * @brief Complete configuration for one driver-keeper invocation.
 */
struct Config {
  /* --- Driver and kernel identity --- */

  std::string driverName{DEFAULT_DRIVER_NAME};
  std::string driverVersion{};
  std::string kernelVersion{};  ///< Target kernel (package key)
  std::string runningKernel{};  ///< Kernel the modules are installed for

  /* --- Build and install options --- */

  bool acceptLicense{false};
  std::string signingKey{};
  std::string packageTag{};
  std::size_t maxThreads{1};

  /* --- Paths --- */

  std::string runDir{DEFAULT_RUN_DIR};
  std::string lockFile{};
  std::string sourceDir{};      ///< Driver sources; make runs in <sourceDir>/kernel
  std::string cacheDir{};       ///< Package cache root
  std::string stagingDir{};     ///< Install staging root
  std::string modulesRoot{"/lib/modules"};
  std::string sysModuleRoot{"/sys/module"};
  std::string procModules{"/proc/modules"};
  std::string mountsFile{"/proc/self/mounts"};
  std::string persistencedPidFile{};
  std::string hookDir{};        ///< Kernel postinst hook dir (empty: no hook)
  std::string selfPath{};       ///< This executable, referenced by the hook

  /* --- Publishing --- */

  bool publishRootfs{true};
  std::string publishSource{"/"};
  std::string publishTarget{};
  std::string privateHierarchy{"/sys"};

  /* --- Collaborators and modules --- */

  Tools tools{};
  std::vector<ModuleSpec> modules{};
  std::vector<std::string> auxModules{"ipmi_msghandler"};

  /// @brief Find a module by kernel name.
  [[nodiscard]] const ModuleSpec* findModule(std::string_view name) const noexcept;

  /// @brief Declared dependents of a module (modules listing it in deps).
  [[nodiscard]] std::vector<std::string> dependentsOf(std::string_view name) const;

  /// @brief Kernel build tree for a kernel version.
  [[nodiscard]] std::string kernelBuildDir(const std::string& kernel) const;

  /// @brief proc mount point handed to the packager for a kernel version.
  [[nodiscard]] std::string procMountPoint(const std::string& kernel) const;

  /// @brief Per-driver-version directory receiving installed module files.
  [[nodiscard]] std::string targetDir() const;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Build a Config from the process environment.
 * @param out Receives the configuration.
 * @param error Receives a diagnostic on failure.
 * @return OK, or CONFIG_ERROR (missing DRIVER_VERSION, bad MAX_THREADS,
 *         unreadable kernel release, invalid module graph).
 */
[[nodiscard]] helpers::status::Status loadConfig(Config& out, std::string& error);

/**
 * @brief Parse and apply a thread count.
 * @return false if value is not a positive integer.
 */
[[nodiscard]] bool setMaxThreads(Config& cfg, std::string_view value) noexcept;

/**
 * @brief Interpret a boolean-ish environment value ("1", "yes", "true", "on").
 */
[[nodiscard]] bool parseFlag(std::string_view value) noexcept;

} // namespace config

} // namespace keeper

#endif // KEEPER_CONFIG_CONFIG_HPP
