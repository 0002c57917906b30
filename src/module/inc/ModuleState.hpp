#ifndef KEEPER_MODULE_MODULE_STATE_HPP
#define KEEPER_MODULE_MODULE_STATE_HPP
/**
 * @file ModuleState.hpp
 * @brief Live kernel module state: load state, refcounts, dependents (Linux).
 * @note Linux-only. Reads /sys/module/\<name\>/refcnt and /proc/modules.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Every query is a fresh read of kernel state. Nothing here caches: module
 * references change under external consumers between any two decisions.
 */

#include "src/config/inc/Config.hpp"

#include <array>   // std::array
#include <cstddef> // std::size_t
#include <cstdint> // std::int32_t, std::uint32_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace keeper {

namespace module {

/* ----------------------------- Constants ----------------------------- */

/// Buffer size for module name.
inline constexpr std::size_t MODULE_NAME_SIZE = 64;

/// Buffer size for module state string from /proc/modules.
inline constexpr std::size_t MODULE_STATE_SIZE = 16;

/// Maximum number of holders tracked per /proc/modules entry.
inline constexpr std::size_t MAX_MODULE_HOLDERS = 16;

/* ----------------------------- ModuleState ----------------------------- */

/**
 * @brief Load state of a single module.
 */
struct ModuleState {
  /// True if the module is present in the running kernel.
  bool loaded{false};

  /// Kernel reference count (0 when absent).
  std::uint32_t refcount{0};

  /// @brief Human-readable form ("absent" or "loaded refs=N").
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ModuleRecord ----------------------------- */

/**
 * @brief One declared module with its live state and dependents.
 */
struct ModuleRecord {
  /// Kernel module name.
  std::array<char, MODULE_NAME_SIZE> name{};

  /// Live state at the time of the query.
  ModuleState state{};

  /// Number of declared dependents (modules listing this one as a dependency).
  std::size_t dependentCount{0};

  /// Number of declared dependents currently loaded.
  std::size_t loadedDependents{0};

  /**
   * @brief In use if loaded with more references than loaded dependents.
   *
   * Approximation of "no external users": each loaded dependent is assumed to
   * hold exactly one reference.
   */
  [[nodiscard]] bool inUse() const noexcept {
    return state.loaded && state.refcount > loadedDependents;
  }

  /// @brief Check if this is a specific module.
  [[nodiscard]] bool isNamed(const char* targetName) const noexcept;

  /// @brief Human-readable single-line summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Live view of the declared module set, in declared order.
 */
struct ModuleSnapshot {
  std::vector<ModuleRecord> records{};

  /// @brief Find record by name.
  [[nodiscard]] const ModuleRecord* find(const char* name) const noexcept;

  /// @brief Count of loaded modules.
  [[nodiscard]] std::size_t loadedCount() const noexcept;

  /// @brief True if every declared module is loaded.
  [[nodiscard]] bool allLoaded() const noexcept;

  /// @brief True if no declared module is loaded.
  [[nodiscard]] bool noneLoaded() const noexcept { return loadedCount() == 0; }

  /// @brief First record that is in use, or nullptr.
  [[nodiscard]] const ModuleRecord* firstInUse() const noexcept;

  /// @brief Human-readable table.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- /proc/modules ----------------------------- */

/**
 * @brief One line of /proc/modules.
 */
struct LoadedModule {
  std::array<char, MODULE_NAME_SIZE> name{};
  std::size_t sizeBytes{0};
  std::int32_t useCount{0};
  std::array<char, MODULE_NAME_SIZE> holders[MAX_MODULE_HOLDERS]{};
  std::size_t holderCount{0};
  std::array<char, MODULE_STATE_SIZE> state{};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Query one module.
 * @param cfg Supplies the sysfs module root.
 * @param name Kernel module name.
 * @return Absent if \<root\>/\<name\>/refcnt cannot be read.
 */
[[nodiscard]] ModuleState queryModule(const config::Config& cfg, const char* name) noexcept;

/**
 * @brief Query every declared module and count loaded dependents.
 * @param cfg Supplies the module set and sysfs root.
 */
[[nodiscard]] ModuleSnapshot queryModuleSet(const config::Config& cfg) noexcept;

/**
 * @brief Parse a single /proc/modules line.
 *
 * Format: name size use_count holders state offset [taint]
 * Example: nvidia 56442880 1639 nvidia_modeset,nvidia_uvm, Live 0x0000000000000000 (POE)
 *
 * @return true if name, size and use count parsed.
 */
[[nodiscard]] bool parseModuleLine(const char* line, LoadedModule& out) noexcept;

/**
 * @brief Read and parse a /proc/modules-format file.
 * @param path Usually Config::procModules.
 * @return Entries in file order; empty on read failure.
 */
[[nodiscard]] std::vector<LoadedModule> readLoadedModules(const char* path) noexcept;

} // namespace module

} // namespace keeper

#endif // KEEPER_MODULE_MODULE_STATE_HPP
