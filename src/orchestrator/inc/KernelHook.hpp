#ifndef KEEPER_ORCHESTRATOR_KERNEL_HOOK_HPP
#define KEEPER_ORCHESTRATOR_KERNEL_HOOK_HPP
/**
 * @file KernelHook.hpp
 * @brief Kernel post-install hook that pre-builds the package for new kernels.
 *
 * The hook is a /bin/sh script installed as <hookDir>/update-<driver>-driver.
 * Package managers run post-install hooks with the new kernel release as the
 * first argument; the script runs "driver-keeper update --kernel <release>"
 * with the driver identity and cache paths of the init that wrote it. Hook
 * failures never fail the kernel installation.
 */

#include "src/config/inc/Config.hpp"

#include <string>

namespace keeper {

namespace orchestrator {

/**
 * @brief Path of the hook script, empty if no hook directory is configured.
 */
[[nodiscard]] std::string kernelHookPath(const config::Config& cfg);

/**
 * @brief Quote a string for /bin/sh (single quotes, embedded quotes escaped).
 */
[[nodiscard]] std::string shellQuote(const std::string& value);

/**
 * @brief Render the hook script.
 */
[[nodiscard]] std::string renderKernelHook(const config::Config& cfg);

/**
 * @brief Write the hook if the hook directory exists.
 * @return false only if the directory exists and the script could not be written.
 */
[[nodiscard]] bool writeKernelUpdateHook(const config::Config& cfg) noexcept;

} // namespace orchestrator

} // namespace keeper

#endif // KEEPER_ORCHESTRATOR_KERNEL_HOOK_HPP
