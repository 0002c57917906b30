/**
 * @file KernelHook.cpp
 * @brief Implementation of the kernel post-install hook writer.
 */

#include "src/orchestrator/inc/KernelHook.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"

#include <sys/stat.h> // chmod

#include <fmt/core.h>

namespace keeper {

namespace orchestrator {

namespace log = helpers::log;

std::string kernelHookPath(const config::Config& cfg) {
  if (cfg.hookDir.empty()) {
    return {};
  }
  return fmt::format("{}/update-{}-driver", cfg.hookDir, cfg.driverName);
}

std::string shellQuote(const std::string& value) {
  std::string out = "'";
  for (const char C : value) {
    if (C == '\'') {
      out += "'\\''";
    } else {
      out += C;
    }
  }
  out += "'";
  return out;
}

std::string renderKernelHook(const config::Config& cfg) {
  std::string out;
  out += "#!/bin/sh\n";
  out += fmt::format("# Rebuilds the {} driver package when a new kernel is installed.\n",
                     cfg.driverName);
  out += "[ -n \"${1:-}\" ] || exit 0\n";
  out += fmt::format("DRIVER_NAME={}\n", shellQuote(cfg.driverName));
  out += fmt::format("DRIVER_VERSION={}\n", shellQuote(cfg.driverVersion));
  out += fmt::format("KEEPER_SOURCE_DIR={}\n", shellQuote(cfg.sourceDir));
  out += fmt::format("KEEPER_CACHE_DIR={}\n", shellQuote(cfg.cacheDir));
  out += fmt::format("KEEPER_LOCK_FILE={}\n", shellQuote(cfg.lockFile));
  out += "export DRIVER_NAME DRIVER_VERSION KEEPER_SOURCE_DIR KEEPER_CACHE_DIR KEEPER_LOCK_FILE\n";
  out += fmt::format("{} update --kernel \"$1\" || echo \"ERROR: Failed to update the {} "
                     "driver\" >&2\n",
                     shellQuote(cfg.selfPath), cfg.driverName);
  out += "exit 0\n";
  return out;
}

bool writeKernelUpdateHook(const config::Config& cfg) noexcept {
  const std::string PATH = kernelHookPath(cfg);
  if (PATH.empty() || !helpers::files::isDirectory(cfg.hookDir.c_str())) {
    log::debug("No kernel hook directory, skipping update hook");
    return true;
  }

  log::info("Writing kernel update hook {}...", PATH);
  if (!helpers::files::writeFile(PATH.c_str(), renderKernelHook(cfg), 0755) ||
      ::chmod(PATH.c_str(), 0755) != 0) {
    log::warn("Could not write kernel update hook {}", PATH);
    return false;
  }
  return true;
}

} // namespace orchestrator

} // namespace keeper
