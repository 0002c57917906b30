/**
 * @file Config.cpp
 * @brief Implementation of environment-driven configuration.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/system/inc/HostInfo.hpp"

#include <unistd.h> // readlink

#include <algorithm>
#include <array>
#include <cstdlib> // getenv, strtoul
#include <utility> // std::move
#include <string>

#include <fmt/core.h>

namespace keeper {

namespace config {

namespace {

using helpers::status::Status;

/// Environment value, or fallback when the variable is unset.
/// A variable set to the empty string yields the empty string.
std::string envOr(const char* name, const std::string& fallback) {
  const char* v = std::getenv(name);
  return (v != nullptr) ? std::string(v) : fallback;
}

/// Path of the running executable.
std::string selfExecutable() {
  std::array<char, 4096> buf{};
  const ssize_t N = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
  if (N <= 0) {
    return "driver-keeper";
  }
  return std::string(buf.data(), static_cast<std::size_t>(N));
}

} // namespace

/* ----------------------------- Module Set ----------------------------- */

std::vector<ModuleSpec> defaultModuleSet() {
  std::vector<ModuleSpec> set;
  set.push_back({"nvidia", "nvidia.ko", "nv-linux.o", "nvidia/nv-kernel.o_binary", {}});
  set.push_back({"nvidia_uvm", "nvidia-uvm.ko", "", "", {"nvidia"}});
  set.push_back({"nvidia_modeset", "nvidia-modeset.ko", "nv-modeset-linux.o",
                 "nvidia-modeset/nv-modeset-kernel.o_binary", {"nvidia"}});
  set.push_back({"nvidia_drm", "nvidia-drm.ko", "", "", {"nvidia_modeset"}});
  return set;
}

bool dependencyOrder(const std::vector<ModuleSpec>& modules, std::vector<ModuleSpec>& ordered) {
  ordered.clear();
  std::vector<bool> placed(modules.size(), false);

  auto indexOf = [&modules](const std::string& name) -> std::size_t {
    for (std::size_t i = 0; i < modules.size(); ++i) {
      if (modules[i].name == name) {
        return i;
      }
    }
    return modules.size();
  };

  for (const ModuleSpec& MOD : modules) {
    for (const std::string& DEP : MOD.deps) {
      if (indexOf(DEP) == modules.size() || DEP == MOD.name) {
        return false;
      }
    }
  }

  // Repeated stable passes: pick the first module whose deps are all placed.
  while (ordered.size() < modules.size()) {
    bool progress = false;
    for (std::size_t i = 0; i < modules.size(); ++i) {
      if (placed[i]) {
        continue;
      }
      const bool READY =
          std::all_of(modules[i].deps.begin(), modules[i].deps.end(),
                      [&](const std::string& dep) { return placed[indexOf(dep)]; });
      if (READY) {
        placed[i] = true;
        ordered.push_back(modules[i]);
        progress = true;
        break;
      }
    }
    if (!progress) {
      ordered.clear();
      return false;
    }
  }
  return true;
}

/* ----------------------------- Config Methods ----------------------------- */

const ModuleSpec* Config::findModule(std::string_view name) const noexcept {
  for (const ModuleSpec& MOD : modules) {
    if (MOD.name == name) {
      return &MOD;
    }
  }
  return nullptr;
}

std::vector<std::string> Config::dependentsOf(std::string_view name) const {
  std::vector<std::string> out;
  for (const ModuleSpec& MOD : modules) {
    if (std::find(MOD.deps.begin(), MOD.deps.end(), name) != MOD.deps.end()) {
      out.push_back(MOD.name);
    }
  }
  return out;
}

std::string Config::kernelBuildDir(const std::string& kernel) const {
  return fmt::format("{}/{}/build", modulesRoot, kernel);
}

std::string Config::procMountPoint(const std::string& kernel) const {
  return fmt::format("{}/{}/proc", modulesRoot, kernel);
}

std::string Config::targetDir() const {
  return fmt::format("{}/{}/kernel/drivers/video/{}-{}", modulesRoot, runningKernel, driverName,
                     driverVersion);
}

std::string Config::toString() const {
  std::string out;
  out.reserve(512);
  out += fmt::format("Driver:          {} {}\n", driverName, driverVersion);
  out += fmt::format("Target kernel:   {}\n", kernelVersion);
  out += fmt::format("Running kernel:  {}\n", runningKernel);
  out += fmt::format("Accept license:  {}\n", acceptLicense ? "yes" : "no");
  out += fmt::format("Signing key:     {}\n", signingKey.empty() ? "-" : signingKey);
  out += fmt::format("Package tag:     {}\n", packageTag.empty() ? "-" : packageTag);
  out += fmt::format("Max threads:     {}\n", maxThreads);
  out += fmt::format("Lock file:       {}\n", lockFile);
  out += fmt::format("Package cache:   {}\n", cacheDir);
  out += fmt::format("Module target:   {}\n", targetDir());
  out += fmt::format("Publish:         {}\n",
                     publishRootfs ? fmt::format("{} -> {}", publishSource, publishTarget) : "off");
  out += "Modules:        ";
  for (const ModuleSpec& MOD : modules) {
    out += " ";
    out += MOD.name;
  }
  out += "\n";
  return out;
}

/* ----------------------------- API ----------------------------- */

bool parseFlag(std::string_view value) noexcept {
  const std::string_view V = helpers::strings::trim(value);
  return V == "1" || V == "yes" || V == "true" || V == "on" || V == "YES" || V == "TRUE";
}

bool setMaxThreads(Config& cfg, std::string_view value) noexcept {
  const std::string S(helpers::strings::trim(value));
  if (S.empty() || S.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  char* end = nullptr;
  const unsigned long N = std::strtoul(S.c_str(), &end, 10);
  if (N == 0 || end == S.c_str()) {
    return false;
  }
  cfg.maxThreads = static_cast<std::size_t>(N);
  return true;
}

Status loadConfig(Config& out, std::string& error) {
  Config cfg{};

  cfg.driverVersion = envOr("DRIVER_VERSION", "");
  if (cfg.driverVersion.empty()) {
    error = "Missing DRIVER_VERSION env";
    return Status::CONFIG_ERROR;
  }
  cfg.driverName = envOr("DRIVER_NAME", DEFAULT_DRIVER_NAME);

  cfg.runningKernel = system::getKernelRelease();
  cfg.kernelVersion = envOr("KERNEL_VERSION", cfg.runningKernel);
  if (cfg.kernelVersion.empty()) {
    error = "Unable to determine kernel version";
    return Status::CONFIG_ERROR;
  }
  if (cfg.runningKernel.empty()) {
    cfg.runningKernel = cfg.kernelVersion;
  }

  cfg.acceptLicense = parseFlag(envOr("ACCEPT_LICENSE", ""));
  cfg.signingKey = envOr("PRIVATE_KEY", "");
  cfg.packageTag = envOr("PACKAGE_TAG", "");

  cfg.maxThreads = system::getOnlineCpuCount();
  const std::string THREADS = envOr("MAX_THREADS", "");
  if (!THREADS.empty() && !setMaxThreads(cfg, THREADS)) {
    error = fmt::format("Invalid MAX_THREADS '{}'", THREADS);
    return Status::CONFIG_ERROR;
  }

  cfg.runDir = envOr("KEEPER_RUN_DIR", DEFAULT_RUN_DIR);
  cfg.lockFile = envOr("KEEPER_LOCK_FILE", fmt::format("{}/{}", cfg.runDir, LOCK_FILE_NAME));
  cfg.sourceDir = envOr("KEEPER_SOURCE_DIR",
                        fmt::format("/usr/src/{}-{}", cfg.driverName, cfg.driverVersion));
  cfg.cacheDir = envOr("KEEPER_CACHE_DIR", cfg.sourceDir + "/precompiled");
  cfg.stagingDir = envOr("KEEPER_STAGING_DIR", cfg.sourceDir + "/staging");
  cfg.modulesRoot = envOr("KEEPER_MODULES_ROOT", cfg.modulesRoot);
  cfg.sysModuleRoot = envOr("KEEPER_SYS_MODULE_ROOT", cfg.sysModuleRoot);
  cfg.procModules = envOr("KEEPER_PROC_MODULES", cfg.procModules);
  cfg.mountsFile = envOr("KEEPER_MOUNTS_FILE", cfg.mountsFile);
  cfg.hookDir = envOr("KEEPER_HOOK_DIR", "");
  cfg.selfPath = selfExecutable();

  cfg.publishRootfs = parseFlag(envOr("KEEPER_PUBLISH_ROOTFS", "1"));
  cfg.publishSource = envOr("KEEPER_PUBLISH_SOURCE", cfg.publishSource);
  cfg.publishTarget = envOr("KEEPER_PUBLISH_TARGET", cfg.runDir + "/driver");
  cfg.privateHierarchy = envOr("KEEPER_PRIVATE_HIERARCHY", cfg.privateHierarchy);

  cfg.tools.provisioner = envOr("KEEPER_PROVISIONER", cfg.tools.provisioner);
  cfg.tools.make = envOr("KEEPER_MAKE", cfg.tools.make);
  cfg.tools.linker = envOr("KEEPER_LINKER", cfg.tools.linker);
  cfg.tools.signer = envOr("KEEPER_SIGNER", cfg.tools.signer);
  cfg.tools.packager = envOr("KEEPER_PACKAGER", cfg.tools.packager);
  cfg.tools.insmod = envOr("KEEPER_INSMOD", cfg.tools.insmod);
  cfg.tools.rmmod = envOr("KEEPER_RMMOD", cfg.tools.rmmod);
  cfg.tools.modprobe = envOr("KEEPER_MODPROBE", cfg.tools.modprobe);
  cfg.tools.depmod = envOr("KEEPER_DEPMOD", cfg.tools.depmod);
  cfg.tools.persistenced = envOr("KEEPER_PERSISTENCED", cfg.driverName + "-persistenced");
  cfg.persistencedPidFile =
      envOr("KEEPER_PERSISTENCED_PID", fmt::format("/var/run/{0}-persistenced/{0}-persistenced.pid",
                                                   cfg.driverName));

  const std::string AUX = envOr("KEEPER_AUX_MODULES", "ipmi_msghandler");
  cfg.auxModules = helpers::strings::split(AUX, ',');

  if (!dependencyOrder(defaultModuleSet(), cfg.modules)) {
    error = "Module dependency graph is invalid";
    return Status::CONFIG_ERROR;
  }

  out = std::move(cfg);
  return Status::OK;
}

} // namespace config

} // namespace keeper
