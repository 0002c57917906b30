/**
 * @file PackageCache.cpp
 * @brief Implementation of the kernel-version keyed package cache.
 */

#include "src/package/inc/PackageCache.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/system/inc/Command.hpp"

#include <signal.h> // kill
#include <unistd.h> // getpid

#include <algorithm>
#include <cerrno>
#include <cstdlib> // strtol
#include <filesystem> // std::filesystem
#include <string_view>
#include <system_error>

#include <fmt/core.h>

namespace keeper {

namespace package {

namespace fs = std::filesystem;
namespace log = helpers::log;
using helpers::status::Status;

namespace {

/// Copy one artifact from srcDir to dstDir, creating intermediate directories.
bool copyArtifact(const fs::path& srcDir, const fs::path& dstDir, const std::string& rel,
                  std::string& error) {
  std::error_code ec;
  const fs::path DST = dstDir / rel;
  fs::create_directories(DST.parent_path(), ec);
  if (ec) {
    error = fmt::format("cannot create {}: {}", DST.parent_path().string(), ec.message());
    return false;
  }
  fs::copy_file(srcDir / rel, DST, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    error = fmt::format("cannot copy {}: {}", (srcDir / rel).string(), ec.message());
    return false;
  }
  return true;
}

/// True if a staging name's trailing "-<pid>" names a live process other than us.
bool ownerAlive(const std::string& name) {
  const std::size_t DASH = name.rfind('-');
  if (DASH == std::string::npos) {
    return false;
  }
  char* end = nullptr;
  const long PID = std::strtol(name.c_str() + DASH + 1, &end, 10);
  if (PID <= 0 || *end != '\0' || PID == static_cast<long>(::getpid())) {
    return false;
  }
  return ::kill(static_cast<pid_t>(PID), 0) == 0 || errno == EPERM;
}

/// Append "key=value" manifest lines for each value.
void appendList(std::string& out, const char* key, const std::vector<std::string>& values) {
  for (const std::string& V : values) {
    out += fmt::format("{}={}\n", key, V);
  }
}

} // namespace

/* ----------------------------- DriverPackage Methods ----------------------------- */

std::string DriverPackage::packagePath() const {
  return (fs::path(directory) / packageName).string();
}

std::string DriverPackage::linkerPath() const {
  if (linker.empty()) {
    return {};
  }
  return (fs::path(directory) / linker).string();
}

bool DriverPackage::hasModule(const std::string& name) const noexcept {
  return std::find(modules.begin(), modules.end(), name) != modules.end();
}

std::string DriverPackage::toString() const {
  std::string out;
  out.reserve(256);
  out += fmt::format("Package:     {}\n", packageName);
  out += fmt::format("  Kernel:    {}\n", description);
  out += fmt::format("  Driver:    {}\n", driverVersion);
  out += "  Modules:  ";
  for (const std::string& M : modules) {
    out += " ";
    out += M;
  }
  out += "\n";
  out += fmt::format("  Signed:    {}\n", signatures.empty() ? "no" : "yes");
  out += fmt::format("  Linker:    {}\n", linker.empty() ? "-" : linker);
  return out;
}

bool DriverPackage::sameContent(const DriverPackage& other) const noexcept {
  return description == other.description && driverVersion == other.driverVersion &&
         packageName == other.packageName && interfaces == other.interfaces &&
         signatures == other.signatures && modules == other.modules && linker == other.linker;
}

/* ----------------------------- Naming ----------------------------- */

std::string packageNameFor(const config::Config& cfg, const std::string& kernelVersion) {
  const std::string BASE = kernelVersion.substr(0, kernelVersion.find('-'));
  std::string name = fmt::format("{}-modules-{}", cfg.driverName, BASE);
  if (!cfg.packageTag.empty()) {
    name += "-";
    name += cfg.packageTag;
  }
  return name;
}

std::string entryDirectory(const config::Config& cfg, const std::string& kernelVersion) {
  return (fs::path(cfg.cacheDir) / kernelVersion).string();
}

/* ----------------------------- Manifest ----------------------------- */

std::string formatManifest(const DriverPackage& pkg) {
  std::string out;
  out += fmt::format("description={}\n", pkg.description);
  out += fmt::format("driver-version={}\n", pkg.driverVersion);
  out += fmt::format("package={}\n", pkg.packageName);
  appendList(out, "interface", pkg.interfaces);
  appendList(out, "signature", pkg.signatures);
  appendList(out, "module", pkg.modules);
  if (!pkg.linker.empty()) {
    out += fmt::format("linker={}\n", pkg.linker);
  }
  return out;
}

bool parseManifest(const std::string& text, DriverPackage& out) {
  out = DriverPackage{};

  std::string_view rest(text);
  while (!rest.empty()) {
    const std::size_t NL = rest.find('\n');
    const std::string_view LINE =
        helpers::strings::trim(rest.substr(0, NL == std::string_view::npos ? rest.size() : NL));
    rest = (NL == std::string_view::npos) ? std::string_view{} : rest.substr(NL + 1);

    if (LINE.empty() || LINE.front() == '#') {
      continue;
    }
    const std::size_t EQ = LINE.find('=');
    if (EQ == std::string_view::npos) {
      continue;
    }
    const std::string_view KEY = LINE.substr(0, EQ);
    const std::string VALUE(LINE.substr(EQ + 1));

    if (KEY == "description") {
      out.description = VALUE;
    } else if (KEY == "driver-version") {
      out.driverVersion = VALUE;
    } else if (KEY == "package") {
      out.packageName = VALUE;
    } else if (KEY == "interface") {
      out.interfaces.push_back(VALUE);
    } else if (KEY == "signature") {
      out.signatures.push_back(VALUE);
    } else if (KEY == "module") {
      out.modules.push_back(VALUE);
    } else if (KEY == "linker") {
      out.linker = VALUE;
    }
  }

  return !out.description.empty() && !out.packageName.empty();
}

/* ----------------------------- Cache Operations ----------------------------- */

std::optional<DriverPackage> lookup(const config::Config& cfg,
                                    const std::string& kernelVersion) noexcept {
  const std::string DIR = entryDirectory(cfg, kernelVersion);
  const std::string MANIFEST = fmt::format("{}/{}", DIR, MANIFEST_FILE_NAME);

  std::string text;
  if (!helpers::files::readFileToString(MANIFEST.c_str(), text)) {
    return std::nullopt;
  }

  DriverPackage pkg{};
  if (!parseManifest(text, pkg)) {
    log::warn("Ignoring malformed package manifest {}", MANIFEST);
    return std::nullopt;
  }
  pkg.directory = DIR;
  return pkg;
}

bool requiresRebuild(const config::Config& cfg, const std::string& kernelVersion,
                     const std::vector<config::ModuleSpec>& moduleSet) noexcept {
  log::info("Checking {} driver packages...", cfg.driverName);

  const std::optional<DriverPackage> PKG = lookup(cfg, kernelVersion);
  if (!PKG) {
    log::info("No cached package for kernel {}", kernelVersion);
    return true;
  }

  for (const config::ModuleSpec& MOD : moduleSet) {
    if (!PKG->hasModule(MOD.name)) {
      log::info("Cached package {} lacks module {}", PKG->packageName, MOD.name);
      return true;
    }
  }

  const std::string PKG_PATH = PKG->packagePath();
  if (!helpers::files::isRegularFile(PKG_PATH.c_str())) {
    log::info("Cached package file {} is missing", PKG_PATH);
    return true;
  }

  system::RunOptions opts{};
  opts.captureOutput = true;

  // Without interface fragments the package itself is matched once.
  std::vector<std::string> fragments = PKG->interfaces;
  if (fragments.empty()) {
    fragments.emplace_back();
  }

  for (const std::string& FRAG : fragments) {
    std::vector<std::string> argv{cfg.tools.packager, "--match", PKG_PATH};
    if (!FRAG.empty()) {
      argv.push_back("--kernel-interface");
      argv.push_back((fs::path(PKG->directory) / FRAG).string());
    }
    argv.push_back("--proc-mount-point");
    argv.push_back(cfg.procMountPoint(kernelVersion));

    const system::CommandResult RES = system::runCommand(argv, opts);
    if (!RES.ok() || helpers::strings::trim(RES.output) != MATCH_MARKER) {
      log::info("Cached package {} does not match kernel {} ({})", PKG->packageName,
                kernelVersion, RES.toString());
      return true;
    }
  }

  log::info("Found {} driver package {}", cfg.driverName, PKG->packageName);
  return false;
}

Status store(const config::Config& cfg, const std::string& kernelVersion,
             const DriverPackage& pkg, const std::string& workDir, std::string& error) noexcept {
  std::error_code ec;
  const fs::path ROOT(cfg.cacheDir);
  const fs::path ENTRY = ROOT / kernelVersion;
  const fs::path STAGING =
      ROOT / fmt::format("{}{}-{}", STAGING_PREFIX, kernelVersion, ::getpid());
  const fs::path RETIRED =
      ROOT / fmt::format("{}{}-{}", RETIRED_PREFIX, kernelVersion, ::getpid());
  const fs::path SRC(workDir);

  fs::remove_all(STAGING, ec);
  fs::create_directories(STAGING, ec);
  if (ec) {
    error = fmt::format("cannot create {}: {}", STAGING.string(), ec.message());
    return Status::BUILD_ERROR;
  }

  auto abandon = [&STAGING]() {
    std::error_code ignored;
    fs::remove_all(STAGING, ignored);
    return Status::BUILD_ERROR;
  };

  std::vector<std::string> artifacts{pkg.packageName};
  artifacts.insert(artifacts.end(), pkg.interfaces.begin(), pkg.interfaces.end());
  artifacts.insert(artifacts.end(), pkg.signatures.begin(), pkg.signatures.end());
  if (!pkg.linker.empty()) {
    artifacts.push_back(pkg.linker);
  }
  for (const std::string& REL : artifacts) {
    if (!copyArtifact(SRC, STAGING, REL, error)) {
      return abandon();
    }
  }
  if (!pkg.linker.empty()) {
    fs::permissions(STAGING / pkg.linker, fs::perms::owner_all | fs::perms::group_read |
                                              fs::perms::group_exec | fs::perms::others_read |
                                              fs::perms::others_exec,
                    ec);
  }

  DriverPackage recorded = pkg;
  recorded.description = kernelVersion;
  recorded.directory.clear();
  const std::string MANIFEST = (STAGING / MANIFEST_FILE_NAME).string();
  if (!helpers::files::writeFile(MANIFEST.c_str(), formatManifest(recorded))) {
    error = fmt::format("cannot write {}", MANIFEST);
    return abandon();
  }

  const bool HAD_ENTRY = fs::exists(ENTRY, ec);
  if (HAD_ENTRY) {
    fs::remove_all(RETIRED, ec);
    fs::rename(ENTRY, RETIRED, ec);
    if (ec) {
      error = fmt::format("cannot retire {}: {}", ENTRY.string(), ec.message());
      return abandon();
    }
  }

  fs::rename(STAGING, ENTRY, ec);
  if (ec) {
    error = fmt::format("cannot publish {}: {}", ENTRY.string(), ec.message());
    if (HAD_ENTRY) {
      std::error_code restore;
      fs::rename(RETIRED, ENTRY, restore);
    }
    return abandon();
  }

  if (HAD_ENTRY) {
    fs::remove_all(RETIRED, ec);
  }
  log::info("Stored {} for kernel {} in {}", pkg.packageName, kernelVersion, ENTRY.string());
  return Status::OK;
}

std::size_t pruneStaging(const config::Config& cfg) noexcept {
  std::size_t removed = 0;
  std::error_code ec;
  if (!fs::is_directory(cfg.cacheDir, ec)) {
    return 0;
  }

  std::vector<fs::path> stale;
  for (fs::directory_iterator it(cfg.cacheDir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string NAME = it->path().filename().string();
    const bool TEMP = helpers::strings::startsWith(NAME.c_str(), STAGING_PREFIX) ||
                      helpers::strings::startsWith(NAME.c_str(), RETIRED_PREFIX);
    if (TEMP && !ownerAlive(NAME)) {
      stale.push_back(it->path());
    }
  }
  if (ec) {
    log::warn("Scanning {} stopped early: {}", cfg.cacheDir, ec.message());
  }

  for (const fs::path& P : stale) {
    std::error_code rmEc;
    fs::remove_all(P, rmEc);
    if (rmEc) {
      log::warn("Could not remove {}: {}", P.string(), rmEc.message());
      continue;
    }
    log::debug("Removed stale cache directory {}", P.string());
    ++removed;
  }
  return removed;
}

} // namespace package

} // namespace keeper
