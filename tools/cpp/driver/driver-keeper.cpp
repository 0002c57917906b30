/**
 * @file driver-keeper.cpp
 * @brief Build, cache, load and publish the GPU driver for the host kernel.
 *
 * Commands:
 *   init    Take the host lock, bring the driver up, wait for a termination
 *           signal, then tear it down.
 *   update  Make sure a valid package exists for a kernel version.
 *   status  Print module, cache, lock and publish state.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/orchestrator/inc/Orchestrator.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = keeper::helpers::args;
namespace cfgns = keeper::config;
namespace orch = keeper::orchestrator;

using keeper::helpers::status::Status;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_ACCEPT_LICENSE = 1,
  ARG_MAX_THREADS = 2,
  ARG_KERNEL = 3,
  ARG_SIGN = 4,
  ARG_TAG = 5,
};

enum class Command : std::uint8_t {
  NONE = 0,
  INIT,
  UPDATE,
  STATUS,
};

constexpr std::string_view PROGRAM = "driver-keeper";

args::ArgMap buildInitArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", "-h", 0, false, "Show this help message"};
  map[ARG_ACCEPT_LICENSE] = {"--accept-license", "-a", 0, false, "Accept the driver license"};
  map[ARG_MAX_THREADS] = {"--max-threads", "-m", 1, false, "Parallel compile jobs"};
  return map;
}

args::ArgMap buildUpdateArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", "-h", 0, false, "Show this help message"};
  map[ARG_KERNEL] = {"--kernel", "-k", 1, false, "Kernel version to build for"};
  map[ARG_SIGN] = {"--sign", "-s", 1, false, "Signing key reference"};
  map[ARG_TAG] = {"--tag", "-t", 1, false, "Package name tag"};
  map[ARG_MAX_THREADS] = {"--max-threads", "-m", 1, false, "Parallel compile jobs"};
  return map;
}

args::ArgMap buildStatusArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", "-h", 0, false, "Show this help message"};
  return map;
}

void printUsage(std::FILE* out) {
  fmt::print(out, "Usage: {} COMMAND [ARG...]\n\n", PROGRAM);
  fmt::print(out, "Commands:\n");
  fmt::print(out, "  init [-a | --accept-license] [-m | --max-threads N]\n");
  args::printOptions(out, buildInitArgMap(), 4);
  fmt::print(out, "  update [-k | --kernel VERSION] [-s | --sign KEYID] [-t | --tag TAG] "
                  "[-m | --max-threads N]\n");
  args::printOptions(out, buildUpdateArgMap(), 4);
  fmt::print(out, "  status\n");
  fmt::print(out, "\nEnvironment: DRIVER_VERSION (required), KERNEL_VERSION, ACCEPT_LICENSE,\n"
                  "  PRIVATE_KEY, PACKAGE_TAG, MAX_THREADS, KEEPER_* path overrides.\n");
}

Command parseCommand(std::string_view name) {
  if (name == "init") {
    return Command::INIT;
  }
  if (name == "update") {
    return Command::UPDATE;
  }
  if (name == "status") {
    return Command::STATUS;
  }
  return Command::NONE;
}

/// Apply command-line overrides to the environment configuration.
bool applyOverrides(Command cmd, const args::ParsedArgs& pargs, cfgns::Config& cfg,
                    std::string& error) {
  if (pargs.count(ARG_MAX_THREADS) != 0) {
    const std::string_view N = args::valueOr(pargs, ARG_MAX_THREADS, "");
    if (!cfgns::setMaxThreads(cfg, N)) {
      error = fmt::format("Invalid thread count '{}'", N);
      return false;
    }
  }

  if (cmd == Command::INIT && pargs.count(ARG_ACCEPT_LICENSE) != 0) {
    cfg.acceptLicense = true;
  }

  if (cmd == Command::UPDATE) {
    if (pargs.count(ARG_KERNEL) != 0) {
      cfg.kernelVersion = std::string(args::valueOr(pargs, ARG_KERNEL, cfg.kernelVersion));
    }
    if (pargs.count(ARG_SIGN) != 0) {
      cfg.signingKey = std::string(args::valueOr(pargs, ARG_SIGN, cfg.signingKey));
    }
    if (pargs.count(ARG_TAG) != 0) {
      cfg.packageTag = std::string(args::valueOr(pargs, ARG_TAG, cfg.packageTag));
    }
  }
  return true;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  if (argc < 2) {
    printUsage(stderr);
    return 1;
  }

  const Command CMD = parseCommand(argv[1]);
  if (CMD == Command::NONE) {
    printUsage(stderr);
    return 1;
  }

  const args::ArgMap ARG_MAP = (CMD == Command::INIT)     ? buildInitArgMap()
                               : (CMD == Command::UPDATE) ? buildUpdateArgMap()
                                                          : buildStatusArgMap();

  std::vector<std::string_view> rest;
  rest.reserve(static_cast<std::size_t>(argc - 2));
  for (int i = 2; i < argc; ++i) {
    rest.emplace_back(argv[i]);
  }

  args::ParsedArgs pargs;
  std::string error;
  if (!args::parseArgs(rest, ARG_MAP, pargs, true, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    printUsage(stderr);
    return 1;
  }

  if (pargs.count(ARG_HELP) != 0) {
    printUsage(stdout);
    return 0;
  }

  cfgns::Config cfg{};
  if (cfgns::loadConfig(cfg, error) != Status::OK) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }
  if (!applyOverrides(CMD, pargs, cfg, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    printUsage(stderr);
    return 1;
  }

  switch (CMD) {
  case Command::INIT:
    return orch::exitCodeFor(orch::runInit(cfg));
  case Command::UPDATE:
    return orch::exitCodeFor(orch::runUpdate(cfg));
  case Command::STATUS:
    fmt::print("{}", orch::statusReport(cfg));
    return 0;
  case Command::NONE:
    break;
  }
  return 1;
}
