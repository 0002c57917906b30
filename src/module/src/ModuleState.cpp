/**
 * @file ModuleState.cpp
 * @brief Implementation of live module state queries.
 */

#include "src/module/inc/ModuleState.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstdlib> // strtol, strtoul
#include <cstring> // strcmp, memcpy

#include <fmt/core.h>

namespace keeper {

namespace module {

namespace {

using helpers::files::readFileToString;
using helpers::strings::copyToFixedArray;
using helpers::strings::skipWhitespace;

/// Find end of token (until whitespace, comma, or end).
const char* findTokenEnd(const char* ptr) noexcept {
  while (*ptr != '\0' && *ptr != ' ' && *ptr != '\t' && *ptr != ',' && *ptr != '\n') {
    ++ptr;
  }
  return ptr;
}

} // namespace

/* ----------------------------- ModuleState Methods ----------------------------- */

std::string ModuleState::toString() const {
  if (!loaded) {
    return "absent";
  }
  return fmt::format("loaded refs={}", refcount);
}

/* ----------------------------- ModuleRecord Methods ----------------------------- */

bool ModuleRecord::isNamed(const char* targetName) const noexcept {
  if (targetName == nullptr) {
    return false;
  }
  return std::strcmp(name.data(), targetName) == 0;
}

std::string ModuleRecord::toString() const {
  return fmt::format("{:<16} {:<16} dependents={}/{}{}", name.data(), state.toString(),
                     loadedDependents, dependentCount, inUse() ? " IN USE" : "");
}

/* ----------------------------- ModuleSnapshot Methods ----------------------------- */

const ModuleRecord* ModuleSnapshot::find(const char* name) const noexcept {
  for (const ModuleRecord& REC : records) {
    if (REC.isNamed(name)) {
      return &REC;
    }
  }
  return nullptr;
}

std::size_t ModuleSnapshot::loadedCount() const noexcept {
  std::size_t n = 0;
  for (const ModuleRecord& REC : records) {
    if (REC.state.loaded) {
      ++n;
    }
  }
  return n;
}

bool ModuleSnapshot::allLoaded() const noexcept {
  return !records.empty() && loadedCount() == records.size();
}

const ModuleRecord* ModuleSnapshot::firstInUse() const noexcept {
  for (const ModuleRecord& REC : records) {
    if (REC.inUse()) {
      return &REC;
    }
  }
  return nullptr;
}

std::string ModuleSnapshot::toString() const {
  std::string out;
  out.reserve(64 * (records.size() + 1));
  out += fmt::format("Driver modules ({}/{} loaded):\n", loadedCount(), records.size());
  for (const ModuleRecord& REC : records) {
    out += "  ";
    out += REC.toString();
    out += "\n";
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

ModuleState queryModule(const config::Config& cfg, const char* name) noexcept {
  ModuleState st{};
  if (name == nullptr || name[0] == '\0') {
    return st;
  }

  const std::string PATH = fmt::format("{}/{}/refcnt", cfg.sysModuleRoot, name);
  std::array<char, helpers::files::INT_READ_BUFFER_SIZE> buf{};
  if (helpers::files::readFileToBuffer(PATH.c_str(), buf.data(), buf.size()) == 0) {
    return st;
  }

  char* end = nullptr;
  const unsigned long REFS = std::strtoul(buf.data(), &end, 10);
  if (end == buf.data()) {
    return st;
  }

  st.loaded = true;
  st.refcount = static_cast<std::uint32_t>(REFS);
  return st;
}

ModuleSnapshot queryModuleSet(const config::Config& cfg) noexcept {
  ModuleSnapshot snap{};
  snap.records.reserve(cfg.modules.size());

  for (const config::ModuleSpec& MOD : cfg.modules) {
    ModuleRecord rec{};
    copyToFixedArray(rec.name, MOD.name.c_str());
    rec.state = queryModule(cfg, MOD.name.c_str());
    snap.records.push_back(rec);
  }

  // Dependents are counted from the same pass of reads.
  for (ModuleRecord& rec : snap.records) {
    for (const std::string& DEPENDENT : cfg.dependentsOf(rec.name.data())) {
      ++rec.dependentCount;
      const ModuleRecord* other = snap.find(DEPENDENT.c_str());
      if (other != nullptr && other->state.loaded) {
        ++rec.loadedDependents;
      }
    }
  }

  return snap;
}

bool parseModuleLine(const char* line, LoadedModule& out) noexcept {
  const char* ptr = skipWhitespace(line);
  if (ptr == nullptr) {
    return false;
  }

  // Name
  const char* nameEnd = findTokenEnd(ptr);
  if (nameEnd == ptr) {
    return false;
  }
  copyToFixedArray(out.name, ptr, static_cast<std::size_t>(nameEnd - ptr));
  ptr = skipWhitespace(nameEnd);

  // Size
  char* numEnd = nullptr;
  out.sizeBytes = static_cast<std::size_t>(std::strtoul(ptr, &numEnd, 10));
  if (numEnd == ptr) {
    return false;
  }
  ptr = skipWhitespace(numEnd);

  // Use count
  out.useCount = static_cast<std::int32_t>(std::strtol(ptr, &numEnd, 10));
  if (numEnd == ptr) {
    return false;
  }
  ptr = skipWhitespace(numEnd);

  // Holders: comma-separated with trailing comma, or a single "-"
  out.holderCount = 0;
  if (*ptr == '-') {
    ++ptr;
  } else {
    while (*ptr != '\0' && *ptr != ' ' && *ptr != '\t') {
      const char* start = ptr;
      while (*ptr != '\0' && *ptr != ',' && *ptr != ' ' && *ptr != '\t') {
        ++ptr;
      }
      if (ptr > start && out.holderCount < MAX_MODULE_HOLDERS) {
        copyToFixedArray(out.holders[out.holderCount], start,
                         static_cast<std::size_t>(ptr - start));
        ++out.holderCount;
      }
      if (*ptr == ',') {
        ++ptr;
      }
    }
  }
  ptr = skipWhitespace(ptr);

  // State
  const char* stateEnd = findTokenEnd(ptr);
  copyToFixedArray(out.state, ptr, static_cast<std::size_t>(stateEnd - ptr));

  return true;
}

std::vector<LoadedModule> readLoadedModules(const char* path) noexcept {
  std::vector<LoadedModule> out;
  std::string text;
  if (!readFileToString(path, text)) {
    return out;
  }

  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    const std::string LINE = text.substr(start, end - start);
    LoadedModule entry{};
    if (parseModuleLine(LINE.c_str(), entry)) {
      out.push_back(entry);
    }
    start = end + 1;
  }
  return out;
}

} // namespace module

} // namespace keeper
