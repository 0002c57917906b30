/**
 * @file MountTable.cpp
 * @brief Implementation of mount table queries.
 */

#include "src/mount/inc/MountTable.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstdio>
#include <cstring>

namespace keeper {

namespace mount {

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr std::size_t LINE_BUF_SIZE = 2 * PATH_SIZE + 1024;

/* ----------------------------- Helpers ----------------------------- */

/// Copy a decoded field into a fixed array.
template <std::size_t N>
inline void storeField(std::array<char, N>& dest, const char* raw) {
  const std::string DECODED = decodeMountField(raw);
  helpers::strings::copyToFixedArray(dest, DECODED.c_str(), DECODED.size());
}

} // namespace

/* ----------------------------- MountTable Methods ----------------------------- */

const MountEntry* MountTable::findByMountPoint(const char* path) const noexcept {
  if (path == nullptr) {
    return nullptr;
  }
  for (auto it = mounts.rbegin(); it != mounts.rend(); ++it) {
    if (std::strcmp(it->mountPoint.data(), path) == 0) {
      return &*it;
    }
  }
  return nullptr;
}

/* ----------------------------- API ----------------------------- */

std::string decodeMountField(const char* field) {
  std::string out;
  if (field == nullptr) {
    return out;
  }
  for (const char* p = field; *p != '\0'; ++p) {
    if (p[0] == '\\' && p[1] >= '0' && p[1] <= '3' && p[2] >= '0' && p[2] <= '7' &&
        p[3] >= '0' && p[3] <= '7') {
      out += static_cast<char>(((p[1] - '0') << 6) | ((p[2] - '0') << 3) | (p[3] - '0'));
      p += 3;
      continue;
    }
    out += *p;
  }
  return out;
}

std::string normalizePath(const std::string& path) {
  std::string out;
  out.reserve(path.size());
  for (const char C : path) {
    if (C == '/' && !out.empty() && out.back() == '/') {
      continue;
    }
    out += C;
  }
  while (out.size() > 1 && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

bool parseMountLine(const char* line, MountEntry& out) noexcept {
  if (line == nullptr) {
    return false;
  }

  // Fields are separated by single spaces; embedded spaces are escaped.
  static thread_local char source[PATH_SIZE];
  static thread_local char mountPoint[PATH_SIZE];
  char fsType[FSTYPE_SIZE];
  char options[MOUNT_OPTIONS_SIZE];

  const int FIELDS =
      std::sscanf(line, "%4095s %4095s %31s %511s", source, mountPoint, fsType, options);
  if (FIELDS < 4) {
    return false;
  }

  out = MountEntry{};
  storeField(out.source, source);
  storeField(out.mountPoint, mountPoint);
  helpers::strings::copyToFixedArray(out.fsType, fsType);
  helpers::strings::copyToFixedArray(out.options, options);
  return true;
}

MountTable readMountTable(const char* path) noexcept {
  MountTable table{};
  if (path == nullptr) {
    return table;
  }

  FILE* fp = std::fopen(path, "re");
  if (fp == nullptr) {
    return table;
  }

  static thread_local char line[LINE_BUF_SIZE];
  while (std::fgets(line, sizeof(line), fp) != nullptr) {
    MountEntry entry{};
    if (parseMountLine(line, entry)) {
      table.mounts.push_back(entry);
    }
  }

  std::fclose(fp);
  return table;
}

bool isMounted(const char* tablePath, const std::string& target) noexcept {
  const std::string NORM = normalizePath(target);
  return readMountTable(tablePath).findByMountPoint(NORM.c_str()) != nullptr;
}

} // namespace mount

} // namespace keeper
