#ifndef KEEPER_HELPERS_LOG_HPP
#define KEEPER_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Leveled diagnostic output on stderr via fmt.
 *
 * Lines look like "[driver-keeper] WARN: message". Debug lines are emitted
 * only when KEEPER_DEBUG is set to a non-empty value other than "0".
 */

#include <cstdint>
#include <cstdio>
#include <cstdlib> // getenv
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace keeper {
namespace helpers {
namespace log {

/* ----------------------------- Types ----------------------------- */

/// Message severity.
enum class Level : std::uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
};

/// Static label for a level.
[[nodiscard]] constexpr const char* toString(Level level) noexcept {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

/* ----------------------------- API ----------------------------- */

/// True when KEEPER_DEBUG enables debug output (read once).
[[nodiscard]] inline bool debugEnabled() noexcept {
  static const bool ENABLED = [] {
    const char* v = std::getenv("KEEPER_DEBUG");
    return v != nullptr && v[0] != '\0' && !(v[0] == '0' && v[1] == '\0');
  }();
  return ENABLED;
}

/// Write one already-formatted line.
inline void write(Level level, std::string_view message) noexcept {
  if (level == Level::DEBUG && !debugEnabled()) {
    return;
  }
  fmt::print(stderr, "[driver-keeper] {}: {}\n", toString(level), message);
  std::fflush(stderr);
}

template <typename... Args> void debug(fmt::format_string<Args...> fmtStr, Args&&... args) {
  if (debugEnabled()) {
    write(Level::DEBUG, fmt::format(fmtStr, std::forward<Args>(args)...));
  }
}

template <typename... Args> void info(fmt::format_string<Args...> fmtStr, Args&&... args) {
  write(Level::INFO, fmt::format(fmtStr, std::forward<Args>(args)...));
}

template <typename... Args> void warn(fmt::format_string<Args...> fmtStr, Args&&... args) {
  write(Level::WARN, fmt::format(fmtStr, std::forward<Args>(args)...));
}

template <typename... Args> void error(fmt::format_string<Args...> fmtStr, Args&&... args) {
  write(Level::ERROR, fmt::format(fmtStr, std::forward<Args>(args)...));
}

} // namespace log
} // namespace helpers
} // namespace keeper

#endif // KEEPER_HELPERS_LOG_HPP
