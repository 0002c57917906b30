#ifndef KEEPER_HELPERS_STRINGS_HPP
#define KEEPER_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String manipulation helpers.
 *
 * Fixed-buffer helpers are noexcept with no allocation; the std::string
 * helpers at the bottom are cold-path only (manifest and config parsing).
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring> // strlen, strncmp, memcpy
#include <string>
#include <string_view>
#include <vector>

namespace keeper {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Skip leading whitespace (spaces and tabs).
 * @param ptr Pointer into string.
 * @return Pointer to first non-whitespace character (or end of string).
 */
[[nodiscard]] inline const char* skipWhitespace(const char* ptr) noexcept {
  if (ptr == nullptr) {
    return nullptr;
  }
  while (*ptr == ' ' || *ptr == '\t') {
    ++ptr;
  }
  return ptr;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

/**
 * @brief Copy exactly len bytes into fixed-size array with null termination.
 * @tparam N Array size.
 * @param dest Destination array.
 * @param src Source buffer (not necessarily null-terminated).
 * @param len Number of bytes to copy from src.
 */
template <std::size_t N>
inline void copyToFixedArray(std::array<char, N>& dest, const char* src, std::size_t len) noexcept {
  if (src == nullptr || len == 0) {
    dest[0] = '\0';
    return;
  }

  const std::size_t COPY_LEN = (len < N - 1) ? len : (N - 1);
  std::memcpy(dest.data(), src, COPY_LEN);
  dest[COPY_LEN] = '\0';
}

/**
 * @brief Copy null-terminated string into fixed-size array.
 * @tparam N Array size.
 */
template <std::size_t N>
inline void copyToFixedArray(std::array<char, N>& dest, const char* src) noexcept {
  copyToFixedArray(dest, src, (src == nullptr) ? 0 : std::strlen(src));
}

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 */
[[nodiscard]] inline bool startsWith(const char* str, const char* prefix) noexcept {
  if (str == nullptr || prefix == nullptr) {
    return false;
  }
  const std::size_t PREFIX_LEN = std::strlen(prefix);
  return std::strncmp(str, prefix, PREFIX_LEN) == 0;
}

/* ----------------------------- Cold-path Helpers ----------------------------- */

/// Trim spaces, tabs and line endings from both ends.
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
  constexpr std::string_view WS = " \t\r\n";
  const std::size_t FIRST = s.find_first_not_of(WS);
  if (FIRST == std::string_view::npos) {
    return {};
  }
  const std::size_t LAST = s.find_last_not_of(WS);
  return s.substr(FIRST, LAST - FIRST + 1);
}

/**
 * @brief Split on a separator character, dropping empty fields.
 */
[[nodiscard]] inline std::vector<std::string> split(std::string_view s, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= s.size()) {
    std::size_t end = s.find(sep, start);
    if (end == std::string_view::npos) {
      end = s.size();
    }
    const std::string_view FIELD = trim(s.substr(start, end - start));
    if (!FIELD.empty()) {
      out.emplace_back(FIELD);
    }
    start = end + 1;
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace keeper

#endif // KEEPER_HELPERS_STRINGS_HPP
