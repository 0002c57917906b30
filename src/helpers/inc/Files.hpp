#ifndef KEEPER_HELPERS_FILES_HPP
#define KEEPER_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File I/O and path utilities.
 *
 * Small-file reads use C-style I/O (open/read/close) into fixed buffers, the
 * way sysfs and procfs attributes are read. Whole-file reads and writes used
 * for manifests, pid files and hook scripts allocate.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISDIR, S_ISREG
#include <unistd.h>   // read, write, close, fsync

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtol
#include <string>

namespace keeper {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Size for small integer file reads.
inline constexpr std::size_t INT_READ_BUFFER_SIZE = 64;

/// Chunk size for whole-file reads.
inline constexpr std::size_t READ_CHUNK_SIZE = 4096;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read (excluding null terminator), 0 on error.
 *
 * Strips trailing newlines and carriage returns. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    return 0;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  keeper::helpers::strings::stripTrailingWhitespace(buf, total);

  return total;
}

/**
 * @brief Read signed 32-bit integer from file.
 * @param path File path to read.
 * @param defaultVal Value to return on error.
 * @return Parsed integer or defaultVal on failure.
 */
[[nodiscard]] inline std::int32_t readFileInt(const char* path,
                                              std::int32_t defaultVal = -1) noexcept {
  std::array<char, INT_READ_BUFFER_SIZE> buf{};
  if (readFileToBuffer(path, buf.data(), buf.size()) == 0) {
    return defaultVal;
  }

  char* end = nullptr;
  const long VAL = std::strtol(buf.data(), &end, 10);
  if (end == buf.data()) {
    return defaultVal;
  }

  return static_cast<std::int32_t>(VAL);
}

/**
 * @brief Read a whole file into a string.
 * @param path File path to read.
 * @param out Receives the contents (untrimmed).
 * @return true if the file was opened and read to EOF.
 */
[[nodiscard]] inline bool readFileToString(const char* path, std::string& out) {
  out.clear();
  if (path == nullptr) {
    return false;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  std::array<char, READ_CHUNK_SIZE> chunk{};
  bool ok = true;
  for (;;) {
    const ssize_t N = ::read(FD, chunk.data(), chunk.size());
    if (N == 0) {
      break;
    }
    if (N < 0) {
      ok = false;
      break;
    }
    out.append(chunk.data(), static_cast<std::size_t>(N));
  }

  ::close(FD);
  return ok;
}

/* ----------------------------- File Writing ----------------------------- */

/**
 * @brief Write buffer to an open descriptor, retrying short writes.
 * @return true if every byte was written.
 */
[[nodiscard]] inline bool writeAll(int fd, const char* data, std::size_t len) noexcept {
  std::size_t done = 0;
  while (done < len) {
    const ssize_t N = ::write(fd, data + done, len - done);
    if (N <= 0) {
      return false;
    }
    done += static_cast<std::size_t>(N);
  }
  return true;
}

/**
 * @brief Create or replace a file with the given contents.
 * @param path Destination path.
 * @param content Bytes to write.
 * @param mode Permission bits for a newly created file.
 * @return true on success (contents flushed with fsync).
 */
[[nodiscard]] inline bool writeFile(const char* path, const std::string& content,
                                    mode_t mode = 0644) noexcept {
  if (path == nullptr) {
    return false;
  }

  const int FD = ::open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (FD < 0) {
    return false;
  }

  const bool OK = writeAll(FD, content.data(), content.size()) && ::fsync(FD) == 0;
  ::close(FD);
  return OK;
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path exists (file or directory).
 * @param path Path to check.
 * @return true if path exists.
 */
[[nodiscard]] inline bool pathExists(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  return ::stat(path, &st) == 0;
}

/**
 * @brief Check if path is a directory.
 * @param path Path to check.
 * @return true if path exists and is a directory.
 */
[[nodiscard]] inline bool isDirectory(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

/**
 * @brief Check if path is a regular file.
 * @param path Path to check.
 * @return true if path exists and is a regular file.
 */
[[nodiscard]] inline bool isRegularFile(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode);
}

} // namespace files
} // namespace helpers
} // namespace keeper

#endif // KEEPER_HELPERS_FILES_HPP
