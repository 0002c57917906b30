#ifndef KEEPER_HELPERS_TEMP_TREE_HPP
#define KEEPER_HELPERS_TEMP_TREE_HPP
/**
 * @file TempTree.hpp
 * @brief Per-test scratch directory with file and script helpers.
 *
 * Test-only. The directory is created under $TMPDIR (or /tmp) and removed
 * recursively by the destructor.
 */

#include "src/helpers/inc/Files.hpp"

#include <stdlib.h>   // mkdtemp
#include <sys/stat.h> // chmod

#include <cstdlib>    // getenv
#include <filesystem> // std::filesystem
#include <string>
#include <system_error>
#include <vector>

namespace keeper {
namespace test {

class TempTree {
public:
  TempTree() {
    const char* base = std::getenv("TMPDIR");
    std::string tmpl = std::string((base != nullptr && base[0] != '\0') ? base : "/tmp") +
                       "/driver-keeper-test-XXXXXX";
    if (::mkdtemp(tmpl.data()) != nullptr) {
      root_ = tmpl;
    }
  }

  ~TempTree() {
    if (!root_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(root_, ec);
    }
  }

  TempTree(const TempTree&) = delete;
  TempTree& operator=(const TempTree&) = delete;

  /// @brief True if the directory was created.
  [[nodiscard]] bool valid() const noexcept { return !root_.empty(); }

  [[nodiscard]] const std::string& root() const noexcept { return root_; }

  /// @brief Absolute path of a relative entry.
  [[nodiscard]] std::string path(const std::string& rel) const { return root_ + "/" + rel; }

  /// @brief Create a directory (and parents); returns its path.
  std::string mkdir(const std::string& rel) const {
    std::error_code ec;
    std::filesystem::create_directories(path(rel), ec);
    return path(rel);
  }

  /// @brief Write a file (parents created); returns its path.
  std::string write(const std::string& rel, const std::string& content,
                    mode_t mode = 0644) const {
    const std::string P = path(rel);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(P).parent_path(), ec);
    (void)helpers::files::writeFile(P.c_str(), content, mode);
    ::chmod(P.c_str(), mode);
    return P;
  }

  /// @brief Write an executable /bin/sh script; returns its path.
  std::string script(const std::string& rel, const std::string& body) const {
    return write(rel, "#!/bin/sh\n" + body, 0755);
  }

  /// @brief Create an empty marker file; returns its path.
  std::string touch(const std::string& rel) const { return write(rel, ""); }

  /// @brief Remove a file or directory tree.
  void remove(const std::string& rel) const {
    std::error_code ec;
    std::filesystem::remove_all(path(rel), ec);
  }

  [[nodiscard]] bool exists(const std::string& rel) const {
    return helpers::files::pathExists(path(rel).c_str());
  }

  /// @brief File contents, empty if unreadable.
  [[nodiscard]] std::string read(const std::string& rel) const {
    std::string out;
    (void)helpers::files::readFileToString(path(rel).c_str(), out);
    return out;
  }

  /// @brief Non-empty lines of a file.
  [[nodiscard]] std::vector<std::string> lines(const std::string& rel) const {
    std::vector<std::string> out;
    const std::string TEXT = read(rel);
    std::size_t start = 0;
    while (start < TEXT.size()) {
      std::size_t end = TEXT.find('\n', start);
      if (end == std::string::npos) {
        end = TEXT.size();
      }
      if (end > start) {
        out.push_back(TEXT.substr(start, end - start));
      }
      start = end + 1;
    }
    return out;
  }

private:
  std::string root_{};
};

} // namespace test
} // namespace keeper

#endif // KEEPER_HELPERS_TEMP_TREE_HPP
