/**
 * @file HostInfo.cpp
 * @brief Implementation of running kernel and CPU count queries.
 */

#include "src/system/inc/HostInfo.hpp"
#include "src/helpers/inc/Files.hpp"

#include <sys/utsname.h> // uname
#include <unistd.h>      // sysconf

#include <array>

namespace keeper {

namespace system {

std::string getKernelRelease() noexcept {
  struct utsname uts{};
  if (::uname(&uts) == 0 && uts.release[0] != '\0') {
    return std::string(uts.release);
  }

  std::array<char, KERNEL_RELEASE_SIZE> buf{};
  if (keeper::helpers::files::readFileToBuffer("/proc/sys/kernel/osrelease", buf.data(),
                                               buf.size()) > 0) {
    return std::string(buf.data());
  }
  return {};
}

std::size_t getOnlineCpuCount() noexcept {
  const long N = ::sysconf(_SC_NPROCESSORS_ONLN);
  if (N <= 0) {
    return 1;
  }
  return static_cast<std::size_t>(N);
}

} // namespace system

} // namespace keeper
