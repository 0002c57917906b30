/**
 * @file Command.cpp
 * @brief Implementation of external program invocation.
 */

#include "src/system/inc/Command.hpp"

#include <fcntl.h>    // open, O_WRONLY, O_CLOEXEC
#include <signal.h>   // sigprocmask, sigaction
#include <sys/stat.h> // stat
#include <sys/wait.h> // waitpid, WIFEXITED
#include <unistd.h>   // fork, execvp, pipe2, dup2, _exit, access

#include <array>
#include <cerrno>
#include <cstdlib> // getenv

#include <fmt/core.h>

namespace keeper {

namespace system {

namespace {

/// Signals whose dispositions are reset in the child.
constexpr std::array<int, 5> RESET_SIGNALS = {SIGHUP, SIGINT, SIGQUIT, SIGPIPE, SIGTERM};

/// Child side after fork. Only async-signal-safe calls.
[[noreturn]] void execChild(char* const* argv, const char* workDir, int outFd,
                            bool discard) noexcept {
  sigset_t empty;
  ::sigemptyset(&empty);
  ::sigprocmask(SIG_SETMASK, &empty, nullptr);

  struct sigaction dfl{};
  dfl.sa_handler = SIG_DFL;
  ::sigemptyset(&dfl.sa_mask);
  for (const int SIG : RESET_SIGNALS) {
    ::sigaction(SIG, &dfl, nullptr);
  }

  if (outFd >= 0) {
    ::dup2(outFd, STDOUT_FILENO);
    ::close(outFd);
  } else if (discard) {
    const int NUL = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (NUL >= 0) {
      ::dup2(NUL, STDOUT_FILENO);
      ::close(NUL);
    }
  }

  if (workDir != nullptr && ::chdir(workDir) != 0) {
    ::_exit(EXIT_EXEC_FAILED);
  }

  ::execvp(argv[0], argv);
  ::_exit(EXIT_EXEC_FAILED);
}

/// Wait for a child, retrying on EINTR.
int waitChild(pid_t pid) noexcept {
  int status = 0;
  for (;;) {
    const pid_t RC = ::waitpid(pid, &status, 0);
    if (RC == pid) {
      break;
    }
    if (RC < 0 && errno != EINTR) {
      return -1;
    }
  }

  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return EXIT_SIGNAL_BASE + WTERMSIG(status);
  }
  return -1;
}

bool isExecutableFile(const std::string& path) noexcept {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
         ::access(path.c_str(), X_OK) == 0;
}

} // namespace

/* ----------------------------- CommandResult Methods ----------------------------- */

std::string CommandResult::toString() const {
  if (!started) {
    return "not started";
  }
  if (exitCode >= EXIT_SIGNAL_BASE) {
    return fmt::format("killed by signal {}", exitCode - EXIT_SIGNAL_BASE);
  }
  return fmt::format("exit {}", exitCode);
}

/* ----------------------------- API ----------------------------- */

std::string formatCommand(const std::vector<std::string>& argv) {
  std::string out;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    if (argv[i].empty() || argv[i].find_first_of(" \t'\"") != std::string::npos) {
      out += fmt::format("'{}'", argv[i]);
    } else {
      out += argv[i];
    }
  }
  return out;
}

std::string findExecutable(const std::string& program) {
  if (program.empty()) {
    return {};
  }
  if (program.find('/') != std::string::npos) {
    return isExecutableFile(program) ? program : std::string{};
  }

  const char* path = std::getenv("PATH");
  std::string dirs = (path != nullptr) ? path : "/usr/local/bin:/usr/bin:/bin:/usr/sbin:/sbin";
  std::size_t start = 0;
  while (start <= dirs.size()) {
    std::size_t end = dirs.find(':', start);
    if (end == std::string::npos) {
      end = dirs.size();
    }
    std::string dir = dirs.substr(start, end - start);
    if (dir.empty()) {
      dir = ".";
    }
    const std::string CANDIDATE = dir + "/" + program;
    if (isExecutableFile(CANDIDATE)) {
      return CANDIDATE;
    }
    start = end + 1;
  }
  return {};
}

CommandResult runCommand(const std::vector<std::string>& argv, const RunOptions& opts) noexcept {
  CommandResult result{};
  if (argv.empty() || argv[0].empty()) {
    return result;
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& ARG : argv) {
    cargv.push_back(const_cast<char*>(ARG.c_str()));
  }
  cargv.push_back(nullptr);

  std::array<int, 2> pipeFds = {-1, -1};
  if (opts.captureOutput && ::pipe2(pipeFds.data(), O_CLOEXEC) != 0) {
    return result;
  }

  const char* workDir = opts.workDir.empty() ? nullptr : opts.workDir.c_str();

  const pid_t PID = ::fork();
  if (PID < 0) {
    if (opts.captureOutput) {
      ::close(pipeFds[0]);
      ::close(pipeFds[1]);
    }
    return result;
  }

  if (PID == 0) {
    if (opts.captureOutput) {
      ::close(pipeFds[0]);
    }
    execChild(cargv.data(), workDir, pipeFds[1], opts.discardOutput);
  }

  result.started = true;

  if (opts.captureOutput) {
    ::close(pipeFds[1]);
    std::array<char, 4096> chunk{};
    for (;;) {
      const ssize_t N = ::read(pipeFds[0], chunk.data(), chunk.size());
      if (N > 0) {
        result.output.append(chunk.data(), static_cast<std::size_t>(N));
        continue;
      }
      if (N < 0 && errno == EINTR) {
        continue;
      }
      break;
    }
    ::close(pipeFds[0]);
  }

  result.exitCode = waitChild(PID);
  return result;
}

} // namespace system

} // namespace keeper
