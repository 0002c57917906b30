/**
 * @file Signals.cpp
 * @brief Implementation of synchronous termination-signal handling.
 */

#include "src/orchestrator/inc/Signals.hpp"

#include <pthread.h> // pthread_sigmask
#include <time.h>    // timespec

#include <cerrno>

namespace keeper {

namespace orchestrator {

sigset_t terminationSignalSet() noexcept {
  sigset_t set;
  sigemptyset(&set);
  for (const int SIG : TERMINATION_SIGNALS) {
    sigaddset(&set, SIG);
  }
  return set;
}

bool blockTerminationSignals(sigset_t* previous) noexcept {
  const sigset_t SET = terminationSignalSet();
  return ::pthread_sigmask(SIG_BLOCK, &SET, previous) == 0;
}

void restoreSignalMask(const sigset_t& previous) noexcept {
  (void)::pthread_sigmask(SIG_SETMASK, &previous, nullptr);
}

int takePendingTerminationSignal() noexcept {
  const sigset_t SET = terminationSignalSet();
  const struct timespec ZERO{0, 0};
  for (;;) {
    const int SIG = ::sigtimedwait(&SET, nullptr, &ZERO);
    if (SIG > 0) {
      return SIG;
    }
    if (errno != EINTR) {
      return 0;
    }
  }
}

int waitForTerminationSignal() noexcept {
  const sigset_t SET = terminationSignalSet();
  for (;;) {
    int sig = 0;
    const int RC = ::sigwait(&SET, &sig);
    if (RC == 0) {
      return sig;
    }
    if (RC != EINTR) {
      return -1;
    }
  }
}

const char* signalName(int signo) noexcept {
  switch (signo) {
  case SIGHUP:
    return "SIGHUP";
  case SIGINT:
    return "SIGINT";
  case SIGQUIT:
    return "SIGQUIT";
  case SIGPIPE:
    return "SIGPIPE";
  case SIGTERM:
    return "SIGTERM";
  default:
    return "signal";
  }
}

} // namespace orchestrator

} // namespace keeper
