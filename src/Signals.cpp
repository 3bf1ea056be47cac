#include "wpcsh/Signals.hpp"

#include <csignal>

namespace wpcsh {

namespace {

volatile std::sig_atomic_t interrupted = 0; // NOLINT

void onInterrupt(int /*signo*/) {
  interrupted = 1;
}

} // namespace

void setShellSignals() {
  struct sigaction sa{};
  sa.sa_handler = onInterrupt;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);

  sa.sa_handler = SIG_IGN;
  sigaction(SIGQUIT, &sa, nullptr);
}

void setChildSignals() {
  struct sigaction sa{};
  sa.sa_handler = SIG_DFL;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGQUIT, &sa, nullptr);
  sigaction(SIGPIPE, &sa, nullptr);
}

int setSpawnSignals(posix_spawnattr_t& attr) {
  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGINT);
  sigaddset(&defaults, SIGQUIT);
  sigaddset(&defaults, SIGPIPE);
  if (int rc = posix_spawnattr_setsigdefault(&attr, &defaults); rc != 0) {
    return rc;
  }
  return posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);
}

bool interruptPending() noexcept {
  return interrupted != 0;
}

void clearInterrupt() noexcept {
  interrupted = 0;
}

} // namespace wpcsh
