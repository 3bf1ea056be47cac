#include "wpcsh/Log.hpp"
#include "wpcsh/Constants.hpp"

namespace wpcsh::log {

namespace {

bool verbose_enabled = false; // NOLINT

} // namespace

void setVerbose(bool enabled) noexcept {
  verbose_enabled = enabled;
}

bool verbose() noexcept {
  return verbose_enabled;
}

void reportError(ShellError const& error) {
  std::fflush(stdout);
  trace("{} error, status {}", kindName(error.kind()), error.exitStatus());
  fmt::print(stderr, "{}: {}\n", SHELL_NAME, error.message());
  std::fflush(stderr);
}

} // namespace wpcsh::log
