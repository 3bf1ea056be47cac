#include "wpcsh/LineEditor.hpp"
#include "wpcsh/Signals.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <readline/history.h>
#include <readline/readline.h>

namespace wpcsh {

namespace {

// Called by readline when a read is interrupted by a signal
int onSignalEvent() {
  if (interruptPending()) {
    rl_done = 1;
  }
  return 0;
}

} // namespace

ReadlineEditor::ReadlineEditor() {
  // Signals stay with the shell's own handlers
  rl_catch_signals     = 0;
  rl_catch_sigwinch    = 1;
  rl_signal_event_hook = onSignalEvent;
  using_history();
}

ReadResult ReadlineEditor::readLine(std::string const& prompt) {
  clearInterrupt();
  std::unique_ptr<char, decltype(&std::free)> line{readline(prompt.c_str()), &std::free};
  if (interruptPending()) {
    clearInterrupt();
    fmt::print("\n");
    std::fflush(stdout);
    return {ReadResult::Kind::INTERRUPTED, {}};
  }
  if (!line) {
    return {ReadResult::Kind::END_OF_INPUT, {}};
  }
  return {ReadResult::Kind::INPUT, line.get()};
}

void ReadlineEditor::addHistory(std::string const& line) {
  add_history(line.c_str());
}

Result<void> ReadlineEditor::loadHistory(std::filesystem::path const& path) {
  if (int rc = read_history(path.c_str()); rc != 0) {
    return fail(ErrorKind::NOT_FOUND, fmt::format("{}: {}", path.string(), std::strerror(rc)));
  }
  return {};
}

Result<void> ReadlineEditor::saveHistory(std::filesystem::path const& path) {
  if (int rc = write_history(path.c_str()); rc != 0) {
    return invalidInput(fmt::format("{}: {}", path.string(), std::strerror(rc)));
  }
  return {};
}

} // namespace wpcsh
