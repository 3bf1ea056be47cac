#include "wpcsh/Cli.hpp"
#include "wpcsh/Constants.hpp"
#include "wpcsh/LineEditor.hpp"
#include "wpcsh/Log.hpp"
#include "wpcsh/Shell.hpp"
#include "wpcsh/ShellState.hpp"
#include "wpcsh/Signals.hpp"

#include <fmt/core.h>

#include <iostream>
#include <span>
#include <utility>

#include <unistd.h>

int main(int argc, char* argv[]) {
  std::span<char const* const> args{const_cast<char const* const*>(argv), static_cast<size_t>(argc)};
  char const* program = argc > 0 ? argv[0] : "wpcsh";

  auto options = wpcsh::cli::parseArguments(args);
  if (!options) {
    fmt::print(stderr, "{}: {}\n\n{}", wpcsh::SHELL_NAME, options.error().message(), wpcsh::cli::usage(program));
    return 2;
  }
  if (options->help_) {
    fmt::print("{}", wpcsh::cli::usage(program));
    return 0;
  }
  if (options->version_) {
    fmt::print("{} {}\n", wpcsh::SHELL_NAME, wpcsh::SHELL_VERSION);
    return 0;
  }
  wpcsh::log::setVerbose(options->verbose_);

  auto state = wpcsh::ShellState::fromEnvironment();
  if (!state) {
    wpcsh::log::reportError(state.error());
    return state.error().exitStatus();
  }
  wpcsh::Shell shell(std::move(*state));

  if (options->login_) {
    shell.loadConfig(wpcsh::PROFILE_FILE);
  }

  if (options->command_) {
    return shell.runCommand(*options->command_);
  }

  if (isatty(STDIN_FILENO) == 0) {
    return shell.runScript(std::cin);
  }

  wpcsh::setShellSignals();
  shell.loadConfig(wpcsh::RC_FILE);
  wpcsh::ReadlineEditor editor;
  return shell.runInteractive(editor);
}
