#pragma once

#include "wpcsh/Error.hpp"
#include "wpcsh/Executor.hpp"
#include "wpcsh/LineEditor.hpp"
#include "wpcsh/ShellState.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace wpcsh {

// Owns the state and the executor bound to it; the execute entry point every
// other front end (source, -c, scripts, the interactive loop) goes through.
class Shell {
  ShellState state_;
  Executor   executor_;

public:
  explicit Shell(ShellState state);

  Shell(Shell const&)            = delete;
  Shell& operator=(Shell const&) = delete;
  Shell(Shell&&)                 = delete;
  Shell& operator=(Shell&&)      = delete;

  [[nodiscard]] ShellState& state() noexcept {
    return state_;
  }

  [[nodiscard]] ShellState const& state() const noexcept {
    return state_;
  }

  // Parse and run one line. A parse failure records status 2. Errors are
  // returned unreported.
  Result<int> execute(std::string_view line);

  Result<int> source(std::filesystem::path const& path);

  // Source <home>/<file_name> when it exists; failures are reported, not returned.
  void loadConfig(std::string_view file_name);

  // Run a line with standard output going to a temporary file and return that output.
  Result<std::string> capture(std::string_view line);

  // Output of the PROMPT command line, or "<cwd> > ".
  std::string prompt();

  // -c COMMAND
  int runCommand(std::string_view line);
  // Stops at the first error and exits with the failing command's status.
  int runScript(std::istream& input);
  int runInteractive(LineEditor& editor);
};

} // namespace wpcsh
