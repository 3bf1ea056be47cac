#pragma once

#include "wpcsh/AST.hpp"
#include "wpcsh/Builtins.hpp"
#include "wpcsh/Error.hpp"
#include "wpcsh/Redirection.hpp"
#include "wpcsh/ShellState.hpp"

#include <span>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace wpcsh {

// A command with every word expanded and its redirect files open.
struct PreparedCommand {
  std::vector<std::string>                         argv_;
  std::vector<std::pair<std::string, std::string>> assignments_;
  std::vector<RedirectAction>                      redirects_;
  bool                                             builtin_ = false;
};

// Walks one parsed line against the shell state. Every executed node records
// its status (or its error's status) as $?.
class Executor {
  ShellState&              state_;
  LineRunner               run_line_;
  std::vector<std::string> env_overrides_;

public:
  Executor(ShellState& state, LineRunner run_line);

  Result<int> execute(Node const& node);

  // NAME=VALUE entries added to every spawned environment until replaced.
  void setEnvironmentOverrides(std::vector<std::string> overrides) {
    env_overrides_ = std::move(overrides);
  }

private:
  Result<int> runList(ListNode const& list);
  Result<int> runPipeline(std::span<Node const> stages);
  Result<int> runCommand(CommandNode const& command);
  Result<int> runExport(ExportNode const& node);
  Result<int> runAssignment(AssignmentNode const& node);

  Result<PreparedCommand> prepare(CommandNode const& command);
  Result<pid_t>           spawnExternal(PreparedCommand& command, int stdin_fd, int stdout_fd);
  Result<pid_t>           forkBuiltin(PreparedCommand& command, int stdin_fd, int stdout_fd, int unused_fd);
  static Result<int>      waitFor(pid_t pid);
};

// Names containing '/' are used as given; others are searched in the PATH variable.
Result<std::string> findProgram(std::string const& name, ShellState const& state);

} // namespace wpcsh
