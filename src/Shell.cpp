#include "wpcsh/Shell.hpp"
#include "wpcsh/Builtins.hpp"
#include "wpcsh/Constants.hpp"
#include "wpcsh/Log.hpp"
#include "wpcsh/Parser.hpp"
#include "wpcsh/Redirection.hpp"
#include "wpcsh/Signals.hpp"
#include "wpcsh/Util.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace wpcsh {

Shell::Shell(ShellState state)
    : state_(std::move(state)), executor_(state_, [this](std::string_view line) { return execute(line); }) {}

Result<int> Shell::execute(std::string_view line) {
  log::trace("line: {}", line);
  auto node = parse(line);
  if (!node) {
    state_.setLastStatus(2);
    return std::unexpected(node.error());
  }
  auto result = executor_.execute(*node);
  // A Ctrl-C aimed at a foreground child is not a pending interrupt for the shell
  clearInterrupt();
  return result;
}

Result<int> Shell::source(std::filesystem::path const& path) {
  std::vector<std::string> args{"source", path.string()};
  LineRunner               runner = [this](std::string_view line) { return execute(line); };
  BuiltinContext           ctx{state_, runner};
  return builtin::source(args, ctx);
}

void Shell::loadConfig(std::string_view file_name) {
  auto            path = state_.home() / file_name;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  log::trace("loading {}", path.string());
  if (auto result = source(path); !result) {
    log::reportError(result.error());
  }
}

Result<std::string> Shell::capture(std::string_view line) {
  std::unique_ptr<FILE, decltype(&std::fclose)> tmp{std::tmpfile(), &std::fclose};
  if (!tmp) {
    return fail(ErrorKind::SPAWN_FAILED, "cannot create temporary file");
  }

  std::vector<RedirectAction> actions(1);
  actions.front().target_fd_ = STDOUT_FILENO;
  actions.front().source_fd_ = fileno(tmp.get());

  int status = state_.lastStatus();
  executor_.setEnvironmentOverrides({
      fmt::format("STARSHIP_SHELL={}", SHELL_NAME),
      fmt::format("STARSHIP_CMD_STATUS={}", status),
  });

  Result<int> result = 0;
  {
    RedirectionGuard guard;
    if (auto applied = guard.apply(actions); !applied) {
      result = std::unexpected(applied.error());
    } else {
      result = execute(line);
    }
  }
  executor_.setEnvironmentOverrides({});
  // Rendering the prompt leaves $? alone
  state_.setLastStatus(status);
  if (!result) {
    return std::unexpected(result.error());
  }

  std::string out;
  std::rewind(tmp.get());
  char   buffer[4096];
  size_t n = 0;
  while ((n = std::fread(buffer, 1, sizeof(buffer), tmp.get())) > 0) {
    out.append(buffer, n);
  }
  return out;
}

std::string Shell::prompt() {
  if (auto command = state_.variable(PROMPT_VAR); command && !trim(*command).empty()) {
    auto text = capture(*command);
    if (text) {
      return std::move(*text);
    }
    log::trace("prompt command failed: {}", text.error().message());
  }
  return fmt::format("{}{}", state_.cwd().string(), DEFAULT_PROMPT_SUFFIX);
}

int Shell::runCommand(std::string_view line) {
  if (auto result = execute(line); !result) {
    log::reportError(result.error());
  }
  return state_.lastStatus();
}

int Shell::runScript(std::istream& input) {
  std::string line;
  while (std::getline(input, line)) {
    if (trim(line).empty()) {
      continue;
    }
    if (auto result = execute(line); !result) {
      log::reportError(result.error());
      return state_.lastStatus();
    }
  }
  return state_.lastStatus();
}

int Shell::runInteractive(LineEditor& editor) {
  auto history = state_.home() / HISTORY_FILE;
  if (auto loaded = editor.loadHistory(history); !loaded) {
    log::trace("history not loaded: {}", loaded.error().message());
  }

  while (true) {
    auto input = editor.readLine(prompt());
    if (input.kind_ == ReadResult::Kind::END_OF_INPUT) {
      break;
    }
    if (input.kind_ == ReadResult::Kind::INTERRUPTED || trim(input.line_).empty()) {
      continue;
    }
    editor.addHistory(input.line_);
    if (auto saved = editor.saveHistory(history); !saved) {
      log::reportError(saved.error());
    }
    if (auto result = execute(input.line_); !result) {
      log::reportError(result.error());
    }
  }
  return state_.lastStatus();
}

} // namespace wpcsh
