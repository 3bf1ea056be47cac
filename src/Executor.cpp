#include "wpcsh/Executor.hpp"
#include "wpcsh/Expander.hpp"
#include "wpcsh/FileDescriptor.hpp"
#include "wpcsh/Log.hpp"
#include "wpcsh/Signals.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::vector<char*> toArgv(std::span<std::string> args) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return argv;
}

bool isExecutable(std::string const& path) {
  struct stat st{};
  if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return false;
  }
  return access(path.c_str(), X_OK) == 0;
}

// Replace NAME=... in env, or append it
void setEntry(std::vector<std::string>& env, std::string entry) {
  auto name = entry.substr(0, entry.find('=') + 1);
  for (auto& existing : env) {
    if (existing.starts_with(name)) {
      existing = std::move(entry);
      return;
    }
  }
  env.push_back(std::move(entry));
}

} // namespace

namespace wpcsh {

Result<std::string> findProgram(std::string const& name, ShellState const& state) {
  if (name.find('/') != std::string::npos) {
    return name;
  }
  auto paths = state.variable("PATH").value_or("");
  size_t start = 0;
  while (start <= paths.size()) {
    auto colon = paths.find(':', start);
    if (colon == std::string::npos) {
      colon = paths.size();
    }
    auto dir = paths.substr(start, colon - start);
    if (!dir.empty()) {
      auto full = fmt::format("{}/{}", dir, name);
      if (isExecutable(full)) {
        return full;
      }
    }
    start = colon + 1;
  }
  return fail(ErrorKind::NOT_FOUND, fmt::format("{}: command not found", name));
}

Executor::Executor(ShellState& state, LineRunner run_line)
    : state_(state), run_line_(std::move(run_line)) {}

Result<int> Executor::execute(Node const& node) {
  auto result = std::visit(
      [this, &node](auto const& n) -> Result<int> {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ListNode>) {
          return runList(n);
        } else if constexpr (std::is_same_v<T, PipelineNode>) {
          return runPipeline(n.commands_);
        } else if constexpr (std::is_same_v<T, CommandNode>) {
          return runCommand(n);
        } else if constexpr (std::is_same_v<T, ExportNode>) {
          return runExport(n);
        } else if constexpr (std::is_same_v<T, AssignmentNode>) {
          return runAssignment(n);
        } else if constexpr (std::is_same_v<T, CommentNode>) {
          return state_.lastStatus();
        } else {
          return fail(ErrorKind::UNSUPPORTED, fmt::format("{} is not supported", nodeName(node)));
        }
      },
      node.kind_
  );
  state_.setLastStatus(result ? *result : result.error().exitStatus());
  return result;
}

Result<int> Executor::runList(ListNode const& list) {
  for (auto op : list.operators_) {
    if (op == ListOp::BACKGROUND) {
      return fail(ErrorKind::UNSUPPORTED, "background jobs are not supported");
    }
  }

  int status = state_.lastStatus();
  for (size_t i = 0; i < list.statements_.size(); ++i) {
    if (i > 0) {
      auto op = list.operators_[i - 1];
      if ((op == ListOp::AND && status != 0) || (op == ListOp::OR && status == 0)) {
        continue;
      }
    }
    auto result = execute(list.statements_[i]);
    if (!result) {
      return result;
    }
    status = *result;
  }
  return status;
}

Result<int> Executor::runExport(ExportNode const& node) {
  if (!node.value_) {
    if (!state_.variable(node.name_)) {
      state_.setVariable(node.name_, "");
    }
    return 0;
  }
  std::string value;
  if (auto const* quoted = node.value_->getIf<SingleQuotedStringNode>()) {
    value = quoted->text_;
  } else if (auto const* literal = node.value_->getIf<StringLiteralNode>()) {
    auto expanded = expandWord(literal->value_, state_);
    if (!expanded) {
      return std::unexpected(expanded.error());
    }
    value = std::move(*expanded);
  }
  if (!state_.setVariable(node.name_, std::move(value))) {
    return invalidInput(fmt::format("export: '{}': not a valid identifier", node.name_));
  }
  return 0;
}

Result<int> Executor::runAssignment(AssignmentNode const& node) {
  for (auto const& assignment : node.assignments_) {
    auto value = expandWord(assignment.value_, state_);
    if (!value) {
      return std::unexpected(value.error());
    }
    state_.setVariable(assignment.name_, std::move(*value));
  }
  return 0;
}

Result<PreparedCommand> Executor::prepare(CommandNode const& command) {
  PreparedCommand prepared;
  for (auto const& assignment : command.assignments_) {
    auto value = expandWord(assignment.value_, state_);
    if (!value) {
      return std::unexpected(value.error());
    }
    prepared.assignments_.emplace_back(assignment.name_, std::move(*value));
  }

  if (!command.name_.parts_.empty()) {
    auto name = expandWord(command.name_, state_);
    if (!name) {
      return std::unexpected(name.error());
    }
    // Aliases apply to an unquoted literal first word only
    auto literal = command.name_.literal();
    if (literal && command.name_.isBare(*literal)) {
      auto words = resolveAlias(state_, *literal);
      if (words.size() != 1 || words.front() != *literal) {
        log::trace("alias {} -> {}", *literal, fmt::join(words, " "));
        for (auto const& word : words) {
          prepared.argv_.push_back(expandText(word, state_));
        }
      } else {
        prepared.argv_.push_back(std::move(*name));
      }
    } else {
      prepared.argv_.push_back(std::move(*name));
    }
  }

  for (auto const& arg : command.args_) {
    auto value = expandWord(arg, state_);
    if (!value) {
      return std::unexpected(value.error());
    }
    prepared.argv_.push_back(std::move(*value));
  }

  for (auto const& redirect : command.redirects_) {
    auto target = expandWord(redirect.target_, state_);
    if (!target) {
      return std::unexpected(target.error());
    }
    auto action = openRedirect(redirect.kind_, *target, redirect.io_number_);
    if (!action) {
      return std::unexpected(action.error());
    }
    prepared.redirects_.push_back(std::move(*action));
  }

  prepared.builtin_ = !prepared.argv_.empty() && isBuiltin(prepared.argv_.front());
  return prepared;
}

Result<int> Executor::runCommand(CommandNode const& command) {
  auto prepared = prepare(command);
  if (!prepared) {
    return std::unexpected(prepared.error());
  }

  // Redirect-only command: the files are already opened; assignments stick
  if (prepared->argv_.empty()) {
    for (auto& [name, value] : prepared->assignments_) {
      state_.setVariable(name, std::move(value));
    }
    return 0;
  }

  log::trace("command: {}", fmt::join(prepared->argv_, " "));

  if (prepared->builtin_) {
    RedirectionGuard guard;
    if (auto applied = guard.apply(prepared->redirects_); !applied) {
      return std::unexpected(applied.error());
    }
    // Prefix assignments hold for the builtin only, then the old values return
    std::vector<std::pair<std::string, std::optional<std::string>>> saved;
    for (auto& [name, value] : prepared->assignments_) {
      saved.emplace_back(name, state_.variable(name));
      state_.setVariable(name, std::move(value));
    }
    BuiltinContext ctx{state_, run_line_};
    auto           result = runBuiltin(prepared->argv_, ctx);
    for (auto it = saved.rbegin(); it != saved.rend(); ++it) {
      if (it->second) {
        state_.setVariable(it->first, std::move(*it->second));
      } else {
        state_.unsetVariable(it->first);
      }
    }
    return result;
  }

  auto pid = spawnExternal(*prepared, -1, -1);
  if (!pid) {
    return std::unexpected(pid.error());
  }
  return waitFor(*pid);
}

Result<int> Executor::runPipeline(std::span<Node const> stages) {
  if (stages.size() == 1) {
    return execute(stages.front());
  }

  std::vector<PreparedCommand> prepared;
  prepared.reserve(stages.size());
  for (auto const& stage : stages) {
    auto const* command = stage.getIf<CommandNode>();
    if (command == nullptr) {
      return fail(ErrorKind::UNSUPPORTED, fmt::format("{} in a pipeline is not supported", nodeName(stage)));
    }
    auto stage_command = prepare(*command);
    if (!stage_command) {
      return std::unexpected(stage_command.error());
    }
    prepared.push_back(std::move(*stage_command));
  }
  log::trace("pipeline of {} stages", prepared.size());

  size_t n = prepared.size();

  // Spawn every stage before waiting on any of them
  std::vector<std::optional<pid_t>> pids;
  pids.reserve(n);
  std::optional<ShellError> spawn_error;
  FileDescriptor            prev_read_fd;

  for (size_t i = 0; i < n; ++i) {
    Pipe pipe;
    if (i < n - 1) {
      auto created = makePipe();
      if (!created) {
        spawn_error = created.error();
        break;
      }
      pipe = std::move(*created);
    }

    auto& stage = prepared[i];
    int   in    = prev_read_fd.valid() ? prev_read_fd.get() : -1;
    int   out   = pipe.write_end_.valid() ? pipe.write_end_.get() : -1;
    int   next  = pipe.read_end_.valid() ? pipe.read_end_.get() : -1;

    auto pid = stage.argv_.empty() ? Result<pid_t>(fail(ErrorKind::INVALID_INPUT, "empty command in pipeline"))
             : stage.builtin_      ? forkBuiltin(stage, in, out, next)
                                   : spawnExternal(stage, in, out);
    if (pid) {
      pids.emplace_back(*pid);
    } else {
      pids.emplace_back(std::nullopt);
      if (!spawn_error) {
        spawn_error = pid.error();
      }
    }

    // Our copies of the pipe ends close here so readers see EOF
    prev_read_fd = std::move(pipe.read_end_);
  }
  prev_read_fd.reset();

  int status = 0;
  for (auto const& pid : pids) {
    if (!pid) {
      continue;
    }
    auto waited = waitFor(*pid);
    if (!waited) {
      return waited;
    }
    status = *waited;
  }

  if (spawn_error) {
    return std::unexpected(*spawn_error);
  }
  return status;
}

Result<pid_t> Executor::spawnExternal(PreparedCommand& command, int stdin_fd, int stdout_fd) {
  auto program = findProgram(command.argv_.front(), state_);
  if (!program) {
    return std::unexpected(program.error());
  }

  auto env = state_.environment();
  for (auto const& entry : env_overrides_) {
    setEntry(env, entry);
  }
  for (auto const& [name, value] : command.assignments_) {
    setEntry(env, fmt::format("{}={}", name, value));
  }
  auto argv = toArgv(command.argv_);
  auto envp = toArgv(env);

  posix_spawn_file_actions_t file_actions;
  posix_spawnattr_t          attr;

  if (int rc = posix_spawn_file_actions_init(&file_actions); rc != 0) {
    return fail(ErrorKind::SPAWN_FAILED, fmt::format("failed to initialize file actions: {}", std::strerror(rc)));
  }
  if (int rc = posix_spawnattr_init(&attr); rc != 0) {
    posix_spawn_file_actions_destroy(&file_actions);
    return fail(ErrorKind::SPAWN_FAILED, fmt::format("failed to initialize spawn attributes: {}", std::strerror(rc)));
  }

  auto cleanup = [&]() {
    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attr);
  };

  int rc = setSpawnSignals(attr);
  if (rc == 0 && stdin_fd >= 0) {
    rc = posix_spawn_file_actions_adddup2(&file_actions, stdin_fd, STDIN_FILENO);
  }
  if (rc == 0 && stdout_fd >= 0) {
    rc = posix_spawn_file_actions_adddup2(&file_actions, stdout_fd, STDOUT_FILENO);
  }
  if (rc == 0) {
    rc = addFileActions(file_actions, command.redirects_);
  }
  if (rc != 0) {
    cleanup();
    return fail(ErrorKind::SPAWN_FAILED, fmt::format("{}: failed to set up redirections: {}", command.argv_.front(), std::strerror(rc)));
  }

  std::fflush(stdout);
  pid_t pid = -1;
  rc        = posix_spawn(&pid, program->c_str(), &file_actions, &attr, argv.data(), envp.data());
  cleanup();

  if (rc != 0) {
    auto kind = rc == ENOENT ? ErrorKind::NOT_FOUND : ErrorKind::SPAWN_FAILED;
    return fail(kind, fmt::format("{}: {}", command.argv_.front(), std::strerror(rc)));
  }
  log::trace("spawned {} as pid {}", *program, pid);
  return pid;
}

Result<pid_t> Executor::forkBuiltin(PreparedCommand& command, int stdin_fd, int stdout_fd, int unused_fd) {
  std::fflush(stdout);
  std::fflush(stderr);
  pid_t pid = fork();
  if (pid < 0) {
    return fail(ErrorKind::SPAWN_FAILED, fmt::format("fork: {}", std::strerror(errno)));
  }
  if (pid > 0) {
    log::trace("forked builtin {} as pid {}", command.argv_.front(), pid);
    return pid;
  }

  // Child: state changes made here are not seen by the shell
  setChildSignals();
  if (stdin_fd >= 0 && dup2(stdin_fd, STDIN_FILENO) < 0) {
    fmt::print(stderr, "dup2 stdin: {}\n", std::strerror(errno));
    _exit(1);
  }
  if (stdout_fd >= 0 && dup2(stdout_fd, STDOUT_FILENO) < 0) {
    fmt::print(stderr, "dup2 stdout: {}\n", std::strerror(errno));
    _exit(1);
  }
  // The pipe ends survive fork; a reader only sees EOF once every copy is gone
  for (int fd : {stdin_fd, stdout_fd, unused_fd}) {
    if (fd > STDERR_FILENO) {
      close(fd);
    }
  }

  for (auto& [name, value] : command.assignments_) {
    state_.setVariable(name, std::move(value));
  }

  RedirectionGuard guard;
  if (auto applied = guard.apply(command.redirects_); !applied) {
    log::reportError(applied.error());
    _exit(applied.error().exitStatus());
  }
  BuiltinContext ctx{state_, run_line_};
  auto           result = runBuiltin(command.argv_, ctx);
  int            code   = result ? *result : result.error().exitStatus();
  if (!result) {
    log::reportError(result.error());
  }
  std::fflush(stdout);
  std::fflush(stderr);
  _exit(code);
}

Result<int> Executor::waitFor(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno == EINTR) {
      continue;
    }
    return fail(ErrorKind::SPAWN_FAILED, fmt::format("waitpid: {}", std::strerror(errno)));
  }
  int code = 1;
  if (WIFEXITED(status)) {
    code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    code = 128 + WTERMSIG(status);
  }
  log::trace("pid {} finished with status {}", pid, code);
  return code;
}

} // namespace wpcsh
