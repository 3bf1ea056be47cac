#include "wpcsh/ShellState.hpp"
#include "wpcsh/Log.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

#include <pwd.h>
#include <unistd.h>

extern char** environ; // NOLINT

namespace wpcsh {

ShellState::ShellState(std::filesystem::path home, std::filesystem::path cwd, VariableMap variables)
    : home_(std::move(home)), cwd_(std::move(cwd)), variables_(std::move(variables)) {
  variables_.erase("?");
  variables_["HOME"] = home_.string();
  variables_["PWD"]  = cwd_.string();
}

Result<std::filesystem::path> findHomeDirectory() {
  if (char const* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return std::filesystem::path(home);
  }
  if (passwd const* pw = getpwuid(getuid()); pw != nullptr && pw->pw_dir != nullptr && *pw->pw_dir != '\0') {
    return std::filesystem::path(pw->pw_dir);
  }
  return fail(ErrorKind::NOT_FOUND, "could not determine home directory");
}

Result<ShellState> ShellState::fromEnvironment() {
  VariableMap variables;
  for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
    std::string_view entry(*env);
    auto             eq = entry.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }
    variables.emplace(entry.substr(0, eq), entry.substr(eq + 1));
  }

  auto home = findHomeDirectory();
  if (!home) {
    return std::unexpected(home.error());
  }

  std::error_code       ec;
  std::filesystem::path cwd = std::filesystem::current_path(ec);
  if (ec) {
    // Inherited directory vanished: fall back to home
    if (chdir(home->c_str()) != 0) {
      return invalidInput(fmt::format("cd: {}: {}", home->string(), std::strerror(errno)));
    }
    cwd = *home;
  }

  std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  variables["SHELL"]        = ec ? std::string() : exe.string();
  log::trace("startup: home {} cwd {}", home->string(), cwd.string());

  return ShellState(std::move(*home), normalizePath(cwd), std::move(variables));
}

std::filesystem::path normalizePath(std::filesystem::path const& path) {
  auto normal = path.lexically_normal();
  auto text   = normal.string();
  while (text.size() > 1 && text.ends_with('/')) {
    text.pop_back();
  }
  return text.empty() ? std::filesystem::path(".") : std::filesystem::path(text);
}

Result<void> ShellState::changeDirectory(std::filesystem::path const& target) {
  auto resolved = normalizePath(target.is_absolute() ? target : cwd_ / target);

  std::error_code ec;
  if (!std::filesystem::is_directory(resolved, ec)) {
    return invalidInput(fmt::format("cd: {}: not a directory", target.string()));
  }
  if (chdir(resolved.c_str()) != 0) {
    return invalidInput(fmt::format("cd: {}: {}", target.string(), std::strerror(errno)));
  }
  cwd_               = std::move(resolved);
  variables_["PWD"] = cwd_.string();
  return {};
}

std::optional<std::string> ShellState::variable(std::string_view name) const {
  if (name == "?") {
    return std::to_string(last_status_);
  }
  if (auto it = variables_.find(std::string(name)); it != variables_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool ShellState::setVariable(std::string_view name, std::string value) {
  if (name == "?") {
    return false;
  }
  variables_[std::string(name)] = std::move(value);
  return true;
}

void ShellState::unsetVariable(std::string_view name) {
  variables_.erase(std::string(name));
}

std::optional<std::string> ShellState::alias(std::string_view name) const {
  if (auto it = aliases_.find(std::string(name)); it != aliases_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void ShellState::setAlias(std::string name, std::string value) {
  aliases_[std::move(name)] = std::move(value);
}

std::vector<std::string> ShellState::environment() const {
  std::vector<std::string> env;
  env.reserve(variables_.size());
  for (auto const& [name, value] : variables_) {
    env.push_back(fmt::format("{}={}", name, value));
  }
  return env;
}

} // namespace wpcsh
