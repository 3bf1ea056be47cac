#pragma once

#include "wpcsh/Error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wpcsh {

using VariableMap = std::unordered_map<std::string, std::string>;
using AliasMap    = std::unordered_map<std::string, std::string>;

// Mutable context shared by every component. cwd_ always mirrors the
// process working directory; "?" is never stored in variables_.
class ShellState {
  std::filesystem::path home_;
  std::filesystem::path cwd_;
  VariableMap           variables_;
  AliasMap              aliases_;
  int                   last_status_ = 0;

public:
  // Does not touch the process working directory; cwd must already be it.
  ShellState(std::filesystem::path home, std::filesystem::path cwd, VariableMap variables = {});

  // Seed from environ, resolve the home directory, set PWD/HOME/SHELL.
  static Result<ShellState> fromEnvironment();

  [[nodiscard]] std::filesystem::path const& home() const noexcept {
    return home_;
  }

  [[nodiscard]] std::filesystem::path const& cwd() const noexcept {
    return cwd_;
  }

  [[nodiscard]] int lastStatus() const noexcept {
    return last_status_;
  }

  void setLastStatus(int status) noexcept {
    last_status_ = status;
  }

  // chdir(2) and the recorded directory change together or not at all.
  Result<void> changeDirectory(std::filesystem::path const& target);

  // "?" yields the last status.
  [[nodiscard]] std::optional<std::string> variable(std::string_view name) const;
  // Returns false for the reserved name "?".
  bool setVariable(std::string_view name, std::string value);
  void unsetVariable(std::string_view name);

  [[nodiscard]] VariableMap const& variables() const noexcept {
    return variables_;
  }

  [[nodiscard]] std::optional<std::string> alias(std::string_view name) const;
  void                                     setAlias(std::string name, std::string value);

  [[nodiscard]] AliasMap const& aliases() const noexcept {
    return aliases_;
  }

  // NAME=VALUE strings for a spawned process.
  [[nodiscard]] std::vector<std::string> environment() const;
};

// Lexical "."/".." removal with no filesystem access; no trailing slash except for "/".
std::filesystem::path normalizePath(std::filesystem::path const& path);

Result<std::filesystem::path> findHomeDirectory();

} // namespace wpcsh
