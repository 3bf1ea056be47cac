#include "wpcsh/Builtins.hpp"
#include "wpcsh/Util.hpp"

#include <algorithm>
#include <fmt/core.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wpcsh::builtin {

namespace {

void printOne(std::string const& name, std::string const& value) {
  fmt::print("alias {}={}\n", name, quoteSingle(value));
}

} // namespace

Result<int> alias(std::span<std::string const> args, BuiltinContext& ctx) {
  auto& state = ctx.state_;

  if (args.size() == 1) {
    std::vector<std::pair<std::string, std::string>> entries(state.aliases().begin(), state.aliases().end());
    std::ranges::sort(entries);
    for (auto const& [name, value] : entries) {
      printOne(name, value);
    }
    return 0;
  }

  // Keep going after a bad operand; the first failure is reported
  std::optional<ShellError> first_error;
  for (auto const& argument : args.subspan(1)) {
    auto equal_pos = argument.find('=');
    if (equal_pos == std::string::npos) {
      if (auto value = state.alias(argument)) {
        printOne(argument, *value);
      } else if (!first_error) {
        first_error = ShellError{ErrorKind::INVALID_INPUT, fmt::format("alias: {}: not found", argument)};
      }
      continue;
    }
    std::string name = argument.substr(0, equal_pos);
    if (name.empty()) {
      if (!first_error) {
        first_error = ShellError{ErrorKind::INVALID_INPUT, "alias: invalid name"};
      }
      continue;
    }
    state.setAlias(std::move(name), argument.substr(equal_pos + 1));
  }
  if (first_error) {
    return std::unexpected(*first_error);
  }
  return 0;
}

} // namespace wpcsh::builtin
