#include "wpcsh/Builtins.hpp"
#include "wpcsh/Util.hpp"

#include <algorithm>
#include <fmt/core.h>

#include <string>
#include <utility>
#include <vector>

namespace wpcsh::builtin {

Result<int> exportVariables(std::span<std::string const> args, BuiltinContext& ctx) {
  auto& state = ctx.state_;

  // No arguments: print every variable as NAME=VALUE, sorted by name
  if (args.size() < 2) {
    std::vector<std::pair<std::string, std::string>> entries(state.variables().begin(), state.variables().end());
    std::ranges::sort(entries);
    for (auto const& [name, value] : entries) {
      fmt::print("{}={}\n", name, value);
    }
    return 0;
  }

  for (auto const& argument : args.subspan(1)) {
    auto        equals_pos = argument.find('=');
    std::string name       = argument.substr(0, equals_pos);
    if (!isValidName(name)) {
      return invalidInput(fmt::format("export: '{}': not a valid identifier", argument));
    }
    if (equals_pos == std::string::npos) {
      // export NAME: make sure it exists, empty when unset
      if (!state.variable(name)) {
        state.setVariable(name, "");
      }
      continue;
    }
    state.setVariable(name, argument.substr(equals_pos + 1));
  }
  return 0;
}

} // namespace wpcsh::builtin
