#include "wpcsh/Builtins.hpp"
#include "wpcsh/Constants.hpp"
#include "wpcsh/Log.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace wpcsh {

bool isBuiltin(std::string_view name) {
  return std::ranges::find(BUILTINS, name) != BUILTINS.end();
}

Result<int> runBuiltin(std::span<std::string const> args, BuiltinContext& ctx) {
  if (args.empty()) {
    return 0;
  }
  log::trace("builtin {}", args[0]);
  if (args[0] == "cd") {
    return builtin::cd(args, ctx);
  }
  if (args[0] == "exit") {
    return builtin::exit(args, ctx);
  }
  if (args[0] == "export") {
    return builtin::exportVariables(args, ctx);
  }
  if (args[0] == "alias") {
    return builtin::alias(args, ctx);
  }
  if (args[0] == "source") {
    return builtin::source(args, ctx);
  }
  if (args[0] == "clear") {
    return builtin::clear(args, ctx);
  }
  return fail(ErrorKind::NOT_FOUND, fmt::format("{}: not a builtin", args[0]));
}

} // namespace wpcsh
