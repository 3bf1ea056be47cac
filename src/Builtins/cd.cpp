#include "wpcsh/Builtins.hpp"

#include <filesystem>

namespace wpcsh::builtin {

Result<int> cd(std::span<std::string const> args, BuiltinContext& ctx) {
  if (args.size() > 2) {
    return invalidInput("cd: too many arguments");
  }
  std::filesystem::path target = args.size() == 2 ? std::filesystem::path(args[1]) : ctx.state_.home();
  if (auto changed = ctx.state_.changeDirectory(target); !changed) {
    return std::unexpected(changed.error());
  }
  return 0;
}

} // namespace wpcsh::builtin
