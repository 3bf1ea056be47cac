#include "wpcsh/Builtins.hpp"
#include "wpcsh/Log.hpp"
#include "wpcsh/Util.hpp"

#include <fmt/core.h>

#include <fstream>
#include <string>

namespace wpcsh::builtin {

Result<int> source(std::span<std::string const> args, BuiltinContext& ctx) {
  if (args.size() != 2) {
    return invalidInput("source: usage: source FILE");
  }
  std::ifstream file(args[1]);
  if (!file) {
    return invalidInput(fmt::format("source: {}: cannot open file", args[1]));
  }
  log::trace("source {}", args[1]);

  int         status = 0;
  std::string line;
  while (std::getline(file, line)) {
    auto text = trim(line);
    if (text.empty() || text.starts_with('#')) {
      continue;
    }
    auto result = ctx.run_line_(text);
    if (!result) {
      return std::unexpected(result.error());
    }
    status = *result;
  }
  return status;
}

} // namespace wpcsh::builtin
