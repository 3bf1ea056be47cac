#include "wpcsh/Builtins.hpp"
#include "wpcsh/Constants.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <system_error>
#include <fmt/core.h>

namespace wpcsh::builtin {

Result<int> exit(std::span<std::string const> args, BuiltinContext& /*ctx*/) {
  if (args.size() > 2) {
    return invalidInput("exit: too many arguments");
  }
  int code = 0;
  if (args.size() == 2) {
    auto const& s  = args[1];
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), code);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
      fmt::print(stderr, "{}: exit: {}: numeric argument required\n", SHELL_NAME, s);
      code = 2;
    }
  }
  std::fflush(stdout);
  std::exit(code);
}

} // namespace wpcsh::builtin
