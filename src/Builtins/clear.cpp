#include "wpcsh/Builtins.hpp"
#include "wpcsh/Constants.hpp"

#include <cstdio>
#include <fmt/core.h>

namespace wpcsh::builtin {

Result<int> clear(std::span<std::string const> /*args*/, BuiltinContext& /*ctx*/) {
  fmt::print("{}", CLEAR_SEQUENCE);
  std::fflush(stdout);
  return 0;
}

} // namespace wpcsh::builtin
