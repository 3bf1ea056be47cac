#pragma once

#include "wpcsh/Error.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace wpcsh::cli {

struct Options {
  std::optional<std::string> command_;
  bool                       login_   = false;
  bool                       verbose_ = false;
  bool                       help_    = false;
  bool                       version_ = false;
};

// args[0] is the program name; a leading '-' there marks a login shell.
Result<Options> parseArguments(std::span<char const* const> args);

std::string usage(std::string_view program);

} // namespace wpcsh::cli
