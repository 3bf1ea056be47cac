#pragma once

#include "wpcsh/Error.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <utility>

namespace wpcsh::log {

void setVerbose(bool enabled) noexcept;
bool verbose() noexcept;

// "wpcsh: trace: ..." on stderr when running with --verbose
template<typename... Args>
void trace(fmt::format_string<Args...> format, Args&&... args) {
  if (!verbose()) {
    return;
  }
  fmt::print(stderr, "wpcsh: trace: {}\n", fmt::format(format, std::forward<Args>(args)...));
}

// "wpcsh: <message>" on stderr
void reportError(ShellError const& error);

} // namespace wpcsh::log
