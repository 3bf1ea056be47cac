#pragma once

#include "wpcsh/Error.hpp"
#include "wpcsh/ShellState.hpp"

#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace wpcsh {

// Feeds one line through the shell's execute entry point (used by source).
using LineRunner = std::function<Result<int>(std::string_view)>;

struct BuiltinContext {
  ShellState&       state_;
  LineRunner const& run_line_;
};

namespace builtin {

// args[0] is the builtin name. Success yields the status to record.
Result<int> cd(std::span<std::string const> args, BuiltinContext& ctx);
Result<int> exit(std::span<std::string const> args, BuiltinContext& ctx);
Result<int> exportVariables(std::span<std::string const> args, BuiltinContext& ctx);
Result<int> alias(std::span<std::string const> args, BuiltinContext& ctx);
Result<int> source(std::span<std::string const> args, BuiltinContext& ctx);
Result<int> clear(std::span<std::string const> args, BuiltinContext& ctx);

} // namespace builtin

bool isBuiltin(std::string_view name);

// Runs args[0] as a builtin; callers check isBuiltin first.
Result<int> runBuiltin(std::span<std::string const> args, BuiltinContext& ctx);

} // namespace wpcsh
