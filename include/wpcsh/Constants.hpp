#pragma once

#include <array>
#include <string_view>

namespace wpcsh {

inline constexpr std::string_view SHELL_NAME    = "wpcsh";
inline constexpr std::string_view SHELL_VERSION = "0.1.0";

// Startup and history files, relative to the home directory
inline constexpr std::string_view PROFILE_FILE = ".wpcsh_profile";
inline constexpr std::string_view RC_FILE      = ".wpcshrc";
inline constexpr std::string_view HISTORY_FILE = ".wpcsh_history";

inline constexpr std::string_view PROMPT_VAR = "PROMPT";
// Default prompt is "<cwd> > "
inline constexpr std::string_view DEFAULT_PROMPT_SUFFIX = " > ";

inline constexpr int ALIAS_EXPANSION_LIMIT = 32;

inline constexpr std::array<std::string_view, 6> BUILTINS = {"cd", "exit", "export", "alias", "source", "clear"};

inline constexpr std::string_view CLEAR_SEQUENCE = "\x1B[2J\x1B[1;1H";

} // namespace wpcsh
