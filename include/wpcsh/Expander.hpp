#pragma once

#include "wpcsh/AST.hpp"
#include "wpcsh/Error.hpp"
#include "wpcsh/ShellState.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wpcsh {

// Replace the first word by its alias until no alias applies, a name repeats,
// or ALIAS_EXPANSION_LIMIT substitutions happened. Returns the resulting words
// (replacement words come before any that followed the original first word).
std::vector<std::string> resolveAlias(ShellState const& state, std::string first);

// "~" and "~/..." at the start of text become the home directory.
std::string expandTilde(std::string_view text, ShellState const& state);

// Literal text with $name, ${name} and $? substituted; unknown names stay as written.
std::string expandText(std::string_view text, ShellState const& state);

// One parsed word to its final text. Embedded substitutions are Unsupported.
Result<std::string> expandWord(Word const& word, ShellState const& state);

} // namespace wpcsh
