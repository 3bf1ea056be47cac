#include "wpcsh/Expander.hpp"
#include "wpcsh/Constants.hpp"
#include "wpcsh/Util.hpp"

#include <fmt/core.h>

#include <iterator>
#include <unordered_set>
#include <utility>
#include <variant>

namespace wpcsh {

namespace {

std::string lookup(ShellState const& state, std::string const& name, bool braced) {
  if (auto value = state.variable(name)) {
    return std::move(*value);
  }
  return braced ? fmt::format("${{{}}}", name) : fmt::format("${}", name);
}

} // namespace

std::vector<std::string> resolveAlias(ShellState const& state, std::string first) {
  std::vector<std::string>        words{std::move(first)};
  std::unordered_set<std::string> seen;
  for (int i = 0; i < ALIAS_EXPANSION_LIMIT && !words.empty(); ++i) {
    auto value = state.alias(words.front());
    if (!value || !seen.insert(words.front()).second) {
      break;
    }
    auto replacement = splitWords(*value);
    words.erase(words.begin());
    words.insert(words.begin(), std::make_move_iterator(replacement.begin()), std::make_move_iterator(replacement.end()));
  }
  return words;
}

std::string expandTilde(std::string_view text, ShellState const& state) {
  if (text == "~") {
    return state.home().string();
  }
  if (text.starts_with("~/")) {
    return state.home().string() + std::string(text.substr(1));
  }
  return std::string(text);
}

std::string expandText(std::string_view segment, ShellState const& state) {
  std::string text = expandTilde(segment, state);
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c != '$' || i + 1 >= text.size()) {
      out.push_back(c);
      continue;
    }
    char n = text[i + 1];
    // $?
    if (n == '?') {
      out += std::to_string(state.lastStatus());
      ++i;
      continue;
    }
    // ${VAR}
    if (n == '{') {
      auto close = text.find('}', i + 2);
      if (close == std::string::npos) {
        out.push_back(c);
        continue;
      }
      out += lookup(state, text.substr(i + 2, close - i - 2), true);
      i = close;
      continue;
    }
    // $VAR
    if (isNameStart(n)) {
      size_t j = i + 1;
      while (j < text.size() && isNameChar(text[j])) {
        ++j;
      }
      out += lookup(state, text.substr(i + 1, j - i - 1), false);
      i = j - 1;
      continue;
    }
    out.push_back(c);
  }
  return out;
}

Result<std::string> expandWord(Word const& word, ShellState const& state) {
  std::string out;
  bool        first = true;
  for (auto const& part : word.parts_) {
    if (auto const* lit = std::get_if<LiteralPart>(&part)) {
      out += first && lit->quoting_ == Quoting::NONE ? expandTilde(lit->text_, state) : lit->text_;
    } else if (auto const* var = std::get_if<VariablePart>(&part)) {
      out += lookup(state, var->name_, var->braced_);
    } else {
      auto const& expansion = std::get<ExpansionPart>(part);
      return fail(ErrorKind::UNSUPPORTED, fmt::format("{} is not supported", nodeName(*expansion.node_)));
    }
    first = false;
  }
  return out;
}

} // namespace wpcsh
