#include "wpcsh/Util.hpp"

#include <algorithm>
#include <ranges>
#include <string_view>

namespace wpcsh {

namespace {

constexpr bool isBlank(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

} // namespace

std::string trim(std::string_view sv) {
  auto begin = std::ranges::find_if_not(sv, isBlank);
  auto end   = std::ranges::find_if_not(sv | std::views::reverse, isBlank).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::vector<std::string> splitWords(std::string_view sv) {
  std::vector<std::string> parts;
  std::string              current;
  bool                     in_single = false;
  bool                     in_double = false;
  bool                     has_word  = false;
  for (size_t i = 0; i < sv.size(); ++i) {
    char c = sv[i];
    if (c == '\\' && !in_single) {
      if (i + 1 < sv.size()) {
        current.push_back(sv[i + 1]);
        ++i;
      }
      has_word = true;
      continue;
    }
    if (c == '\'' && !in_double) {
      in_single = !in_single;
      has_word  = true;
      continue;
    }
    if (c == '"' && !in_single) {
      in_double = !in_double;
      has_word  = true;
      continue;
    }
    if (isBlank(c) && !in_single && !in_double) {
      if (has_word) {
        parts.push_back(std::move(current));
        current.clear();
        has_word = false;
      }
      continue;
    }
    current.push_back(c);
    has_word = true;
  }
  if (has_word) {
    parts.push_back(std::move(current));
  }
  return parts;
}

std::string quoteSingle(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''"; // close ', add \' , reopen '
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

bool isValidName(std::string_view name) noexcept {
  if (name.empty() || !isNameStart(name[0])) {
    return false;
  }
  return std::ranges::all_of(name | std::views::drop(1), isNameChar);
}

bool isAllDigits(std::string_view s) noexcept {
  return !s.empty() && std::ranges::all_of(s, isDigit);
}

} // namespace wpcsh
