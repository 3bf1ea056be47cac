#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wpcsh {

std::string trim(std::string_view s);

// Split on blanks, honouring single/double quotes and backslash escapes; quotes are removed.
std::vector<std::string> splitWords(std::string_view text);

// Single-quote a value so it reads back unchanged ('it'\''s').
std::string quoteSingle(std::string_view s);

constexpr bool isDigit(char c) noexcept {
  return c >= '0' && c <= '9';
}

constexpr bool isNameStart(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

constexpr bool isNameChar(char c) noexcept {
  return isNameStart(c) || isDigit(c);
}

// [A-Za-z_][A-Za-z0-9_]*
bool isValidName(std::string_view name) noexcept;
bool isAllDigits(std::string_view s) noexcept;

} // namespace wpcsh
