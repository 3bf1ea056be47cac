#pragma once

#include "wpcsh/Error.hpp"
#include "wpcsh/Tokens.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wpcsh {

// Cursor over one input line. The lexer never resolves variables or aliases.
class Lexer {
  std::string_view src_;
  size_t           pos_ = 0;

public:
  explicit Lexer(std::string_view src);

  // Returns the next token and advances; past end-of-input yields EndToken forever.
  Result<Token> nextToken();

  // All tokens up to and including the EndToken.
  Result<std::vector<Token>> lex();

  [[nodiscard]] bool atEnd() const noexcept {
    return pos_ >= src_.size();
  }

private:
  bool        match(char const* literal);
  bool        skipBlanks();
  static bool isWordBreak(char c);

  Token         lexWord(size_t start, bool glued);
  Result<Token> lexSingleQuoted(size_t start, bool glued);
  Result<Token> lexDoubleQuoted(size_t start, bool glued);
  Result<Token> lexDollar(size_t start, bool glued, bool in_quotes);
  Result<Token> lexQuotedSubstitution(size_t start, bool glued);
  Result<Token> lexBackquote(size_t start, bool glued);
};

} // namespace wpcsh
