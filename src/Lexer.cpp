#include "wpcsh/Lexer.hpp"
#include "wpcsh/Util.hpp"

#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace wpcsh {

Lexer::Lexer(std::string_view src)
    : src_(src) {}

Result<std::vector<Token>> Lexer::lex() {
  std::vector<Token> out;
  while (true) {
    auto token = nextToken();
    if (!token) {
      return std::unexpected(token.error());
    }
    bool end = token->is<EndToken>();
    out.push_back(std::move(*token));
    if (end) {
      break;
    }
  }
  return out;
}

Result<Token> Lexer::nextToken() {
  bool   glued = !skipBlanks() && pos_ > 0;
  size_t pos   = pos_;
  if (pos_ >= src_.size()) {
    return Token{Token::Kind{EndToken{}}, pos, glued};
  }

  auto make = [pos, glued](Token::Kind kind) { return Token{std::move(kind), pos, glued}; };

  char c = src_[pos_];
  if (c == '\n') {
    ++pos_;
    return make(NewlineToken{});
  }

  // Two- and three-character operators before their one-character prefixes
  if (match("&&")) {
    return make(AndIfToken{});
  }
  if (match("||")) {
    return make(OrIfToken{});
  }
  if (match("<<<")) {
    return make(TLessToken{});
  }
  if (match("<<-")) {
    return make(DLessDashToken{});
  }
  if (match("<<")) {
    return make(DLessToken{});
  }
  if (match("<>")) {
    return make(LessGreatToken{});
  }
  if (match("<&")) {
    return make(LessAndToken{});
  }
  if (match(">>")) {
    return make(DGreatToken{});
  }
  if (match(">&")) {
    return make(GreatAndToken{});
  }

  switch (c) {
    case ';': ++pos_; return make(SemiToken{});
    case '&': ++pos_; return make(AmpToken{});
    case '|': ++pos_; return make(PipeToken{});
    case '(': ++pos_; return make(LParenToken{});
    case ')': ++pos_; return make(RParenToken{});
    case '{': ++pos_; return make(LBraceToken{});
    case '}': ++pos_; return make(RBraceToken{});
    case '<': ++pos_; return make(LessToken{});
    case '>': ++pos_; return make(GreatToken{});
    case '\'': return lexSingleQuoted(pos, glued);
    case '"': return lexDoubleQuoted(pos, glued);
    case '$': return lexDollar(pos, glued, false);
    case '`': return lexBackquote(pos, glued);
    default: break;
  }

  // Comment: '#' opening a word swallows the rest of the line as one word
  if (c == '#' && (pos_ == 0 || std::string_view{" \t\r\n;&|()<>{}"}.contains(src_[pos_ - 1]))) {
    auto end = src_.find('\n', pos_);
    if (end == std::string_view::npos) {
      end = src_.size();
    }
    std::string text(src_.substr(pos_, end - pos_));
    pos_ = end;
    return make(WordToken{std::move(text)});
  }

  return lexWord(pos, glued);
}

bool Lexer::match(char const* literal) {
  size_t n = std::strlen(literal);
  if (src_.compare(pos_, n, literal) == 0) {
    pos_ += n;
    return true;
  }
  return false;
}

bool Lexer::skipBlanks() {
  size_t begin = pos_;
  while (pos_ < src_.size()) {
    char c = src_[pos_];
    if (c == ' ' || c == '\t' || c == '\r') {
      ++pos_;
      continue;
    }
    // Backslash-newline joins lines
    if (c == '\\' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
      pos_ += 2;
      continue;
    }
    break;
  }
  return pos_ != begin;
}

bool Lexer::isWordBreak(char c) {
  return std::string_view{" \t\r\n|&;<>(){}\"'$`"}.contains(c);
}

Token Lexer::lexWord(size_t start, bool glued) {
  std::string out;
  while (pos_ < src_.size()) {
    char c = src_[pos_];
    if (c == '\\') {
      if (pos_ + 1 < src_.size()) {
        if (src_[pos_ + 1] != '\n') {
          out.push_back(src_[pos_ + 1]);
        }
        pos_ += 2;
      } else {
        // Trailing backslash stays literal
        out.push_back(c);
        ++pos_;
      }
      continue;
    }
    if (isWordBreak(c)) {
      break;
    }
    out.push_back(c);
    ++pos_;
  }
  return Token{Token::Kind{WordToken{std::move(out)}}, start, glued};
}

Result<Token> Lexer::lexSingleQuoted(size_t start, bool glued) {
  ++pos_;
  auto close = src_.find('\'', pos_);
  if (close == std::string_view::npos) {
    pos_ = src_.size();
    return invalidInput("unterminated single quote");
  }
  std::string text(src_.substr(pos_, close - pos_));
  pos_ = close + 1;
  return Token{Token::Kind{SingleQuotedToken{std::move(text)}}, start, glued};
}

Result<Token> Lexer::lexDoubleQuoted(size_t start, bool glued) {
  ++pos_;
  DoubleQuotedToken quoted;
  std::string       literal;
  size_t            literal_pos = pos_;

  auto flush = [&]() {
    if (!literal.empty()) {
      quoted.parts_.push_back(Token{Token::Kind{WordToken{std::move(literal)}}, literal_pos, true});
      literal.clear();
    }
  };

  while (true) {
    if (pos_ >= src_.size()) {
      return invalidInput("unterminated double quote");
    }
    char c = src_[pos_];
    if (c == '"') {
      ++pos_;
      break;
    }
    if (c == '\\' && pos_ + 1 < src_.size()) {
      char next = src_[pos_ + 1];
      if (next == '\n') {
        pos_ += 2;
        continue;
      }
      if (next == '$' || next == '`' || next == '"' || next == '\\') {
        if (literal.empty()) {
          literal_pos = pos_;
        }
        literal.push_back(next);
        pos_ += 2;
        continue;
      }
    }
    if (c == '`') {
      auto sub = lexBackquote(pos_, true);
      if (!sub) {
        return std::unexpected(sub.error());
      }
      flush();
      quoted.parts_.push_back(std::move(*sub));
      continue;
    }
    if (c == '$') {
      size_t dollar = pos_;
      auto   ref    = lexDollar(dollar, true, true);
      if (!ref) {
        return std::unexpected(ref.error());
      }
      if (ref->is<WordToken>()) {
        if (literal.empty()) {
          literal_pos = dollar;
        }
        literal += ref->getIf<WordToken>()->text_;
        continue;
      }
      flush();
      quoted.parts_.push_back(std::move(*ref));
      continue;
    }
    if (literal.empty()) {
      literal_pos = pos_;
    }
    literal.push_back(c);
    ++pos_;
  }
  flush();
  return Token{Token::Kind{std::move(quoted)}, start, glued};
}

Result<Token> Lexer::lexDollar(size_t start, bool glued, bool in_quotes) {
  auto make = [start, glued](Token::Kind kind) { return Token{std::move(kind), start, glued}; };

  char next = pos_ + 1 < src_.size() ? src_[pos_ + 1] : '\0';

  if (next == '{') {
    // Balanced braces so ${a:-${b}} stays one reference
    size_t i     = pos_ + 2;
    int    depth = 1;
    while (i < src_.size()) {
      if (src_[i] == '{') {
        ++depth;
      } else if (src_[i] == '}' && --depth == 0) {
        break;
      }
      ++i;
    }
    if (i >= src_.size()) {
      pos_ = src_.size();
      return invalidInput("unterminated ${");
    }
    std::string name(src_.substr(pos_ + 2, i - pos_ - 2));
    pos_ = i + 1;
    return make(VariableBracedToken{std::move(name)});
  }

  if (next == '?') {
    pos_ += 2;
    return make(VariableToken{"?"});
  }

  if (isDigit(next)) {
    pos_ += 2;
    return make(VariableToken{std::string(1, next)});
  }

  if (isNameStart(next)) {
    size_t i = pos_ + 1;
    while (i < src_.size() && isNameChar(src_[i])) {
      ++i;
    }
    std::string name(src_.substr(pos_ + 1, i - pos_ - 1));
    pos_ = i;
    return make(VariableToken{std::move(name)});
  }

  if (next == '(' && in_quotes) {
    return lexQuotedSubstitution(start, glued);
  }

  if (next == '(') {
    if (pos_ + 2 < src_.size() && src_[pos_ + 2] == '(') {
      pos_ += 3;
      return make(DollarDParenToken{});
    }
    pos_ += 2;
    return make(DollarParenToken{});
  }

  // A lone '$' is literal text
  ++pos_;
  return make(WordToken{"$"});
}

Result<Token> Lexer::lexQuotedSubstitution(size_t start, bool glued) {
  size_t open       = pos_ + 1;
  size_t i          = open + 1;
  int    depth      = 1;
  size_t inner_open = src_.size(); // where a leading "((" first closes
  while (i < src_.size() && depth > 0) {
    char c = src_[i];
    if (c == '\\') {
      i += 2;
      continue;
    }
    if (c == '\'') {
      auto close = src_.find('\'', i + 1);
      i          = close == std::string_view::npos ? src_.size() : close + 1;
      continue;
    }
    if (c == '(') {
      ++depth;
    } else if (c == ')') {
      --depth;
      if (depth == 1 && inner_open == src_.size()) {
        inner_open = i;
      }
    }
    ++i;
  }
  if (depth > 0) {
    pos_ = src_.size();
    return invalidInput("unterminated $(");
  }
  size_t close = i - 1;
  pos_         = i;

  SubstitutionToken sub;
  sub.arithmetic_ = src_[open + 1] == '(' && inner_open + 1 == close;
  sub.source_     = sub.arithmetic_ ? std::string(src_.substr(open + 2, inner_open - open - 2))
                                    : std::string(src_.substr(open + 1, close - open - 1));
  return Token{Token::Kind{std::move(sub)}, start, glued};
}

Result<Token> Lexer::lexBackquote(size_t start, bool glued) {
  ++pos_;
  std::string source;
  while (pos_ < src_.size() && src_[pos_] != '`') {
    if (src_[pos_] == '\\' && pos_ + 1 < src_.size() && std::string_view{"`$\\"}.contains(src_[pos_ + 1])) {
      ++pos_;
    }
    source.push_back(src_[pos_]);
    ++pos_;
  }
  if (pos_ >= src_.size()) {
    return invalidInput("unterminated backquote");
  }
  ++pos_;
  return Token{Token::Kind{SubstitutionToken{std::move(source), false, true}}, start, glued};
}

} // namespace wpcsh
