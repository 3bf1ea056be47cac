#pragma once

#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace wpcsh {

struct Token;

// Leaf token types
struct EndToken {};
struct NewlineToken {};
struct SemiToken {};
struct AmpToken {};
struct AndIfToken {};
struct OrIfToken {};
struct PipeToken {};
struct LParenToken {};
struct RParenToken {};
struct LBraceToken {};
struct RBraceToken {};

// Redirections
struct LessToken {};
struct GreatToken {};
struct DGreatToken {};
struct LessGreatToken {};
struct DLessToken {};
struct DLessDashToken {};
struct TLessToken {};
struct LessAndToken {};
struct GreatAndToken {};

// Expansion openers: "$(" and "$(("
struct DollarParenToken {};
struct DollarDParenToken {};

struct WordToken {
  std::string text_;
};

struct SingleQuotedToken {
  std::string text_;
};

// Literal spans (WordToken) interleaved with variable references, in source order.
struct DoubleQuotedToken {
  std::vector<Token> parts_;
};

struct VariableToken {
  std::string name_;
};

struct VariableBracedToken {
  std::string name_;
};

// A whole $(...), $((...)) or `...` captured as source text, where the
// parser cannot follow it token by token (inside double quotes, backquotes).
struct SubstitutionToken {
  std::string source_;
  bool        arithmetic_ = false;
  bool        backquoted_ = false;
};

// Token wrapper with position and variant payload
struct Token {
  using Kind = std::variant<
      EndToken,
      NewlineToken,
      SemiToken,
      AmpToken,
      AndIfToken,
      OrIfToken,
      PipeToken,
      LParenToken,
      RParenToken,
      LBraceToken,
      RBraceToken,
      LessToken,
      GreatToken,
      DGreatToken,
      LessGreatToken,
      DLessToken,
      DLessDashToken,
      TLessToken,
      LessAndToken,
      GreatAndToken,
      DollarParenToken,
      DollarDParenToken,
      WordToken,
      SingleQuotedToken,
      DoubleQuotedToken,
      VariableToken,
      VariableBracedToken,
      SubstitutionToken>;

  Kind   kind_;
  size_t pos_ = 0;
  // True when no whitespace separates this token from the previous one.
  bool glued_ = false;

  template<typename T>
  [[nodiscard]] bool is() const {
    return std::holds_alternative<T>(kind_);
  }

  template<typename T>
  T const* getIf() const {
    return std::get_if<T>(&kind_);
  }
};

// Payload comparison for the variant; stateless tokens are always equal.
template<typename T>
  requires std::is_empty_v<T>
inline bool operator==(T const&, T const&) {
  return true;
}

inline bool operator==(WordToken const& lhs, WordToken const& rhs) {
  return lhs.text_ == rhs.text_;
}

inline bool operator==(SingleQuotedToken const& lhs, SingleQuotedToken const& rhs) {
  return lhs.text_ == rhs.text_;
}

inline bool operator==(VariableToken const& lhs, VariableToken const& rhs) {
  return lhs.name_ == rhs.name_;
}

inline bool operator==(VariableBracedToken const& lhs, VariableBracedToken const& rhs) {
  return lhs.name_ == rhs.name_;
}

inline bool operator==(SubstitutionToken const& lhs, SubstitutionToken const& rhs) {
  return lhs.source_ == rhs.source_ && lhs.arithmetic_ == rhs.arithmetic_ && lhs.backquoted_ == rhs.backquoted_;
}

inline bool operator==(DoubleQuotedToken const& lhs, DoubleQuotedToken const& rhs) {
  return lhs.parts_ == rhs.parts_;
}

// Position and adjacency are ignored.
inline bool operator==(Token const& lhs, Token const& rhs) {
  return lhs.kind_ == rhs.kind_;
}

// Printable representation for error messages and raw-text reconstruction
std::string tokenText(Token const& t);

// Variadic at_any helper
template<typename... Ts>
inline bool holdsAny(Token const& t) {
  return (t.is<Ts>() || ...);
}

inline bool isRedirection(Token const& t) {
  return holdsAny<
      LessToken,
      GreatToken,
      DGreatToken,
      LessGreatToken,
      DLessToken,
      DLessDashToken,
      TLessToken,
      LessAndToken,
      GreatAndToken>(t);
}

// Tokens that may form (part of) a shell word
inline bool isWordLike(Token const& t) {
  return holdsAny<
      WordToken,
      SingleQuotedToken,
      DoubleQuotedToken,
      VariableToken,
      VariableBracedToken,
      SubstitutionToken,
      DollarParenToken,
      DollarDParenToken>(t);
}

} // namespace wpcsh
