#pragma once

#include "wpcsh/AST.hpp"
#include "wpcsh/Error.hpp"
#include "wpcsh/Lexer.hpp"
#include "wpcsh/Tokens.hpp"

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace wpcsh {

// Recursive-descent parser pulling tokens from a Lexer on demand.
class Parser {
  Lexer                           lexer_;
  std::deque<Token>               lookahead_;
  std::optional<ShellError>       lex_error_;
  std::unordered_set<std::string> functions_;
  bool                            prev_word_like_ = false;

public:
  explicit Parser(std::string_view src);

  // Whole input as a ListNode (newlines separate statements).
  Result<Node> parseScript();
  // Exactly one command or pipeline; anything after it is an error.
  Result<Node> parsePipelineOnly();

private:
  Token const& peek(size_t offset = 0);
  Token        consume();

  template<typename T>
  [[nodiscard]] bool at() {
    return peek().is<T>();
  }

  template<typename... Ts>
  [[nodiscard]] bool atAny() {
    return holdsAny<Ts...>(peek());
  }

  template<typename T>
  bool tryConsume() {
    if (at<T>()) {
      consume();
      return true;
    }
    return false;
  }

  template<typename T>
  Result<void> expectConsume(char const* msg) {
    if (!at<T>()) {
      return std::unexpected(error(msg));
    }
    consume();
    return {};
  }

  // Error at the current token; a pending lexer error takes precedence.
  ShellError error(std::string_view msg);

  bool         atWord(std::string_view text, size_t offset = 0);
  Result<void> expectWord(std::string_view text);
  bool         atListEnd();
  bool         atCommentStart();
  bool         atRedirectStart();
  bool         atProcessSubstitution();
  bool         atCaseTerminator();
  void         skipNewlines();

  Result<ListNode> parseList();
  Result<NodePtr>  parseCompoundList(std::string_view before);
  Result<Node>     parsePipeline();
  Result<Node>     parseCommand();
  Result<Node>     parseSimpleCommand();
  Result<Node>     parseComment();
  Result<Redirect> parseRedirect();
  Result<void>     parseTrailingRedirects(std::vector<Redirect>& out);
  Result<Word>     parseWord(bool leading_brace = false);
  Result<void>     parseWordPart(Word& word);
  Result<NodePtr>  parseExtGlob(char op);
  Result<NodePtr>  parseProcessSubstitution();
  Result<NodePtr>  parseParameterExpansion(std::string const& body);
  Result<std::string> collectArithmetic();

  Result<Node> parseSubshell();
  Result<Node> parseGroup();
  Result<Node> parseArithmeticCommand();
  Result<Node> parseIf();
  Result<Node> parseWhileUntil(bool until);
  Result<Node> parseForSelect(bool select);
  Result<Node> parseCase();
  Result<Node> parseFunction(bool keyword);
  Result<Node> parseExtendedTest();
  Result<Node> parseReturn();
  Result<Node> parseComplete();
  Result<Node> parseArray(std::string name);

  Result<std::optional<std::vector<Word>>> parseInItems();

  static std::optional<Node> makeExport(Word& arg);
  static bool                splitAssignment(Word& word, Assignment& out);
};

Result<Node> parse(std::string_view src);

} // namespace wpcsh
