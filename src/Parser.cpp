#include "wpcsh/Parser.hpp"
#include "wpcsh/Util.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace wpcsh {

namespace {

// Reserved words that close an embedded list
constexpr std::array<std::string_view, 7> LIST_TERMINATORS = {"then", "else", "elif", "fi", "do", "done", "esac"};

// Longest operators first so ":-" wins over ":" and "##" over "#"
constexpr std::array<std::string_view, 15> EXPANSION_OPERATORS = {
    ":-", ":=", ":?", ":+", "##", "%%", "//", "-", "=", "?", "+", "#", "%", "/", ":"};

constexpr bool isExtGlobOperator(char c) noexcept {
  return c == '?' || c == '*' || c == '+' || c == '@' || c == '!';
}

template<typename T>
Node node(T&& value) {
  return Node{Node::Kind{std::forward<T>(value)}};
}

// Adjacent literals with the same quoting collapse into one part.
void appendLiteral(Word& word, std::string text, Quoting quoting) {
  if (!word.parts_.empty()) {
    if (auto* last = std::get_if<LiteralPart>(&word.parts_.back()); last != nullptr && last->quoting_ == quoting) {
      last->text_ += text;
      return;
    }
  }
  word.parts_.emplace_back(LiteralPart{std::move(text), quoting});
}

// Outside command position '{' and '}' are ordinary word text
bool isBrace(Token const& t) {
  return holdsAny<LBraceToken, RBraceToken>(t);
}

bool isCompound(Node const& n) {
  return n.is<GroupNode>() || n.is<SubshellNode>() || n.is<IfStatementNode>() || n.is<WhileLoopNode>() ||
         n.is<UntilLoopNode>() || n.is<ForLoopNode>() || n.is<SelectStatementNode>() ||
         n.is<CaseStatementNode>() || n.is<ArithmeticCommandNode>() || n.is<ExtendedTestNode>();
}

} // namespace

Parser::Parser(std::string_view src)
    : lexer_(src) {}

Token const& Parser::peek(size_t offset) {
  while (lookahead_.size() <= offset) {
    if (!lookahead_.empty() && lookahead_.back().is<EndToken>()) {
      return lookahead_.back();
    }
    auto token = lexer_.nextToken();
    if (!token) {
      // Remember the first lexer failure and present it as end of input
      if (!lex_error_) {
        lex_error_ = token.error();
      }
      lookahead_.push_back(Token{Token::Kind{EndToken{}}, 0, false});
      continue;
    }
    lookahead_.push_back(std::move(*token));
  }
  return lookahead_[offset];
}

Token Parser::consume() {
  peek();
  if (lookahead_.front().is<EndToken>()) {
    return lookahead_.front();
  }
  Token token = std::move(lookahead_.front());
  lookahead_.pop_front();
  prev_word_like_ = isWordLike(token);
  return token;
}

ShellError Parser::error(std::string_view msg) {
  if (lex_error_) {
    return *lex_error_;
  }
  auto const& token = peek();
  if (token.is<EndToken>()) {
    return ShellError{ErrorKind::INVALID_INPUT, fmt::format("{} near end of input", msg)};
  }
  return ShellError{ErrorKind::INVALID_INPUT, fmt::format("{} near '{}'", msg, tokenText(token))};
}

bool Parser::atWord(std::string_view text, size_t offset) {
  auto const* word = peek(offset).getIf<WordToken>();
  if (word == nullptr || word->text_ != text) {
    return false;
  }
  // "fi" followed directly by a quote is a different word
  auto const& next = peek(offset + 1);
  return !(next.glued_ && isWordLike(next));
}

Result<void> Parser::expectWord(std::string_view text) {
  if (!atWord(text)) {
    return std::unexpected(error(fmt::format("expected '{}'", text)));
  }
  consume();
  return {};
}

bool Parser::atCaseTerminator() {
  return at<SemiToken>() && peek(1).is<SemiToken>() && peek(1).glued_;
}

bool Parser::atListEnd() {
  if (atAny<EndToken, RParenToken, RBraceToken>() || atCaseTerminator()) {
    return true;
  }
  return std::ranges::any_of(LIST_TERMINATORS, [this](std::string_view w) { return atWord(w); });
}

bool Parser::atCommentStart() {
  auto const* word = peek().getIf<WordToken>();
  if (word == nullptr || !word->text_.starts_with('#')) {
    return false;
  }
  return !peek().glued_ || !prev_word_like_;
}

bool Parser::atProcessSubstitution() {
  return atAny<LessToken, GreatToken>() && peek(1).is<LParenToken>() && peek(1).glued_;
}

bool Parser::atRedirectStart() {
  if (atProcessSubstitution()) {
    return false;
  }
  if (isRedirection(peek())) {
    return true;
  }
  // io number: "2>" with the digits glued to the operator
  auto const* word = peek().getIf<WordToken>();
  return word != nullptr && isAllDigits(word->text_) && isRedirection(peek(1)) && peek(1).glued_;
}

void Parser::skipNewlines() {
  while (tryConsume<NewlineToken>()) {}
}

Result<Node> Parser::parseScript() {
  auto list = parseList();
  if (!list) {
    return std::unexpected(list.error());
  }
  if (!at<EndToken>()) {
    return std::unexpected(error("unexpected token"));
  }
  if (lex_error_) {
    return std::unexpected(*lex_error_);
  }
  return node(std::move(*list));
}

Result<Node> Parser::parsePipelineOnly() {
  skipNewlines();
  if (at<EndToken>()) {
    return std::unexpected(error("expected command"));
  }
  auto pipeline = parsePipeline();
  if (!pipeline) {
    return std::unexpected(pipeline.error());
  }
  skipNewlines();
  if (!at<EndToken>()) {
    return std::unexpected(error("unexpected token"));
  }
  if (lex_error_) {
    return std::unexpected(*lex_error_);
  }
  return pipeline;
}

Result<ListNode> Parser::parseList() {
  ListNode list;
  skipNewlines();
  while (!atListEnd()) {
    auto stmt = atCommentStart() ? parseComment() : parsePipeline();
    if (!stmt) {
      return std::unexpected(stmt.error());
    }
    bool comment = stmt->is<CommentNode>();
    list.statements_.push_back(std::move(*stmt));

    if (comment) {
      // A comment runs to the end of its line
      if (!tryConsume<NewlineToken>()) {
        break;
      }
      list.operators_.push_back(ListOp::SEQ);
      skipNewlines();
      continue;
    }

    ListOp op = ListOp::SEQ;
    if (tryConsume<AndIfToken>()) {
      op = ListOp::AND;
    } else if (tryConsume<OrIfToken>()) {
      op = ListOp::OR;
    } else if (atCaseTerminator()) {
      break;
    } else if (tryConsume<SemiToken>() || tryConsume<NewlineToken>()) {
      op = ListOp::SEQ;
    } else if (tryConsume<AmpToken>()) {
      op = ListOp::BACKGROUND;
    } else if (atCommentStart()) {
      op = ListOp::SEQ;
    } else if (atListEnd()) {
      break;
    } else {
      return std::unexpected(error("unexpected token"));
    }
    list.operators_.push_back(op);
    skipNewlines();
    if ((op == ListOp::AND || op == ListOp::OR) && (atListEnd() || atCommentStart())) {
      return std::unexpected(error(op == ListOp::AND ? "expected command after '&&'" : "expected command after '||'"));
    }
  }

  // "a; b;" keeps no dangling separator; a trailing '&' is kept
  if (!list.operators_.empty() && list.operators_.size() == list.statements_.size() &&
      list.operators_.back() == ListOp::SEQ) {
    list.operators_.pop_back();
  }
  return list;
}

Result<NodePtr> Parser::parseCompoundList(std::string_view before) {
  auto list = parseList();
  if (!list) {
    return std::unexpected(list.error());
  }
  if (list->statements_.empty()) {
    return std::unexpected(error(fmt::format("expected command after '{}'", before)));
  }
  return makeNode(std::move(*list));
}

Result<Node> Parser::parsePipeline() {
  if (atWord("!")) {
    consume();
    auto inner = parsePipeline();
    if (!inner) {
      return std::unexpected(inner.error());
    }
    return node(NegationNode{makeNode(std::move(*inner))});
  }

  auto first = parseCommand();
  if (!first) {
    return std::unexpected(first.error());
  }
  if (!at<PipeToken>()) {
    return first;
  }

  PipelineNode pipeline;
  pipeline.commands_.push_back(std::move(*first));
  while (tryConsume<PipeToken>()) {
    skipNewlines();
    if (atListEnd() || atCommentStart()) {
      return std::unexpected(error("expected command after '|'"));
    }
    auto next = parseCommand();
    if (!next) {
      return std::unexpected(next.error());
    }
    pipeline.commands_.push_back(std::move(*next));
  }
  return node(std::move(pipeline));
}

Result<Node> Parser::parseCommand() {
  if (at<LParenToken>()) {
    if (peek(1).is<LParenToken>() && peek(1).glued_) {
      return parseArithmeticCommand();
    }
    return parseSubshell();
  }
  if (at<LBraceToken>()) {
    return parseGroup();
  }
  if (auto const* word = peek().getIf<WordToken>()) {
    if (atWord("if")) {
      return parseIf();
    }
    if (atWord("while")) {
      return parseWhileUntil(false);
    }
    if (atWord("until")) {
      return parseWhileUntil(true);
    }
    if (atWord("for")) {
      return parseForSelect(false);
    }
    if (atWord("select")) {
      return parseForSelect(true);
    }
    if (atWord("case")) {
      return parseCase();
    }
    if (atWord("function")) {
      return parseFunction(true);
    }
    if (atWord("[[")) {
      return parseExtendedTest();
    }
    if (atWord("return")) {
      return parseReturn();
    }
    if (atWord("complete")) {
      return parseComplete();
    }
    if (isValidName(word->text_) && peek(1).is<LParenToken>() && peek(2).is<RParenToken>()) {
      return parseFunction(false);
    }
  }
  if (atRedirectStart() || atProcessSubstitution() || (isWordLike(peek()) && !atCommentStart())) {
    return parseSimpleCommand();
  }
  return std::unexpected(error("unexpected token"));
}

bool Parser::splitAssignment(Word& word, Assignment& out) {
  if (word.parts_.empty()) {
    return false;
  }
  auto* first = std::get_if<LiteralPart>(&word.parts_.front());
  if (first == nullptr || first->quoting_ != Quoting::NONE) {
    return false;
  }
  auto eq = first->text_.find('=');
  if (eq == std::string::npos || !isValidName(std::string_view{first->text_}.substr(0, eq))) {
    return false;
  }

  out.name_ = first->text_.substr(0, eq);
  out.value_.parts_.clear();
  std::string rest = first->text_.substr(eq + 1);
  if (!rest.empty()) {
    out.value_.parts_.emplace_back(LiteralPart{std::move(rest), Quoting::NONE});
  }
  for (size_t i = 1; i < word.parts_.size(); ++i) {
    out.value_.parts_.push_back(std::move(word.parts_[i]));
  }
  word.parts_.clear();
  return true;
}

std::optional<Node> Parser::makeExport(Word& arg) {
  if (arg.parts_.empty()) {
    return std::nullopt;
  }
  auto const* first = std::get_if<LiteralPart>(&arg.parts_.front());
  if (first == nullptr || first->quoting_ != Quoting::NONE) {
    return std::nullopt;
  }
  if (first->text_.find('=') == std::string::npos) {
    if (arg.parts_.size() == 1 && isValidName(first->text_)) {
      return node(ExportNode{first->text_, nullptr});
    }
    return std::nullopt;
  }

  Assignment assignment;
  if (!splitAssignment(arg, assignment)) {
    return std::nullopt;
  }
  NodePtr value;
  auto const& parts = assignment.value_.parts_;
  auto const* single = parts.size() == 1 ? std::get_if<LiteralPart>(parts.data()) : nullptr;
  if (single != nullptr && single->quoting_ == Quoting::SINGLE) {
    value = makeNode(SingleQuotedStringNode{single->text_});
  } else {
    value = makeNode(StringLiteralNode{std::move(assignment.value_)});
  }
  return node(ExportNode{std::move(assignment.name_), std::move(value)});
}

Result<Node> Parser::parseSimpleCommand() {
  CommandNode cmd;
  bool        have_name = false;

  auto atWordStart = [this](bool braces) {
    return (isWordLike(peek()) || atProcessSubstitution() || (braces && isBrace(peek()))) && !atCommentStart();
  };

  // Prefix: redirects and NAME=value words before the command name
  while (!have_name) {
    if (atRedirectStart()) {
      auto redirect = parseRedirect();
      if (!redirect) {
        return std::unexpected(redirect.error());
      }
      cmd.redirects_.push_back(std::move(*redirect));
      continue;
    }
    if (!atWordStart(false)) {
      break;
    }
    auto word = parseWord();
    if (!word) {
      return std::unexpected(word.error());
    }
    Assignment assignment;
    if (splitAssignment(*word, assignment)) {
      if (assignment.value_.parts_.empty() && at<LParenToken>() && peek().glued_) {
        if (!cmd.assignments_.empty() || !cmd.redirects_.empty()) {
          return std::unexpected(error("unexpected array assignment"));
        }
        return parseArray(std::move(assignment.name_));
      }
      cmd.assignments_.push_back(std::move(assignment));
      continue;
    }
    cmd.name_  = std::move(*word);
    have_name = true;
  }

  while (have_name) {
    if (atRedirectStart()) {
      auto redirect = parseRedirect();
      if (!redirect) {
        return std::unexpected(redirect.error());
      }
      cmd.redirects_.push_back(std::move(*redirect));
      continue;
    }
    if (!atWordStart(true)) {
      break;
    }
    auto word = parseWord(true);
    if (!word) {
      return std::unexpected(word.error());
    }
    cmd.args_.push_back(std::move(*word));
  }

  if (!have_name) {
    if (cmd.assignments_.empty() && cmd.redirects_.empty()) {
      return std::unexpected(error("expected command"));
    }
    if (cmd.redirects_.empty()) {
      return node(AssignmentNode{std::move(cmd.assignments_)});
    }
    return node(std::move(cmd));
  }

  if (cmd.redirects_.empty() && cmd.assignments_.empty()) {
    if (cmd.name_.isBare("export") && cmd.args_.size() == 1) {
      if (auto exported = makeExport(cmd.args_.front())) {
        return std::move(*exported);
      }
    }
    if (auto name = cmd.name_.literal(); name && cmd.name_.isBare(*name)) {
      if (functions_.contains(*name)) {
        return node(FunctionCallNode{std::move(*name), std::move(cmd.args_)});
      }
      if (name->size() > 1 && name->starts_with('!')) {
        return node(HistoryExpansionNode{std::move(*name), std::move(cmd.args_)});
      }
    }
  }
  return node(std::move(cmd));
}

Result<Node> Parser::parseComment() {
  Token token = consume();
  return node(CommentNode{token.getIf<WordToken>()->text_});
}

Result<Redirect> Parser::parseRedirect() {
  std::optional<int> io_number;
  if (auto const* word = peek().getIf<WordToken>(); word != nullptr && isAllDigits(word->text_)) {
    int  fd = 0;
    auto [ptr, ec] = std::from_chars(word->text_.data(), word->text_.data() + word->text_.size(), fd);
    if (ec != std::errc()) {
      return std::unexpected(error("bad file descriptor"));
    }
    io_number = fd;
    consume();
  }

  RedirectKind kind{};
  auto const&  op = peek();
  if (op.is<LessToken>()) {
    kind = RedirectKind::INPUT;
  } else if (op.is<GreatToken>()) {
    kind = RedirectKind::OUTPUT;
  } else if (op.is<DGreatToken>()) {
    kind = RedirectKind::APPEND;
  } else if (op.is<LessGreatToken>()) {
    kind = RedirectKind::READ_WRITE;
  } else if (op.is<DLessToken>()) {
    kind = RedirectKind::HERE_DOC;
  } else if (op.is<DLessDashToken>()) {
    kind = RedirectKind::HERE_DOC_DASH;
  } else if (op.is<TLessToken>()) {
    kind = RedirectKind::HERE_STRING;
  } else if (op.is<LessAndToken>()) {
    kind = RedirectKind::INPUT_DUP;
  } else if (op.is<GreatAndToken>()) {
    kind = RedirectKind::OUTPUT_DUP;
  } else {
    return std::unexpected(error("expected redirection operator"));
  }
  consume();

  if (!isWordLike(peek()) || atCommentStart()) {
    return std::unexpected(error("expected word after redirection"));
  }
  auto target = parseWord();
  if (!target) {
    return std::unexpected(target.error());
  }
  return Redirect{kind, std::move(*target), io_number};
}

Result<void> Parser::parseTrailingRedirects(std::vector<Redirect>& out) {
  while (atRedirectStart()) {
    auto redirect = parseRedirect();
    if (!redirect) {
      return std::unexpected(redirect.error());
    }
    out.push_back(std::move(*redirect));
  }
  return {};
}

Result<Word> Parser::parseWord(bool leading_brace) {
  Word word;
  if (atProcessSubstitution()) {
    auto substitution = parseProcessSubstitution();
    if (!substitution) {
      return std::unexpected(substitution.error());
    }
    word.parts_.emplace_back(ExpansionPart{std::move(*substitution)});
    return word;
  }
  if (!isWordLike(peek()) && !(leading_brace && isBrace(peek()))) {
    return std::unexpected(error("expected word"));
  }
  do {
    if (auto part = parseWordPart(word); !part) {
      return std::unexpected(part.error());
    }
  } while (peek().glued_ && (isWordLike(peek()) || isBrace(peek())));
  return word;
}

Result<void> Parser::parseWordPart(Word& word) {
  Token token = consume();

  auto braced = [&](std::string const& name) -> Result<void> {
    if (isValidName(name) || name == "?" || isAllDigits(name)) {
      word.parts_.emplace_back(VariablePart{name, true});
      return {};
    }
    auto expansion = parseParameterExpansion(name);
    if (!expansion) {
      return std::unexpected(expansion.error());
    }
    word.parts_.emplace_back(ExpansionPart{std::move(*expansion)});
    return {};
  };

  // Captured source is parsed on its own
  auto substituted = [&](SubstitutionToken const& sub) -> Result<void> {
    if (sub.arithmetic_) {
      word.parts_.emplace_back(ExpansionPart{makeNode(ArithmeticExpansionNode{trim(sub.source_)})});
      return {};
    }
    auto body = parse(sub.source_);
    if (!body) {
      return std::unexpected(body.error());
    }
    word.parts_.emplace_back(ExpansionPart{makeNode(CommandSubstitutionNode{makeNode(std::move(*body))})});
    return {};
  };

  if (auto const* w = token.getIf<WordToken>()) {
    std::string text = w->text_;
    if (!text.empty() && isExtGlobOperator(text.back()) && at<LParenToken>() && peek().glued_) {
      char op = text.back();
      text.pop_back();
      if (!text.empty()) {
        appendLiteral(word, std::move(text), Quoting::NONE);
      }
      auto glob = parseExtGlob(op);
      if (!glob) {
        return std::unexpected(glob.error());
      }
      word.parts_.emplace_back(ExpansionPart{std::move(*glob)});
      return {};
    }
    appendLiteral(word, std::move(text), Quoting::NONE);
    return {};
  }
  if (auto const* q = token.getIf<SingleQuotedToken>()) {
    appendLiteral(word, q->text_, Quoting::SINGLE);
    return {};
  }
  if (auto const* q = token.getIf<DoubleQuotedToken>()) {
    if (q->parts_.empty()) {
      appendLiteral(word, "", Quoting::DOUBLE);
    }
    for (auto const& part : q->parts_) {
      if (auto const* lit = part.getIf<WordToken>()) {
        appendLiteral(word, lit->text_, Quoting::DOUBLE);
      } else if (auto const* var = part.getIf<VariableToken>()) {
        word.parts_.emplace_back(VariablePart{var->name_, false});
      } else if (auto const* var = part.getIf<VariableBracedToken>()) {
        if (auto r = braced(var->name_); !r) {
          return r;
        }
      } else if (auto const* sub = part.getIf<SubstitutionToken>()) {
        if (auto r = substituted(*sub); !r) {
          return r;
        }
      }
    }
    return {};
  }
  if (auto const* var = token.getIf<VariableToken>()) {
    word.parts_.emplace_back(VariablePart{var->name_, false});
    return {};
  }
  if (auto const* var = token.getIf<VariableBracedToken>()) {
    return braced(var->name_);
  }
  if (auto const* sub = token.getIf<SubstitutionToken>()) {
    return substituted(*sub);
  }
  if (isBrace(token)) {
    appendLiteral(word, tokenText(token), Quoting::NONE);
    return {};
  }
  if (token.is<DollarParenToken>()) {
    auto body = parseList();
    if (!body) {
      return std::unexpected(body.error());
    }
    if (auto r = expectConsume<RParenToken>("expected ')' to close command substitution"); !r) {
      return r;
    }
    word.parts_.emplace_back(ExpansionPart{makeNode(CommandSubstitutionNode{makeNode(std::move(*body))})});
    return {};
  }
  if (token.is<DollarDParenToken>()) {
    auto expr = collectArithmetic();
    if (!expr) {
      return std::unexpected(expr.error());
    }
    word.parts_.emplace_back(ExpansionPart{makeNode(ArithmeticExpansionNode{std::move(*expr)})});
    return {};
  }
  return std::unexpected(error("expected word"));
}

Result<NodePtr> Parser::parseExtGlob(char op) {
  consume(); // (
  std::vector<std::string> patterns;
  std::string              current;
  int                      depth = 0;
  while (true) {
    if (at<EndToken>()) {
      return std::unexpected(error("unterminated extended glob"));
    }
    Token token = consume();
    if (token.is<LParenToken>()) {
      ++depth;
    } else if (token.is<RParenToken>()) {
      if (depth == 0) {
        break;
      }
      --depth;
    } else if (token.is<PipeToken>() && depth == 0) {
      patterns.push_back(std::move(current));
      current.clear();
      continue;
    }
    if (!current.empty() && !token.glued_) {
      current += ' ';
    }
    current += tokenText(token);
  }
  patterns.push_back(std::move(current));
  return makeNode(ExtGlobPatternNode{op, std::move(patterns)});
}

Result<NodePtr> Parser::parseProcessSubstitution() {
  auto direction = at<LessToken>() ? ProcessDirection::INPUT : ProcessDirection::OUTPUT;
  consume();
  consume(); // (
  auto body = parseList();
  if (!body) {
    return std::unexpected(body.error());
  }
  if (auto r = expectConsume<RParenToken>("expected ')' to close process substitution"); !r) {
    return std::unexpected(r.error());
  }
  return makeNode(ProcessSubstitutionNode{direction, makeNode(std::move(*body))});
}

Result<NodePtr> Parser::parseParameterExpansion(std::string const& body) {
  // ${#name}
  if (body.size() > 1 && body.starts_with('#') && isValidName(std::string_view{body}.substr(1))) {
    return makeNode(ParameterExpansionNode{body.substr(1), "#", ""});
  }
  size_t i = 0;
  while (i < body.size() && isNameChar(body[i])) {
    ++i;
  }
  std::string      name = body.substr(0, i);
  std::string_view rest = std::string_view{body}.substr(i);
  if (name.empty()) {
    return invalidInput(fmt::format("bad substitution: ${{{}}}", body));
  }
  for (auto op : EXPANSION_OPERATORS) {
    if (rest.starts_with(op)) {
      return makeNode(ParameterExpansionNode{std::move(name), std::string(op), std::string(rest.substr(op.size()))});
    }
  }
  return invalidInput(fmt::format("bad substitution: ${{{}}}", body));
}

Result<std::string> Parser::collectArithmetic() {
  std::string text;
  int         depth = 0;
  while (true) {
    if (at<EndToken>()) {
      return std::unexpected(error("unterminated arithmetic expression"));
    }
    Token token = consume();
    if (token.is<LParenToken>() || token.is<DollarParenToken>()) {
      ++depth;
    } else if (token.is<DollarDParenToken>()) {
      depth += 2;
    } else if (token.is<RParenToken>()) {
      if (depth == 0) {
        if (at<RParenToken>() && peek().glued_) {
          consume();
          break;
        }
        return std::unexpected(error("expected '))'"));
      }
      --depth;
    }
    if (!text.empty() && !token.glued_) {
      text += ' ';
    }
    text += tokenText(token);
  }
  return trim(text);
}

Result<Node> Parser::parseSubshell() {
  consume(); // (
  auto body = parseCompoundList("(");
  if (!body) {
    return std::unexpected(body.error());
  }
  if (auto r = expectConsume<RParenToken>("expected ')'"); !r) {
    return std::unexpected(r.error());
  }
  SubshellNode subshell{std::move(*body), {}};
  if (auto r = parseTrailingRedirects(subshell.redirects_); !r) {
    return std::unexpected(r.error());
  }
  return node(std::move(subshell));
}

Result<Node> Parser::parseGroup() {
  consume(); // {
  auto body = parseCompoundList("{");
  if (!body) {
    return std::unexpected(body.error());
  }
  if (auto r = expectConsume<RBraceToken>("expected '}'"); !r) {
    return std::unexpected(r.error());
  }
  GroupNode group{std::move(*body), {}};
  if (auto r = parseTrailingRedirects(group.redirects_); !r) {
    return std::unexpected(r.error());
  }
  return node(std::move(group));
}

Result<Node> Parser::parseArithmeticCommand() {
  consume();
  consume();
  auto expr = collectArithmetic();
  if (!expr) {
    return std::unexpected(expr.error());
  }
  return node(ArithmeticCommandNode{std::move(*expr)});
}

Result<Node> Parser::parseIf() {
  consume(); // if
  IfStatementNode stmt;

  auto condition = parseCompoundList("if");
  if (!condition) {
    return std::unexpected(condition.error());
  }
  if (auto r = expectWord("then"); !r) {
    return std::unexpected(r.error());
  }
  auto then = parseCompoundList("then");
  if (!then) {
    return std::unexpected(then.error());
  }
  stmt.condition_ = std::move(*condition);
  stmt.then_      = std::move(*then);

  while (atWord("elif")) {
    consume();
    auto elif_condition = parseCompoundList("elif");
    if (!elif_condition) {
      return std::unexpected(elif_condition.error());
    }
    if (auto r = expectWord("then"); !r) {
      return std::unexpected(r.error());
    }
    auto elif_body = parseCompoundList("then");
    if (!elif_body) {
      return std::unexpected(elif_body.error());
    }
    stmt.elifs_.push_back(node(ElifBranchNode{std::move(*elif_condition), std::move(*elif_body)}));
  }

  if (atWord("else")) {
    consume();
    auto else_body = parseCompoundList("else");
    if (!else_body) {
      return std::unexpected(else_body.error());
    }
    stmt.else_ = makeNode(ElseBranchNode{std::move(*else_body)});
  }

  if (auto r = expectWord("fi"); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = parseTrailingRedirects(stmt.redirects_); !r) {
    return std::unexpected(r.error());
  }
  return node(std::move(stmt));
}

Result<Node> Parser::parseWhileUntil(bool until) {
  consume();
  auto condition = parseCompoundList(until ? "until" : "while");
  if (!condition) {
    return std::unexpected(condition.error());
  }
  if (auto r = expectWord("do"); !r) {
    return std::unexpected(r.error());
  }
  auto body = parseCompoundList("do");
  if (!body) {
    return std::unexpected(body.error());
  }
  if (auto r = expectWord("done"); !r) {
    return std::unexpected(r.error());
  }
  std::vector<Redirect> redirects;
  if (auto r = parseTrailingRedirects(redirects); !r) {
    return std::unexpected(r.error());
  }
  if (until) {
    return node(UntilLoopNode{std::move(*condition), std::move(*body), std::move(redirects)});
  }
  return node(WhileLoopNode{std::move(*condition), std::move(*body), std::move(redirects)});
}

Result<std::optional<std::vector<Word>>> Parser::parseInItems() {
  skipNewlines();
  if (!atWord("in")) {
    tryConsume<SemiToken>();
    skipNewlines();
    return std::optional<std::vector<Word>>{};
  }
  consume();
  std::vector<Word> items;
  while (isWordLike(peek()) && !atCommentStart()) {
    auto item = parseWord();
    if (!item) {
      return std::unexpected(item.error());
    }
    items.push_back(std::move(*item));
  }
  if (!tryConsume<SemiToken>() && !tryConsume<NewlineToken>()) {
    return std::unexpected(error("expected ';' or newline after word list"));
  }
  skipNewlines();
  return std::optional<std::vector<Word>>{std::move(items)};
}

Result<Node> Parser::parseForSelect(bool select) {
  consume(); // for / select

  if (!select && at<LParenToken>() && peek(1).is<LParenToken>() && peek(1).glued_) {
    consume();
    consume();
    auto header = collectArithmetic();
    if (!header) {
      return std::unexpected(header.error());
    }
    tryConsume<SemiToken>();
    skipNewlines();
    if (auto r = expectWord("do"); !r) {
      return std::unexpected(r.error());
    }
    auto body = parseCompoundList("do");
    if (!body) {
      return std::unexpected(body.error());
    }
    if (auto r = expectWord("done"); !r) {
      return std::unexpected(r.error());
    }
    ForLoopNode loop;
    loop.arithmetic_ = std::move(*header);
    loop.body_       = std::move(*body);
    if (auto r = parseTrailingRedirects(loop.redirects_); !r) {
      return std::unexpected(r.error());
    }
    return node(std::move(loop));
  }

  auto const* name = peek().getIf<WordToken>();
  if (name == nullptr || !isValidName(name->text_)) {
    return std::unexpected(error(select ? "expected name after 'select'" : "expected name after 'for'"));
  }
  std::string variable = name->text_;
  consume();

  auto items = parseInItems();
  if (!items) {
    return std::unexpected(items.error());
  }
  if (auto r = expectWord("do"); !r) {
    return std::unexpected(r.error());
  }
  auto body = parseCompoundList("do");
  if (!body) {
    return std::unexpected(body.error());
  }
  if (auto r = expectWord("done"); !r) {
    return std::unexpected(r.error());
  }
  std::vector<Redirect> redirects;
  if (auto r = parseTrailingRedirects(redirects); !r) {
    return std::unexpected(r.error());
  }
  if (select) {
    return node(SelectStatementNode{std::move(variable), std::move(*items), std::move(*body), std::move(redirects)});
  }
  return node(ForLoopNode{std::move(variable), std::move(*items), "", std::move(*body), std::move(redirects)});
}

Result<Node> Parser::parseCase() {
  consume(); // case
  if (!isWordLike(peek())) {
    return std::unexpected(error("expected word after 'case'"));
  }
  auto subject = parseWord();
  if (!subject) {
    return std::unexpected(subject.error());
  }
  skipNewlines();
  if (auto r = expectWord("in"); !r) {
    return std::unexpected(r.error());
  }
  skipNewlines();

  CaseStatementNode stmt;
  stmt.subject_ = std::move(*subject);
  while (!atWord("esac")) {
    if (at<EndToken>()) {
      return std::unexpected(error("expected 'esac'"));
    }
    CaseItem item;
    tryConsume<LParenToken>();
    while (true) {
      if (!isWordLike(peek())) {
        return std::unexpected(error("expected case pattern"));
      }
      auto pattern = parseWord();
      if (!pattern) {
        return std::unexpected(pattern.error());
      }
      item.patterns_.push_back(std::move(*pattern));
      if (!tryConsume<PipeToken>()) {
        break;
      }
    }
    if (auto r = expectConsume<RParenToken>("expected ')' after case pattern"); !r) {
      return std::unexpected(r.error());
    }
    auto body = parseList();
    if (!body) {
      return std::unexpected(body.error());
    }
    item.body_ = makeNode(std::move(*body));
    stmt.items_.push_back(std::move(item));

    if (atCaseTerminator()) {
      consume();
      consume();
      skipNewlines();
      continue;
    }
    if (!atWord("esac")) {
      return std::unexpected(error("expected ';;' or 'esac'"));
    }
  }
  consume(); // esac
  if (auto r = parseTrailingRedirects(stmt.redirects_); !r) {
    return std::unexpected(r.error());
  }
  return node(std::move(stmt));
}

Result<Node> Parser::parseFunction(bool keyword) {
  if (keyword) {
    consume(); // function
  }
  auto const* name_token = peek().getIf<WordToken>();
  if (name_token == nullptr || !isValidName(name_token->text_)) {
    return std::unexpected(error("expected function name"));
  }
  std::string name = name_token->text_;
  consume();

  if (at<LParenToken>() && peek(1).is<RParenToken>()) {
    consume();
    consume();
  } else if (!keyword) {
    return std::unexpected(error("expected '()'"));
  }
  skipNewlines();

  auto body = parseCommand();
  if (!body) {
    return std::unexpected(body.error());
  }
  if (!isCompound(*body)) {
    return std::unexpected(error(fmt::format("expected compound command as body of '{}'", name)));
  }
  functions_.insert(name);
  return node(FunctionNode{std::move(name), makeNode(std::move(*body))});
}

Result<Node> Parser::parseExtendedTest() {
  consume(); // [[
  ExtendedTestNode test;
  while (!atWord("]]")) {
    if (atAny<EndToken, NewlineToken>()) {
      return std::unexpected(error("expected ']]'"));
    }
    Token token = consume();
    if (token.glued_ && isWordLike(token) && !test.operands_.empty()) {
      test.operands_.back() += tokenText(token);
    } else {
      test.operands_.push_back(tokenText(token));
    }
  }
  consume(); // ]]
  return node(std::move(test));
}

Result<Node> Parser::parseReturn() {
  consume();
  ReturnNode ret;
  if (isWordLike(peek()) && !atCommentStart()) {
    auto value = parseWord();
    if (!value) {
      return std::unexpected(value.error());
    }
    ret.value_ = std::move(*value);
  }
  return node(std::move(ret));
}

Result<Node> Parser::parseComplete() {
  consume();
  CompleteNode complete;
  while (isWordLike(peek()) && !atCommentStart()) {
    auto arg = parseWord();
    if (!arg) {
      return std::unexpected(arg.error());
    }
    complete.args_.push_back(std::move(*arg));
  }
  return node(std::move(complete));
}

Result<Node> Parser::parseArray(std::string name) {
  consume(); // (
  ArrayNode array;
  array.name_ = std::move(name);
  while (true) {
    skipNewlines();
    if (tryConsume<RParenToken>()) {
      break;
    }
    if (!isWordLike(peek())) {
      return std::unexpected(error("expected ')' to close array"));
    }
    auto element = parseWord();
    if (!element) {
      return std::unexpected(element.error());
    }
    array.elements_.push_back(std::move(*element));
  }
  return node(std::move(array));
}

Result<Node> parse(std::string_view src) {
  Parser parser(src);
  return parser.parseScript();
}

} // namespace wpcsh
