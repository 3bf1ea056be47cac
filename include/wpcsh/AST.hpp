#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace wpcsh {

struct Node;
using NodePtr = std::unique_ptr<Node>;

enum struct Quoting {
  NONE,
  SINGLE,
  DOUBLE
};

struct LiteralPart {
  std::string text_;
  Quoting     quoting_ = Quoting::NONE;
};

// $name, ${name}, $?
struct VariablePart {
  std::string name_;
  bool        braced_ = false;
};

// Command/arithmetic/parameter/process substitution or an extended glob embedded in a word
struct ExpansionPart {
  NodePtr node_;
};

using WordPart = std::variant<LiteralPart, VariablePart, ExpansionPart>;

// One shell word: adjacent literal, quoted and expansion parts with no blank between them.
struct Word {
  std::vector<WordPart> parts_;

  // Text of a word made only of literal parts; nullopt when it needs expansion.
  [[nodiscard]] std::optional<std::string> literal() const;
  // True for an unquoted literal equal to text (reserved-word test).
  [[nodiscard]] bool isBare(std::string_view text) const;
};

enum struct RedirectKind {
  INPUT,
  OUTPUT,
  APPEND,
  READ_WRITE,
  HERE_DOC,
  HERE_DOC_DASH,
  HERE_STRING,
  INPUT_DUP,
  OUTPUT_DUP
};

struct Redirect {
  RedirectKind       kind_;
  Word               target_;
  std::optional<int> io_number_;
};

struct Assignment {
  std::string name_;
  Word        value_;
};

struct CommandNode {
  Word                    name_;
  std::vector<Word>       args_;
  std::vector<Redirect>   redirects_;
  // Prefix assignments (A=1 cmd) scoped to this command's environment
  std::vector<Assignment> assignments_;
};

struct PipelineNode {
  std::vector<Node> commands_;
};

enum struct ListOp {
  SEQ,
  AND,
  OR,
  BACKGROUND
};

// operators_[i] joins statements_[i] and statements_[i + 1]; a trailing
// BACKGROUND may follow the last statement.
struct ListNode {
  std::vector<Node>   statements_;
  std::vector<ListOp> operators_;
};

// Value is a StringLiteralNode or SingleQuotedStringNode; null for "export NAME".
struct ExportNode {
  std::string name_;
  NodePtr     value_;
};

struct AssignmentNode {
  std::vector<Assignment> assignments_;
};

struct SubshellNode {
  NodePtr               body_;
  std::vector<Redirect> redirects_;
};

struct GroupNode {
  NodePtr               body_;
  std::vector<Redirect> redirects_;
};

struct ElifBranchNode {
  NodePtr condition_;
  NodePtr body_;
};

struct ElseBranchNode {
  NodePtr body_;
};

struct IfStatementNode {
  NodePtr               condition_;
  NodePtr               then_;
  std::vector<Node>     elifs_;
  NodePtr               else_;
  std::vector<Redirect> redirects_;
};

struct CaseItem {
  std::vector<Word> patterns_;
  NodePtr           body_;
};

struct CaseStatementNode {
  Word                  subject_;
  std::vector<CaseItem> items_;
  std::vector<Redirect> redirects_;
};

struct ForLoopNode {
  std::string                      variable_;
  std::optional<std::vector<Word>> items_;
  // Header of the arithmetic form: for ((init; cond; step))
  std::string           arithmetic_;
  NodePtr               body_;
  std::vector<Redirect> redirects_;
};

struct WhileLoopNode {
  NodePtr               condition_;
  NodePtr               body_;
  std::vector<Redirect> redirects_;
};

struct UntilLoopNode {
  NodePtr               condition_;
  NodePtr               body_;
  std::vector<Redirect> redirects_;
};

struct SelectStatementNode {
  std::string                      variable_;
  std::optional<std::vector<Word>> items_;
  NodePtr                          body_;
  std::vector<Redirect>            redirects_;
};

struct FunctionNode {
  std::string name_;
  NodePtr     body_;
};

struct FunctionCallNode {
  std::string       name_;
  std::vector<Word> args_;
};

struct CommandSubstitutionNode {
  NodePtr body_;
};

struct ArithmeticExpansionNode {
  std::string expression_;
};

struct ArithmeticCommandNode {
  std::string expression_;
};

// ?(..) *(..) +(..) @(..) !(..)
struct ExtGlobPatternNode {
  char                     operator_;
  std::vector<std::string> patterns_;
};

// ${name<op><argument>}; operator "#" with empty argument is the length form ${#name}
struct ParameterExpansionNode {
  std::string name_;
  std::string operator_;
  std::string argument_;
};

enum struct ProcessDirection {
  INPUT, // <(...)
  OUTPUT // >(...)
};

struct ProcessSubstitutionNode {
  ProcessDirection direction_;
  NodePtr          body_;
};

struct HistoryExpansionNode {
  std::string       designator_;
  std::vector<Word> args_;
};

struct NegationNode {
  NodePtr pipeline_;
};

struct ArrayNode {
  std::string       name_;
  std::vector<Word> elements_;
};

struct ReturnNode {
  std::optional<Word> value_;
};

struct CompleteNode {
  std::vector<Word> args_;
};

// Raw operand texts between [[ and ]]
struct ExtendedTestNode {
  std::vector<std::string> operands_;
};

struct CommentNode {
  std::string text_;
};

struct StringLiteralNode {
  Word value_;
};

struct SingleQuotedStringNode {
  std::string text_;
};

struct Node {
  using Kind = std::variant<
      CommandNode,
      PipelineNode,
      ListNode,
      ExportNode,
      AssignmentNode,
      SubshellNode,
      GroupNode,
      IfStatementNode,
      ElifBranchNode,
      ElseBranchNode,
      CaseStatementNode,
      ForLoopNode,
      WhileLoopNode,
      UntilLoopNode,
      SelectStatementNode,
      FunctionNode,
      FunctionCallNode,
      CommandSubstitutionNode,
      ArithmeticExpansionNode,
      ArithmeticCommandNode,
      ExtGlobPatternNode,
      ParameterExpansionNode,
      ProcessSubstitutionNode,
      HistoryExpansionNode,
      NegationNode,
      ArrayNode,
      ReturnNode,
      CompleteNode,
      ExtendedTestNode,
      CommentNode,
      StringLiteralNode,
      SingleQuotedStringNode>;

  Kind kind_;

  template<typename T>
  [[nodiscard]] bool is() const {
    return std::holds_alternative<T>(kind_);
  }

  template<typename T>
  T const* getIf() const {
    return std::get_if<T>(&kind_);
  }
};

template<typename T>
NodePtr makeNode(T&& value) {
  return std::make_unique<Node>(Node{Node::Kind{std::forward<T>(value)}});
}

inline NodePtr makeNode(Node&& value) {
  return std::make_unique<Node>(std::move(value));
}

// Construct name used in diagnostics ("if statement", "pipeline", ...)
std::string_view nodeName(Node const& node);

} // namespace wpcsh
