#include "wpcsh/AST.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace wpcsh {

std::optional<std::string> Word::literal() const {
  std::string out;
  for (auto const& part : parts_) {
    auto const* lit = std::get_if<LiteralPart>(&part);
    if (lit == nullptr) {
      return std::nullopt;
    }
    out += lit->text_;
  }
  return out;
}

bool Word::isBare(std::string_view text) const {
  if (parts_.size() != 1) {
    return false;
  }
  auto const* lit = std::get_if<LiteralPart>(parts_.data());
  return lit != nullptr && lit->quoting_ == Quoting::NONE && lit->text_ == text;
}

std::string_view nodeName(Node const& node) {
  return std::visit(
      [](auto const& v) -> std::string_view {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, CommandNode>) {
          return "command";
        } else if constexpr (std::is_same_v<V, PipelineNode>) {
          return "pipeline";
        } else if constexpr (std::is_same_v<V, ListNode>) {
          return "list";
        } else if constexpr (std::is_same_v<V, ExportNode>) {
          return "export";
        } else if constexpr (std::is_same_v<V, AssignmentNode>) {
          return "assignment";
        } else if constexpr (std::is_same_v<V, SubshellNode>) {
          return "subshell";
        } else if constexpr (std::is_same_v<V, GroupNode>) {
          return "group";
        } else if constexpr (std::is_same_v<V, IfStatementNode>) {
          return "if statement";
        } else if constexpr (std::is_same_v<V, ElifBranchNode>) {
          return "elif branch";
        } else if constexpr (std::is_same_v<V, ElseBranchNode>) {
          return "else branch";
        } else if constexpr (std::is_same_v<V, CaseStatementNode>) {
          return "case statement";
        } else if constexpr (std::is_same_v<V, ForLoopNode>) {
          return "for loop";
        } else if constexpr (std::is_same_v<V, WhileLoopNode>) {
          return "while loop";
        } else if constexpr (std::is_same_v<V, UntilLoopNode>) {
          return "until loop";
        } else if constexpr (std::is_same_v<V, SelectStatementNode>) {
          return "select statement";
        } else if constexpr (std::is_same_v<V, FunctionNode>) {
          return "function definition";
        } else if constexpr (std::is_same_v<V, FunctionCallNode>) {
          return "function call";
        } else if constexpr (std::is_same_v<V, CommandSubstitutionNode>) {
          return "command substitution";
        } else if constexpr (std::is_same_v<V, ArithmeticExpansionNode>) {
          return "arithmetic expansion";
        } else if constexpr (std::is_same_v<V, ArithmeticCommandNode>) {
          return "arithmetic command";
        } else if constexpr (std::is_same_v<V, ExtGlobPatternNode>) {
          return "extended glob";
        } else if constexpr (std::is_same_v<V, ParameterExpansionNode>) {
          return "parameter expansion";
        } else if constexpr (std::is_same_v<V, ProcessSubstitutionNode>) {
          return "process substitution";
        } else if constexpr (std::is_same_v<V, HistoryExpansionNode>) {
          return "history expansion";
        } else if constexpr (std::is_same_v<V, NegationNode>) {
          return "negation";
        } else if constexpr (std::is_same_v<V, ArrayNode>) {
          return "array assignment";
        } else if constexpr (std::is_same_v<V, ReturnNode>) {
          return "return";
        } else if constexpr (std::is_same_v<V, CompleteNode>) {
          return "complete";
        } else if constexpr (std::is_same_v<V, ExtendedTestNode>) {
          return "extended test";
        } else if constexpr (std::is_same_v<V, CommentNode>) {
          return "comment";
        } else if constexpr (std::is_same_v<V, StringLiteralNode>) {
          return "string literal";
        } else {
          return "single-quoted string";
        }
      },
      node.kind_
  );
}

} // namespace wpcsh
