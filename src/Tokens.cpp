#include "wpcsh/Tokens.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace wpcsh {

std::string tokenText(Token const& t) {
  return std::visit(
      [](auto const& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, EndToken>) {
          return "<end>";
        } else if constexpr (std::is_same_v<V, NewlineToken>) {
          return "\\n";
        } else if constexpr (std::is_same_v<V, SemiToken>) {
          return ";";
        } else if constexpr (std::is_same_v<V, AmpToken>) {
          return "&";
        } else if constexpr (std::is_same_v<V, AndIfToken>) {
          return "&&";
        } else if constexpr (std::is_same_v<V, OrIfToken>) {
          return "||";
        } else if constexpr (std::is_same_v<V, PipeToken>) {
          return "|";
        } else if constexpr (std::is_same_v<V, LParenToken>) {
          return "(";
        } else if constexpr (std::is_same_v<V, RParenToken>) {
          return ")";
        } else if constexpr (std::is_same_v<V, LBraceToken>) {
          return "{";
        } else if constexpr (std::is_same_v<V, RBraceToken>) {
          return "}";
        } else if constexpr (std::is_same_v<V, LessToken>) {
          return "<";
        } else if constexpr (std::is_same_v<V, GreatToken>) {
          return ">";
        } else if constexpr (std::is_same_v<V, DGreatToken>) {
          return ">>";
        } else if constexpr (std::is_same_v<V, LessGreatToken>) {
          return "<>";
        } else if constexpr (std::is_same_v<V, DLessToken>) {
          return "<<";
        } else if constexpr (std::is_same_v<V, DLessDashToken>) {
          return "<<-";
        } else if constexpr (std::is_same_v<V, TLessToken>) {
          return "<<<";
        } else if constexpr (std::is_same_v<V, LessAndToken>) {
          return "<&";
        } else if constexpr (std::is_same_v<V, GreatAndToken>) {
          return ">&";
        } else if constexpr (std::is_same_v<V, DollarParenToken>) {
          return "$(";
        } else if constexpr (std::is_same_v<V, DollarDParenToken>) {
          return "$((";
        } else if constexpr (std::is_same_v<V, WordToken>) {
          return v.text_;
        } else if constexpr (std::is_same_v<V, SingleQuotedToken>) {
          return "'" + v.text_ + "'";
        } else if constexpr (std::is_same_v<V, DoubleQuotedToken>) {
          std::string out = "\"";
          for (auto const& part : v.parts_) {
            out += tokenText(part);
          }
          out += '"';
          return out;
        } else if constexpr (std::is_same_v<V, VariableToken>) {
          return "$" + v.name_;
        } else if constexpr (std::is_same_v<V, VariableBracedToken>) {
          return "${" + v.name_ + "}";
        } else if constexpr (std::is_same_v<V, SubstitutionToken>) {
          if (v.backquoted_) {
            return "`" + v.source_ + "`";
          }
          return v.arithmetic_ ? "$((" + v.source_ + "))" : "$(" + v.source_ + ")";
        } else {
          return std::string{"<tok>"};
        }
      },
      t.kind_
  );
}

} // namespace wpcsh
