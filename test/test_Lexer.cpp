#include "wpcsh/Lexer.hpp"
#include "wpcsh/Tokens.hpp"

#include <string>
#include <vector>
#include <gtest/gtest.h>

using namespace wpcsh;

namespace {

std::vector<Token> lexAll(std::string_view s) {
  Lexer lx(s);
  auto  tokens = lx.lex();
  EXPECT_TRUE(tokens.has_value()) << (tokens ? "" : tokens.error().message());
  return tokens.value_or(std::vector<Token>{});
}

Token word(std::string text) {
  return Token{Token::Kind{WordToken{std::move(text)}}};
}

template<typename T>
Token tok() {
  return Token{Token::Kind{T{}}};
}

} // namespace

TEST(Lexer, PlainWords) {
  auto toks = lexAll("ls   -la\t/tmp");
  ASSERT_EQ(toks.size(), 4);
  EXPECT_EQ(toks[0], word("ls"));
  EXPECT_EQ(toks[1], word("-la"));
  EXPECT_EQ(toks[2], word("/tmp"));
  EXPECT_TRUE(toks[3].is<EndToken>());
}

TEST(Lexer, WordsRejoinToInput) {
  std::string input = "git commit -m message --amend";
  auto        toks  = lexAll(input);
  std::string joined;
  for (auto const& t : toks) {
    if (auto const* w = t.getIf<WordToken>()) {
      joined += joined.empty() ? w->text_ : " " + w->text_;
    }
  }
  EXPECT_EQ(joined, input);
}

TEST(Lexer, DoubleQuotesEmbedVariables) {
  auto toks = lexAll("echo \"a $X b\"");
  ASSERT_EQ(toks.size(), 3);
  EXPECT_EQ(toks[0], word("echo"));
  auto const* quoted = toks[1].getIf<DoubleQuotedToken>();
  ASSERT_NE(quoted, nullptr);
  ASSERT_EQ(quoted->parts_.size(), 3);
  EXPECT_EQ(quoted->parts_[0], word("a "));
  EXPECT_EQ(quoted->parts_[1], Token{Token::Kind{VariableToken{"X"}}});
  EXPECT_EQ(quoted->parts_[2], word(" b"));
}

TEST(Lexer, DoubleQuoteEscapes) {
  auto toks = lexAll(R"("a \"b\" \$c")");
  auto const* quoted = toks[0].getIf<DoubleQuotedToken>();
  ASSERT_NE(quoted, nullptr);
  ASSERT_EQ(quoted->parts_.size(), 1);
  EXPECT_EQ(quoted->parts_[0], word("a \"b\" $c"));
}

TEST(Lexer, SingleQuotesAreOpaque) {
  auto toks = lexAll("echo '$HOME ${X}'");
  ASSERT_EQ(toks.size(), 3);
  EXPECT_EQ(toks[1], Token{Token::Kind{SingleQuotedToken{"$HOME ${X}"}}});
}

TEST(Lexer, Variables) {
  auto toks = lexAll("$HOME ${USER} $? $1 $");
  ASSERT_EQ(toks.size(), 6);
  EXPECT_EQ(toks[0], Token{Token::Kind{VariableToken{"HOME"}}});
  EXPECT_EQ(toks[1], Token{Token::Kind{VariableBracedToken{"USER"}}});
  EXPECT_EQ(toks[2], Token{Token::Kind{VariableToken{"?"}}});
  EXPECT_EQ(toks[3], Token{Token::Kind{VariableToken{"1"}}});
  EXPECT_EQ(toks[4], word("$"));
}

TEST(Lexer, SubstitutionOpeners) {
  auto toks = lexAll("$(ls) $((1))");
  ASSERT_GE(toks.size(), 6);
  EXPECT_TRUE(toks[0].is<DollarParenToken>());
  EXPECT_EQ(toks[1], word("ls"));
  EXPECT_TRUE(toks[2].is<RParenToken>());
  EXPECT_TRUE(toks[3].is<DollarDParenToken>());
}

TEST(Lexer, SubstitutionsInsideQuotesAndBackquotes) {
  auto toks = lexAll("echo \"a $(date +%s) b $((1 + 2))\" `ls \\`x\\``");
  ASSERT_EQ(toks.size(), 4);
  auto const* quoted = toks[1].getIf<DoubleQuotedToken>();
  ASSERT_NE(quoted, nullptr);
  std::vector<Token> parts = {
      word("a "),
      Token{Token::Kind{SubstitutionToken{"date +%s"}}},
      word(" b "),
      Token{Token::Kind{SubstitutionToken{"1 + 2", true}}},
  };
  EXPECT_EQ(quoted->parts_, parts);
  EXPECT_EQ(toks[2], (Token{Token::Kind{SubstitutionToken{"ls `x`", false, true}}}));
  EXPECT_EQ(tokenText(toks[2]), "`ls `x``");
}

TEST(Lexer, BackquoteBreaksWords) {
  auto toks = lexAll("a`b`c");
  ASSERT_EQ(toks.size(), 4);
  EXPECT_EQ(toks[0], word("a"));
  EXPECT_EQ(toks[1], (Token{Token::Kind{SubstitutionToken{"b", false, true}}}));
  EXPECT_TRUE(toks[1].glued_);
  EXPECT_EQ(toks[2], word("c"));
}

TEST(Lexer, UnterminatedSubstitutions) {
  for (auto const* input : {"echo `ls", "echo \"$(ls\"", "echo \"`ls\""}) {
    Lexer lx(input);
    auto  tokens = lx.lex();
    EXPECT_FALSE(tokens.has_value()) << input;
  }
}

TEST(Lexer, Operators) {
  auto toks = lexAll("a && b || c | d ; e & f > g >> h < i <> j << k <<- l <<< m <& n >& o\n");
  std::vector<Token> expected = {
      word("a"), tok<AndIfToken>(),     word("b"),          tok<OrIfToken>(),     word("c"), tok<PipeToken>(),
      word("d"), tok<SemiToken>(),      word("e"),          tok<AmpToken>(),      word("f"), tok<GreatToken>(),
      word("g"), tok<DGreatToken>(),    word("h"),          tok<LessToken>(),     word("i"), tok<LessGreatToken>(),
      word("j"), tok<DLessToken>(),     word("k"),          tok<DLessDashToken>(), word("l"), tok<TLessToken>(),
      word("m"), tok<LessAndToken>(),   word("n"),          tok<GreatAndToken>(), word("o"), tok<NewlineToken>(),
      tok<EndToken>(),
  };
  EXPECT_EQ(toks, expected);
}

TEST(Lexer, Grouping) {
  auto toks = lexAll("(a){b}");
  std::vector<Token> expected = {
      tok<LParenToken>(), word("a"), tok<RParenToken>(), tok<LBraceToken>(), word("b"), tok<RBraceToken>(), tok<EndToken>(),
  };
  EXPECT_EQ(toks, expected);
}

TEST(Lexer, BackslashEscapesNextChar) {
  auto toks = lexAll(R"(a\ b c\|d)");
  ASSERT_EQ(toks.size(), 3);
  EXPECT_EQ(toks[0], word("a b"));
  EXPECT_EQ(toks[1], word("c|d"));
}

TEST(Lexer, GluedTokens) {
  auto toks = lexAll("pre$X.txt next");
  ASSERT_EQ(toks.size(), 5);
  EXPECT_FALSE(toks[0].glued_);
  EXPECT_TRUE(toks[1].glued_);
  EXPECT_TRUE(toks[2].glued_);
  EXPECT_FALSE(toks[3].glued_);
  EXPECT_EQ(toks[2], word(".txt"));
}

TEST(Lexer, CommentRunsToEndOfLine) {
  auto toks = lexAll("echo hi # don't stop\nls");
  ASSERT_EQ(toks.size(), 6);
  EXPECT_EQ(toks[2], word("# don't stop"));
  EXPECT_TRUE(toks[3].is<NewlineToken>());
  EXPECT_EQ(toks[4], word("ls"));
}

TEST(Lexer, HashInsideWordIsLiteral) {
  auto toks = lexAll("a#b");
  ASSERT_EQ(toks.size(), 2);
  EXPECT_EQ(toks[0], word("a#b"));
}

TEST(Lexer, EndRepeats) {
  Lexer lx("x");
  ASSERT_TRUE(lx.nextToken().has_value());
  for (int i = 0; i < 3; ++i) {
    auto t = lx.nextToken();
    ASSERT_TRUE(t.has_value());
    EXPECT_TRUE(t->is<EndToken>());
  }
  EXPECT_TRUE(lx.atEnd());
}

TEST(Lexer, UnterminatedQuotesFail) {
  for (auto const* input : {"echo \"abc", "echo 'abc", "echo ${abc"}) {
    Lexer lx(input);
    auto  toks = lx.lex();
    ASSERT_FALSE(toks.has_value()) << input;
    EXPECT_EQ(toks.error().kind(), ErrorKind::INVALID_INPUT) << input;
  }
}

TEST(Lexer, TokenText) {
  EXPECT_EQ(tokenText(word("ls")), "ls");
  EXPECT_EQ(tokenText(tok<AndIfToken>()), "&&");
  EXPECT_EQ(tokenText(Token{Token::Kind{VariableBracedToken{"X"}}}), "${X}");
}
