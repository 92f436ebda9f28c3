#include "script/lexer.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "script/errors.hpp"

namespace {

using script::Token;
using script::Tokenize;

std::vector<Token::Type> Types(const std::vector<Token>& tokens) {
  std::vector<Token::Type> types;
  for (const Token& tok : tokens) types.push_back(tok.type);
  return types;
}

// NOLINTNEXTLINE
TEST(Lexer, SimpleAssignment) {
  auto tokens = Tokenize("x = 1 + 2.5");
  using T = Token::Type;
  EXPECT_THAT(Types(tokens), ::testing::ElementsAre(T::NAME, T::OP, T::INT,
                                                    T::OP, T::FLOAT,
                                                    T::NEWLINE, T::END));
  EXPECT_EQ(tokens[0].text, "x");
  EXPECT_EQ(tokens[2].int_value, 1);
  EXPECT_DOUBLE_EQ(tokens[4].float_value, 2.5);
}

// NOLINTNEXTLINE
TEST(Lexer, IndentAndDedent) {
  auto tokens = Tokenize("if x:\n    y = 1\nz = 2\n");
  using T = Token::Type;
  EXPECT_THAT(Types(tokens),
              ::testing::ElementsAre(T::NAME, T::NAME, T::OP, T::NEWLINE,
                                     T::INDENT, T::NAME, T::OP, T::INT,
                                     T::NEWLINE, T::DEDENT, T::NAME, T::OP,
                                     T::INT, T::NEWLINE, T::END));
}

// NOLINTNEXTLINE
TEST(Lexer, NewlinesInsideBracketsAreIgnored) {
  auto tokens = Tokenize("x = [1,\n     2]\n");
  int newlines = 0;
  for (const Token& tok : tokens) {
    if (tok.type == Token::Type::NEWLINE) newlines++;
  }
  EXPECT_EQ(newlines, 1);
}

// NOLINTNEXTLINE
TEST(Lexer, StringEscapes) {
  auto tokens = Tokenize("'a\\tb\\n' \"it's\"");
  ASSERT_EQ(tokens[0].type, Token::Type::STRING);
  EXPECT_EQ(tokens[0].text, "a\tb\n");
  EXPECT_EQ(tokens[1].text, "it's");
}

// NOLINTNEXTLINE
TEST(Lexer, CommentsAndBlankLines) {
  auto tokens = Tokenize("# header\n\n   # indented comment\nx = 1  # tail\n");
  EXPECT_EQ(tokens[0].text, "x");
  EXPECT_EQ(tokens[0].line, 4u);
}

// NOLINTNEXTLINE
TEST(Lexer, UnterminatedString) {
  try {
    Tokenize("x = 'abc\n");
    FAIL() << "expected a syntax error";
  } catch (const script::SyntaxError& e) {
    EXPECT_EQ(e.Line(), 1u);
    EXPECT_THAT(e.what(), ::testing::HasSubstr("unterminated"));
  }
}

// NOLINTNEXTLINE
TEST(Lexer, InvalidCharacterLocation) {
  try {
    Tokenize("x = 1\ny = $\n");
    FAIL() << "expected a syntax error";
  } catch (const script::SyntaxError& e) {
    EXPECT_EQ(e.Line(), 2u);
    EXPECT_EQ(e.Column(), 5u);
  }
}

// NOLINTNEXTLINE
TEST(Lexer, BadDedent) {
  EXPECT_THROW(Tokenize("if x:\n    y = 1\n  z = 2\n"), script::SyntaxError);
}

// NOLINTNEXTLINE
TEST(Lexer, IntegerTooLarge) {
  EXPECT_THROW(Tokenize("x = 99999999999999999999"), script::SyntaxError);
}

// NOLINTNEXTLINE
TEST(Lexer, Identifiers) {
  EXPECT_TRUE(script::IsIdentifier("prices"));
  EXPECT_TRUE(script::IsIdentifier("_x1"));
  EXPECT_FALSE(script::IsIdentifier("1x"));
  EXPECT_FALSE(script::IsIdentifier("a-b"));
  EXPECT_FALSE(script::IsIdentifier(""));
  EXPECT_FALSE(script::IsIdentifier("import"));
  EXPECT_TRUE(script::IsKeyword("lambda"));
  EXPECT_FALSE(script::IsKeyword("print"));
}

}  // namespace
