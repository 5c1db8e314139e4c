#include "surql/Lexer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using sgw::surql::Lexer;
using sgw::surql::Token;
using sgw::surql::TokenKind;

namespace {

std::vector<Token> lex(const std::string& sInput) {
  Lexer lx(sInput);
  return lx.tokenize();
}

}  // namespace

TEST(LexerTest, SplitsWordsPunctuationAndParams) {
  auto vTokens = lex("SELECT * FROM person WHERE age >= $min;");
  ASSERT_EQ(vTokens.size(), 10u);
  EXPECT_EQ(vTokens[0].kind, TokenKind::Ident);
  EXPECT_EQ(vTokens[0].sText, "SELECT");
  EXPECT_EQ(vTokens[1].kind, TokenKind::Punct);
  EXPECT_EQ(vTokens[1].sText, "*");
  EXPECT_EQ(vTokens[6].sText, ">=");
  EXPECT_EQ(vTokens[7].kind, TokenKind::Param);
  EXPECT_EQ(vTokens[7].sText, "min");
  EXPECT_EQ(vTokens[8].sText, ";");
  EXPECT_EQ(vTokens[9].kind, TokenKind::End);
}

TEST(LexerTest, RecordsOffsetsAndLeadingSpace) {
  auto vTokens = lex("person:tobie");
  ASSERT_EQ(vTokens.size(), 4u);
  EXPECT_EQ(vTokens[1].sText, ":");
  EXPECT_EQ(vTokens[1].uOffset, 6u);
  EXPECT_FALSE(vTokens[1].bSpaceBefore);
  EXPECT_FALSE(vTokens[2].bSpaceBefore);

  auto vSpaced = lex("a : b");
  EXPECT_TRUE(vSpaced[1].bSpaceBefore);
}

TEST(LexerTest, UnescapesStrings) {
  auto vTokens = lex(R"('it\'s' "say \"hi\"\n" 'é')");
  ASSERT_EQ(vTokens.size(), 4u);
  EXPECT_EQ(vTokens[0].kind, TokenKind::String);
  EXPECT_EQ(vTokens[0].sText, "it's");
  EXPECT_EQ(vTokens[1].sText, "say \"hi\"\n");
  EXPECT_EQ(vTokens[2].sText, "\xC3\xA9");
}

TEST(LexerTest, ReadsNumbersAndDurations) {
  auto vTokens = lex("42 3.5 1e9 2E-3 1h30m 500ms");
  ASSERT_EQ(vTokens.size(), 7u);
  EXPECT_EQ(vTokens[0].kind, TokenKind::Number);
  EXPECT_EQ(vTokens[1].sText, "3.5");
  EXPECT_EQ(vTokens[2].sText, "1e9");
  EXPECT_EQ(vTokens[3].sText, "2E-3");
  EXPECT_EQ(vTokens[4].kind, TokenKind::Duration);
  EXPECT_EQ(vTokens[4].sText, "1h30m");
  EXPECT_EQ(vTokens[5].kind, TokenKind::Duration);
}

TEST(LexerTest, ReadsEscapedIdentifiers) {
  auto vTokens = lex("person:\xE2\x9F\xA8john doe\xE2\x9F\xA9 `my table`");
  ASSERT_EQ(vTokens.size(), 5u);
  EXPECT_EQ(vTokens[2].kind, TokenKind::RawIdent);
  EXPECT_EQ(vTokens[2].sText, "john doe");
  EXPECT_EQ(vTokens[3].kind, TokenKind::RawIdent);
  EXPECT_EQ(vTokens[3].sText, "my table");
}

TEST(LexerTest, DecodesClosingDelimiterAndBackslashEscapes) {
  auto vTokens = lex("`a\\`b` person:\xE2\x9F\xA8we\\\xE2\x9F\xA9ird\xE2\x9F\xA9 `c\\\\d`");
  ASSERT_EQ(vTokens.size(), 6u);
  EXPECT_EQ(vTokens[0].kind, TokenKind::RawIdent);
  EXPECT_EQ(vTokens[0].sText, "a`b");
  EXPECT_EQ(vTokens[3].kind, TokenKind::RawIdent);
  EXPECT_EQ(vTokens[3].sText, "we\xE2\x9F\xA9ird");
  EXPECT_EQ(vTokens[4].sText, "c\\d");
}

TEST(LexerTest, OtherBackslashesInRawIdentifierStayLiteral) {
  auto vTokens = lex("`a\\nb`");
  ASSERT_EQ(vTokens.size(), 2u);
  EXPECT_EQ(vTokens[0].sText, "a\\nb");
}

TEST(LexerTest, EscapedClosingDelimiterDoesNotTerminate) {
  EXPECT_THROW(lex("`abc\\`"), sgw::common::ParseError);
}

TEST(LexerTest, SkipsComments) {
  auto vTokens = lex("-- leading\nSELECT /* inline */ * # trailing\nFROM // end\nperson");
  ASSERT_EQ(vTokens.size(), 5u);
  EXPECT_EQ(vTokens[0].sText, "SELECT");
  EXPECT_EQ(vTokens[1].sText, "*");
  EXPECT_EQ(vTokens[2].sText, "FROM");
  EXPECT_EQ(vTokens[3].sText, "person");
}

TEST(LexerTest, PrefersLongestOperator) {
  auto vTokens = lex("a<->b->c<-d");
  ASSERT_EQ(vTokens.size(), 8u);
  EXPECT_EQ(vTokens[1].sText, "<->");
  EXPECT_EQ(vTokens[3].sText, "->");
  EXPECT_EQ(vTokens[5].sText, "<-");
}

TEST(LexerTest, RejectsUnterminatedString) {
  try {
    lex("CREATE person CONTENT { name: 'oops }");
    FAIL() << "expected ParseError";
  } catch (const sgw::common::ParseError& e) {
    EXPECT_EQ(e._uOffset, 30u);
  }
}

TEST(LexerTest, RejectsStrayCharacter) {
  EXPECT_THROW(lex("SELECT @ FROM person"), sgw::common::ParseError);
}

TEST(LexerTest, RejectsUnterminatedBlockComment) {
  EXPECT_THROW(lex("SELECT * /* FROM person"), sgw::common::ParseError);
}

TEST(LexerTest, RejectsMalformedNumber) {
  EXPECT_THROW(lex("LIMIT 12abc"), sgw::common::ParseError);
}
