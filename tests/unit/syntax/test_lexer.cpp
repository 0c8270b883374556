#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "ouro/syntax/lexer.hpp"
#include "ouro/syntax/token.hpp"

using ouro::syntax::LexerErrorKind;
using ouro::syntax::scan_tokens;
using ouro::syntax::Token;
using ouro::syntax::TokenKind;

namespace
{

std::vector<Token> lex_ok(std::string_view src)
{
  auto result = scan_tokens(src);
  EXPECT_TRUE(result.has_value()) << "unexpected lexer error: "
                                  << (result ? "" : result.error().message);
  if (!result) return {};
  return std::move(result).value();
}

std::vector<TokenKind> kinds_of(std::string_view src)
{
  std::vector<TokenKind> out;
  for (const auto & t : lex_ok(src)) {
    out.push_back(t.kind);
  }
  return out;
}

LexerErrorKind lex_error_kind(std::string_view src)
{
  auto result = scan_tokens(src);
  EXPECT_FALSE(result.has_value()) << "expected a lexer error for: " << src;
  if (result) return LexerErrorKind::InvalidCharacter;
  return result.error().kind;
}

}  // namespace

TEST(SyntaxLexer, EmptyInputIsJustEof)
{
  const auto toks = lex_ok("");
  ASSERT_EQ(toks.size(), 1u);
  EXPECT_EQ(toks[0].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, StreamEndsWithExactlyOneEof)
{
  for (const std::string_view src :
       {"var x = 1;", "   \n\t", "// only a comment", "/* block */", "a.b.c()"}) {
    const auto toks = lex_ok(src);
    ASSERT_FALSE(toks.empty());
    EXPECT_EQ(toks.back().kind, TokenKind::Eof) << src;
    size_t eofs = 0;
    for (const auto & t : toks) {
      if (t.kind == TokenKind::Eof) ++eofs;
    }
    EXPECT_EQ(eofs, 1u) << src;
  }
}

TEST(SyntaxLexer, RadixPrefixedIntegerLiterals)
{
  const auto toks = lex_ok("0xFF 0b101 0o173 1_000_000 0xdead_beef");
  ASSERT_EQ(toks.size(), 6u);
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(toks[i].kind, TokenKind::IntLiteral);
  }
  EXPECT_EQ(toks[0].int_value(), 255);
  EXPECT_EQ(toks[1].int_value(), 5);
  EXPECT_EQ(toks[2].int_value(), 123);
  EXPECT_EQ(toks[3].int_value(), 1000000);
  EXPECT_EQ(toks[4].int_value(), 0xdeadbeef);
  EXPECT_EQ(toks[0].lexeme, "0xFF");
}

TEST(SyntaxLexer, FloatLiterals)
{
  const auto toks = lex_ok("1.5e2 3.25 2E-1 7");
  ASSERT_EQ(toks.size(), 5u);
  EXPECT_EQ(toks[0].kind, TokenKind::FloatLiteral);
  EXPECT_DOUBLE_EQ(toks[0].float_value(), 150.0);
  EXPECT_EQ(toks[1].kind, TokenKind::FloatLiteral);
  EXPECT_DOUBLE_EQ(toks[1].float_value(), 3.25);
  EXPECT_EQ(toks[2].kind, TokenKind::FloatLiteral);
  EXPECT_DOUBLE_EQ(toks[2].float_value(), 0.2);
  EXPECT_EQ(toks[3].kind, TokenKind::IntLiteral);
}

TEST(SyntaxLexer, DotAfterIntegerIsNotAFraction)
{
  // `1..5` is a range: Int DotDot Int
  EXPECT_EQ(
    kinds_of("1..5"), (std::vector<TokenKind>{
                        TokenKind::IntLiteral, TokenKind::DotDot, TokenKind::IntLiteral,
                        TokenKind::Eof}));
  EXPECT_EQ(
    kinds_of("a.count"), (std::vector<TokenKind>{
                           TokenKind::Identifier, TokenKind::Dot, TokenKind::Identifier,
                           TokenKind::Eof}));
}

TEST(SyntaxLexer, InvalidNumbers)
{
  EXPECT_EQ(lex_error_kind("0x"), LexerErrorKind::InvalidNumber);
  EXPECT_EQ(lex_error_kind("0b102"), LexerErrorKind::InvalidNumber);
  EXPECT_EQ(lex_error_kind("0o9"), LexerErrorKind::InvalidNumber);
  EXPECT_EQ(lex_error_kind("1e"), LexerErrorKind::InvalidNumber);
  EXPECT_EQ(lex_error_kind("123abc"), LexerErrorKind::InvalidNumber);
  EXPECT_EQ(lex_error_kind("99999999999999999999"), LexerErrorKind::InvalidNumber);
  EXPECT_EQ(lex_error_kind("0x8000000000000000"), LexerErrorKind::InvalidNumber);
}

TEST(SyntaxLexer, Int64MaxIsAccepted)
{
  const auto toks = lex_ok("9223372036854775807 0x7FFFFFFFFFFFFFFF");
  ASSERT_EQ(toks.size(), 3u);
  EXPECT_EQ(toks[0].int_value(), INT64_MAX);
  EXPECT_EQ(toks[1].int_value(), INT64_MAX);
}

TEST(SyntaxLexer, LongestMatchOperators)
{
  EXPECT_EQ(
    kinds_of(">>>= >>> >>= >> >= >"),
    (std::vector<TokenKind>{
      TokenKind::GtGtGtEq, TokenKind::GtGtGt, TokenKind::GtGtEq, TokenKind::GtGt, TokenKind::Ge,
      TokenKind::Gt, TokenKind::Eof}));
  EXPECT_EQ(
    kinds_of("... .. ."),
    (std::vector<TokenKind>{TokenKind::Ellipsis, TokenKind::DotDot, TokenKind::Dot, TokenKind::Eof}));
  EXPECT_EQ(
    kinds_of("?\?= ?? ?"), (std::vector<TokenKind>{
                             TokenKind::QuestionQuestionEq, TokenKind::QuestionQuestion,
                             TokenKind::Question, TokenKind::Eof}));
  EXPECT_EQ(
    kinds_of("<=> <= <<= << <"),
    (std::vector<TokenKind>{
      TokenKind::Spaceship, TokenKind::Le, TokenKind::LtLtEq, TokenKind::LtLt, TokenKind::Lt,
      TokenKind::Eof}));
  EXPECT_EQ(
    kinds_of("**= ** *= * -> - =>"),
    (std::vector<TokenKind>{
      TokenKind::StarStarEq, TokenKind::StarStar, TokenKind::StarEq, TokenKind::Star,
      TokenKind::Arrow, TokenKind::Minus, TokenKind::FatArrow, TokenKind::Eof}));
}

TEST(SyntaxLexer, KeywordsAndIdentifiers)
{
  const auto toks = lex_ok("class classy _x1 true false null func");
  ASSERT_EQ(toks.size(), 8u);
  EXPECT_EQ(toks[0].kind, TokenKind::KwClass);
  EXPECT_EQ(toks[1].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[1].lexeme, "classy");
  EXPECT_EQ(toks[2].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[3].kind, TokenKind::KwTrue);
  EXPECT_TRUE(toks[3].bool_value());
  EXPECT_EQ(toks[4].kind, TokenKind::KwFalse);
  EXPECT_FALSE(toks[4].bool_value());
  EXPECT_EQ(toks[5].kind, TokenKind::KwNull);
  EXPECT_EQ(toks[6].kind, TokenKind::KwFunc);
}

TEST(SyntaxLexer, StringEscapes)
{
  const auto toks = lex_ok(R"("a\tb\n\"q\" \u{48}\u{1F600}")");
  ASSERT_EQ(toks.size(), 2u);
  EXPECT_EQ(toks[0].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[0].string_value(), "a\tb\n\"q\" H\xF0\x9F\x98\x80");
}

TEST(SyntaxLexer, TripleQuotedStringSpansLines)
{
  const auto toks = lex_ok("\"\"\"line one\nline two\"\"\";");
  ASSERT_EQ(toks.size(), 3u);
  EXPECT_EQ(toks[0].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[0].string_value(), "line one\nline two");
  EXPECT_EQ(toks[1].kind, TokenKind::Semicolon);
}

TEST(SyntaxLexer, CharLiterals)
{
  const auto toks = lex_ok(R"('a' '\n' '\u{E9}')");
  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[0].kind, TokenKind::CharLiteral);
  EXPECT_EQ(toks[0].char_value(), U'a');
  EXPECT_EQ(toks[1].char_value(), U'\n');
  EXPECT_EQ(toks[2].char_value(), char32_t{0xE9});
}

TEST(SyntaxLexer, MalformedTextFailsWithoutCrashing)
{
  EXPECT_EQ(lex_error_kind("\"unterminated"), LexerErrorKind::UnterminatedString);
  EXPECT_EQ(lex_error_kind("\"line\nbreak\""), LexerErrorKind::UnterminatedString);
  EXPECT_EQ(lex_error_kind("\"\"\"never closed"), LexerErrorKind::UnterminatedString);
  EXPECT_EQ(lex_error_kind("'"), LexerErrorKind::UnterminatedChar);
  EXPECT_EQ(lex_error_kind("'a"), LexerErrorKind::UnterminatedChar);
  EXPECT_EQ(lex_error_kind(R"("\z")"), LexerErrorKind::InvalidEscapeSequence);
  EXPECT_EQ(lex_error_kind(R"("\u{D800}")"), LexerErrorKind::InvalidEscapeSequence);
  EXPECT_EQ(lex_error_kind("/* unterminated"), LexerErrorKind::UnterminatedBlockComment);
  EXPECT_EQ(lex_error_kind("''"), LexerErrorKind::InvalidCharLiteral);
  EXPECT_EQ(lex_error_kind("'ab'"), LexerErrorKind::InvalidCharLiteral);
  EXPECT_EQ(lex_error_kind("var x = 1 @ 2;"), LexerErrorKind::InvalidCharacter);
}

TEST(SyntaxLexer, ErrorCarriesPosition)
{
  auto result = scan_tokens("var s = 1;\n  /* open");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, LexerErrorKind::UnterminatedBlockComment);
  EXPECT_EQ(result.error().line, 2u);
  EXPECT_EQ(result.error().column, 3u);

  const auto diag = result.error().to_diagnostic();
  EXPECT_FALSE(diag.code.empty());
  EXPECT_EQ(diag.code[0], 'L');
}

TEST(SyntaxLexer, CommentsAreSkipped)
{
  EXPECT_EQ(
    kinds_of("a // trailing\n/* b /* not nested */ c"),
    (std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Identifier, TokenKind::Eof}));
}

TEST(SyntaxLexer, LineAndColumnAreOneBased)
{
  const auto toks = lex_ok("var x\n  = 42;");
  ASSERT_GE(toks.size(), 4u);
  EXPECT_EQ(toks[0].line, 1u);
  EXPECT_EQ(toks[0].column, 1u);
  EXPECT_EQ(toks[1].column, 5u);
  EXPECT_EQ(toks[2].line, 2u);
  EXPECT_EQ(toks[2].column, 3u);
  EXPECT_EQ(toks[3].int_value(), 42);
}

TEST(SyntaxLexer, RelexingALexemeGivesTheSameKind)
{
  const std::string_view src =
    "class A: B { var x: Int = 0x1F; func f(a: Double) -> String { return \"s\\n\" + 'c'; } }"
    " x >>>= 2; y ?\?= z; a <=> b; 1.5e3; 0b1_0; ...";

  for (const auto & tok : lex_ok(src)) {
    if (tok.kind == TokenKind::Eof) continue;
    const auto again = lex_ok(tok.lexeme);
    ASSERT_EQ(again.size(), 2u) << tok.lexeme;
    EXPECT_EQ(again[0].kind, tok.kind) << tok.lexeme;
    EXPECT_EQ(again[0].lexeme, tok.lexeme);
  }
}
