// ouro/syntax/lexer.hpp - Source text to token stream
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ouro/basic/diagnostic.hpp"
#include "ouro/basic/result.hpp"
#include "ouro/syntax/token.hpp"

namespace ouro::syntax
{

// ============================================================================
// LexerError
// ============================================================================

enum class LexerErrorKind : uint8_t {
  InvalidCharacter,
  UnterminatedString,
  UnterminatedChar,
  InvalidEscapeSequence,
  UnterminatedBlockComment,
  InvalidNumber,
  InvalidCharLiteral,
};

[[nodiscard]] std::string_view to_string(LexerErrorKind k) noexcept;

struct LexerError
{
  LexerErrorKind kind = LexerErrorKind::InvalidCharacter;
  std::string message;
  uint32_t line = 1;
  uint32_t column = 1;
  SourceRange range;

  /// Diagnostic with code `L000n` and the offending range labelled.
  [[nodiscard]] Diagnostic to_diagnostic() const;
};

// ============================================================================
// Lexer
// ============================================================================

/**
 * Single-pass scanner over one source text.
 *
 * Scanning stops at the first error; on success the returned stream ends
 * with exactly one Eof token. Token lexemes are views into `src`, which
 * must outlive the tokens.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] Result<std::vector<Token>, LexerError> scan_tokens();

private:
  // Each lex_* consumes one token into tokens_, or records error_ and
  // returns false.
  bool lex_token();
  bool skip_trivia();
  bool lex_identifier_or_keyword();
  bool lex_number();
  bool lex_radix_integer(int base);
  bool lex_string();
  bool lex_char();
  bool lex_punctuation();

  /// Decodes an escape at pos_ (just after the backslash) into `out`.
  bool lex_escape(std::string & out, uint32_t backslash_pos);

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept;

  [[nodiscard]] LineColumn position_of(uint32_t offset) const noexcept;

  void push(TokenKind kind, uint32_t start, LiteralValue literal = {});

  bool fail(LexerErrorKind kind, std::string message, uint32_t start, uint32_t end);

  std::string_view src_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t line_start_ = 0;

  // Position of the token currently being scanned.
  uint32_t tok_line_ = 1;
  uint32_t tok_column_ = 1;

  std::vector<Token> tokens_;
  std::optional<LexerError> error_;
};

/// Tokenizes `source`; fails with the first lexical error.
[[nodiscard]] Result<std::vector<Token>, LexerError> scan_tokens(std::string_view source);

/// Appends the UTF-8 encoding of `cp` to `out`.
void append_utf8(std::string & out, char32_t cp);

}  // namespace ouro::syntax
