// ouro/syntax/lexer.cpp - Fail-fast scanner
#include "ouro/syntax/lexer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <unordered_map>
#include <utility>

namespace ouro::syntax
{

namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

int digit_value(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string char_for_message(char c)
{
  if (std::isprint(static_cast<unsigned char>(c)) != 0) {
    return std::string(1, c);
  }
  static constexpr char k_hex[] = "0123456789ABCDEF";
  const auto u = static_cast<unsigned char>(c);
  return std::string("\\x") + k_hex[u >> 4] + k_hex[u & 0xF];
}

/// Length of the UTF-8 sequence introduced by lead byte `c` (1 for invalid leads).
size_t utf8_length(unsigned char c)
{
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

char32_t decode_utf8(std::string_view s)
{
  const auto b0 = static_cast<unsigned char>(s[0]);
  switch (s.size()) {
    case 2:
      return ((b0 & 0x1FU) << 6) | (static_cast<unsigned char>(s[1]) & 0x3FU);
    case 3:
      return ((b0 & 0x0FU) << 12) | ((static_cast<unsigned char>(s[1]) & 0x3FU) << 6) |
             (static_cast<unsigned char>(s[2]) & 0x3FU);
    case 4:
      return ((b0 & 0x07U) << 18) | ((static_cast<unsigned char>(s[1]) & 0x3FU) << 12) |
             ((static_cast<unsigned char>(s[2]) & 0x3FU) << 6) |
             (static_cast<unsigned char>(s[3]) & 0x3FU);
    default:
      return b0;
  }
}

/// Punctuation spellings ordered longest first for maximal munch.
struct PunctEntry
{
  std::string_view spelling;
  TokenKind kind;
};

constexpr PunctEntry k_punctuation[] = {
  {">>>=", TokenKind::GtGtGtEq},
  {"<<=", TokenKind::LtLtEq},
  {">>=", TokenKind::GtGtEq},
  {">>>", TokenKind::GtGtGt},
  {"**=", TokenKind::StarStarEq},
  {"?\?=", TokenKind::QuestionQuestionEq},
  {"<=>", TokenKind::Spaceship},
  {"...", TokenKind::Ellipsis},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::Ne},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
  {"+=", TokenKind::PlusEq},
  {"-=", TokenKind::MinusEq},
  {"*=", TokenKind::StarEq},
  {"/=", TokenKind::SlashEq},
  {"%=", TokenKind::PercentEq},
  {"&=", TokenKind::AmpEq},
  {"|=", TokenKind::PipeEq},
  {"^=", TokenKind::CaretEq},
  {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},
  {"<<", TokenKind::LtLt},
  {">>", TokenKind::GtGt},
  {"**", TokenKind::StarStar},
  {"??", TokenKind::QuestionQuestion},
  {"->", TokenKind::Arrow},
  {"=>", TokenKind::FatArrow},
  {"..", TokenKind::DotDot},
  {"::", TokenKind::ColonColon},
  {"(", TokenKind::LParen},
  {")", TokenKind::RParen},
  {"{", TokenKind::LBrace},
  {"}", TokenKind::RBrace},
  {"[", TokenKind::LBracket},
  {"]", TokenKind::RBracket},
  {",", TokenKind::Comma},
  {".", TokenKind::Dot},
  {":", TokenKind::Colon},
  {";", TokenKind::Semicolon},
  {"?", TokenKind::Question},
  {"+", TokenKind::Plus},
  {"-", TokenKind::Minus},
  {"*", TokenKind::Star},
  {"/", TokenKind::Slash},
  {"%", TokenKind::Percent},
  {"&", TokenKind::Amp},
  {"|", TokenKind::Pipe},
  {"^", TokenKind::Caret},
  {"~", TokenKind::Tilde},
  {"!", TokenKind::Bang},
  {"=", TokenKind::Eq},
  {"<", TokenKind::Lt},
  {">", TokenKind::Gt},
};

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

std::optional<TokenKind> lookup_keyword(std::string_view text) noexcept
{
  static const std::unordered_map<std::string_view, TokenKind> k_keywords = {
#define OURO_KEYWORD(Name, Spelling) {Spelling, TokenKind::Name},
#include "ouro/syntax/token_kinds.def"
  };
  const auto it = k_keywords.find(text);
  if (it == k_keywords.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string_view to_string(LexerErrorKind k) noexcept
{
  switch (k) {
    case LexerErrorKind::InvalidCharacter:
      return "invalid character";
    case LexerErrorKind::UnterminatedString:
      return "unterminated string";
    case LexerErrorKind::UnterminatedChar:
      return "unterminated char";
    case LexerErrorKind::InvalidEscapeSequence:
      return "invalid escape sequence";
    case LexerErrorKind::UnterminatedBlockComment:
      return "unterminated block comment";
    case LexerErrorKind::InvalidNumber:
      return "invalid number";
    case LexerErrorKind::InvalidCharLiteral:
      return "invalid char literal";
  }
  return "lexer error";
}

Diagnostic LexerError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = "L000" + std::to_string(static_cast<int>(kind) + 1);
  d.message = message;
  d.labels.push_back(Label{range, std::string(to_string(kind)), LabelStyle::Primary});
  return d;
}

void append_utf8(std::string & out, char32_t cp)
{
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

Result<std::vector<Token>, LexerError> scan_tokens(std::string_view source)
{
  Lexer lexer(source);
  return lexer.scan_tokens();
}

// ============================================================================
// Lexer
// ============================================================================

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::advance(size_t n) noexcept
{
  for (size_t i = 0; i < n && pos_ < src_.size(); ++i) {
    if (src_[pos_] == '\n') {
      ++line_;
      line_start_ = static_cast<uint32_t>(pos_ + 1);
    }
    ++pos_;
  }
}

LineColumn Lexer::position_of(uint32_t offset) const noexcept
{
  uint32_t line = 1;
  uint32_t start = 0;
  for (uint32_t i = 0; i < offset && i < src_.size(); ++i) {
    if (src_[i] == '\n') {
      ++line;
      start = i + 1;
    }
  }
  return {line, offset - start + 1};
}

void Lexer::push(TokenKind kind, uint32_t start, LiteralValue literal)
{
  const auto end = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = kind;
  t.lexeme = src_.substr(start, end - start);
  t.literal = std::move(literal);
  t.range = SourceRange(start, end);
  t.line = tok_line_;
  t.column = tok_column_;
  tokens_.push_back(std::move(t));
}

bool Lexer::fail(LexerErrorKind kind, std::string message, uint32_t start, uint32_t end)
{
  const LineColumn lc = position_of(start);
  LexerError e;
  e.kind = kind;
  e.message = std::move(message);
  e.line = lc.line;
  e.column = lc.column;
  e.range = SourceRange(start, std::max(start, end));
  error_ = std::move(e);
  return false;
}

Result<std::vector<Token>, LexerError> Lexer::scan_tokens()
{
  tokens_.clear();
  error_.reset();
  pos_ = 0;
  line_ = 1;
  line_start_ = 0;

  while (true) {
    if (!skip_trivia()) {
      return std::move(*error_);
    }
    if (eof()) {
      break;
    }
    tok_line_ = line_;
    tok_column_ = static_cast<uint32_t>(pos_) - line_start_ + 1;
    if (!lex_token()) {
      return std::move(*error_);
    }
  }

  tok_line_ = line_;
  tok_column_ = static_cast<uint32_t>(pos_) - line_start_ + 1;
  push(TokenKind::Eof, static_cast<uint32_t>(pos_));
  return std::move(tokens_);
}

bool Lexer::skip_trivia()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      advance();
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance();
      }
      continue;
    }
    if (starts_with("/*")) {
      // The first "*/" closes the comment; nested openers are plain text.
      const auto start = static_cast<uint32_t>(pos_);
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance();
      }
      if (eof()) {
        return fail(
          LexerErrorKind::UnterminatedBlockComment, "unterminated block comment", start,
          start + 2);
      }
      advance(2);
      continue;
    }
    break;
  }
  return true;
}

bool Lexer::lex_token()
{
  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (c == '"') {
    return lex_string();
  }
  if (c == '\'') {
    return lex_char();
  }
  return lex_punctuation();
}

bool Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance();
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }
  const std::string_view text = src_.substr(start, pos_ - start);

  if (const auto kw = lookup_keyword(text)) {
    if (*kw == TokenKind::KwTrue || *kw == TokenKind::KwFalse) {
      push(*kw, start, *kw == TokenKind::KwTrue);
    } else {
      push(*kw, start);
    }
    return true;
  }

  push(TokenKind::Identifier, start, std::string(text));
  return true;
}

bool Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  if (peek() == '0') {
    switch (peek(1)) {
      case 'x':
      case 'X':
        return lex_radix_integer(16);
      case 'b':
      case 'B':
        return lex_radix_integer(2);
      case 'o':
      case 'O':
        return lex_radix_integer(8);
      default:
        break;
    }
  }

  std::string digits;
  const auto scan_digits = [&]() {
    while (!eof() && (is_digit(peek()) || peek() == '_')) {
      if (peek() != '_') {
        digits += peek();
      }
      advance();
    }
  };

  scan_digits();
  bool is_float = false;

  if (peek() == '.' && is_digit(peek(1))) {
    is_float = true;
    digits += '.';
    advance();
    scan_digits();
  }

  if (peek() == 'e' || peek() == 'E') {
    is_float = true;
    digits += 'e';
    advance();
    if (peek() == '+' || peek() == '-') {
      digits += peek();
      advance();
    }
    if (!is_digit(peek())) {
      return fail(
        LexerErrorKind::InvalidNumber, "exponent has no digits", start,
        static_cast<uint32_t>(pos_));
    }
    scan_digits();
  }

  if (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    return fail(
      LexerErrorKind::InvalidNumber,
      "invalid digit '" + char_for_message(peek()) + "' in number literal", start,
      static_cast<uint32_t>(pos_ + 1));
  }

  if (is_float) {
    const double value = std::strtod(digits.c_str(), nullptr);
    if (std::isinf(value)) {
      return fail(
        LexerErrorKind::InvalidNumber, "float literal is out of range", start,
        static_cast<uint32_t>(pos_));
    }
    push(TokenKind::FloatLiteral, start, value);
    return true;
  }

  constexpr auto k_max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  uint64_t value = 0;
  for (const char d : digits) {
    const auto dv = static_cast<uint64_t>(d - '0');
    if (value > (k_max - dv) / 10) {
      return fail(
        LexerErrorKind::InvalidNumber, "integer literal is too large", start,
        static_cast<uint32_t>(pos_));
    }
    value = value * 10 + dv;
  }
  push(TokenKind::IntLiteral, start, static_cast<int64_t>(value));
  return true;
}

bool Lexer::lex_radix_integer(int base)
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);

  constexpr auto k_max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  const auto ubase = static_cast<uint64_t>(base);
  uint64_t value = 0;
  bool any = false;

  while (!eof()) {
    const char c = peek();
    if (c == '_') {
      advance();
      continue;
    }
    const int d = digit_value(c);
    if (d < 0 || d >= base) {
      if (is_ident_continue(static_cast<unsigned char>(c))) {
        return fail(
          LexerErrorKind::InvalidNumber,
          "invalid digit '" + char_for_message(c) + "' in base-" + std::to_string(base) +
            " literal",
          start, static_cast<uint32_t>(pos_ + 1));
      }
      break;
    }
    const auto dv = static_cast<uint64_t>(d);
    if (value > (k_max - dv) / ubase) {
      return fail(
        LexerErrorKind::InvalidNumber, "integer literal is too large", start,
        static_cast<uint32_t>(pos_ + 1));
    }
    value = value * ubase + dv;
    any = true;
    advance();
  }

  if (!any) {
    return fail(
      LexerErrorKind::InvalidNumber, "expected digits after radix prefix", start,
      static_cast<uint32_t>(pos_));
  }

  push(TokenKind::IntLiteral, start, static_cast<int64_t>(value));
  return true;
}

bool Lexer::lex_escape(std::string & out, uint32_t backslash_pos)
{
  if (eof()) {
    return fail(
      LexerErrorKind::UnterminatedString, "unterminated escape sequence", backslash_pos,
      static_cast<uint32_t>(pos_));
  }

  const char c = peek();
  switch (c) {
    case 'n':
      out += '\n';
      break;
    case 't':
      out += '\t';
      break;
    case 'r':
      out += '\r';
      break;
    case '0':
      out += '\0';
      break;
    case '\\':
      out += '\\';
      break;
    case '"':
      out += '"';
      break;
    case '\'':
      out += '\'';
      break;
    case 'u': {
      advance();
      if (peek() != '{') {
        return fail(
          LexerErrorKind::InvalidEscapeSequence, "expected '{' after '\\u'", backslash_pos,
          static_cast<uint32_t>(pos_));
      }
      advance();

      uint32_t cp = 0;
      int digits = 0;
      while (!eof() && peek() != '}') {
        const int d = digit_value(peek());
        if (d < 0) {
          return fail(
            LexerErrorKind::InvalidEscapeSequence, "invalid hex digit in unicode escape",
            backslash_pos, static_cast<uint32_t>(pos_ + 1));
        }
        if (++digits > 6) {
          return fail(
            LexerErrorKind::InvalidEscapeSequence, "unicode escape has more than 6 hex digits",
            backslash_pos, static_cast<uint32_t>(pos_ + 1));
        }
        cp = cp * 16 + static_cast<uint32_t>(d);
        advance();
      }
      if (eof()) {
        return fail(
          LexerErrorKind::InvalidEscapeSequence, "unterminated unicode escape", backslash_pos,
          static_cast<uint32_t>(pos_));
      }
      advance();  // '}'
      if (digits == 0) {
        return fail(
          LexerErrorKind::InvalidEscapeSequence, "empty unicode escape", backslash_pos,
          static_cast<uint32_t>(pos_));
      }
      if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return fail(
          LexerErrorKind::InvalidEscapeSequence, "unicode escape is not a scalar value",
          backslash_pos, static_cast<uint32_t>(pos_));
      }
      append_utf8(out, static_cast<char32_t>(cp));
      return true;
    }
    default:
      return fail(
        LexerErrorKind::InvalidEscapeSequence,
        "invalid escape sequence '\\" + char_for_message(c) + "'", backslash_pos,
        static_cast<uint32_t>(pos_ + 1));
  }
  advance();
  return true;
}

bool Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  const bool multiline = starts_with("\"\"\"");
  advance(multiline ? 3 : 1);

  std::string value;
  while (true) {
    if (eof()) {
      return fail(
        LexerErrorKind::UnterminatedString, "unterminated string literal", start,
        static_cast<uint32_t>(pos_));
    }
    if (multiline) {
      if (starts_with("\"\"\"")) {
        advance(3);
        break;
      }
    } else {
      if (peek() == '"') {
        advance();
        break;
      }
      if (peek() == '\n' || peek() == '\r') {
        return fail(
          LexerErrorKind::UnterminatedString, "unterminated string literal", start,
          static_cast<uint32_t>(pos_));
      }
    }

    if (peek() == '\\') {
      const auto backslash = static_cast<uint32_t>(pos_);
      advance();
      if (!lex_escape(value, backslash)) {
        return false;
      }
      continue;
    }

    value += peek();
    advance();
  }

  push(TokenKind::StringLiteral, start, std::move(value));
  return true;
}

bool Lexer::lex_char()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance();

  if (eof() || peek() == '\n' || peek() == '\r') {
    return fail(
      LexerErrorKind::UnterminatedChar, "unterminated char literal", start,
      static_cast<uint32_t>(pos_));
  }
  if (peek() == '\'') {
    advance();
    return fail(
      LexerErrorKind::InvalidCharLiteral, "empty char literal", start,
      static_cast<uint32_t>(pos_));
  }

  char32_t value = 0;
  if (peek() == '\\') {
    const auto backslash = static_cast<uint32_t>(pos_);
    advance();
    std::string decoded;
    if (!lex_escape(decoded, backslash)) {
      if (error_ && error_->kind == LexerErrorKind::UnterminatedString) {
        error_->kind = LexerErrorKind::UnterminatedChar;
        error_->message = "unterminated char literal";
      }
      return false;
    }
    value = decode_utf8(decoded);
  } else {
    const size_t len = utf8_length(static_cast<unsigned char>(peek()));
    if (pos_ + len > src_.size()) {
      return fail(
        LexerErrorKind::UnterminatedChar, "unterminated char literal", start,
        static_cast<uint32_t>(src_.size()));
    }
    value = decode_utf8(src_.substr(pos_, len));
    advance(len);
  }

  if (peek() == '\'') {
    advance();
    push(TokenKind::CharLiteral, start, value);
    return true;
  }

  // Distinguish "'ab'" (too long) from "'a" (never closed) by looking for a
  // closing quote on the same line.
  size_t scan = pos_;
  while (scan < src_.size() && src_[scan] != '\n' && src_[scan] != '\'') {
    ++scan;
  }
  if (scan < src_.size() && src_[scan] == '\'') {
    return fail(
      LexerErrorKind::InvalidCharLiteral, "char literal must contain exactly one character",
      start, static_cast<uint32_t>(scan + 1));
  }
  return fail(
    LexerErrorKind::UnterminatedChar, "unterminated char literal", start,
    static_cast<uint32_t>(pos_));
}

bool Lexer::lex_punctuation()
{
  const auto start = static_cast<uint32_t>(pos_);
  for (const auto & entry : k_punctuation) {
    if (starts_with(entry.spelling)) {
      advance(entry.spelling.size());
      push(entry.kind, start);
      return true;
    }
  }

  const unsigned char c = static_cast<unsigned char>(peek());
  const size_t len = utf8_length(c);
  return fail(
    LexerErrorKind::InvalidCharacter,
    "unexpected character '" + std::string(src_.substr(pos_, len)) + "'", start,
    static_cast<uint32_t>(pos_ + len));
}

}  // namespace ouro::syntax
