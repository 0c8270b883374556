// ouro/syntax/token.hpp - Token kinds and token payloads
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "ouro/basic/source_manager.hpp"

namespace ouro::syntax
{

enum class TokenKind : uint8_t {
#define OURO_TOKEN(Name, Spelling) Name,
#define OURO_PUNCT(Name, Spelling) Name,
#define OURO_KEYWORD(Name, Spelling) Name,
#include "ouro/syntax/token_kinds.def"
};

namespace detail
{
inline constexpr TokenKind k_first_keyword = TokenKind::KwClass;
inline constexpr TokenKind k_last_keyword = TokenKind::KwModule;
}  // namespace detail

/// Spelling of punctuation/keywords, or a description for the other kinds.
[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
#define OURO_TOKEN(Name, Spelling) \
  case TokenKind::Name:            \
    return Spelling;
#define OURO_PUNCT(Name, Spelling) \
  case TokenKind::Name:            \
    return Spelling;
#define OURO_KEYWORD(Name, Spelling) \
  case TokenKind::Name:              \
    return Spelling;
#include "ouro/syntax/token_kinds.def"
  }
  return "<unknown>";
}

[[nodiscard]] constexpr bool is_keyword(TokenKind k) noexcept
{
  return k >= detail::k_first_keyword && k <= detail::k_last_keyword;
}

/// Keyword kind for `text`, or nullopt if it is an ordinary identifier.
[[nodiscard]] std::optional<TokenKind> lookup_keyword(std::string_view text) noexcept;

// ============================================================================
// Token
// ============================================================================

/// Literal payload: none, integer, float, string, character or boolean.
using LiteralValue = std::variant<std::monostate, int64_t, double, std::string, char32_t, bool>;

struct Token
{
  TokenKind kind = TokenKind::Eof;
  std::string_view lexeme;  // exact source slice (quotes included for strings/chars)
  LiteralValue literal;
  SourceRange range;
  uint32_t line = 1;
  uint32_t column = 1;

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }

  [[nodiscard]] bool has_literal() const noexcept
  {
    return !std::holds_alternative<std::monostate>(literal);
  }

  [[nodiscard]] int64_t int_value() const { return std::get<int64_t>(literal); }
  [[nodiscard]] double float_value() const { return std::get<double>(literal); }
  [[nodiscard]] const std::string & string_value() const { return std::get<std::string>(literal); }
  [[nodiscard]] char32_t char_value() const { return std::get<char32_t>(literal); }
  [[nodiscard]] bool bool_value() const { return std::get<bool>(literal); }
};

}  // namespace ouro::syntax
