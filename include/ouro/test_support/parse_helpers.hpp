// ouro/test_support/parse_helpers.hpp - helpers for unit tests
//
// A lightweight single-source pipeline: lex, parse and optionally check in
// one call. Ownership stays explicit (AstContext + SemanticModel live in the
// returned unit), so AST pointers remain valid as long as the unit does.
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ouro/ast/ast.hpp"
#include "ouro/ast/ast_context.hpp"
#include "ouro/basic/diagnostic.hpp"
#include "ouro/sema/sema.hpp"
#include "ouro/syntax/lexer.hpp"
#include "ouro/syntax/parser.hpp"

namespace ouro::test_support
{

struct TestParseUnit
{
  std::string source;
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Program * program = nullptr;

  /// Set when scanning failed; the parser did not run.
  std::optional<syntax::LexerError> lex_error;
  std::vector<syntax::ParserError> parse_errors;

  SemanticModel model;
  std::vector<SymbolError> sema_errors;

  [[nodiscard]] bool parsed() const noexcept
  {
    return !lex_error && parse_errors.empty() && program != nullptr;
  }
};

/// Lex and parse `src`. The source is kept alive in the unit.
[[nodiscard]] inline std::unique_ptr<TestParseUnit> parse(std::string src)
{
  auto out = std::make_unique<TestParseUnit>();
  out->source = std::move(src);
  out->ast = std::make_unique<AstContext>();

  auto tokens = syntax::scan_tokens(out->source);
  if (!tokens) {
    out->lex_error = tokens.error();
    return out;
  }

  syntax::Parser parser(*out->ast, out->diags, std::move(tokens).value());
  out->program = parser.parse_program();
  out->parse_errors = parser.errors();
  return out;
}

/// Lex, parse and (when parsing succeeded) run `ouro::check`.
[[nodiscard]] inline std::unique_ptr<TestParseUnit> check(std::string src)
{
  auto out = parse(std::move(src));
  if (out->parsed()) {
    out->sema_errors = ouro::check(*out->program, out->model);
  }
  return out;
}

}  // namespace ouro::test_support
