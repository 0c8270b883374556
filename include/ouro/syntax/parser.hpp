// ouro/syntax/parser.hpp - Recursive-descent parser producing the arena AST
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ouro/ast/ast.hpp"
#include "ouro/ast/ast_context.hpp"
#include "ouro/basic/diagnostic.hpp"
#include "ouro/basic/result.hpp"
#include "ouro/syntax/token.hpp"

namespace ouro::syntax
{

// ============================================================================
// ParserError
// ============================================================================

enum class ParserErrorKind : uint8_t {
  UnexpectedToken,
  ExpectedToken,
  InvalidAssignmentTarget,
  NestingTooDeep,
};

[[nodiscard]] std::string_view to_string(ParserErrorKind k) noexcept;

struct ParserError
{
  ParserErrorKind kind = ParserErrorKind::UnexpectedToken;
  std::string message;
  std::string expected;  // what the parser wanted (ExpectedToken only)
  uint32_t line = 1;
  uint32_t column = 1;
  SourceRange range;

  /// Diagnostic with code `P000n`.
  [[nodiscard]] Diagnostic to_diagnostic() const;
};

// ============================================================================
// Parser
// ============================================================================

enum class RecoverySet : uint32_t {
  None = 0,
  Statement = 1 << 0,  // ;
  Block = 1 << 1,      // } or ;
  Argument = 1 << 2,   // ) or ; or {
};

inline RecoverySet operator|(RecoverySet a, RecoverySet b)
{
  return static_cast<RecoverySet>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(RecoverySet a, RecoverySet b)
{
  return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

/**
 * Parser for one token stream.
 *
 * Errors are collected (and mirrored into `diags`) while the parser
 * resynchronizes at statement and member boundaries, so one run can
 * report several problems. A program with errors() is not meant to be
 * analysed further.
 */
class Parser
{
public:
  /// Maximum nesting of expressions and statements before NestingTooDeep.
  static constexpr uint32_t k_max_nesting_depth = 256;

  Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens);

  [[nodiscard]] Program * parse_program();

  [[nodiscard]] const std::vector<ParserError> & errors() const noexcept { return errors_; }
  [[nodiscard]] bool has_errors() const noexcept { return !errors_.empty(); }

private:
  class DepthGuard;

  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what, RecoverySet recovery = RecoverySet::None);
  bool expect_name(std::string_view what);
  bool expect_closing_angle(std::string_view what);

  void error_at(
    const Token & t, ParserErrorKind kind, std::string msg, std::string expected = "");
  void report(
    ParserErrorKind kind, std::string msg, std::string expected, SourceRange range,
    LineColumn loc);
  void synchronize_to_stmt();
  void synchronize_to_member();
  void synchronize_skip_block();

  [[nodiscard]] bool at_modifier() const;
  [[nodiscard]] bool at_decl_start() const;
  [[nodiscard]] bool at_contextual(std::string_view word) const;
  [[nodiscard]] bool at_name() const;
  [[nodiscard]] bool at_member_name() const;
  [[nodiscard]] Modifiers parse_modifiers();

  // Depth accounting; false once the limit has been hit.
  bool enter_nested();
  void leave_nested() noexcept;

  template <typename T, typename... Args>
  T * make(LineColumn loc, SourceRange range, Args &&... args);

  [[nodiscard]] SourceRange span_from(const Token & first) const;

  // Declarations
  [[nodiscard]] Decl * parse_decl();
  [[nodiscard]] VarDecl * parse_var_decl(const Token & first, Modifiers mods);
  [[nodiscard]] FunctionDecl * parse_function_decl(
    const Token & first, Modifiers mods, bool signature_allowed);
  [[nodiscard]] FunctionDecl * parse_initializer(const Token & first, Modifiers mods);
  [[nodiscard]] ClassDecl * parse_class_decl(const Token & first, Modifiers mods);
  [[nodiscard]] StructDecl * parse_struct_decl(const Token & first, Modifiers mods);
  [[nodiscard]] EnumDecl * parse_enum_decl(const Token & first, Modifiers mods);
  [[nodiscard]] InterfaceDecl * parse_interface_decl(const Token & first, Modifiers mods);

  struct MemberLists
  {
    std::vector<VarDecl *> properties;
    std::vector<FunctionDecl *> methods;
  };

  /// One property, method or initializer inside a type body.
  void parse_member(MemberLists & out, bool in_interface);
  void finish_type_body(TypeDecl * decl, MemberLists & members);

  [[nodiscard]] std::vector<std::string_view> parse_type_params_opt();
  [[nodiscard]] std::vector<NamedType *> parse_inherited_names();
  [[nodiscard]] gsl::span<ParamDecl *> parse_params();
  [[nodiscard]] ParamDecl * parse_param();

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] BlockStmt * parse_block();
  [[nodiscard]] Stmt * parse_if_stmt();
  [[nodiscard]] Stmt * parse_while_stmt();
  [[nodiscard]] Stmt * parse_for_stmt();
  [[nodiscard]] Stmt * parse_return_stmt();
  [[nodiscard]] Stmt * parse_expression_stmt();
  [[nodiscard]] Stmt * parse_body_stmt();
  [[nodiscard]] VarDeclStmt * parse_local_var();

  // Types
  [[nodiscard]] TypeNode * parse_type();
  [[nodiscard]] NamedType * parse_named_type();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_nested(Expr * (Parser::*level)());
  [[nodiscard]] Expr * parse_assignment();
  [[nodiscard]] Expr * parse_conditional();
  [[nodiscard]] Expr * parse_coalesce();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_bitor();
  [[nodiscard]] Expr * parse_bitxor();
  [[nodiscard]] Expr * parse_bitand();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_shift();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_power();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] gsl::span<Expr *> parse_call_args();

  [[nodiscard]] Expr * make_binary(Expr * lhs, BinaryOp op, Expr * rhs);
  [[nodiscard]] Expr * make_missing_expr_at(const Token & t);

  AstContext & ast_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;

  uint32_t depth_ = 0;
  bool too_deep_ = false;

  std::vector<ParserError> errors_;
};

/// Parses `tokens` (which must end with Eof); fails with the first error.
[[nodiscard]] Result<Program *, ParserError> parse(AstContext & ast, std::vector<Token> tokens);

}  // namespace ouro::syntax
