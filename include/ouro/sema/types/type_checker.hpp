// ouro/sema/types/type_checker.hpp - Expression and statement type checking
//
// Runs after SemanticAnalyzer. Annotates every Expr::resolvedType and
// collects every independent type error instead of stopping at the first.
//
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ouro/ast/ast.hpp"
#include "ouro/sema/resolution/symbol_table.hpp"
#include "ouro/sema/sema_error.hpp"
#include "ouro/sema/types/type_resolver.hpp"

namespace ouro
{

/**
 * Bidirectional type checker.
 *
 * ## Algorithm
 *
 * 1. **Top-down**: an expected type (annotation, parameter, return type,
 *    the other operand of a binary operator) flows into the expression.
 *    Numeric literals adopt an expected numeric type when they fit.
 * 2. **Bottom-up**: operator, call and member results are synthesized
 *    from their operands.
 * 3. **Defaulting**: unconstrained integer literals are `Int`, float
 *    literals `Double`.
 *
 * Operands of error type suppress follow-up diagnostics.
 *
 * ## Usage
 * ```cpp
 * TypeChecker checker(symbols, types);
 * std::vector<SymbolError> errors = checker.check(program);
 * ```
 */
class TypeChecker
{
public:
  TypeChecker(SymbolTable & symbols, TypeResolver & types);

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /// Check a whole program; errors are returned in source order.
  std::vector<SymbolError> check(Program & program);

  /**
   * Infer the type of `expr` (also stored in expr->resolvedType).
   *
   * @param expected Contextual type, or nullptr when unconstrained
   */
  const TypeDefinition * check_expr(Expr * expr, const TypeDefinition * expected = nullptr);

private:
  /// Member found by `object.name`, with everything needed to use it.
  struct MemberRef
  {
    const Symbol * symbol = nullptr;
    const TypeDefinition * owner = nullptr;
    const TypeDefinition * builtin = nullptr;  ///< count / length
    bool append = false;                      ///< Array.append
    bool failed = false;                      ///< Already reported or unknowable
  };

  struct LazyVar
  {
    VarDecl * decl = nullptr;
    const TypeDecl * owner = nullptr;
  };

  // ===========================================================================
  // Expression Type Inference
  // ===========================================================================

  const TypeDefinition * infer_literal(LiteralExpr * node, const TypeDefinition * expected);
  const TypeDefinition * infer_variable(VariableExpr * node);
  const TypeDefinition * infer_unary(UnaryExpr * node, const TypeDefinition * expected);
  const TypeDefinition * infer_negated_literal(UnaryExpr * node, int64_t magnitude, const TypeDefinition * expected);
  const TypeDefinition * infer_binary(BinaryExpr * node, const TypeDefinition * expected);
  const TypeDefinition * infer_conditional(ConditionalExpr * node, const TypeDefinition * expected);
  const TypeDefinition * infer_assign(AssignExpr * node);
  const TypeDefinition * infer_call(CallExpr * node);
  const TypeDefinition * infer_get(GetExpr * node);
  const TypeDefinition * infer_set(SetExpr * node);
  const TypeDefinition * infer_index(IndexExpr * node);
  const TypeDefinition * infer_index_set(IndexSetExpr * node);
  const TypeDefinition * infer_this(ThisExpr * node);
  const TypeDefinition * infer_super(SuperExpr * node);
  const TypeDefinition * infer_array_literal(
    ArrayLiteralExpr * node, const TypeDefinition * expected);

  /// Result of `lt op rt`, or the error type after reporting InvalidOperation.
  const TypeDefinition * binary_result(
    BinaryOp op, const TypeDefinition * lt, const TypeDefinition * rt, const AstNode * at);

  // ===========================================================================
  // Calls and Members
  // ===========================================================================

  const TypeDefinition * check_call_to(
    CallExpr * node, const FunctionDecl * fn, std::string_view callee_name);
  const TypeDefinition * check_construction(CallExpr * node, const TypeDefinition * type);
  void check_arguments_loosely(CallExpr * node);

  MemberRef resolve_member(Expr * object, std::string_view name, const AstNode * at);
  bool check_access(const MemberRef & member, const AstNode * at);

  /// Element type of the array or string being indexed, or nullptr.
  const TypeDefinition * index_target(IndexExpr * node, Expr * base, Expr * index);
  void check_store(
    AssignOp op, const TypeDefinition * target, Expr * value, const AstNode * at);

  // ===========================================================================
  // Statement / Declaration Processing
  // ===========================================================================

  void check_stmt(Stmt * stmt);
  void check_var_decl(VarDecl * var);
  void check_function(FunctionDecl * fn);
  void check_type_decl(TypeDecl * decl);
  void check_return(ReturnStmt * node);
  void check_condition(Expr * cond, std::string_view construct);

  /// Type the unannotated global or property behind `var` on first use.
  void ensure_typed(const VarDecl * var);

  // ===========================================================================
  // Helpers
  // ===========================================================================

  [[nodiscard]] const TypeDefinition * symbol_type(const Symbol * sym);
  [[nodiscard]] const TypeDefinition * param_type(const ParamDecl * param) const;
  [[nodiscard]] bool is_error(const TypeDefinition * t) const noexcept
  {
    return t == nullptr || t->is_error();
  }

  /// Returns false when the same error was already reported for this node.
  bool report(SymbolErrorKind kind, const AstNode * at, std::string message);
  void report_mismatch(
    const AstNode * at, const TypeDefinition * expected, const TypeDefinition * got,
    std::string message = "");

  SymbolTable & symbols_;
  TypeResolver & types_;

  const TypeDefinition * current_type_ = nullptr;
  const FunctionDecl * current_function_ = nullptr;
  const TypeDefinition * current_return_ = nullptr;

  std::unordered_map<const VarDecl *, LazyVar> lazy_vars_;
  std::unordered_set<const VarDecl *> typed_;
  std::unordered_set<const VarDecl *> typing_;

  std::vector<SymbolError> errors_;
};

}  // namespace ouro
