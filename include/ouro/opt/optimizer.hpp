// ouro/opt/optimizer.hpp - AST-level constant folding and dead-code elimination
#pragma once

#include <cstddef>
#include <optional>

#include "ouro/ast/ast.hpp"
#include "ouro/ast/ast_context.hpp"

namespace ouro
{

/// What a single `optimize()` call changed.
struct OptimizationStats
{
  size_t folded_expressions = 0;
  size_t removed_statements = 0;   ///< Unreachable statements after return/break/continue
  size_t simplified_branches = 0;  ///< `if` with a literal condition
  size_t removed_loops = 0;        ///< `while (false)`

  [[nodiscard]] bool changed() const noexcept
  {
    return folded_expressions + removed_statements + simplified_branches + removed_loops != 0;
  }
};

/**
 * Structure-preserving AST rewriter.
 *
 * Runs on a checked program. Folded literals are allocated in the unit's
 * AstContext and keep the source range and resolved type of the
 * expression they replace. Folds that would overflow the expression's
 * integer type, or divide by zero, are left in place.
 *
 * Optimizing an already optimized program changes nothing.
 *
 * ## Usage
 * ```cpp
 * Optimizer opt(ctx);
 * opt.optimize(*program);
 * if (opt.stats().changed()) { ... }
 * ```
 */
class Optimizer
{
public:
  explicit Optimizer(AstContext & ctx) : ctx_(ctx) {}

  Program & optimize(Program & program);

  [[nodiscard]] const OptimizationStats & stats() const noexcept { return stats_; }

private:
  // ===========================================================================
  // Expressions
  // ===========================================================================

  /// Fold `expr` bottom-up; returns the replacement (possibly `expr` itself).
  Expr * fold(Expr * expr);
  Expr * fold_unary(UnaryExpr * node);
  Expr * fold_binary(BinaryExpr * node);
  void fold_all(gsl::span<Expr *> exprs);

  /// Integer result that fits the integer type `node` was checked as.
  [[nodiscard]] bool fits(const Expr * node, int64_t value) const noexcept;

  LiteralExpr * make_literal(const Expr * replaced, LiteralKind kind);
  Expr * make_int(const Expr * replaced, int64_t value);
  Expr * make_float(const Expr * replaced, double value);
  Expr * make_bool(const Expr * replaced, bool value);
  Expr * make_string(const Expr * replaced, std::string_view value);

  // ===========================================================================
  // Statements
  // ===========================================================================

  /// Rewrite `stmt`; nullptr means "remove".
  Stmt * rewrite(Stmt * stmt);
  gsl::span<Stmt *> rewrite_list(gsl::span<Stmt *> stmts);
  Stmt * rewrite_required(Stmt * stmt, SourceRange fallback);
  void rewrite_function(FunctionDecl * fn);

  [[nodiscard]] static std::optional<bool> literal_bool(const Expr * expr) noexcept;

  AstContext & ctx_;
  OptimizationStats stats_;
};

}  // namespace ouro
