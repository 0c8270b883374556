// ouro/opt/optimizer.cpp - Constant folding and dead-code elimination
#include "ouro/opt/optimizer.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "ouro/basic/casting.hpp"
#include "ouro/sema/types/type_definition.hpp"

namespace ouro
{

namespace
{

bool is_terminator(const Stmt * stmt)
{
  return isa<ReturnStmt, BreakStmt, ContinueStmt>(stmt);
}

const LiteralExpr * as_literal(const Expr * e) { return dyn_cast<LiteralExpr>(e); }

using Limits = std::numeric_limits<int64_t>;

std::optional<int64_t> checked_add(int64_t a, int64_t b)
{
  if ((b > 0 && a > Limits::max() - b) || (b < 0 && a < Limits::min() - b)) return std::nullopt;
  return a + b;
}

std::optional<int64_t> checked_sub(int64_t a, int64_t b)
{
  if ((b < 0 && a > Limits::max() + b) || (b > 0 && a < Limits::min() + b)) return std::nullopt;
  return a - b;
}

std::optional<int64_t> checked_mul(int64_t a, int64_t b)
{
  if (a == 0 || b == 0) return 0;
  if (a > 0) {
    if (b > 0 ? a > Limits::max() / b : b < Limits::min() / a) return std::nullopt;
  } else {
    if (b > 0 ? a < Limits::min() / b : a < Limits::max() / b) return std::nullopt;
  }
  return a * b;
}

/// Integer exponentiation; nullopt on overflow or negative exponent.
std::optional<int64_t> checked_pow(int64_t base, int64_t exp)
{
  if (exp < 0) return std::nullopt;
  if (base == 0) return exp == 0 ? 1 : 0;
  if (base == 1) return 1;
  if (base == -1) return exp % 2 == 0 ? 1 : -1;
  int64_t result = 1;
  for (int64_t i = 0; i < exp; ++i) {
    const auto next = checked_mul(result, base);
    if (!next) return std::nullopt;
    result = *next;
  }
  return result;
}

}  // namespace

Program & Optimizer::optimize(Program & program)
{
  stats_ = OptimizationStats{};

  for (Decl * d : program.decls) {
    if (auto * var = dyn_cast<VarDecl>(d)) {
      var->initializer = fold(var->initializer);
    } else if (auto * fn = dyn_cast<FunctionDecl>(d)) {
      rewrite_function(fn);
    } else if (auto * td = dyn_cast<TypeDecl>(d)) {
      for (VarDecl * prop : td->properties) {
        prop->initializer = fold(prop->initializer);
      }
      if (auto * ed = dyn_cast<EnumDecl>(td)) {
        for (EnumCaseDecl * c : ed->cases) {
          c->rawValue = fold(c->rawValue);
        }
      }
      for (FunctionDecl * fn : td->methods) {
        rewrite_function(fn);
      }
    }
  }

  program.statements = rewrite_list(program.statements);
  return program;
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Optimizer::fold(Expr * expr)
{
  if (!expr) return nullptr;

  switch (expr->get_kind()) {
    case NodeKind::Grouping: {
      auto * node = cast<GroupingExpr>(expr);
      node->inner = fold(node->inner);
      if (isa<LiteralExpr>(node->inner)) {
        ++stats_.folded_expressions;
        return node->inner;
      }
      return node;
    }
    case NodeKind::Unary:
      return fold_unary(cast<UnaryExpr>(expr));
    case NodeKind::Binary:
      return fold_binary(cast<BinaryExpr>(expr));
    case NodeKind::Conditional: {
      auto * node = cast<ConditionalExpr>(expr);
      node->condition = fold(node->condition);
      node->thenExpr = fold(node->thenExpr);
      node->elseExpr = fold(node->elseExpr);
      return node;
    }
    case NodeKind::Assign: {
      auto * node = cast<AssignExpr>(expr);
      node->value = fold(node->value);
      return node;
    }
    case NodeKind::Call: {
      auto * node = cast<CallExpr>(expr);
      node->callee = fold(node->callee);
      fold_all(node->args);
      return node;
    }
    case NodeKind::Get: {
      auto * node = cast<GetExpr>(expr);
      node->object = fold(node->object);
      return node;
    }
    case NodeKind::Set: {
      auto * node = cast<SetExpr>(expr);
      node->object = fold(node->object);
      node->value = fold(node->value);
      return node;
    }
    case NodeKind::Index: {
      auto * node = cast<IndexExpr>(expr);
      node->base = fold(node->base);
      node->index = fold(node->index);
      return node;
    }
    case NodeKind::IndexSet: {
      auto * node = cast<IndexSetExpr>(expr);
      node->base = fold(node->base);
      node->index = fold(node->index);
      node->value = fold(node->value);
      return node;
    }
    case NodeKind::ArrayLiteral:
      fold_all(cast<ArrayLiteralExpr>(expr)->elements);
      return expr;
    default:
      return expr;
  }
}

void Optimizer::fold_all(gsl::span<Expr *> exprs)
{
  for (Expr *& e : exprs) {
    e = fold(e);
  }
}

Expr * Optimizer::fold_unary(UnaryExpr * node)
{
  node->operand = fold(node->operand);
  const LiteralExpr * lit = as_literal(node->operand);
  if (lit == nullptr) return node;

  switch (node->op) {
    case UnaryOp::Plus:
      if (!lit->is_numeric()) break;
      ++stats_.folded_expressions;
      return node->operand;
    case UnaryOp::Neg:
      if (lit->literalKind == LiteralKind::Int &&
          lit->intValue != std::numeric_limits<int64_t>::min() && fits(node, -lit->intValue)) {
        return make_int(node, -lit->intValue);
      }
      if (lit->literalKind == LiteralKind::Float) {
        return make_float(node, -lit->floatValue);
      }
      break;
    case UnaryOp::Not:
      if (lit->literalKind == LiteralKind::Bool) {
        return make_bool(node, !lit->boolValue);
      }
      break;
    case UnaryOp::BitNot:
      if (lit->literalKind == LiteralKind::Int && fits(node, ~lit->intValue)) {
        return make_int(node, ~lit->intValue);
      }
      break;
  }
  return node;
}

Expr * Optimizer::fold_binary(BinaryExpr * node)
{
  node->lhs = fold(node->lhs);
  node->rhs = fold(node->rhs);

  const LiteralExpr * l = as_literal(node->lhs);
  const LiteralExpr * r = as_literal(node->rhs);
  if (l == nullptr || r == nullptr) return node;

  const BinaryOp op = node->op;

  // Int op Int, unless the checker gave the literals a float type.
  const bool float_typed = (l->resolvedType && l->resolvedType->is_float()) ||
                           (r->resolvedType && r->resolvedType->is_float());
  if (l->literalKind == LiteralKind::Int && r->literalKind == LiteralKind::Int && !float_typed) {
    const int64_t a = l->intValue;
    const int64_t b = r->intValue;
    int64_t out = 0;
    bool ok = true;

    switch (op) {
      case BinaryOp::Add:
      case BinaryOp::Sub:
      case BinaryOp::Mul: {
        const auto r = op == BinaryOp::Add   ? checked_add(a, b)
                       : op == BinaryOp::Sub ? checked_sub(a, b)
                                             : checked_mul(a, b);
        ok = r.has_value();
        out = r.value_or(0);
        break;
      }
      case BinaryOp::Div:
      case BinaryOp::Mod:
        if (b == 0 || (a == std::numeric_limits<int64_t>::min() && b == -1)) return node;
        out = op == BinaryOp::Div ? a / b : a % b;
        break;
      case BinaryOp::Pow: {
        const auto p = checked_pow(a, b);
        ok = p.has_value();
        out = p.value_or(0);
        break;
      }
      case BinaryOp::BitAnd:
        out = a & b;
        break;
      case BinaryOp::BitOr:
        out = a | b;
        break;
      case BinaryOp::BitXor:
        out = a ^ b;
        break;
      case BinaryOp::Shl:
        if (b < 0 || b > 62 || a < 0 || a > (std::numeric_limits<int64_t>::max() >> b)) {
          return node;
        }
        out = a << b;
        break;
      case BinaryOp::Shr:
        if (b < 0 || b > 63) return node;
        out = a >> b;
        break;
      case BinaryOp::UShr:
        if (b < 0 || b > 63 || a < 0) return node;
        out = static_cast<int64_t>(static_cast<uint64_t>(a) >> b);
        break;
      case BinaryOp::Eq:
        return make_bool(node, a == b);
      case BinaryOp::Ne:
        return make_bool(node, a != b);
      case BinaryOp::Lt:
        return make_bool(node, a < b);
      case BinaryOp::Le:
        return make_bool(node, a <= b);
      case BinaryOp::Gt:
        return make_bool(node, a > b);
      case BinaryOp::Ge:
        return make_bool(node, a >= b);
      case BinaryOp::Cmp:
        return make_int(node, a < b ? -1 : (a > b ? 1 : 0));
      default:
        return node;
    }
    if (!ok || !fits(node, out)) return node;
    return make_int(node, out);
  }

  // Float arithmetic; an Int literal operand is promoted.
  if (l->is_numeric() && r->is_numeric()) {
    const double a = l->literalKind == LiteralKind::Float ? l->floatValue
                                                          : static_cast<double>(l->intValue);
    const double b = r->literalKind == LiteralKind::Float ? r->floatValue
                                                          : static_cast<double>(r->intValue);
    switch (op) {
      case BinaryOp::Add:
        return make_float(node, a + b);
      case BinaryOp::Sub:
        return make_float(node, a - b);
      case BinaryOp::Mul:
        return make_float(node, a * b);
      case BinaryOp::Div:
        if (b == 0.0) return node;
        return make_float(node, a / b);
      case BinaryOp::Mod:
        if (b == 0.0) return node;
        return make_float(node, std::fmod(a, b));
      case BinaryOp::Pow:
        return make_float(node, std::pow(a, b));
      case BinaryOp::Eq:
        return make_bool(node, a == b);
      case BinaryOp::Ne:
        return make_bool(node, a != b);
      case BinaryOp::Lt:
        return make_bool(node, a < b);
      case BinaryOp::Le:
        return make_bool(node, a <= b);
      case BinaryOp::Gt:
        return make_bool(node, a > b);
      case BinaryOp::Ge:
        return make_bool(node, a >= b);
      default:
        return node;
    }
  }

  if (l->literalKind == LiteralKind::Bool && r->literalKind == LiteralKind::Bool) {
    switch (op) {
      case BinaryOp::And:
        return make_bool(node, l->boolValue && r->boolValue);
      case BinaryOp::Or:
        return make_bool(node, l->boolValue || r->boolValue);
      case BinaryOp::Eq:
        return make_bool(node, l->boolValue == r->boolValue);
      case BinaryOp::Ne:
        return make_bool(node, l->boolValue != r->boolValue);
      default:
        return node;
    }
  }

  if (l->literalKind == LiteralKind::String && r->literalKind == LiteralKind::String) {
    switch (op) {
      case BinaryOp::Add: {
        std::string concat;
        concat.reserve(l->stringValue.size() + r->stringValue.size());
        concat += l->stringValue;
        concat += r->stringValue;
        return make_string(node, ctx_.intern(concat));
      }
      case BinaryOp::Eq:
        return make_bool(node, l->stringValue == r->stringValue);
      case BinaryOp::Ne:
        return make_bool(node, l->stringValue != r->stringValue);
      default:
        return node;
    }
  }

  return node;
}

bool Optimizer::fits(const Expr * node, int64_t value) const noexcept
{
  const TypeDefinition * t = node->resolvedType;
  if (t == nullptr || !t->is_integer()) return true;
  return fits_integer(value, t->kind);
}

LiteralExpr * Optimizer::make_literal(const Expr * replaced, LiteralKind kind)
{
  auto * lit = ctx_.create<LiteralExpr>(replaced->get_range());
  lit->loc_ = replaced->loc_;
  lit->resolvedType = replaced->resolvedType;
  lit->literalKind = kind;
  ++stats_.folded_expressions;
  return lit;
}

Expr * Optimizer::make_int(const Expr * replaced, int64_t value)
{
  LiteralExpr * lit = make_literal(replaced, LiteralKind::Int);
  lit->intValue = value;
  return lit;
}

Expr * Optimizer::make_float(const Expr * replaced, double value)
{
  LiteralExpr * lit = make_literal(replaced, LiteralKind::Float);
  lit->floatValue = value;
  return lit;
}

Expr * Optimizer::make_bool(const Expr * replaced, bool value)
{
  LiteralExpr * lit = make_literal(replaced, LiteralKind::Bool);
  lit->boolValue = value;
  return lit;
}

Expr * Optimizer::make_string(const Expr * replaced, std::string_view value)
{
  LiteralExpr * lit = make_literal(replaced, LiteralKind::String);
  lit->stringValue = value;
  return lit;
}

// ============================================================================
// Statements
// ============================================================================

void Optimizer::rewrite_function(FunctionDecl * fn)
{
  for (ParamDecl * param : fn->params) {
    param->defaultValue = fold(param->defaultValue);
  }
  if (fn->body) {
    fn->body->statements = rewrite_list(fn->body->statements);
  }
}

gsl::span<Stmt *> Optimizer::rewrite_list(gsl::span<Stmt *> stmts)
{
  std::vector<Stmt *> kept;
  kept.reserve(stmts.size());

  bool changed = false;
  for (size_t i = 0; i < stmts.size(); ++i) {
    Stmt * s = rewrite(stmts[i]);
    if (s != stmts[i]) changed = true;
    if (s == nullptr) continue;

    kept.push_back(s);
    if (is_terminator(s)) {
      const size_t dropped = stmts.size() - i - 1;
      if (dropped != 0) {
        stats_.removed_statements += dropped;
        changed = true;
      }
      break;
    }
  }

  if (!changed) return stmts;
  return ctx_.copy_to_arena(kept);
}

Stmt * Optimizer::rewrite_required(Stmt * stmt, SourceRange fallback)
{
  if (stmt == nullptr) return nullptr;
  if (Stmt * s = rewrite(stmt)) return s;
  auto * empty = ctx_.create<BlockStmt>(gsl::span<Stmt *>{}, fallback);
  empty->loc_ = stmt->loc_;
  return empty;
}

Stmt * Optimizer::rewrite(Stmt * stmt)
{
  if (!stmt) return nullptr;

  switch (stmt->get_kind()) {
    case NodeKind::ExpressionStmt: {
      auto * node = cast<ExpressionStmt>(stmt);
      node->expr = fold(node->expr);
      return node;
    }
    case NodeKind::BlockStmt: {
      auto * node = cast<BlockStmt>(stmt);
      node->statements = rewrite_list(node->statements);
      return node;
    }
    case NodeKind::VarDeclStmt: {
      VarDecl * var = cast<VarDeclStmt>(stmt)->decl;
      var->initializer = fold(var->initializer);
      return stmt;
    }
    case NodeKind::ReturnStmt: {
      auto * node = cast<ReturnStmt>(stmt);
      node->value = fold(node->value);
      return node;
    }
    case NodeKind::IfStmt: {
      auto * node = cast<IfStmt>(stmt);
      node->condition = fold(node->condition);
      if (const auto taken = literal_bool(node->condition)) {
        ++stats_.simplified_branches;
        Stmt * branch = *taken ? node->thenBranch : node->elseBranch;
        return branch ? rewrite_required(branch, branch->get_range()) : nullptr;
      }
      node->thenBranch = rewrite_required(node->thenBranch, node->get_range());
      node->elseBranch = rewrite_required(node->elseBranch, node->get_range());
      return node;
    }
    case NodeKind::WhileStmt: {
      auto * node = cast<WhileStmt>(stmt);
      node->condition = fold(node->condition);
      if (literal_bool(node->condition) == std::optional<bool>(false)) {
        ++stats_.removed_loops;
        return nullptr;
      }
      node->body = rewrite_required(node->body, node->get_range());
      return node;
    }
    case NodeKind::ForStmt: {
      auto * node = cast<ForStmt>(stmt);
      if (node->init) node->init = rewrite(node->init);
      node->condition = fold(node->condition);
      node->increment = fold(node->increment);
      node->body = rewrite_required(node->body, node->get_range());
      return node;
    }
    default:
      return stmt;
  }
}

std::optional<bool> Optimizer::literal_bool(const Expr * expr) noexcept
{
  const LiteralExpr * lit = as_literal(expr);
  if (lit == nullptr || lit->literalKind != LiteralKind::Bool) return std::nullopt;
  return lit->boolValue;
}

}  // namespace ouro
