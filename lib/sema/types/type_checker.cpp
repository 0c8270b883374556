// ouro/sema/types/type_checker.cpp - Bidirectional type checking
#include "ouro/sema/types/type_checker.hpp"

#include <algorithm>

#include "ouro/basic/casting.hpp"

namespace ouro
{

namespace
{

std::string quote_name(std::string_view s) { return "'" + std::string(s) + "'"; }

/// Numeric literal, possibly parenthesized or signed.
bool is_untyped_numeric(const Expr * e)
{
  while (e != nullptr) {
    if (const auto * g = dyn_cast<GroupingExpr>(e)) {
      e = g->inner;
    } else if (const auto * u = dyn_cast<UnaryExpr>(e);
               u && (u->op == UnaryOp::Neg || u->op == UnaryOp::Plus)) {
      e = u->operand;
    } else {
      const auto * lit = dyn_cast<LiteralExpr>(e);
      return lit != nullptr && lit->is_numeric();
    }
  }
  return false;
}

/// Integer literal under any number of parentheses.
const LiteralExpr * int_literal_operand(const Expr * e)
{
  while (const auto * g = dyn_cast<GroupingExpr>(e)) {
    e = g->inner;
  }
  const auto * lit = dyn_cast<LiteralExpr>(e);
  return lit != nullptr && lit->literalKind == LiteralKind::Int ? lit : nullptr;
}

const FunctionDecl * as_function(const Symbol * sym)
{
  return sym && sym->is_function() ? dyn_cast<FunctionDecl>(sym->ast_node) : nullptr;
}

std::string count_phrase(size_t n)
{
  return std::to_string(n) + (n == 1 ? " argument" : " arguments");
}

}  // namespace

TypeChecker::TypeChecker(SymbolTable & symbols, TypeResolver & types)
: symbols_(symbols), types_(types)
{
}

// ============================================================================
// Entry Points
// ============================================================================

std::vector<SymbolError> TypeChecker::check(Program & program)
{
  errors_.clear();
  lazy_vars_.clear();
  typed_.clear();
  typing_.clear();
  current_type_ = nullptr;
  current_function_ = nullptr;
  current_return_ = nullptr;

  for (Decl * d : program.decls) {
    if (auto * var = dyn_cast<VarDecl>(d)) {
      lazy_vars_.emplace(var, LazyVar{var, nullptr});
    } else if (auto * td = dyn_cast<TypeDecl>(d)) {
      for (VarDecl * prop : td->properties) {
        lazy_vars_.emplace(prop, LazyVar{prop, td});
      }
    }
  }

  for (Decl * d : program.decls) {
    if (auto * var = dyn_cast<VarDecl>(d)) {
      ensure_typed(var);
    } else if (auto * fn = dyn_cast<FunctionDecl>(d)) {
      check_function(fn);
    } else if (auto * td = dyn_cast<TypeDecl>(d)) {
      check_type_decl(td);
    }
  }
  for (Stmt * s : program.statements) {
    check_stmt(s);
  }

  sort_by_position(errors_);
  return std::move(errors_);
}

const TypeDefinition * TypeChecker::check_expr(Expr * expr, const TypeDefinition * expected)
{
  if (!expr) return types_.error_type();

  const TypeDefinition * result = nullptr;

  switch (expr->get_kind()) {
    case NodeKind::Literal:
      result = infer_literal(cast<LiteralExpr>(expr), expected);
      break;
    case NodeKind::Variable:
      result = infer_variable(cast<VariableExpr>(expr));
      break;
    case NodeKind::Grouping:
      result = check_expr(cast<GroupingExpr>(expr)->inner, expected);
      break;
    case NodeKind::Unary:
      result = infer_unary(cast<UnaryExpr>(expr), expected);
      break;
    case NodeKind::Binary:
      result = infer_binary(cast<BinaryExpr>(expr), expected);
      break;
    case NodeKind::Conditional:
      result = infer_conditional(cast<ConditionalExpr>(expr), expected);
      break;
    case NodeKind::Assign:
      result = infer_assign(cast<AssignExpr>(expr));
      break;
    case NodeKind::Call:
      result = infer_call(cast<CallExpr>(expr));
      break;
    case NodeKind::Get:
      result = infer_get(cast<GetExpr>(expr));
      break;
    case NodeKind::Set:
      result = infer_set(cast<SetExpr>(expr));
      break;
    case NodeKind::Index:
      result = infer_index(cast<IndexExpr>(expr));
      break;
    case NodeKind::IndexSet:
      result = infer_index_set(cast<IndexSetExpr>(expr));
      break;
    case NodeKind::This:
      result = infer_this(cast<ThisExpr>(expr));
      break;
    case NodeKind::Super:
      result = infer_super(cast<SuperExpr>(expr));
      break;
    case NodeKind::ArrayLiteral:
      result = infer_array_literal(cast<ArrayLiteralExpr>(expr), expected);
      break;
    case NodeKind::MissingExpr:
    default:
      result = types_.error_type();
  }

  if (result == nullptr) result = types_.error_type();
  expr->resolvedType = result;
  return result;
}

// ============================================================================
// Expression Type Inference
// ============================================================================

const TypeDefinition * TypeChecker::infer_literal(LiteralExpr * node, const TypeDefinition * expected)
{
  switch (node->literalKind) {
    case LiteralKind::Int:
      if (expected && expected->is_integer() && fits_integer(node->intValue, expected->kind)) {
        return expected;
      }
      if (expected && expected->is_float()) {
        return expected;
      }
      return fits_integer(node->intValue, TypeKind::Int32) ? types_.int_type()
                                                                  : types_.int64_type();
    case LiteralKind::Float:
      if (expected && expected->is_float()) {
        return expected;
      }
      return types_.double_type();
    case LiteralKind::String:
      return types_.string_type();
    case LiteralKind::Char:
      return types_.char_type();
    case LiteralKind::Bool:
      return types_.bool_type();
    case LiteralKind::Null:
      return types_.null_type();
  }
  return types_.error_type();
}

const TypeDefinition * TypeChecker::infer_variable(VariableExpr * node)
{
  const Symbol * sym = node->resolvedSymbol;
  if (sym == nullptr) {
    return types_.error_type();  // reported during analysis
  }

  switch (sym->kind) {
    case SymbolKind::Type:
      report(
        SymbolErrorKind::InvalidOperation, node,
        "type " + quote_name(sym->name) + " cannot be used as a value");
      return types_.error_type();
    case SymbolKind::Function:
      report(
        SymbolErrorKind::InvalidOperation, node,
        "function " + quote_name(sym->name) + " must be called");
      return types_.error_type();
    default:
      return symbol_type(sym);
  }
}

const TypeDefinition * TypeChecker::infer_unary(UnaryExpr * node, const TypeDefinition * expected)
{
  if (node->op == UnaryOp::Neg) {
    if (const LiteralExpr * lit = int_literal_operand(node->operand)) {
      return infer_negated_literal(node, lit->intValue, expected);
    }
  }

  const bool numeric_context = expected && expected->is_numeric();
  const TypeDefinition * operand = check_expr(
    node->operand, node->op == UnaryOp::Not ? types_.bool_type() : (numeric_context ? expected : nullptr));
  if (is_error(operand)) return types_.error_type();

  switch (node->op) {
    case UnaryOp::Neg:
      if (operand->is_float() || operand->is_signed_integer()) return operand;
      break;
    case UnaryOp::Plus:
      if (operand->is_numeric()) return operand;
      break;
    case UnaryOp::Not:
      if (operand->kind == TypeKind::Bool) return operand;
      break;
    case UnaryOp::BitNot:
      if (operand->is_integer()) return operand;
      break;
  }

  report(
    SymbolErrorKind::InvalidOperation, node,
    "unary operator " + quote_name(to_string(node->op)) + " cannot be applied to " +
      quote_name(operand->name));
  return types_.error_type();
}

const TypeDefinition * TypeChecker::infer_negated_literal(
  UnaryExpr * node, int64_t magnitude, const TypeDefinition * expected)
{
  // Literals are non-negative, so the negation never overflows.
  const int64_t value = -magnitude;

  const TypeDefinition * type = nullptr;
  if (expected && expected->is_integer() && fits_integer(value, expected->kind)) {
    type = expected;
  } else if (expected && expected->is_float()) {
    type = expected;
  } else {
    type = fits_integer(value, TypeKind::Int32) ? types_.int_type() : types_.int64_type();
  }

  // The operand alone may be out of range (`-128` as Int8); it takes the
  // unsigned magnitude's own type.
  check_expr(node->operand, type->is_float() ? type : nullptr);
  return type;
}

const TypeDefinition * TypeChecker::infer_binary(BinaryExpr * node, const TypeDefinition * expected)
{
  // Only value-producing numeric operators pass the context down.
  const bool passes_context = is_arithmetic(node->op) || is_bitwise(node->op);
  const TypeDefinition * hint = passes_context && expected && expected->is_numeric() ? expected : nullptr;
  if (node->op == BinaryOp::And || node->op == BinaryOp::Or) {
    hint = types_.bool_type();
  }

  const TypeDefinition * lt = nullptr;
  const TypeDefinition * rt = nullptr;

  // An untyped literal adopts the type of the other operand.
  if (is_untyped_numeric(node->lhs) && !is_untyped_numeric(node->rhs)) {
    rt = check_expr(node->rhs, hint);
    lt = check_expr(node->lhs, rt->is_numeric() ? rt : hint);
  } else {
    lt = check_expr(node->lhs, hint);
    const bool adopt = is_untyped_numeric(node->rhs) && lt->is_numeric() &&
                       node->op != BinaryOp::Shl && node->op != BinaryOp::Shr &&
                       node->op != BinaryOp::UShr;
    rt = check_expr(node->rhs, adopt ? lt : hint);
  }

  return binary_result(node->op, lt, rt, node);
}

const TypeDefinition * TypeChecker::binary_result(
  BinaryOp op, const TypeDefinition * lt, const TypeDefinition * rt, const AstNode * at)
{
  const bool yields_bool = op == BinaryOp::Eq || op == BinaryOp::Ne || is_comparison(op) ||
                           op == BinaryOp::And || op == BinaryOp::Or;

  if (is_error(lt) || is_error(rt)) {
    if (yields_bool) return types_.bool_type();
    if (op == BinaryOp::Cmp) return types_.int_type();
    if (op == BinaryOp::Coalesce && !is_error(rt)) return rt;
    return types_.error_type();
  }

  switch (op) {
    case BinaryOp::Add:
      if (lt->kind == TypeKind::String && rt->kind == TypeKind::String) {
        return types_.string_type();
      }
      [[fallthrough]];
    case BinaryOp::Sub:
    case BinaryOp::Mul:
    case BinaryOp::Div:
    case BinaryOp::Mod:
    case BinaryOp::Pow:
      if (lt->is_numeric() && rt->is_numeric()) {
        return types_.common_numeric(lt, rt);
      }
      break;

    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
      if ((lt->is_numeric() && rt->is_numeric()) ||
          (lt->kind == TypeKind::Char && rt->kind == TypeKind::Char)) {
        return types_.bool_type();
      }
      break;

    case BinaryOp::Cmp:
      if ((lt->is_numeric() && rt->is_numeric()) ||
          (lt->kind == TypeKind::Char && rt->kind == TypeKind::Char) ||
          (lt->kind == TypeKind::String && rt->kind == TypeKind::String)) {
        return types_.int_type();
      }
      break;

    case BinaryOp::Eq:
    case BinaryOp::Ne:
      if ((lt->is_numeric() && rt->is_numeric()) || types_.is_assignable(lt, rt) ||
          types_.is_assignable(rt, lt)) {
        return types_.bool_type();
      }
      report(
        SymbolErrorKind::InvalidOperation, at,
        "cannot compare values of type " + quote_name(lt->name) + " and " + quote_name(rt->name));
      return types_.bool_type();

    case BinaryOp::And:
    case BinaryOp::Or:
      if (lt->kind == TypeKind::Bool && rt->kind == TypeKind::Bool) {
        return types_.bool_type();
      }
      break;

    case BinaryOp::BitAnd:
    case BinaryOp::BitOr:
    case BinaryOp::BitXor:
      if (lt->is_integer() && rt->is_integer()) {
        return types_.common_numeric(lt, rt);
      }
      break;

    case BinaryOp::Shl:
    case BinaryOp::Shr:
    case BinaryOp::UShr:
      if (lt->is_integer() && rt->is_integer()) {
        return lt;
      }
      break;

    case BinaryOp::Coalesce:
      return rt;
  }

  report(
    SymbolErrorKind::InvalidOperation, at,
    "binary operator " + quote_name(to_string(op)) + " cannot be applied to operands of type " +
      quote_name(lt->name) + " and " + quote_name(rt->name));
  return yields_bool ? types_.bool_type() : types_.error_type();
}

const TypeDefinition * TypeChecker::infer_conditional(
  ConditionalExpr * node, const TypeDefinition * expected)
{
  check_condition(node->condition, "conditional expression");

  const TypeDefinition * then_t = check_expr(node->thenExpr, expected);
  const TypeDefinition * else_t = check_expr(node->elseExpr, expected);
  if (is_error(then_t)) return else_t;
  if (is_error(else_t)) return then_t;

  if (const TypeDefinition * common = types_.common_type(then_t, else_t)) {
    return common;
  }
  report(
    SymbolErrorKind::IncompatibleTypes, node,
    "branches of conditional expression have incompatible types " + quote_name(then_t->name) +
      " and " + quote_name(else_t->name));
  return types_.error_type();
}

const TypeDefinition * TypeChecker::infer_assign(AssignExpr * node)
{
  const Symbol * sym = node->resolvedSymbol;
  if (sym == nullptr || !sym->is_value()) {
    check_expr(node->value);  // reported during analysis
    return types_.error_type();
  }

  const TypeDefinition * target = symbol_type(sym);
  check_store(AssignOp::Assign, target, node->value, node->value);
  return target;
}

const TypeDefinition * TypeChecker::infer_call(CallExpr * node)
{
  Expr * callee = node->callee;

  switch (callee->get_kind()) {
    case NodeKind::Variable: {
      auto * var = cast<VariableExpr>(callee);
      const Symbol * sym = var->resolvedSymbol;
      if (sym == nullptr) {
        check_arguments_loosely(node);
        return types_.error_type();
      }
      if (const FunctionDecl * fn = as_function(sym)) {
        var->resolvedType = fn->resolvedReturnType;
        return check_call_to(node, fn, sym->name);
      }
      if (sym->is_type()) {
        var->resolvedType = sym->type;
        return check_construction(node, sym->type);
      }
      const TypeDefinition * t = symbol_type(sym);
      var->resolvedType = t;
      check_arguments_loosely(node);
      if (is_error(t) || t->kind == TypeKind::Any) return types_.error_type();
      report(
        SymbolErrorKind::NotCallable, callee,
        quote_name(sym->name) + " of type " + quote_name(t->name) + " is not callable");
      return types_.error_type();
    }

    case NodeKind::Get: {
      auto * get = cast<GetExpr>(callee);
      MemberRef member = resolve_member(get->object, get->name, get);
      if (member.failed) {
        check_arguments_loosely(node);
        return types_.error_type();
      }
      if (member.append) {
        const TypeDefinition * array = get->object->resolvedType;
        if (node->args.size() != 1) {
          report(
            SymbolErrorKind::ArgumentCountMismatch, node,
            "'append' expects 1 argument but " + std::to_string(node->args.size()) +
              (node->args.size() == 1 ? " was" : " were") + " given");
          check_arguments_loosely(node);
        } else {
          const TypeDefinition * got = check_expr(node->args[0], array->element);
          if (!types_.is_assignable(got, array->element)) {
            report_mismatch(node->args[0], array->element, got);
          }
        }
        get->resolvedType = types_.void_type();
        return types_.void_type();
      }
      if (member.builtin != nullptr) {
        get->resolvedType = member.builtin;
        check_arguments_loosely(node);
        report(
          SymbolErrorKind::NotCallable, get, quote_name(get->name) + " is a property, not a method");
        return types_.error_type();
      }
      if (const FunctionDecl * fn = as_function(member.symbol)) {
        get->resolvedType = fn->resolvedReturnType;
        return check_call_to(node, fn, member.symbol->name);
      }
      check_arguments_loosely(node);
      get->resolvedType = symbol_type(member.symbol);
      report(SymbolErrorKind::NotCallable, get, quote_name(get->name) + " is not a method");
      return types_.error_type();
    }

    case NodeKind::Super: {
      auto * sup = cast<SuperExpr>(callee);
      const TypeDefinition * base = current_type_ ? current_type_->superclass : nullptr;
      if (base == nullptr) {
        check_arguments_loosely(node);
        return types_.error_type();  // reported during analysis
      }
      MemberLookup m = types_.lookup_member(base, sup->method);
      const FunctionDecl * fn = as_function(m.symbol);
      if (fn == nullptr) {
        check_arguments_loosely(node);
        report(
          SymbolErrorKind::UnknownMember, sup,
          quote_name(base->name) + " has no method " + quote_name(sup->method));
        return types_.error_type();
      }
      if (!fn->has_body()) {
        report(
          SymbolErrorKind::AbstractMethodCall, sup,
          "cannot call abstract method " + quote_name(sup->method) + " through 'super'");
      }
      sup->resolvedType = fn->resolvedReturnType;
      return check_call_to(node, fn, sup->method);
    }

    default: {
      const TypeDefinition * t = check_expr(callee);
      check_arguments_loosely(node);
      if (is_error(t) || t->kind == TypeKind::Any) return types_.error_type();
      report(
        SymbolErrorKind::NotCallable, callee,
        "expression of type " + quote_name(t->name) + " is not callable");
      return types_.error_type();
    }
  }
}

const TypeDefinition * TypeChecker::infer_get(GetExpr * node)
{
  MemberRef member = resolve_member(node->object, node->name, node);
  if (member.failed) return types_.error_type();
  if (member.builtin != nullptr) return member.builtin;
  if (member.append) {
    report(SymbolErrorKind::InvalidOperation, node, "method 'append' must be called");
    return types_.error_type();
  }
  if (const FunctionDecl * fn = as_function(member.symbol)) {
    report(
      SymbolErrorKind::InvalidOperation, node, "method " + quote_name(fn->name) + " must be called");
    return types_.error_type();
  }
  return symbol_type(member.symbol);
}

const TypeDefinition * TypeChecker::infer_set(SetExpr * node)
{
  MemberRef member = resolve_member(node->object, node->name, node);
  if (member.failed) {
    check_expr(node->value);
    return types_.error_type();
  }
  if (member.builtin != nullptr || member.append || !member.symbol->is_value()) {
    check_expr(node->value);
    report(
      SymbolErrorKind::InvalidOperation, node, "cannot assign to member " + quote_name(node->name));
    return types_.error_type();
  }

  if (member.symbol->is_const()) {
    const bool in_own_init = current_function_ != nullptr && current_function_->isInitializer &&
                             current_type_ == member.owner;
    if (!in_own_init) {
      report(
        SymbolErrorKind::AssignToConstant, node,
        "cannot assign to constant " + quote_name(node->name));
    }
  }

  const TypeDefinition * target = symbol_type(member.symbol);
  check_store(node->op, target, node->value, node);
  return target;
}

const TypeDefinition * TypeChecker::infer_index(IndexExpr * node)
{
  const TypeDefinition * elem = index_target(node, node->base, node->index);
  return elem ? elem : types_.error_type();
}

const TypeDefinition * TypeChecker::infer_index_set(IndexSetExpr * node)
{
  const TypeDefinition * elem = index_target(nullptr, node->base, node->index);
  if (elem == nullptr) {
    check_expr(node->value);
    return types_.error_type();
  }
  if (node->base->resolvedType && node->base->resolvedType->kind == TypeKind::String) {
    check_expr(node->value);
    report(SymbolErrorKind::InvalidOperation, node, "strings are immutable");
    return types_.error_type();
  }
  check_store(node->op, elem, node->value, node);
  return elem;
}

const TypeDefinition * TypeChecker::infer_this(ThisExpr * /*node*/)
{
  // Misuse is reported during analysis.
  return current_type_ ? current_type_ : types_.error_type();
}

const TypeDefinition * TypeChecker::infer_super(SuperExpr * node)
{
  const TypeDefinition * base = current_type_ ? current_type_->superclass : nullptr;
  if (base == nullptr) return types_.error_type();

  MemberLookup m = types_.lookup_member(base, node->method);
  if (!m) {
    report(
      SymbolErrorKind::UnknownMember, node,
      quote_name(base->name) + " has no member " + quote_name(node->method));
    return types_.error_type();
  }
  if (as_function(m.symbol) != nullptr) {
    report(
      SymbolErrorKind::InvalidOperation, node,
      "method " + quote_name(node->method) + " must be called");
    return types_.error_type();
  }
  return symbol_type(m.symbol);
}

const TypeDefinition * TypeChecker::infer_array_literal(
  ArrayLiteralExpr * node, const TypeDefinition * expected)
{
  const TypeDefinition * expected_elem =
    expected && expected->kind == TypeKind::Array ? expected->element : nullptr;

  if (node->elements.empty()) {
    return expected_elem ? expected : types_.array_of(types_.any_type());
  }

  const TypeDefinition * common = nullptr;
  bool all_fit_expected = expected_elem != nullptr;
  for (Expr * elem : node->elements) {
    const TypeDefinition * t = check_expr(elem, expected_elem);
    if (is_error(t)) continue;

    if (expected_elem && !types_.is_assignable(t, expected_elem)) {
      all_fit_expected = false;
    }
    if (common == nullptr) {
      common = t;
      continue;
    }
    if (const TypeDefinition * unified = types_.common_type(common, t)) {
      common = unified;
    } else {
      report(
        SymbolErrorKind::IncompatibleTypes, elem,
        "array element of type " + quote_name(t->name) + " is incompatible with " +
          quote_name(common->name));
    }
  }

  if (all_fit_expected) return expected;
  if (common == nullptr) return types_.error_type();
  if (common->kind == TypeKind::Null) common = types_.any_type();
  return types_.array_of(common);
}

// ============================================================================
// Calls and Members
// ============================================================================

void TypeChecker::check_arguments_loosely(CallExpr * node)
{
  for (Expr * arg : node->args) {
    check_expr(arg);
  }
}

const TypeDefinition * TypeChecker::check_call_to(
  CallExpr * node, const FunctionDecl * fn, std::string_view callee_name)
{
  const size_t required = fn->required_param_count();
  const size_t total = fn->params.size();
  const size_t given = node->args.size();

  if (given < required || given > total) {
    std::string expected_count = required == total ? count_phrase(total)
                                                   : std::to_string(required) + " to " +
                                                       count_phrase(total);
    report(
      SymbolErrorKind::ArgumentCountMismatch, node,
      quote_name(callee_name) + " expects " + expected_count + " but " + std::to_string(given) +
        (given == 1 ? " was" : " were") + " given");
  }

  for (size_t i = 0; i < given; ++i) {
    const TypeDefinition * expected = i < total ? param_type(fn->params[i]) : nullptr;
    const TypeDefinition * got = check_expr(node->args[i], expected);
    if (expected && !types_.is_assignable(got, expected)) {
      report_mismatch(
        node->args[i], expected, got,
        "argument " + std::to_string(i + 1) + " of " + quote_name(callee_name) + " expects " +
          quote_name(expected->name) + ", found " + quote_name(got->name));
    }
  }

  return fn->resolvedReturnType ? fn->resolvedReturnType : types_.void_type();
}

const TypeDefinition * TypeChecker::check_construction(
  CallExpr * node, const TypeDefinition * type)
{
  if (is_error(type)) {
    check_arguments_loosely(node);
    return types_.error_type();
  }

  if (type->kind == TypeKind::TypeParameter || type->kind == TypeKind::Enum) {
    check_arguments_loosely(node);
    report(
      SymbolErrorKind::NotCallable, node->callee,
      std::string(to_string(type->kind)) + " " + quote_name(type->name) + " cannot be instantiated");
    return types_.error_type();
  }
  if (type->is_abstract) {
    check_arguments_loosely(node);
    report(
      SymbolErrorKind::InvalidOperation, node->callee,
      "cannot instantiate abstract type " + quote_name(type->name));
    return type;
  }

  MemberLookup init = types_.lookup_member(type, "init");
  if (const FunctionDecl * fn = as_function(init.symbol)) {
    check_call_to(node, fn, type->name);
    return type;
  }

  if (type->kind == TypeKind::Struct && type->decl != nullptr) {
    // Memberwise initializer over the stored, non-static properties.
    std::vector<const VarDecl *> stored;
    bool all_defaulted = true;
    for (const VarDecl * prop : type->decl->properties) {
      if (prop->modifiers.has(Modifier::Static)) continue;
      stored.push_back(prop);
      all_defaulted = all_defaulted && prop->initializer != nullptr;
    }

    const size_t given = node->args.size();
    if (!(given == stored.size() || (given == 0 && all_defaulted))) {
      report(
        SymbolErrorKind::ArgumentCountMismatch, node,
        quote_name(type->name) + " expects " + count_phrase(stored.size()) + " but " +
          std::to_string(given) + (given == 1 ? " was" : " were") + " given");
    }
    for (size_t i = 0; i < given; ++i) {
      const TypeDefinition * expected = nullptr;
      if (i < stored.size()) {
        ensure_typed(stored[i]);
        expected = stored[i]->resolvedType;
      }
      const TypeDefinition * got = check_expr(node->args[i], expected);
      if (expected && !types_.is_assignable(got, expected)) {
        report_mismatch(node->args[i], expected, got);
      }
    }
    return type;
  }

  if (!node->args.empty()) {
    check_arguments_loosely(node);
    report(
      SymbolErrorKind::ArgumentCountMismatch, node,
      quote_name(type->name) + " has no initializer taking arguments");
  }
  return type;
}

TypeChecker::MemberRef TypeChecker::resolve_member(
  Expr * object, std::string_view name, const AstNode * at)
{
  MemberRef ref;

  // `TypeName.member` is a static access; the type name is not a value.
  const TypeDefinition * receiver = nullptr;
  if (auto * var = dyn_cast<VariableExpr>(object); var && var->resolvedSymbol &&
                                                  var->resolvedSymbol->is_type()) {
    receiver = var->resolvedSymbol->type;
    var->resolvedType = receiver;
  } else {
    receiver = check_expr(object);
  }

  if (is_error(receiver) || receiver->kind == TypeKind::Any ||
      receiver->kind == TypeKind::TypeParameter) {
    ref.failed = true;
    return ref;
  }

  switch (receiver->kind) {
    case TypeKind::Array:
      if (name == "count" || name == "length") {
        ref.builtin = types_.int_type();
        return ref;
      }
      if (name == "append") {
        ref.append = true;
        return ref;
      }
      break;
    case TypeKind::String:
      if (name == "count" || name == "length") {
        ref.builtin = types_.int_type();
        return ref;
      }
      break;
    default:
      if (receiver->is_user_type() || receiver->kind == TypeKind::Generic) {
        MemberLookup m = types_.lookup_member(receiver, name);
        if (m) {
          ref.symbol = m.symbol;
          ref.owner = m.owner;
          check_access(ref, at);  // an inaccessible member still types
          return ref;
        }
      }
      break;
  }

  report(
    SymbolErrorKind::UnknownMember, at,
    "type " + quote_name(receiver->name) + " has no member " + quote_name(name));
  ref.failed = true;
  return ref;
}

bool TypeChecker::check_access(const MemberRef & member, const AstNode * at)
{
  const auto * decl = dyn_cast<Decl>(member.symbol->ast_node);
  if (decl == nullptr) return true;  // enum cases are always public

  if (decl->modifiers.has(Modifier::Private)) {
    if (current_type_ == member.owner) return true;
    report(
      SymbolErrorKind::InaccessibleMember, at,
      quote_name(member.symbol->name) + " is private to " + quote_name(member.owner->name));
    return false;
  }
  if (decl->modifiers.has(Modifier::Protected)) {
    if (current_type_ != nullptr && (current_type_ == member.owner ||
                                     types_.is_subtype(current_type_, member.owner))) {
      return true;
    }
    report(
      SymbolErrorKind::InaccessibleMember, at,
      quote_name(member.symbol->name) + " is protected in " + quote_name(member.owner->name));
    return false;
  }
  return true;
}

const TypeDefinition * TypeChecker::index_target(IndexExpr * node, Expr * base, Expr * index)
{
  const TypeDefinition * base_t = check_expr(base);
  const TypeDefinition * index_t = check_expr(index, types_.int_type());

  if (!is_error(index_t) && !index_t->is_integer()) {
    report_mismatch(
      index, types_.int_type(), index_t,
      "array index must be an integer, found " + quote_name(index_t->name));
  }
  if (is_error(base_t)) return nullptr;

  if (base_t->kind == TypeKind::Array) return base_t->element;
  if (base_t->kind == TypeKind::String) return types_.char_type();
  if (base_t->kind == TypeKind::Any) return types_.any_type();

  report(
    SymbolErrorKind::InvalidOperation, node ? static_cast<const AstNode *>(node) : base,
    "value of type " + quote_name(base_t->name) + " cannot be indexed");
  return nullptr;
}

void TypeChecker::check_store(
  AssignOp op, const TypeDefinition * target, Expr * value, const AstNode * at)
{
  if (op == AssignOp::Assign) {
    const TypeDefinition * got = check_expr(value, target);
    if (!types_.is_assignable(got, target)) {
      report_mismatch(value, target, got);
    }
    return;
  }

  const BinaryOp bop = compound_binary_op(op);
  const TypeDefinition * rhs = check_expr(value, target && target->is_numeric() ? target : nullptr);
  const TypeDefinition * result = binary_result(bop, target, rhs, at);
  if (!is_error(result) && !types_.is_assignable(result, target)) {
    report_mismatch(at, target, result);
  }
}

// ============================================================================
// Statement / Declaration Processing
// ============================================================================

void TypeChecker::check_stmt(Stmt * stmt)
{
  if (!stmt) return;

  switch (stmt->get_kind()) {
    case NodeKind::ExpressionStmt:
      check_expr(cast<ExpressionStmt>(stmt)->expr);
      break;
    case NodeKind::BlockStmt:
      for (Stmt * s : cast<BlockStmt>(stmt)->statements) {
        check_stmt(s);
      }
      break;
    case NodeKind::IfStmt: {
      auto * node = cast<IfStmt>(stmt);
      check_condition(node->condition, "if");
      check_stmt(node->thenBranch);
      check_stmt(node->elseBranch);
      break;
    }
    case NodeKind::WhileStmt: {
      auto * node = cast<WhileStmt>(stmt);
      check_condition(node->condition, "while");
      check_stmt(node->body);
      break;
    }
    case NodeKind::ForStmt: {
      auto * node = cast<ForStmt>(stmt);
      check_stmt(node->init);
      if (node->condition) check_condition(node->condition, "for");
      if (node->increment) check_expr(node->increment);
      check_stmt(node->body);
      break;
    }
    case NodeKind::ReturnStmt:
      check_return(cast<ReturnStmt>(stmt));
      break;
    case NodeKind::VarDeclStmt:
      check_var_decl(cast<VarDeclStmt>(stmt)->decl);
      break;
    case NodeKind::BreakStmt:
    case NodeKind::ContinueStmt:
    default:
      break;
  }
}

void TypeChecker::check_condition(Expr * cond, std::string_view construct)
{
  const TypeDefinition * t = check_expr(cond, types_.bool_type());
  if (!is_error(t) && t->kind != TypeKind::Bool) {
    report_mismatch(
      cond, types_.bool_type(), t,
      std::string(construct) + " condition must be of type 'Bool', found " + quote_name(t->name));
  }
}

void TypeChecker::check_return(ReturnStmt * node)
{
  if (current_function_ == nullptr) {
    if (node->value) check_expr(node->value);  // reported during analysis
    return;
  }

  const TypeDefinition * expected = current_return_ ? current_return_ : types_.void_type();
  if (is_error(expected)) {
    if (node->value) check_expr(node->value);
    return;
  }

  if (expected->kind == TypeKind::Void) {
    if (node->value) {
      const TypeDefinition * got = check_expr(node->value);
      if (!is_error(got) && got->kind != TypeKind::Void) {
        report_mismatch(
          node->value, types_.void_type(), got,
          "unexpected return value in " + quote_name(current_function_->name) +
            ", which returns 'Void'");
      }
    }
    return;
  }

  if (node->value == nullptr) {
    report(
      SymbolErrorKind::MissingReturnValue, node,
      quote_name(current_function_->name) + " must return a value of type " +
        quote_name(expected->name));
    return;
  }

  const TypeDefinition * got = check_expr(node->value, expected);
  if (!types_.is_assignable(got, expected)) {
    report_mismatch(node->value, expected, got);
  }
}

void TypeChecker::check_var_decl(VarDecl * var)
{
  const TypeDefinition * declared = var->resolvedType;

  if (var->initializer) {
    const TypeDefinition * got = check_expr(var->initializer, declared);
    if (declared) {
      if (!types_.is_assignable(got, declared)) {
        report_mismatch(var->initializer, declared, got);
      }
    } else if (got->kind == TypeKind::Void) {
      report(
        SymbolErrorKind::InvalidOperation, var->initializer,
        "cannot initialize " + quote_name(var->name) + " with an expression of type 'Void'");
      declared = types_.error_type();
    } else if (got->kind == TypeKind::Null) {
      declared = types_.any_type();
    } else {
      declared = got;
    }
  } else if (!declared) {
    declared = types_.any_type();
  }

  var->resolvedType = declared;
  symbols_.attach_type(var->symbol, declared);
}

void TypeChecker::ensure_typed(const VarDecl * var)
{
  if (typed_.count(var) != 0) return;

  auto it = lazy_vars_.find(var);
  if (it == lazy_vars_.end()) return;

  if (!typing_.insert(var).second) {
    report(
      SymbolErrorKind::InvalidOperation, var,
      "type of " + quote_name(var->name) + " depends on its own initializer");
    return;
  }

  const TypeDefinition * saved_type = current_type_;
  const FunctionDecl * saved_fn = current_function_;
  const TypeDefinition * saved_ret = current_return_;
  current_type_ = it->second.owner ? it->second.owner->definition : nullptr;
  current_function_ = nullptr;
  current_return_ = nullptr;

  check_var_decl(it->second.decl);

  current_return_ = saved_ret;
  current_function_ = saved_fn;
  current_type_ = saved_type;

  typing_.erase(var);
  typed_.insert(var);
}

void TypeChecker::check_function(FunctionDecl * fn)
{
  const FunctionDecl * saved_fn = current_function_;
  const TypeDefinition * saved_ret = current_return_;
  current_function_ = fn;
  current_return_ = fn->isInitializer ? types_.void_type() : fn->resolvedReturnType;

  for (ParamDecl * param : fn->params) {
    if (param->defaultValue == nullptr) continue;
    const TypeDefinition * expected = param_type(param);
    const TypeDefinition * got = check_expr(param->defaultValue, expected);
    if (expected && !types_.is_assignable(got, expected)) {
      report_mismatch(param->defaultValue, expected, got);
    }
  }

  if (fn->body) {
    for (Stmt * s : fn->body->statements) {
      check_stmt(s);
    }
  }

  current_return_ = saved_ret;
  current_function_ = saved_fn;
}

void TypeChecker::check_type_decl(TypeDecl * decl)
{
  const TypeDefinition * saved = current_type_;
  current_type_ = decl->definition;

  for (VarDecl * prop : decl->properties) {
    ensure_typed(prop);
  }

  if (auto * ed = dyn_cast<EnumDecl>(decl)) {
    const TypeDefinition * raw = decl->definition ? decl->definition->raw_type : nullptr;
    for (EnumCaseDecl * c : ed->cases) {
      if (c->rawValue == nullptr) continue;
      const TypeDefinition * got = check_expr(c->rawValue, raw);
      if (raw == nullptr) {
        report(
          SymbolErrorKind::InvalidOperation, c,
          "enum case " + quote_name(c->name) + " has a raw value but " + quote_name(decl->name) +
            " declares no raw type");
      } else if (!types_.is_assignable(got, raw)) {
        report_mismatch(c->rawValue, raw, got);
      }
    }
  }

  for (FunctionDecl * fn : decl->methods) {
    check_function(fn);
  }

  current_type_ = saved;
}

// ============================================================================
// Helpers
// ============================================================================

const TypeDefinition * TypeChecker::symbol_type(const Symbol * sym)
{
  if (sym == nullptr) return types_.error_type();
  if (sym->type == nullptr) {
    if (const auto * var = dyn_cast<VarDecl>(sym->ast_node)) {
      ensure_typed(var);
    }
  }
  return sym->type ? sym->type : types_.error_type();
}

const TypeDefinition * TypeChecker::param_type(const ParamDecl * param) const
{
  if (param->symbol && param->symbol->type) return param->symbol->type;
  return param->type ? param->type->resolvedType : nullptr;
}

bool TypeChecker::report(SymbolErrorKind kind, const AstNode * at, std::string message)
{
  // One error of each kind per node.
  if (at != nullptr && at->get_range().is_valid()) {
    const SourceRange range = at->get_range();
    const bool seen = std::any_of(errors_.begin(), errors_.end(), [&](const SymbolError & e) {
      return e.kind == kind && e.range == range;
    });
    if (seen) return false;
  }

  SymbolError err;
  err.kind = kind;
  err.message = std::move(message);
  if (at != nullptr) {
    err.line = at->line();
    err.column = at->column();
    err.range = at->get_range();
  }
  errors_.push_back(std::move(err));
  return true;
}

void TypeChecker::report_mismatch(
  const AstNode * at, const TypeDefinition * expected, const TypeDefinition * got,
  std::string message)
{
  if (is_error(expected) || is_error(got)) return;

  if (message.empty()) {
    message = "cannot convert value of type " + quote_name(got->name) + " to expected type " +
              quote_name(expected->name);
  }
  if (!report(SymbolErrorKind::TypeMismatch, at, std::move(message))) return;
  errors_.back().expected = expected->name;
  errors_.back().got = got->name;
}

}  // namespace ouro
