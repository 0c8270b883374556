// ouro/ast/json_visitor.cpp - JSON serialization implementation
//
#include "ouro/ast/json_visitor.hpp"

#include <cstdint>
#include <string>
#include <string_view>

#include "ouro/basic/casting.hpp"
#include "ouro/sema/types/type_definition.hpp"

namespace ouro
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

/// Object with the common "type" / "range" / "line" / "column" header.
json j_node(const AstNode * n)
{
  return json{
    {"type", std::string(to_string(n->get_kind()))},
    {"range", j_range(n->get_range())},
    {"line", n->line()},
    {"column", n->column()}};
}

json j_modifiers(Modifiers mods)
{
  json out = json::array();
  for (uint16_t bit = 1; bit != 0 && bit <= static_cast<uint16_t>(Modifier::Override); bit <<= 1) {
    const auto m = static_cast<Modifier>(bit);
    if (mods.has(m)) out.push_back(std::string(to_string(m)));
  }
  return out;
}

json j_names(gsl::span<std::string_view> names)
{
  json out = json::array();
  for (std::string_view n : names) out.push_back(std::string(n));
  return out;
}

void add_resolved(json & j, const TypeDefinition * t)
{
  if (t != nullptr) j["resolvedType"] = t->name;
}

// Forward declarations
json j_type(const TypeNode * t);
json j_expr(const Expr * e);
json j_stmt(const Stmt * s);
json j_decl(const Decl * d);

json j_exprs(gsl::span<Expr *> exprs)
{
  json out = json::array();
  for (const Expr * e : exprs) out.push_back(j_expr(e));
  return out;
}

json j_type_list(gsl::span<NamedType *> types)
{
  json out = json::array();
  for (const NamedType * t : types) out.push_back(j_type(t));
  return out;
}

// ============================================================================
// Type serialization
// ============================================================================

json j_type(const TypeNode * t)
{
  if (!t) return json{{"type", "MissingType"}, {"range", j_range({})}};

  json j = j_node(t);
  if (const auto * named = dyn_cast<NamedType>(t)) {
    j["name"] = std::string(named->name);
  } else if (const auto * arr = dyn_cast<ArrayType>(t)) {
    j["elementType"] = j_type(arr->elementType);
  } else if (const auto * gen = dyn_cast<GenericType>(t)) {
    j["name"] = std::string(gen->name);
    json args = json::array();
    for (const TypeNode * a : gen->typeArgs) args.push_back(j_type(a));
    j["typeArgs"] = args;
  }
  add_resolved(j, t->resolvedType);
  return j;
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_literal(const LiteralExpr * lit, json j)
{
  j["literalKind"] = std::string(to_string(lit->literalKind));
  switch (lit->literalKind) {
    case LiteralKind::Int:
      j["value"] = lit->intValue;
      break;
    case LiteralKind::Float:
      j["value"] = lit->floatValue;
      break;
    case LiteralKind::String:
      j["value"] = std::string(lit->stringValue);
      break;
    case LiteralKind::Char:
      j["value"] = static_cast<uint32_t>(lit->charValue);
      break;
    case LiteralKind::Bool:
      j["value"] = lit->boolValue;
      break;
    case LiteralKind::Null:
      j["value"] = nullptr;
      break;
  }
  return j;
}

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  json j = j_node(e);

  switch (e->get_kind()) {
    case NodeKind::Literal:
      j = j_literal(cast<LiteralExpr>(e), std::move(j));
      break;
    case NodeKind::Variable:
      j["name"] = std::string(cast<VariableExpr>(e)->name);
      break;
    case NodeKind::Grouping:
      j["inner"] = j_expr(cast<GroupingExpr>(e)->inner);
      break;
    case NodeKind::Unary: {
      const auto * u = cast<UnaryExpr>(e);
      j["op"] = std::string(to_string(u->op));
      j["operand"] = j_expr(u->operand);
      break;
    }
    case NodeKind::Binary: {
      const auto * b = cast<BinaryExpr>(e);
      j["op"] = std::string(to_string(b->op));
      j["lhs"] = j_expr(b->lhs);
      j["rhs"] = j_expr(b->rhs);
      break;
    }
    case NodeKind::Conditional: {
      const auto * c = cast<ConditionalExpr>(e);
      j["condition"] = j_expr(c->condition);
      j["thenExpr"] = j_expr(c->thenExpr);
      j["elseExpr"] = j_expr(c->elseExpr);
      break;
    }
    case NodeKind::Assign: {
      const auto * a = cast<AssignExpr>(e);
      j["name"] = std::string(a->name);
      j["value"] = j_expr(a->value);
      break;
    }
    case NodeKind::Call: {
      const auto * c = cast<CallExpr>(e);
      j["callee"] = j_expr(c->callee);
      j["args"] = j_exprs(c->args);
      break;
    }
    case NodeKind::Get: {
      const auto * g = cast<GetExpr>(e);
      j["object"] = j_expr(g->object);
      j["name"] = std::string(g->name);
      break;
    }
    case NodeKind::Set: {
      const auto * s = cast<SetExpr>(e);
      j["object"] = j_expr(s->object);
      j["name"] = std::string(s->name);
      j["op"] = std::string(to_string(s->op));
      j["value"] = j_expr(s->value);
      break;
    }
    case NodeKind::Index: {
      const auto * i = cast<IndexExpr>(e);
      j["base"] = j_expr(i->base);
      j["index"] = j_expr(i->index);
      break;
    }
    case NodeKind::IndexSet: {
      const auto * i = cast<IndexSetExpr>(e);
      j["base"] = j_expr(i->base);
      j["index"] = j_expr(i->index);
      j["op"] = std::string(to_string(i->op));
      j["value"] = j_expr(i->value);
      break;
    }
    case NodeKind::Super:
      j["method"] = std::string(cast<SuperExpr>(e)->method);
      break;
    case NodeKind::ArrayLiteral:
      j["elements"] = j_exprs(cast<ArrayLiteralExpr>(e)->elements);
      break;
    default:
      break;
  }

  add_resolved(j, e->resolvedType);
  return j;
}

// ============================================================================
// Statement serialization
// ============================================================================

json j_stmt_list(gsl::span<Stmt *> stmts)
{
  json out = json::array();
  for (const Stmt * s : stmts) out.push_back(j_stmt(s));
  return out;
}

json j_stmt(const Stmt * s)
{
  if (!s) return json{{"type", "MissingStmt"}, {"range", j_range({})}};

  json j = j_node(s);

  switch (s->get_kind()) {
    case NodeKind::ExpressionStmt:
      j["expr"] = j_expr(cast<ExpressionStmt>(s)->expr);
      break;
    case NodeKind::BlockStmt:
      j["statements"] = j_stmt_list(cast<BlockStmt>(s)->statements);
      break;
    case NodeKind::IfStmt: {
      const auto * i = cast<IfStmt>(s);
      j["condition"] = j_expr(i->condition);
      j["thenBranch"] = j_stmt(i->thenBranch);
      if (i->elseBranch) j["elseBranch"] = j_stmt(i->elseBranch);
      break;
    }
    case NodeKind::WhileStmt: {
      const auto * w = cast<WhileStmt>(s);
      j["condition"] = j_expr(w->condition);
      j["body"] = j_stmt(w->body);
      break;
    }
    case NodeKind::ForStmt: {
      const auto * f = cast<ForStmt>(s);
      if (f->init) j["init"] = j_stmt(f->init);
      if (f->condition) j["condition"] = j_expr(f->condition);
      if (f->increment) j["increment"] = j_expr(f->increment);
      j["body"] = j_stmt(f->body);
      break;
    }
    case NodeKind::ReturnStmt:
      if (const Expr * v = cast<ReturnStmt>(s)->value) j["value"] = j_expr(v);
      break;
    case NodeKind::VarDeclStmt:
      j["decl"] = j_decl(cast<VarDeclStmt>(s)->decl);
      break;
    default:
      break;
  }
  return j;
}

// ============================================================================
// Declaration serialization
// ============================================================================

json j_param(const ParamDecl * p)
{
  json j = j_node(p);
  j["name"] = std::string(p->name);
  j["typeExpr"] = j_type(p->type);
  if (p->defaultValue) j["defaultValue"] = j_expr(p->defaultValue);
  return j;
}

json j_enum_case(const EnumCaseDecl * c)
{
  json j = j_node(c);
  j["name"] = std::string(c->name);
  if (c->rawValue) j["rawValue"] = j_expr(c->rawValue);
  return j;
}

json j_decl(const Decl * d)
{
  if (!d) return json{{"type", "MissingDecl"}, {"range", j_range({})}};

  json j = j_node(d);
  j["name"] = std::string(d->name);
  if (!d->modifiers.empty()) j["modifiers"] = j_modifiers(d->modifiers);

  if (const auto * v = dyn_cast<VarDecl>(d)) {
    j["isConst"] = v->isConst;
    if (v->type) j["typeExpr"] = j_type(v->type);
    if (v->initializer) j["initializer"] = j_expr(v->initializer);
    add_resolved(j, v->resolvedType);
    return j;
  }

  if (const auto * fn = dyn_cast<FunctionDecl>(d)) {
    if (!fn->typeParams.empty()) j["typeParams"] = j_names(fn->typeParams);
    json params = json::array();
    for (const ParamDecl * p : fn->params) params.push_back(j_param(p));
    j["params"] = params;
    if (fn->returnType) j["returnType"] = j_type(fn->returnType);
    if (fn->isInitializer) j["isInitializer"] = true;
    if (fn->body) j["body"] = j_stmt(fn->body);
    return j;
  }

  const auto * td = dyn_cast<TypeDecl>(d);
  if (td == nullptr) return j;

  if (!td->typeParams.empty()) j["typeParams"] = j_names(td->typeParams);

  if (const auto * cd = dyn_cast<ClassDecl>(td)) {
    if (cd->superclass) j["superclass"] = j_type(cd->superclass);
    j["interfaces"] = j_type_list(cd->interfaces);
    if (!cd->permits.empty()) j["permits"] = j_type_list(cd->permits);
  } else if (const auto * sd = dyn_cast<StructDecl>(td)) {
    j["interfaces"] = j_type_list(sd->interfaces);
  } else if (const auto * id = dyn_cast<InterfaceDecl>(td)) {
    j["parents"] = j_type_list(id->parents);
  } else if (const auto * ed = dyn_cast<EnumDecl>(td)) {
    if (ed->rawType) j["rawType"] = j_type(ed->rawType);
    json cases = json::array();
    for (const EnumCaseDecl * c : ed->cases) cases.push_back(j_enum_case(c));
    j["cases"] = cases;
  }

  json props = json::array();
  for (const VarDecl * p : td->properties) props.push_back(j_decl(p));
  j["properties"] = props;

  json methods = json::array();
  for (const FunctionDecl * m : td->methods) methods.push_back(j_decl(m));
  j["methods"] = methods;
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<Program>(node)) {
    return to_json(cast<Program>(node));
  }
  if (isa<Decl>(node)) {
    return j_decl(cast<Decl>(node));
  }
  if (isa<Stmt>(node)) {
    return j_stmt(cast<Stmt>(node));
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }
  if (isa<TypeNode>(node)) {
    return j_type(cast<TypeNode>(node));
  }
  if (isa<ParamDecl>(node)) {
    return j_param(cast<ParamDecl>(node));
  }
  if (isa<EnumCaseDecl>(node)) {
    return j_enum_case(cast<EnumCaseDecl>(node));
  }

  return nlohmann::json{{"type", "UnknownNode"}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const Program * program)
{
  if (!program) {
    return nlohmann::json{
      {"type", "Program"},
      {"range", j_range({})},
      {"decls", nlohmann::json::array()},
      {"statements", nlohmann::json::array()}};
  }

  nlohmann::json decls = nlohmann::json::array();
  for (const Decl * d : program->decls) decls.push_back(j_decl(d));

  return nlohmann::json{
    {"type", "Program"},
    {"range", j_range(program->get_range())},
    {"decls", decls},
    {"statements", j_stmt_list(program->statements)}};
}

}  // namespace ouro
