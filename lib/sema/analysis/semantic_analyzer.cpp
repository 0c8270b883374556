// ouro/sema/analysis/semantic_analyzer.cpp - Declaration-level semantic analysis
#include "ouro/sema/analysis/semantic_analyzer.hpp"

#include <algorithm>
#include <unordered_set>

#include "ouro/ast/visitor.hpp"
#include "ouro/basic/casting.hpp"

namespace ouro
{

namespace
{

Symbol make_symbol(
  std::string_view name, SymbolKind kind, const TypeDefinition * type, const AstNode * node)
{
  Symbol sym;
  sym.name = name;
  sym.kind = kind;
  sym.type = type;
  sym.declared_at = node->loc_;
  sym.definition_range = node->get_range();
  sym.ast_node = node;
  return sym;
}

TypeKind type_kind_for(const TypeDecl & decl)
{
  switch (decl.get_kind()) {
    case NodeKind::StructDecl:
      return TypeKind::Struct;
    case NodeKind::EnumDecl:
      return TypeKind::Enum;
    case NodeKind::InterfaceDecl:
      return TypeKind::Interface;
    default:
      return TypeKind::Class;
  }
}

std::string quote_name(std::string_view s) { return "'" + std::string(s) + "'"; }

std::string_view type_node_name(const TypeNode * node)
{
  if (const auto * named = dyn_cast<NamedType>(node)) return named->name;
  if (const auto * gen = dyn_cast<GenericType>(node)) return gen->name;
  return "?";
}

const FunctionDecl * as_function(const Symbol * sym)
{
  return sym && sym->is_function() ? dyn_cast<FunctionDecl>(sym->ast_node) : nullptr;
}

}  // namespace

// ============================================================================
// BodyResolver - pass 6
// ============================================================================

class SemanticAnalyzer::BodyResolver : public RecursiveAstVisitor<BodyResolver>
{
  using Base = RecursiveAstVisitor<BodyResolver>;

public:
  explicit BodyResolver(SemanticAnalyzer & sema) : sema_(sema), symbols_(sema.symbols_) {}

  void run(Program & program)
  {
    symbols_.set_current_scope(symbols_.global_scope());
    for (Decl * d : program.decls) {
      if (auto * fn = dyn_cast<FunctionDecl>(d)) {
        walk_function(fn);
      } else if (auto * var = dyn_cast<VarDecl>(d)) {
        if (var->initializer) visit(var->initializer);
      } else if (auto * td = dyn_cast<TypeDecl>(d)) {
        walk_type(td);
      }
    }
    for (Stmt * s : program.statements) {
      visit(s);
    }
    symbols_.set_current_scope(symbols_.global_scope());
  }

  // Statements

  bool visit_block_stmt(BlockStmt * node)
  {
    symbols_.enter_scope();
    Base::visit_block_stmt(node);
    symbols_.exit_scope();
    return true;
  }

  bool visit_var_decl_stmt(VarDeclStmt * node)
  {
    VarDecl * var = node->decl;
    // The initializer cannot see the variable it initializes.
    if (var->initializer) visit(var->initializer);

    const TypeDefinition * type = nullptr;
    if (var->type) {
      type = sema_.resolve_annotation(var->type);
      if (!type) type = sema_.types_.error_type();
    }
    var->resolvedType = type;
    var->symbol = sema_.define(
      symbols_.current_scope(),
      make_symbol(var->name, var->isConst ? SymbolKind::Constant : SymbolKind::Variable, type, var));
    return true;
  }

  bool visit_while_stmt(WhileStmt * node)
  {
    visit(node->condition);
    ++loop_depth_;
    visit(node->body);
    --loop_depth_;
    return true;
  }

  bool visit_for_stmt(ForStmt * node)
  {
    symbols_.enter_scope();
    if (node->init) visit(node->init);
    if (node->condition) visit(node->condition);
    if (node->increment) visit(node->increment);
    ++loop_depth_;
    visit(node->body);
    --loop_depth_;
    symbols_.exit_scope();
    return true;
  }

  bool visit_break_stmt(BreakStmt * node)
  {
    if (loop_depth_ == 0) {
      sema_.report(SymbolErrorKind::InvalidJump, node, "'break' outside of a loop");
    }
    return true;
  }

  bool visit_continue_stmt(ContinueStmt * node)
  {
    if (loop_depth_ == 0) {
      sema_.report(SymbolErrorKind::InvalidJump, node, "'continue' outside of a loop");
    }
    return true;
  }

  bool visit_return_stmt(ReturnStmt * node)
  {
    if (current_function_ == nullptr) {
      sema_.report(SymbolErrorKind::InvalidJump, node, "'return' outside of a function");
    }
    return Base::visit_return_stmt(node);
  }

  // Expressions

  bool visit_variable_expr(VariableExpr * node)
  {
    node->resolvedSymbol = lookup(node->name);
    if (node->resolvedSymbol == nullptr) {
      sema_.report(
        SymbolErrorKind::UndefinedSymbol, node,
        "use of undeclared identifier " + quote_name(node->name));
    }
    return true;
  }

  bool visit_assign_expr(AssignExpr * node)
  {
    visit(node->value);

    const Symbol * sym = lookup(node->name);
    node->resolvedSymbol = sym;
    if (sym == nullptr) {
      sema_.report(
        SymbolErrorKind::UndefinedSymbol, node,
        "use of undeclared identifier " + quote_name(node->name));
    } else if (sym->is_const() && !initializing_own_member(sym)) {
      sema_.report(
        SymbolErrorKind::AssignToConstant, node,
        "cannot assign to constant " + quote_name(node->name));
    } else if (!sym->is_value()) {
      sema_.report(
        SymbolErrorKind::InvalidOperation, node,
        "cannot assign to " + std::string(to_string(sym->kind)) + " " + quote_name(node->name));
    }
    return true;
  }

  bool visit_this_expr(ThisExpr * node)
  {
    if (current_type_ == nullptr) {
      sema_.report(SymbolErrorKind::InvalidThis, node, "'this' used outside of a type");
    } else if (in_static_) {
      sema_.report(SymbolErrorKind::InvalidThis, node, "'this' used in a static member");
    }
    return true;
  }

  bool visit_super_expr(SuperExpr * node)
  {
    if (current_type_ == nullptr) {
      sema_.report(SymbolErrorKind::InvalidSuper, node, "'super' used outside of a class");
    } else if (current_type_->superclass == nullptr) {
      sema_.report(
        SymbolErrorKind::InvalidSuper, node, quote_name(current_type_->name) + " has no superclass");
    } else if (in_static_) {
      sema_.report(SymbolErrorKind::InvalidSuper, node, "'super' used in a static member");
    }
    return true;
  }

private:
  void walk_type(TypeDecl * td)
  {
    const auto it = sema_.entry_index_.find(td);
    if (it == sema_.entry_index_.end()) return;
    const TypeEntry & entry = sema_.entries_[it->second];

    Scope * saved_scope = symbols_.current_scope();
    const TypeDefinition * saved_type = current_type_;
    symbols_.set_current_scope(entry.scope);
    current_type_ = entry.def;

    for (VarDecl * prop : td->properties) {
      in_static_ = prop->modifiers.has(Modifier::Static);
      if (prop->initializer) visit(prop->initializer);
    }
    in_static_ = false;
    if (auto * ed = dyn_cast<EnumDecl>(td)) {
      for (EnumCaseDecl * c : ed->cases) {
        if (c->rawValue) visit(c->rawValue);
      }
    }
    for (FunctionDecl * fn : td->methods) {
      walk_function(fn);
    }

    current_type_ = saved_type;
    symbols_.set_current_scope(saved_scope);
  }

  void walk_function(FunctionDecl * fn)
  {
    const auto it = sema_.function_scopes_.find(fn);
    if (it == sema_.function_scopes_.end()) return;

    Scope * saved_scope = symbols_.current_scope();
    const FunctionDecl * saved_fn = current_function_;
    const bool saved_static = in_static_;
    const int saved_loops = loop_depth_;

    symbols_.set_current_scope(it->second);
    current_function_ = fn;
    in_static_ = fn->modifiers.has(Modifier::Static);
    loop_depth_ = 0;

    for (ParamDecl * p : fn->params) {
      if (p->defaultValue) visit(p->defaultValue);
    }
    // Parameters and top-level locals share the signature scope.
    if (fn->body) {
      for (Stmt * s : fn->body->statements) {
        visit(s);
      }
    }

    loop_depth_ = saved_loops;
    in_static_ = saved_static;
    current_function_ = saved_fn;
    symbols_.set_current_scope(saved_scope);
  }

  /// Lexical scopes, then inherited members of the enclosing type, then globals.
  [[nodiscard]] const Symbol * lookup(std::string_view name) const
  {
    const Scope * global = symbols_.global_scope();
    for (const Scope * s = symbols_.current_scope(); s && s != global; s = s->parent()) {
      if (const Symbol * sym = s->lookup_local(name)) return sym;
    }
    if (current_type_ != nullptr) {
      if (MemberLookup m = sema_.types_.lookup_member(current_type_, name)) return m.symbol;
    }
    return global->lookup_local(name);
  }

  /// Constants of a type may be assigned inside its initializers.
  [[nodiscard]] bool initializing_own_member(const Symbol * sym) const
  {
    return current_type_ != nullptr && current_function_ != nullptr &&
           current_function_->isInitializer && current_type_->find_member(sym->name) == sym;
  }

  SemanticAnalyzer & sema_;
  SymbolTable & symbols_;

  const TypeDefinition * current_type_ = nullptr;
  const FunctionDecl * current_function_ = nullptr;
  bool in_static_ = false;
  int loop_depth_ = 0;
};

// ============================================================================
// SemanticAnalyzer
// ============================================================================

SemanticAnalyzer::SemanticAnalyzer(SymbolTable & symbols, TypeResolver & types)
: symbols_(symbols), types_(types)
{
}

std::vector<SymbolError> SemanticAnalyzer::analyze(Program & program)
{
  errors_.clear();
  entries_.clear();
  entry_index_.clear();
  function_scopes_.clear();
  symbols_.set_current_scope(symbols_.global_scope());

  declare_types(program);
  declare_globals(program);
  link_inheritance();
  declare_members();
  check_conformance();
  resolve_bodies(program);

  symbols_.set_current_scope(symbols_.global_scope());
  sort_by_position(errors_);
  return std::move(errors_);
}

void SemanticAnalyzer::report(SymbolErrorKind kind, const AstNode * at, std::string message)
{
  SymbolError err;
  err.kind = kind;
  err.message = std::move(message);
  if (at != nullptr) {
    err.line = at->line();
    err.column = at->column();
    err.range = at->get_range();
  }
  errors_.push_back(std::move(err));
}

Symbol * SemanticAnalyzer::define(Scope * scope, const Symbol & symbol)
{
  auto result = symbols_.define_in(scope, symbol);
  if (result) {
    return result.value();
  }
  errors_.push_back(std::move(result).error());
  return nullptr;
}

const TypeDefinition * SemanticAnalyzer::resolve_annotation(TypeNode * node)
{
  if (node == nullptr) return nullptr;

  const TypeNode * unresolved = nullptr;
  const TypeDefinition * type = types_.resolve(node, &unresolved);
  if (type == nullptr) {
    const TypeNode * at = unresolved ? unresolved : node;
    report(SymbolErrorKind::UndefinedType, at, "unknown type " + quote_name(type_node_name(at)));
  }
  return type;
}

// ============================================================================
// Pass 1: types
// ============================================================================

void SemanticAnalyzer::declare_types(Program & program)
{
  Scope * global = symbols_.global_scope();

  for (Decl * d : program.decls) {
    auto * td = dyn_cast<TypeDecl>(d);
    if (td == nullptr) continue;

    TypeEntry entry;
    entry.decl = td;
    entry.def = types_.create_user_type(td->name, type_kind_for(*td), td);
    entry.scope = symbols_.create_scope(global);
    entry.def->member_scope = entry.scope->id();
    td->definition = entry.def;

    if (types_.lookup_builtin(td->name) != nullptr) {
      report(
        SymbolErrorKind::DuplicateDefinition, td,
        quote_name(td->name) + " conflicts with a builtin type");
    } else {
      define(global, make_symbol(td->name, SymbolKind::Type, entry.def, td));
    }

    for (std::string_view param : td->typeParams) {
      const TypeDefinition * tp = types_.create_type_parameter(param);
      entry.def->type_parameters.push_back(tp);
      define(entry.scope, make_symbol(param, SymbolKind::Type, tp, td));
    }

    entry_index_.emplace(td, entries_.size());
    entries_.push_back(entry);
  }
}

// ============================================================================
// Pass 2: globals
// ============================================================================

Symbol * SemanticAnalyzer::declare_function(FunctionDecl * fn, Scope * owner)
{
  Scope * saved = symbols_.current_scope();
  Scope * signature = symbols_.create_scope(owner);
  function_scopes_[fn] = signature;
  symbols_.set_current_scope(signature);

  for (std::string_view tp : fn->typeParams) {
    define(signature, make_symbol(tp, SymbolKind::Type, types_.create_type_parameter(tp), fn));
  }

  for (ParamDecl * param : fn->params) {
    const TypeDefinition * type = types_.error_type();
    if (param->type) {
      if (const TypeDefinition * t = resolve_annotation(param->type)) type = t;
    }
    param->symbol = define(signature, make_symbol(param->name, SymbolKind::Variable, type, param));
  }

  const TypeDefinition * ret = types_.void_type();
  if (fn->returnType) {
    ret = resolve_annotation(fn->returnType);
    if (ret == nullptr) ret = types_.error_type();
  }
  fn->resolvedReturnType = ret;
  symbols_.set_current_scope(saved);

  Symbol * sym = define(owner, make_symbol(fn->name, SymbolKind::Function, ret, fn));
  fn->symbol = sym;
  return sym;
}

void SemanticAnalyzer::declare_globals(Program & program)
{
  Scope * global = symbols_.global_scope();
  symbols_.set_current_scope(global);

  for (Decl * d : program.decls) {
    if (auto * fn = dyn_cast<FunctionDecl>(d)) {
      declare_function(fn, global);
    } else if (auto * var = dyn_cast<VarDecl>(d)) {
      const TypeDefinition * type = nullptr;
      if (var->type) {
        type = resolve_annotation(var->type);
        if (type == nullptr) type = types_.error_type();
      }
      // Unannotated globals are typed lazily by the checker.
      var->resolvedType = type;
      var->symbol = define(
        global, make_symbol(
                  var->name, var->isConst ? SymbolKind::Constant : SymbolKind::Variable, type, var));
    }
  }
}

// ============================================================================
// Pass 3: inheritance
// ============================================================================

bool SemanticAnalyzer::would_cycle(
  const TypeDefinition * derived, const TypeDefinition * base) const
{
  return base == derived || types_.is_subtype(base, derived);
}

void SemanticAnalyzer::check_sealed(
  const TypeEntry & entry, const TypeDefinition * base, const NamedType * at)
{
  // A sealed type without a permits list is open to its own unit.
  if (!base->is_sealed || base->permits.empty()) return;

  const auto & permits = base->permits;
  if (std::find(permits.begin(), permits.end(), entry.decl->name) == permits.end()) {
    report(
      SymbolErrorKind::SealedNotPermitted, at,
      quote_name(entry.decl->name) + " is not permitted to extend sealed type " + quote_name(base->name));
  }
}

void SemanticAnalyzer::link_interfaces(const TypeEntry & entry, gsl::span<NamedType *> names)
{
  for (NamedType * name : names) {
    const TypeDefinition * base = types_.resolve(name);
    if (base == nullptr) {
      report(SymbolErrorKind::UndefinedType, name, "unknown type " + quote_name(name->name));
      continue;
    }
    if (!base->is_interface) {
      report(SymbolErrorKind::NotAnInterface, name, quote_name(name->name) + " is not an interface");
      continue;
    }
    if (would_cycle(entry.def, base)) {
      report(
        SymbolErrorKind::CircularInheritance, name,
        "circular inheritance between " + quote_name(entry.decl->name) + " and " + quote_name(base->name));
      continue;
    }
    check_sealed(entry, base, name);

    auto & ifaces = entry.def->interfaces;
    if (std::find(ifaces.begin(), ifaces.end(), base) == ifaces.end()) {
      ifaces.push_back(base);
    }
  }
}

void SemanticAnalyzer::link_class(const TypeEntry & entry, const ClassDecl & decl)
{
  if (NamedType * super_name = decl.superclass) {
    const TypeDefinition * base = types_.resolve(super_name);
    if (base == nullptr) {
      report(SymbolErrorKind::UndefinedType, super_name, "unknown type " + quote_name(super_name->name));
    } else if (base->is_interface) {
      report(
        SymbolErrorKind::SuperclassIsInterface, super_name,
        quote_name(base->name) + " is an interface and cannot be the superclass of " +
          quote_name(decl.name));
      // Still honour the conformance it was meant to declare.
      if (!would_cycle(entry.def, base)) {
        check_sealed(entry, base, super_name);
        entry.def->interfaces.push_back(base);
      }
    } else if (base->kind != TypeKind::Class) {
      report(
        SymbolErrorKind::ExtendsFinal, super_name,
        quote_name(decl.name) + " cannot inherit from " + std::string(to_string(base->kind)) + " " +
          quote_name(base->name));
    } else if (base->is_final) {
      report(
        SymbolErrorKind::ExtendsFinal, super_name,
        quote_name(decl.name) + " cannot inherit from final class " + quote_name(base->name));
    } else if (would_cycle(entry.def, base)) {
      report(
        SymbolErrorKind::CircularInheritance, super_name,
        "circular inheritance between " + quote_name(decl.name) + " and " + quote_name(base->name));
    } else {
      check_sealed(entry, base, super_name);
      entry.def->superclass = base;
    }
  }

  link_interfaces(entry, decl.interfaces);
}

void SemanticAnalyzer::link_inheritance()
{
  symbols_.set_current_scope(symbols_.global_scope());

  // Permits first: subclasses may be declared before their sealed base.
  for (const TypeEntry & entry : entries_) {
    const auto * cd = dyn_cast<ClassDecl>(entry.decl);
    if (cd == nullptr) continue;
    for (NamedType * permitted : cd->permits) {
      entry.def->permits.push_back(permitted->name);
      if (types_.resolve(permitted) == nullptr) {
        report(
          SymbolErrorKind::UndefinedType, permitted, "unknown type " + quote_name(permitted->name));
      }
    }
  }

  for (const TypeEntry & entry : entries_) {
    switch (entry.decl->get_kind()) {
      case NodeKind::ClassDecl:
        link_class(entry, *cast<ClassDecl>(entry.decl));
        break;
      case NodeKind::StructDecl:
        link_interfaces(entry, cast<StructDecl>(entry.decl)->interfaces);
        break;
      case NodeKind::InterfaceDecl:
        link_interfaces(entry, cast<InterfaceDecl>(entry.decl)->parents);
        break;
      case NodeKind::EnumDecl:
        if (auto * raw = cast<EnumDecl>(entry.decl)->rawType) {
          entry.def->raw_type = resolve_annotation(raw);
        }
        break;
      default:
        break;
    }
  }
}

// ============================================================================
// Pass 4: members
// ============================================================================

void SemanticAnalyzer::declare_members()
{
  for (const TypeEntry & entry : entries_) {
    symbols_.set_current_scope(entry.scope);
    TypeDecl * td = entry.decl;

    for (VarDecl * prop : td->properties) {
      const TypeDefinition * type = nullptr;
      if (prop->type) {
        type = resolve_annotation(prop->type);
        if (type == nullptr) type = types_.error_type();
      }
      prop->resolvedType = type;

      if (prop->modifiers.has(Modifier::Abstract) && !entry.def->is_abstract) {
        report(
          SymbolErrorKind::AbstractMemberInConcreteType, prop,
          "abstract property " + quote_name(prop->name) + " in non-abstract type " + quote_name(td->name));
      }

      Symbol * sym = define(
        entry.scope,
        make_symbol(
          prop->name, prop->isConst ? SymbolKind::Constant : SymbolKind::Variable, type, prop));
      if (sym != nullptr) {
        prop->symbol = sym;
        entry.def->members.push_back(sym);
      }
    }

    if (auto * ed = dyn_cast<EnumDecl>(td)) {
      for (EnumCaseDecl * c : ed->cases) {
        if (Symbol * sym = define(entry.scope, make_symbol(c->name, SymbolKind::Constant, entry.def, c))) {
          entry.def->members.push_back(sym);
        }
      }
    }

    for (FunctionDecl * fn : td->methods) {
      if (fn->modifiers.has(Modifier::Abstract) && !entry.def->is_abstract) {
        report(
          SymbolErrorKind::AbstractMemberInConcreteType, fn,
          "abstract method " + quote_name(fn->name) + " in non-abstract type " + quote_name(td->name));
      }
      if (Symbol * sym = declare_function(fn, entry.scope)) {
        entry.def->members.push_back(sym);
      }
    }
  }
  symbols_.set_current_scope(symbols_.global_scope());
}

// ============================================================================
// Pass 5: overrides and conformance
// ============================================================================

void SemanticAnalyzer::check_overrides(const TypeEntry & entry)
{
  const TypeDefinition * def = entry.def;
  for (const FunctionDecl * fn : entry.decl->methods) {
    if (!fn->modifiers.has(Modifier::Override)) continue;

    // Name presence is enough; signatures are not compared.
    bool found = false;
    if (def->superclass != nullptr) {
      found = as_function(types_.lookup_member(def->superclass, fn->name).symbol) != nullptr;
    }
    for (size_t i = 0; !found && i < def->interfaces.size(); ++i) {
      found = as_function(types_.lookup_member(def->interfaces[i], fn->name).symbol) != nullptr;
    }
    if (!found) {
      report(
        SymbolErrorKind::InvalidOverride, fn,
        "method " + quote_name(fn->name) + " is marked 'override' but does not override any "
                                       "inherited method");
    }
  }
}

void SemanticAnalyzer::check_interface_methods(const TypeEntry & entry)
{
  const TypeDefinition * def = entry.def;

  // Every interface reachable from the class chain, breadth-first.
  std::vector<const TypeDefinition *> ifaces;
  std::unordered_set<const TypeDefinition *> seen;
  for (const TypeDefinition * t = def; t != nullptr; t = t->superclass) {
    for (const TypeDefinition * i : t->interfaces) {
      if (seen.insert(i).second) ifaces.push_back(i);
    }
  }
  for (size_t i = 0; i < ifaces.size(); ++i) {
    for (const TypeDefinition * parent : ifaces[i]->interfaces) {
      if (seen.insert(parent).second) ifaces.push_back(parent);
    }
  }

  auto has_default = [&](std::string_view name) {
    for (const TypeDefinition * iface : ifaces) {
      const FunctionDecl * fn = as_function(iface->find_member(name));
      if (fn != nullptr && fn->has_body()) return true;
    }
    return false;
  };

  std::unordered_set<std::string_view> reported;
  for (const TypeDefinition * iface : ifaces) {
    for (const Symbol * member : iface->members) {
      const FunctionDecl * required = as_function(member);
      if (required == nullptr || required->has_body()) continue;

      bool implemented = false;
      for (const TypeDefinition * t = def; t != nullptr && !implemented; t = t->superclass) {
        const FunctionDecl * impl = as_function(t->find_member(member->name));
        implemented = impl != nullptr && impl->has_body();
      }
      if (implemented || has_default(member->name)) continue;
      if (!reported.insert(member->name).second) continue;

      report(
        SymbolErrorKind::MissingInterfaceMethod, entry.decl,
        quote_name(def->name) + " does not implement method " + quote_name(member->name) +
          " required by interface " + quote_name(iface->name));
    }
  }
}

void SemanticAnalyzer::check_abstract_methods(const TypeEntry & entry)
{
  const TypeDefinition * def = entry.def;
  std::unordered_set<std::string_view> reported;

  for (const TypeDefinition * base = def->superclass; base != nullptr; base = base->superclass) {
    for (const Symbol * member : base->members) {
      const FunctionDecl * fn = as_function(member);
      if (fn == nullptr || fn->has_body()) continue;

      // The most derived declaration of the name decides.
      const FunctionDecl * impl = nullptr;
      for (const TypeDefinition * t = def; t != nullptr && impl == nullptr; t = t->superclass) {
        impl = as_function(t->find_member(member->name));
      }
      if (impl != nullptr && impl->has_body()) continue;
      if (!reported.insert(member->name).second) continue;

      report(
        SymbolErrorKind::MissingAbstractImplementation, entry.decl,
        quote_name(def->name) + " does not implement abstract method " + quote_name(member->name) +
          " inherited from " + quote_name(base->name));
    }
  }
}

void SemanticAnalyzer::check_conformance()
{
  for (const TypeEntry & entry : entries_) {
    check_overrides(entry);

    const TypeKind kind = entry.def->kind;
    if (entry.def->is_abstract) continue;
    if (kind == TypeKind::Class || kind == TypeKind::Struct) {
      check_interface_methods(entry);
    }
    if (kind == TypeKind::Class) {
      check_abstract_methods(entry);
    }
  }
}

// ============================================================================
// Pass 6: bodies
// ============================================================================

void SemanticAnalyzer::resolve_bodies(Program & program)
{
  BodyResolver resolver(*this);
  resolver.run(program);
}

}  // namespace ouro
