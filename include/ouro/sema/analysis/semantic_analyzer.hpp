// ouro/sema/analysis/semantic_analyzer.hpp - Declaration-level semantic analysis
//
// Populates the SymbolTable and TypeResolver from a parsed Program and
// validates declaration rules. Expression typing is left to TypeChecker.
//
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "ouro/ast/ast.hpp"
#include "ouro/sema/resolution/symbol_table.hpp"
#include "ouro/sema/sema_error.hpp"
#include "ouro/sema/types/type_resolver.hpp"

namespace ouro
{

/**
 * Semantic analyzer.
 *
 * ## Passes
 *
 * 1. Declare types (forward references between siblings work)
 * 2. Declare global functions, variables and constants
 * 3. Link superclasses and interfaces (final / sealed / cycles)
 * 4. Declare members of every type
 * 5. Overrides and interface / abstract conformance
 * 6. Walk bodies: scopes, identifier resolution, this / super / jumps,
 *    assignment to constants
 *
 * Annotates VariableExpr/AssignExpr::resolvedSymbol, VarDecl::resolvedType
 * (when annotated), FunctionDecl::resolvedReturnType, ParamDecl::symbol and
 * TypeDecl::definition.
 *
 * ## Usage
 * ```cpp
 * SymbolTable symbols;
 * TypeResolver types(symbols);
 * SemanticAnalyzer analyzer(symbols, types);
 * std::vector<SymbolError> errors = analyzer.analyze(program);
 * ```
 */
class SemanticAnalyzer
{
public:
  SemanticAnalyzer(SymbolTable & symbols, TypeResolver & types);

  /// Run every pass; errors are returned in source order.
  std::vector<SymbolError> analyze(Program & program);

private:
  class BodyResolver;

  /// Per-declaration bookkeeping for user types.
  struct TypeEntry
  {
    TypeDecl * decl = nullptr;
    TypeDefinition * def = nullptr;
    Scope * scope = nullptr;  ///< Member scope (type parameters + members)
  };

  // ===========================================================================
  // Passes
  // ===========================================================================

  void declare_types(Program & program);
  void declare_globals(Program & program);
  void link_inheritance();
  void declare_members();
  void check_conformance();
  void resolve_bodies(Program & program);

  // ===========================================================================
  // Helpers
  // ===========================================================================

  void link_class(const TypeEntry & entry, const ClassDecl & decl);
  void link_interfaces(const TypeEntry & entry, gsl::span<NamedType *> names);
  void check_sealed(const TypeEntry & entry, const TypeDefinition * base, const NamedType * at);
  [[nodiscard]] bool would_cycle(const TypeDefinition * derived, const TypeDefinition * base) const;

  void check_overrides(const TypeEntry & entry);
  void check_interface_methods(const TypeEntry & entry);
  void check_abstract_methods(const TypeEntry & entry);

  /// Creates the signature scope, resolves parameter and return types and
  /// defines the function symbol in `owner`.
  Symbol * declare_function(FunctionDecl * fn, Scope * owner);

  /// Resolve an annotation in the current scope, reporting UndefinedType.
  const TypeDefinition * resolve_annotation(TypeNode * node);

  Symbol * define(Scope * scope, const Symbol & symbol);

  void report(SymbolErrorKind kind, const AstNode * at, std::string message);

  SymbolTable & symbols_;
  TypeResolver & types_;

  std::vector<TypeEntry> entries_;
  std::unordered_map<const TypeDecl *, size_t> entry_index_;
  std::unordered_map<const FunctionDecl *, Scope *> function_scopes_;

  std::vector<SymbolError> errors_;
};

}  // namespace ouro
