// ouro/sema/types/type_resolver.hpp - Type name resolution and compatibility
//
// Owns every TypeDefinition of one compilation unit: the primitive
// singletons seeded at construction, user declarations, and interned
// array / generic instantiations.
//
#pragma once

#include <deque>
#include <map>
#include <memory_resource>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ouro/ast/ast.hpp"
#include "ouro/sema/resolution/symbol_table.hpp"
#include "ouro/sema/types/type_definition.hpp"

namespace ouro
{

/// Result of a member lookup along the inheritance graph.
struct MemberLookup
{
  const Symbol * symbol = nullptr;
  const TypeDefinition * owner = nullptr;  ///< Type that declares the member

  explicit operator bool() const noexcept { return symbol != nullptr; }
};

/**
 * Maps type names and annotations to canonical definitions.
 *
 * User types and type parameters are found through the SymbolTable (kind
 * Type, from the current scope outward); builtins and their lowercase
 * aliases live in the resolver itself and are always visible.
 *
 * @code
 *   TypeResolver types(symbols);
 *   const TypeDefinition * t = types.resolve(var->type);  // nullptr if unknown
 *   bool ok = types.is_assignable(types.int_type(), types.double_type());
 * @endcode
 */
class TypeResolver
{
public:
  explicit TypeResolver(SymbolTable & symbols);

  TypeResolver(const TypeResolver &) = delete;
  TypeResolver & operator=(const TypeResolver &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const TypeDefinition * int_type() const noexcept { return int_; }
  [[nodiscard]] const TypeDefinition * int64_type() const noexcept { return int64_; }
  [[nodiscard]] const TypeDefinition * double_type() const noexcept { return double_; }
  [[nodiscard]] const TypeDefinition * bool_type() const noexcept { return bool_; }
  [[nodiscard]] const TypeDefinition * string_type() const noexcept { return string_; }
  [[nodiscard]] const TypeDefinition * char_type() const noexcept { return char_; }
  [[nodiscard]] const TypeDefinition * void_type() const noexcept { return void_; }
  [[nodiscard]] const TypeDefinition * any_type() const noexcept { return any_; }
  [[nodiscard]] const TypeDefinition * never_type() const noexcept { return never_; }
  [[nodiscard]] const TypeDefinition * null_type() const noexcept { return null_; }
  [[nodiscard]] const TypeDefinition * error_type() const noexcept { return error_; }

  /// Builtin or builtin alias by name; nullptr otherwise.
  [[nodiscard]] const TypeDefinition * lookup_builtin(std::string_view name) const;

  // ===========================================================================
  // Creation
  // ===========================================================================

  /// Register the definition of a class, struct, enum or interface declaration.
  TypeDefinition * create_user_type(std::string_view name, TypeKind kind, const TypeDecl * decl);

  const TypeDefinition * create_type_parameter(std::string_view name);

  /// Interned `element[]`.
  const TypeDefinition * array_of(const TypeDefinition * element);

  /// Interned `origin<args...>`.
  const TypeDefinition * generic_of(
    const TypeDefinition * origin, const std::vector<const TypeDefinition *> & args);

  // ===========================================================================
  // Resolution
  // ===========================================================================

  /**
   * Resolve an annotation and record it in `node->resolvedType`.
   *
   * @param unresolved Receives the innermost NamedType/GenericType whose
   *                   name is unknown, if any.
   * @return The definition, or nullptr when some name is unknown.
   */
  const TypeDefinition * resolve(TypeNode * node, const TypeNode ** unresolved = nullptr);

  /// Scope-visible user type or type parameter first, then builtins.
  [[nodiscard]] const TypeDefinition * resolve_name(std::string_view name) const;

  /// Member by name on `type`, its superclass chain, then its interfaces.
  [[nodiscard]] MemberLookup lookup_member(
    const TypeDefinition * type, std::string_view name) const;

  // ===========================================================================
  // Compatibility
  // ===========================================================================

  /// Whether a value of type `from` may be stored where `to` is expected.
  [[nodiscard]] bool is_assignable(const TypeDefinition * from, const TypeDefinition * to) const;

  /// Whether `sub` reaches `super` through superclass or interface edges.
  [[nodiscard]] bool is_subtype(const TypeDefinition * sub, const TypeDefinition * super) const;

  /// Wider of two numeric types; floats dominate integers.
  [[nodiscard]] const TypeDefinition * common_numeric(
    const TypeDefinition * a, const TypeDefinition * b) const;

  /// Type both operands can be stored as, or nullptr when there is none.
  [[nodiscard]] const TypeDefinition * common_type(
    const TypeDefinition * a, const TypeDefinition * b) const;

  [[nodiscard]] size_t definition_count() const noexcept { return definitions_.size(); }

private:
  TypeDefinition * make(std::string name, TypeKind kind, std::string canonical);
  const TypeDefinition * add_builtin(std::string_view name, TypeKind kind, std::string_view canonical);
  void add_alias(std::string_view alias, const TypeDefinition * target);

  [[nodiscard]] static bool numeric_widens(
    const TypeDefinition * from, const TypeDefinition * to) noexcept;

  SymbolTable & symbols_;

  std::pmr::monotonic_buffer_resource arena_{4096};
  // Pointers are handed out everywhere; storage needs stable addresses.
  std::pmr::deque<TypeDefinition> definitions_{&arena_};

  std::unordered_map<std::string_view, const TypeDefinition *> builtins_;
  std::unordered_map<const TypeDefinition *, const TypeDefinition *> arrays_;
  std::map<std::vector<const TypeDefinition *>, const TypeDefinition *> generics_;

  const TypeDefinition * int_ = nullptr;
  const TypeDefinition * int64_ = nullptr;
  const TypeDefinition * double_ = nullptr;
  const TypeDefinition * bool_ = nullptr;
  const TypeDefinition * string_ = nullptr;
  const TypeDefinition * char_ = nullptr;
  const TypeDefinition * void_ = nullptr;
  const TypeDefinition * any_ = nullptr;
  const TypeDefinition * never_ = nullptr;
  const TypeDefinition * null_ = nullptr;
  const TypeDefinition * error_ = nullptr;
};

}  // namespace ouro
