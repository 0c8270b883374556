// ouro/sema/types/type_definition.hpp - Semantic type representation
//
// A TypeDefinition is created once per builtin, user declaration, array
// element type or generic instantiation, and is owned by the TypeResolver.
// Everything else refers to it by `const TypeDefinition *`.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ouro/ast/ast.hpp"

namespace ouro
{

struct Symbol;

// ============================================================================
// TypeKind
// ============================================================================

enum class TypeKind : uint8_t {
  // Integers
  Int8,
  Int16,
  Int32,
  Int64,
  UInt8,
  UInt16,
  UInt32,
  UInt64,
  // Floating point
  Float16,
  Float32,
  Float64,
  Decimal,
  // Other primitives
  Bool,
  Char,
  String,
  Void,
  Any,
  Never,
  Null,  ///< Type of the `null` literal
  // User-defined
  Class,
  Struct,
  Enum,
  Interface,
  // Composite
  Array,
  Generic,        ///< Instantiation such as Box<Int>
  TypeParameter,  ///< T inside `class Box<T>`
  // Error recovery (compatible with everything)
  Error,
};

[[nodiscard]] std::string_view to_string(TypeKind kind) noexcept;

/// Whether `value` is representable in the integer kind `kind`.
[[nodiscard]] bool fits_integer(int64_t value, TypeKind kind) noexcept;

// ============================================================================
// TypeDefinition
// ============================================================================

struct TypeDefinition
{
  std::string name;            ///< Display name (Int, Point, Int[], Box<String>)
  TypeKind kind = TypeKind::Error;
  std::string canonical_name;  ///< Backend-facing name (i32, f64, !ouro.string)

  bool is_interface = false;
  bool is_abstract = false;
  bool is_sealed = false;
  bool is_final = false;
  bool is_primitive = false;

  /// Properties, methods and enum cases declared directly on this type
  std::vector<const Symbol *> members;

  const TypeDefinition * superclass = nullptr;
  std::vector<const TypeDefinition *> interfaces;
  std::vector<std::string_view> permits;

  const TypeDefinition * element = nullptr;          ///< Array element
  std::vector<const TypeDefinition *> type_arguments;  ///< Generic arguments
  const TypeDefinition * origin = nullptr;            ///< Generic base declaration
  std::vector<const TypeDefinition *> type_parameters;
  const TypeDefinition * raw_type = nullptr;  ///< Enum raw value type

  const TypeDecl * decl = nullptr;
  uint32_t member_scope = 0;  ///< Scope holding the members (user types only)

  /// Member declared directly on this type (no inheritance walk).
  [[nodiscard]] const Symbol * find_member(std::string_view member_name) const;

  [[nodiscard]] bool is_error() const noexcept { return kind == TypeKind::Error; }

  [[nodiscard]] bool is_integer() const noexcept
  {
    return kind >= TypeKind::Int8 && kind <= TypeKind::UInt64;
  }
  [[nodiscard]] bool is_signed_integer() const noexcept
  {
    return kind >= TypeKind::Int8 && kind <= TypeKind::Int64;
  }
  [[nodiscard]] bool is_float() const noexcept
  {
    return kind >= TypeKind::Float16 && kind <= TypeKind::Decimal;
  }
  [[nodiscard]] bool is_numeric() const noexcept { return is_integer() || is_float(); }

  /// Class, interface, array, string or generic instance: accepts `null`.
  [[nodiscard]] bool is_reference() const noexcept
  {
    return kind == TypeKind::Class || kind == TypeKind::Interface || kind == TypeKind::Array ||
           kind == TypeKind::String || kind == TypeKind::Generic || kind == TypeKind::Any ||
           kind == TypeKind::TypeParameter;
  }

  [[nodiscard]] bool is_user_type() const noexcept
  {
    return kind >= TypeKind::Class && kind <= TypeKind::Interface;
  }

  /// Width rank within the integer or float family (0 when not numeric).
  [[nodiscard]] int numeric_rank() const noexcept;
};

}  // namespace ouro
