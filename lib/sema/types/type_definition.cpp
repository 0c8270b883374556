// ouro/sema/types/type_definition.cpp - TypeDefinition helpers
#include "ouro/sema/types/type_definition.hpp"

#include <limits>

#include "ouro/sema/resolution/symbol_table.hpp"

namespace ouro
{

std::string_view to_string(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Int8:
      return "Int8";
    case TypeKind::Int16:
      return "Int16";
    case TypeKind::Int32:
      return "Int32";
    case TypeKind::Int64:
      return "Int64";
    case TypeKind::UInt8:
      return "UInt8";
    case TypeKind::UInt16:
      return "UInt16";
    case TypeKind::UInt32:
      return "UInt32";
    case TypeKind::UInt64:
      return "UInt64";
    case TypeKind::Float16:
      return "Float16";
    case TypeKind::Float32:
      return "Float32";
    case TypeKind::Float64:
      return "Float64";
    case TypeKind::Decimal:
      return "Decimal";
    case TypeKind::Bool:
      return "Bool";
    case TypeKind::Char:
      return "Char";
    case TypeKind::String:
      return "String";
    case TypeKind::Void:
      return "Void";
    case TypeKind::Any:
      return "Any";
    case TypeKind::Never:
      return "Never";
    case TypeKind::Null:
      return "Null";
    case TypeKind::Class:
      return "class";
    case TypeKind::Struct:
      return "struct";
    case TypeKind::Enum:
      return "enum";
    case TypeKind::Interface:
      return "interface";
    case TypeKind::Array:
      return "array";
    case TypeKind::Generic:
      return "generic";
    case TypeKind::TypeParameter:
      return "type parameter";
    case TypeKind::Error:
      return "<error>";
  }
  return "<error>";
}

const Symbol * TypeDefinition::find_member(std::string_view member_name) const
{
  for (const Symbol * m : members) {
    if (m->name == member_name) {
      return m;
    }
  }
  return nullptr;
}

int TypeDefinition::numeric_rank() const noexcept
{
  switch (kind) {
    case TypeKind::Int8:
    case TypeKind::UInt8:
    case TypeKind::Float16:
      return 1;
    case TypeKind::Int16:
    case TypeKind::UInt16:
    case TypeKind::Float32:
      return 2;
    case TypeKind::Int32:
    case TypeKind::UInt32:
    case TypeKind::Float64:
      return 3;
    case TypeKind::Int64:
    case TypeKind::UInt64:
    case TypeKind::Decimal:
      return 4;
    default:
      return 0;
  }
}

bool fits_integer(int64_t value, TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Int8:
      return value >= std::numeric_limits<int8_t>::min() &&
             value <= std::numeric_limits<int8_t>::max();
    case TypeKind::Int16:
      return value >= std::numeric_limits<int16_t>::min() &&
             value <= std::numeric_limits<int16_t>::max();
    case TypeKind::Int32:
      return value >= std::numeric_limits<int32_t>::min() &&
             value <= std::numeric_limits<int32_t>::max();
    case TypeKind::Int64:
      return true;
    case TypeKind::UInt8:
      return value >= 0 && value <= std::numeric_limits<uint8_t>::max();
    case TypeKind::UInt16:
      return value >= 0 && value <= std::numeric_limits<uint16_t>::max();
    case TypeKind::UInt32:
      return value >= 0 && value <= std::numeric_limits<uint32_t>::max();
    case TypeKind::UInt64:
      return value >= 0;
    default:
      return false;
  }
}

}  // namespace ouro
