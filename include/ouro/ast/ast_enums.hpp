// ouro/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators, literal kinds and declaration modifiers.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace ouro
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "ouro/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "ouro/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "ouro/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "ouro/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "ouro/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "ouro/ast/ast_nodes.def"
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_TYPE(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "ouro/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Literals
// ============================================================================

enum class LiteralKind : uint8_t {
  Int,
  Float,
  String,
  Char,
  Bool,
  Null,
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  Pow,  ///< **
  // Comparison
  Eq,   ///< ==
  Ne,   ///< !=
  Lt,   ///< <
  Le,   ///< <=
  Gt,   ///< >
  Ge,   ///< >=
  Cmp,  ///< <=>
  // Logical
  And,  ///< &&
  Or,   ///< ||
  // Bitwise
  BitAnd,  ///< &
  BitXor,  ///< ^
  BitOr,   ///< |
  Shl,     ///< <<
  Shr,     ///< >>
  UShr,    ///< >>>
  // Null handling
  Coalesce,  ///< ??
};

enum class UnaryOp : uint8_t {
  Not,     ///< !
  Neg,     ///< -
  Plus,    ///< +
  BitNot,  ///< ~
};

/// Operator of an assignment; compound forms carry the underlying binary op.
enum class AssignOp : uint8_t {
  Assign,
  Add,
  Sub,
  Mul,
  Div,
  Mod,
  Pow,
  BitAnd,
  BitOr,
  BitXor,
  Shl,
  Shr,
  UShr,
  Coalesce,
};

/// Binary operator applied by a compound assignment (`Assign` has none).
[[nodiscard]] constexpr BinaryOp compound_binary_op(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Sub:
      return BinaryOp::Sub;
    case AssignOp::Mul:
      return BinaryOp::Mul;
    case AssignOp::Div:
      return BinaryOp::Div;
    case AssignOp::Mod:
      return BinaryOp::Mod;
    case AssignOp::Pow:
      return BinaryOp::Pow;
    case AssignOp::BitAnd:
      return BinaryOp::BitAnd;
    case AssignOp::BitOr:
      return BinaryOp::BitOr;
    case AssignOp::BitXor:
      return BinaryOp::BitXor;
    case AssignOp::Shl:
      return BinaryOp::Shl;
    case AssignOp::Shr:
      return BinaryOp::Shr;
    case AssignOp::UShr:
      return BinaryOp::UShr;
    case AssignOp::Coalesce:
      return BinaryOp::Coalesce;
    case AssignOp::Assign:
    case AssignOp::Add:
      break;
  }
  return BinaryOp::Add;
}

[[nodiscard]] constexpr bool is_arithmetic(BinaryOp op) noexcept
{
  return op >= BinaryOp::Add && op <= BinaryOp::Pow;
}

[[nodiscard]] constexpr bool is_comparison(BinaryOp op) noexcept
{
  return op >= BinaryOp::Lt && op <= BinaryOp::Ge;
}

[[nodiscard]] constexpr bool is_bitwise(BinaryOp op) noexcept
{
  return op >= BinaryOp::BitAnd && op <= BinaryOp::UShr;
}

// ============================================================================
// Declaration modifiers
// ============================================================================

enum class Modifier : uint16_t {
  None = 0,
  Public = 1U << 0,
  Private = 1U << 1,
  Protected = 1U << 2,
  Internal = 1U << 3,
  Static = 1U << 4,
  Final = 1U << 5,
  Abstract = 1U << 6,
  Sealed = 1U << 7,
  Override = 1U << 8,
};

/// Bit set of Modifier values.
struct Modifiers
{
  uint16_t bits = 0;

  [[nodiscard]] constexpr bool has(Modifier m) const noexcept
  {
    return (bits & static_cast<uint16_t>(m)) != 0;
  }
  constexpr void add(Modifier m) noexcept { bits |= static_cast<uint16_t>(m); }
  [[nodiscard]] constexpr bool empty() const noexcept { return bits == 0; }
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Pow:
      return "**";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::Cmp:
      return "<=>";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
    case BinaryOp::UShr:
      return ">>>";
    case BinaryOp::Coalesce:
      return "??";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::BitNot:
      return "~";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::Add:
      return "+=";
    case AssignOp::Sub:
      return "-=";
    case AssignOp::Mul:
      return "*=";
    case AssignOp::Div:
      return "/=";
    case AssignOp::Mod:
      return "%=";
    case AssignOp::Pow:
      return "**=";
    case AssignOp::BitAnd:
      return "&=";
    case AssignOp::BitOr:
      return "|=";
    case AssignOp::BitXor:
      return "^=";
    case AssignOp::Shl:
      return "<<=";
    case AssignOp::Shr:
      return ">>=";
    case AssignOp::UShr:
      return ">>>=";
    case AssignOp::Coalesce:
      return "?\?=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(LiteralKind kind) noexcept
{
  switch (kind) {
    case LiteralKind::Int:
      return "int";
    case LiteralKind::Float:
      return "float";
    case LiteralKind::String:
      return "string";
    case LiteralKind::Char:
      return "char";
    case LiteralKind::Bool:
      return "bool";
    case LiteralKind::Null:
      return "null";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Modifier m) noexcept
{
  switch (m) {
    case Modifier::None:
      return "";
    case Modifier::Public:
      return "public";
    case Modifier::Private:
      return "private";
    case Modifier::Protected:
      return "protected";
    case Modifier::Internal:
      return "internal";
    case Modifier::Static:
      return "static";
    case Modifier::Final:
      return "final";
    case Modifier::Abstract:
      return "abstract";
    case Modifier::Sealed:
      return "sealed";
    case Modifier::Override:
      return "override";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::Literal;
inline constexpr NodeKind k_last_expr_kind = NodeKind::MissingExpr;

inline constexpr NodeKind k_first_type_kind = NodeKind::NamedType;
inline constexpr NodeKind k_last_type_kind = NodeKind::GenericType;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::ExpressionStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::VarDeclStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::VarDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::InterfaceDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace ouro
