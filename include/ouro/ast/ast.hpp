// ouro/ast/ast.hpp - AST node class definitions for OuroLang
//
// LLVM/Clang style nodes with classof() for RTTI support. Every node is
// allocated in an AstContext and must stay trivially destructible: names
// are interned string_views, child lists are gsl::spans into the arena.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "ouro/ast/ast_enums.hpp"
#include "ouro/basic/casting.hpp"
#include "ouro/basic/source_manager.hpp"

namespace ouro
{

// Semantic annotations (owned by the SemanticModel, not by the AST)
struct TypeDefinition;
struct Symbol;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node has a NodeKind, the byte range it was parsed from, and the
 * 1-based line/column of its first token.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;
  LineColumn loc_{1, 1};

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }
  [[nodiscard]] uint32_t line() const noexcept { return loc_.line; }
  [[nodiscard]] uint32_t column() const noexcept { return loc_.column; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

class Expr : public AstNode
{
public:
  /// Type computed by the type checker (nullptr before checking)
  const TypeDefinition * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class TypeNode : public AstNode
{
public:
  /// Definition this annotation denotes (nullptr before or on failed resolution)
  const TypeDefinition * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  std::string_view name;
  Modifiers modifiers;

  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class BlockStmt;
class ParamDecl;
class EnumCaseDecl;
class VarDecl;
class FunctionDecl;

// ============================================================================
// Expression Nodes
// ============================================================================

/// Literal of any kind; only the field matching `literalKind` is meaningful.
class LiteralExpr : public NodeBase<LiteralExpr, Expr, NodeKind::Literal>
{
public:
  LiteralKind literalKind = LiteralKind::Null;
  int64_t intValue = 0;
  double floatValue = 0.0;
  std::string_view stringValue;
  char32_t charValue = 0;
  bool boolValue = false;

  explicit LiteralExpr(SourceRange r = {}) : NodeBase(r) {}

  [[nodiscard]] bool is_numeric() const noexcept
  {
    return literalKind == LiteralKind::Int || literalKind == LiteralKind::Float;
  }
};

class VariableExpr : public NodeBase<VariableExpr, Expr, NodeKind::Variable>
{
public:
  std::string_view name;

  /// Symbol the name resolved to (set during semantic analysis)
  const Symbol * resolvedSymbol = nullptr;

  explicit VariableExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class GroupingExpr : public NodeBase<GroupingExpr, Expr, NodeKind::Grouping>
{
public:
  Expr * inner;

  explicit GroupingExpr(Expr * e, SourceRange r = {}) : NodeBase(r), inner(e) {}
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

/// cond ? thenExpr : elseExpr
class ConditionalExpr : public NodeBase<ConditionalExpr, Expr, NodeKind::Conditional>
{
public:
  Expr * condition;
  Expr * thenExpr;
  Expr * elseExpr;

  ConditionalExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenExpr(t), elseExpr(e)
  {
  }
};

/// name = value. Compound forms on variables are desugared by the parser.
class AssignExpr : public NodeBase<AssignExpr, Expr, NodeKind::Assign>
{
public:
  std::string_view name;
  Expr * value;

  const Symbol * resolvedSymbol = nullptr;

  AssignExpr(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  CallExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

/// object.name
class GetExpr : public NodeBase<GetExpr, Expr, NodeKind::Get>
{
public:
  Expr * object;
  std::string_view name;

  GetExpr(Expr * o, std::string_view n, SourceRange r = {}) : NodeBase(r), object(o), name(n) {}
};

/// object.name op value
class SetExpr : public NodeBase<SetExpr, Expr, NodeKind::Set>
{
public:
  Expr * object;
  std::string_view name;
  AssignOp op;
  Expr * value;

  SetExpr(Expr * o, std::string_view n, AssignOp a, Expr * v, SourceRange r = {})
  : NodeBase(r), object(o), name(n), op(a), value(v)
  {
  }
};

/// base[index]
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::Index>
{
public:
  Expr * base;
  Expr * index;

  IndexExpr(Expr * b, Expr * i, SourceRange r = {}) : NodeBase(r), base(b), index(i) {}
};

/// base[index] op value
class IndexSetExpr : public NodeBase<IndexSetExpr, Expr, NodeKind::IndexSet>
{
public:
  Expr * base;
  Expr * index;
  AssignOp op;
  Expr * value;

  IndexSetExpr(Expr * b, Expr * i, AssignOp a, Expr * v, SourceRange r = {})
  : NodeBase(r), base(b), index(i), op(a), value(v)
  {
  }
};

class ThisExpr : public NodeBase<ThisExpr, Expr, NodeKind::This>
{
public:
  explicit ThisExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// super.method
class SuperExpr : public NodeBase<SuperExpr, Expr, NodeKind::Super>
{
public:
  std::string_view method;

  explicit SuperExpr(std::string_view m, SourceRange r = {}) : NodeBase(r), method(m) {}
};

class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

/// Parser recovery placeholder; never present in a successfully parsed program.
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Type Nodes
// ============================================================================

/// Int, String, MyClass
class NamedType : public NodeBase<NamedType, TypeNode, NodeKind::NamedType>
{
public:
  std::string_view name;

  explicit NamedType(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// T[]
class ArrayType : public NodeBase<ArrayType, TypeNode, NodeKind::ArrayType>
{
public:
  TypeNode * elementType;

  explicit ArrayType(TypeNode * elem, SourceRange r = {}) : NodeBase(r), elementType(elem) {}
};

/// Name<A, B>
class GenericType : public NodeBase<GenericType, TypeNode, NodeKind::GenericType>
{
public:
  std::string_view name;
  gsl::span<TypeNode *> typeArgs;

  GenericType(std::string_view n, gsl::span<TypeNode *> a, SourceRange r = {})
  : NodeBase(r), name(n), typeArgs(a)
  {
  }
};

// ============================================================================
// Statement Nodes
// ============================================================================

class ExpressionStmt : public NodeBase<ExpressionStmt, Stmt, NodeKind::ExpressionStmt>
{
public:
  Expr * expr;

  explicit ExpressionStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> statements;

  explicit BlockStmt(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), statements(s) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  Stmt * thenBranch;
  Stmt * elseBranch = nullptr;

  IfStmt(Expr * c, Stmt * t, Stmt * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenBranch(t), elseBranch(e)
  {
  }
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * condition;
  Stmt * body;

  WhileStmt(Expr * c, Stmt * b, SourceRange r = {}) : NodeBase(r), condition(c), body(b) {}
};

/// for (init; condition; increment) body; each clause may be absent.
class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  Stmt * init = nullptr;  ///< VarDeclStmt or ExpressionStmt
  Expr * condition = nullptr;
  Expr * increment = nullptr;
  Stmt * body = nullptr;

  explicit ForStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value = nullptr;

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::BreakStmt>
{
public:
  explicit BreakStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::ContinueStmt>
{
public:
  explicit ContinueStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// Local variable or constant declaration.
class VarDeclStmt : public NodeBase<VarDeclStmt, Stmt, NodeKind::VarDeclStmt>
{
public:
  VarDecl * decl;

  explicit VarDeclStmt(VarDecl * d, SourceRange r = {}) : NodeBase(r), decl(d) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class ParamDecl : public NodeBase<ParamDecl, AstNode, NodeKind::ParamDecl>
{
public:
  std::string_view name;
  TypeNode * type;
  Expr * defaultValue = nullptr;

  const Symbol * symbol = nullptr;

  ParamDecl(std::string_view n, TypeNode * t, Expr * def, SourceRange r = {})
  : NodeBase(r), name(n), type(t), defaultValue(def)
  {
  }
};

class EnumCaseDecl : public NodeBase<EnumCaseDecl, AstNode, NodeKind::EnumCaseDecl>
{
public:
  std::string_view name;
  Expr * rawValue = nullptr;

  EnumCaseDecl(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), rawValue(v)
  {
  }
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// var/const declaration (global, local, or a type's property).
class VarDecl : public NodeBase<VarDecl, Decl, NodeKind::VarDecl>
{
public:
  TypeNode * type = nullptr;
  Expr * initializer = nullptr;
  bool isConst = false;

  /// Declared or inferred type (set during semantic analysis / type checking)
  const TypeDefinition * resolvedType = nullptr;
  const Symbol * symbol = nullptr;

  VarDecl(std::string_view n, TypeNode * t, Expr * init, bool c, SourceRange r = {})
  : NodeBase(r), type(t), initializer(init), isConst(c)
  {
    name = n;
  }
};

class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  gsl::span<std::string_view> typeParams;
  gsl::span<ParamDecl *> params;
  TypeNode * returnType = nullptr;  ///< nullptr means Void
  BlockStmt * body = nullptr;       ///< nullptr for signatures
  bool isInitializer = false;       ///< `init(...)` inside a type body

  const TypeDefinition * resolvedReturnType = nullptr;
  const Symbol * symbol = nullptr;

  explicit FunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r) { name = n; }

  [[nodiscard]] bool has_body() const noexcept { return body != nullptr; }

  /// Number of leading parameters without a default value.
  [[nodiscard]] size_t required_param_count() const noexcept
  {
    size_t n = 0;
    for (const auto * p : params) {
      if (p->defaultValue != nullptr) break;
      ++n;
    }
    return n;
  }
};

/// Shared layout of class, struct and interface bodies.
class TypeDecl : public Decl
{
public:
  gsl::span<std::string_view> typeParams;
  gsl::span<VarDecl *> properties;
  gsl::span<FunctionDecl *> methods;

  /// Definition registered for this declaration (set during semantic analysis)
  const TypeDefinition * definition = nullptr;

  static bool classof(const AstNode * node)
  {
    return node->kind >= NodeKind::ClassDecl && node->kind <= NodeKind::InterfaceDecl;
  }

protected:
  TypeDecl(NodeKind k, std::string_view n, SourceRange r) : Decl(k, r) { name = n; }
};

/**
 * class Name<T>: Super, Iface... permits A, B { members }
 *
 * The first inherited name is recorded as `superclass`; whether it really
 * denotes a class is decided during semantic analysis.
 */
class ClassDecl : public TypeDecl
{
public:
  static constexpr NodeKind kind = NodeKind::ClassDecl;

  NamedType * superclass = nullptr;
  gsl::span<NamedType *> interfaces;
  gsl::span<NamedType *> permits;

  explicit ClassDecl(std::string_view n, SourceRange r = {}) : TypeDecl(NodeKind::ClassDecl, n, r)
  {
  }

  static bool classof(const AstNode * node) { return node->get_kind() == NodeKind::ClassDecl; }
};

/// struct Name: Iface... { members }; every inherited name is an interface.
class StructDecl : public TypeDecl
{
public:
  static constexpr NodeKind kind = NodeKind::StructDecl;

  gsl::span<NamedType *> interfaces;

  explicit StructDecl(std::string_view n, SourceRange r = {})
  : TypeDecl(NodeKind::StructDecl, n, r)
  {
  }

  static bool classof(const AstNode * node) { return node->get_kind() == NodeKind::StructDecl; }
};

/// enum Name[: RawType] { Case [= value]; ... methods }
class EnumDecl : public TypeDecl
{
public:
  static constexpr NodeKind kind = NodeKind::EnumDecl;

  TypeNode * rawType = nullptr;
  gsl::span<EnumCaseDecl *> cases;

  explicit EnumDecl(std::string_view n, SourceRange r = {}) : TypeDecl(NodeKind::EnumDecl, n, r) {}

  static bool classof(const AstNode * node) { return node->get_kind() == NodeKind::EnumDecl; }
};

/// interface Name: Parent... { signatures and default methods }
class InterfaceDecl : public TypeDecl
{
public:
  static constexpr NodeKind kind = NodeKind::InterfaceDecl;

  gsl::span<NamedType *> parents;

  explicit InterfaceDecl(std::string_view n, SourceRange r = {})
  : TypeDecl(NodeKind::InterfaceDecl, n, r)
  {
  }

  static bool classof(const AstNode * node) { return node->get_kind() == NodeKind::InterfaceDecl; }
};

// ============================================================================
// Program (Root Node)
// ============================================================================

/**
 * Root of one compilation unit.
 *
 * Declarations are hoisted: top-level statements see every global
 * declaration regardless of order.
 */
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Decl *> decls;
  gsl::span<Stmt *> statements;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace ouro
