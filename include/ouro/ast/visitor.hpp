// ouro/ast/visitor.hpp - CRTP visitors for AST traversal
#pragma once

#include <type_traits>

#include "ouro/ast/ast.hpp"
#include "ouro/ast/ast_enums.hpp"
#include "ouro/basic/casting.hpp"

namespace ouro
{

namespace detail
{

/// Propagates const from NodePtrT to a derived node pointer type
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP visitor dispatching on NodeKind without virtual calls.
 *
 * Derived classes implement `visit_<snake_name>` for the nodes they care
 * about; unhandled nodes fall back to visit_expr / visit_stmt / ... and
 * finally visit_node.
 *
 * @code
 *   class LiteralCounter : public ConstAstVisitor<LiteralCounter, int> {
 *   public:
 *     int visit_literal_expr(const LiteralExpr *) { return 1; }
 *     int visit_node(const AstNode *) { return 0; }
 *   };
 * @endcode
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define OURO_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                      \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR OURO_VISIT_CASE
#define AST_NODE_TYPE OURO_VISIT_CASE
#define AST_NODE_STMT OURO_VISIT_CASE
#define AST_NODE_DECL OURO_VISIT_CASE
#define AST_NODE_SUPPORT OURO_VISIT_CASE
#define AST_NODE_TOP OURO_VISIT_CASE
#include "ouro/ast/ast_nodes.def"
#undef OURO_VISIT_CASE
    }

    return ReturnType();
  }

  // Default per-node methods forward to their category.
#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_type_node(node);                             \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "ouro/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * Visitor that walks every child node.
 *
 * Override a visit method to customize a node; call the base version to
 * keep descending, or return false to stop the whole traversal.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  bool visit_node(NodePtrT /*node*/) { return true; }

  // Expressions

  bool visit_grouping_expr(NodePtr<GroupingExpr> node) { return get_derived().visit(node->inner); }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }

  bool visit_conditional_expr(NodePtr<ConditionalExpr> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->thenExpr) &&
           get_derived().visit(node->elseExpr);
  }

  bool visit_assign_expr(NodePtr<AssignExpr> node) { return get_derived().visit(node->value); }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    if (!get_derived().visit(node->callee)) return false;
    for (auto * arg : node->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_get_expr(NodePtr<GetExpr> node) { return get_derived().visit(node->object); }

  bool visit_set_expr(NodePtr<SetExpr> node)
  {
    return get_derived().visit(node->object) && get_derived().visit(node->value);
  }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    return get_derived().visit(node->base) && get_derived().visit(node->index);
  }

  bool visit_index_set_expr(NodePtr<IndexSetExpr> node)
  {
    return get_derived().visit(node->base) && get_derived().visit(node->index) &&
           get_derived().visit(node->value);
  }

  bool visit_array_literal_expr(NodePtr<ArrayLiteralExpr> node)
  {
    for (auto * elem : node->elements) {
      if (!get_derived().visit(elem)) return false;
    }
    return true;
  }

  bool visit_literal_expr(NodePtr<LiteralExpr> /*node*/) { return true; }
  bool visit_variable_expr(NodePtr<VariableExpr> /*node*/) { return true; }
  bool visit_this_expr(NodePtr<ThisExpr> /*node*/) { return true; }
  bool visit_super_expr(NodePtr<SuperExpr> /*node*/) { return true; }
  bool visit_missing_expr(NodePtr<MissingExpr> /*node*/) { return true; }

  // Types

  bool visit_named_type(NodePtr<NamedType> /*node*/) { return true; }

  bool visit_array_type(NodePtr<ArrayType> node) { return get_derived().visit(node->elementType); }

  bool visit_generic_type(NodePtr<GenericType> node)
  {
    for (auto * arg : node->typeArgs) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  // Statements

  bool visit_expression_stmt(NodePtr<ExpressionStmt> node)
  {
    return get_derived().visit(node->expr);
  }

  bool visit_block_stmt(NodePtr<BlockStmt> node)
  {
    for (auto * stmt : node->statements) {
      if (!get_derived().visit(stmt)) return false;
    }
    return true;
  }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    if (!get_derived().visit(node->condition)) return false;
    if (!get_derived().visit(node->thenBranch)) return false;
    return !node->elseBranch || get_derived().visit(node->elseBranch);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->body);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    if (node->init && !get_derived().visit(node->init)) return false;
    if (node->condition && !get_derived().visit(node->condition)) return false;
    if (node->increment && !get_derived().visit(node->increment)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node)
  {
    return !node->value || get_derived().visit(node->value);
  }

  bool visit_break_stmt(NodePtr<BreakStmt> /*node*/) { return true; }
  bool visit_continue_stmt(NodePtr<ContinueStmt> /*node*/) { return true; }

  bool visit_var_decl_stmt(NodePtr<VarDeclStmt> node) { return get_derived().visit(node->decl); }

  // Declarations

  bool visit_var_decl(NodePtr<VarDecl> node)
  {
    if (node->type && !get_derived().visit(node->type)) return false;
    return !node->initializer || get_derived().visit(node->initializer);
  }

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    for (auto * param : node->params) {
      if (!get_derived().visit(param)) return false;
    }
    if (node->returnType && !get_derived().visit(node->returnType)) return false;
    return !node->body || get_derived().visit(node->body);
  }

  bool visit_class_decl(NodePtr<ClassDecl> node) { return traverse_members(node); }
  bool visit_struct_decl(NodePtr<StructDecl> node) { return traverse_members(node); }
  bool visit_interface_decl(NodePtr<InterfaceDecl> node) { return traverse_members(node); }

  bool visit_enum_decl(NodePtr<EnumDecl> node)
  {
    for (auto * c : node->cases) {
      if (!get_derived().visit(c)) return false;
    }
    return traverse_members(node);
  }

  bool visit_param_decl(NodePtr<ParamDecl> node)
  {
    if (node->type && !get_derived().visit(node->type)) return false;
    return !node->defaultValue || get_derived().visit(node->defaultValue);
  }

  bool visit_enum_case_decl(NodePtr<EnumCaseDecl> node)
  {
    return !node->rawValue || get_derived().visit(node->rawValue);
  }

  bool visit_program(NodePtr<Program> node)
  {
    for (auto * d : node->decls) {
      if (!get_derived().visit(d)) return false;
    }
    for (auto * s : node->statements) {
      if (!get_derived().visit(s)) return false;
    }
    return true;
  }

protected:
  bool traverse_members(NodePtr<TypeDecl> node)
  {
    for (auto * prop : node->properties) {
      if (!get_derived().visit(prop)) return false;
    }
    for (auto * method : node->methods) {
      if (!get_derived().visit(method)) return false;
    }
    return true;
  }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace ouro
