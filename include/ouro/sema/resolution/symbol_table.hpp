// ouro/sema/resolution/symbol_table.hpp - Scope and symbol management
//
// Scopes form a tree rooted at the global scope (id 0). The SymbolTable
// owns every scope; symbols are stored inside their scope and keep stable
// addresses for the table's lifetime.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ouro/ast/ast.hpp"
#include "ouro/basic/result.hpp"
#include "ouro/sema/sema_error.hpp"

namespace ouro
{

struct TypeDefinition;

// ============================================================================
// Symbol Types
// ============================================================================

enum class SymbolKind : uint8_t {
  Variable,  ///< var, parameter, property
  Constant,  ///< const
  Function,  ///< free function or method
  Type,      ///< class, struct, enum, interface, type parameter
};

[[nodiscard]] std::string_view to_string(SymbolKind kind) noexcept;

/**
 * A named entity recorded in a scope.
 *
 * Created once per declaration; only `type` may be filled in later
 * (through SymbolTable::attach_type) once inference completes.
 */
struct Symbol
{
  std::string_view name;
  SymbolKind kind = SymbolKind::Variable;
  const TypeDefinition * type = nullptr;
  LineColumn declared_at{1, 1};
  SourceRange definition_range;
  uint32_t scope_id = 0;

  /// Declaring node (VarDecl, ParamDecl, FunctionDecl, TypeDecl, EnumCaseDecl)
  const AstNode * ast_node = nullptr;

  [[nodiscard]] bool is_const() const noexcept { return kind == SymbolKind::Constant; }
  [[nodiscard]] bool is_function() const noexcept { return kind == SymbolKind::Function; }
  [[nodiscard]] bool is_type() const noexcept { return kind == SymbolKind::Type; }
  [[nodiscard]] bool is_value() const noexcept
  {
    return kind == SymbolKind::Variable || kind == SymbolKind::Constant;
  }
};

// ============================================================================
// Transparent Hash/Equal for string_view keys
// ============================================================================

struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// Scope
// ============================================================================

/**
 * A lexical scope.
 *
 * Keys must be interned string_views owned by the AstContext (or static
 * strings) so they outlive the scope.
 */
class Scope
{
public:
  Scope(uint32_t id, Scope * parent) : id_(id), parent_(parent) {}

  /**
   * Define a symbol in this scope.
   *
   * @return The stored symbol and true, or the existing symbol of the same
   *         name and false.
   */
  std::pair<Symbol *, bool> define(Symbol symbol)
  {
    symbol.scope_id = id_;
    auto [it, inserted] = symbols_.emplace(symbol.name, symbol);
    return {&it->second, inserted};
  }

  [[nodiscard]] const Symbol * lookup_local(std::string_view name) const
  {
    auto it = symbols_.find(name);
    return it != symbols_.end() ? &it->second : nullptr;
  }

  /// Look up through the parent chain.
  [[nodiscard]] const Symbol * lookup(std::string_view name) const
  {
    for (const Scope * s = this; s != nullptr; s = s->parent_) {
      if (const Symbol * sym = s->lookup_local(name)) {
        return sym;
      }
    }
    return nullptr;
  }

  [[nodiscard]] Scope * parent() const noexcept { return parent_; }
  [[nodiscard]] uint32_t id() const noexcept { return id_; }
  [[nodiscard]] const auto & symbols() const noexcept { return symbols_; }
  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }

private:
  friend class SymbolTable;

  [[nodiscard]] Symbol * lookup_local_mut(std::string_view name)
  {
    auto it = symbols_.find(name);
    return it != symbols_.end() ? &it->second : nullptr;
  }

  uint32_t id_;
  Scope * parent_;
  std::unordered_map<std::string_view, Symbol, StringViewHash, StringViewEqual> symbols_;
};

// ============================================================================
// SymbolTable
// ============================================================================

/**
 * Owner of every scope of one compilation unit, plus a cursor (the
 * current scope) used while walking the AST.
 */
class SymbolTable
{
public:
  static constexpr uint32_t k_global_scope_id = 0;

  SymbolTable();

  SymbolTable(const SymbolTable &) = delete;
  SymbolTable & operator=(const SymbolTable &) = delete;

  // ===========================================================================
  // Scope Management
  // ===========================================================================

  [[nodiscard]] Scope * global_scope() noexcept { return scopes_.front().get(); }
  [[nodiscard]] const Scope * global_scope() const noexcept { return scopes_.front().get(); }
  [[nodiscard]] Scope * current_scope() noexcept { return current_; }
  [[nodiscard]] const Scope * current_scope() const noexcept { return current_; }

  /// Create a scope without entering it.
  Scope * create_scope(Scope * parent);

  /// Create a child of the current scope and make it current.
  Scope * enter_scope();

  /// Return to the parent scope; false (and no change) at the global scope.
  bool exit_scope() noexcept;

  void set_current_scope(Scope * scope) noexcept { current_ = scope; }

  [[nodiscard]] Scope * scope(uint32_t id) noexcept
  {
    return id < scopes_.size() ? scopes_[id].get() : nullptr;
  }
  [[nodiscard]] size_t scope_count() const noexcept { return scopes_.size(); }

  // ===========================================================================
  // Definition and Lookup
  // ===========================================================================

  /// Define in the current scope; a name clash yields DuplicateDefinition.
  Result<Symbol *, SymbolError> define(Symbol symbol);

  /// Define in a specific scope.
  Result<Symbol *, SymbolError> define_in(Scope * scope, Symbol symbol);

  /// Resolve from the current scope outward.
  [[nodiscard]] const Symbol * resolve(std::string_view name) const;

  [[nodiscard]] const Symbol * resolve_in(const Scope * scope, std::string_view name) const;

  /// Resolve a symbol of kind Type from the current scope outward.
  [[nodiscard]] const Symbol * resolve_type(std::string_view name) const;

  /// Fill in the type of a symbol once it is known.
  void attach_type(const Symbol * symbol, const TypeDefinition * type);

private:
  std::vector<std::unique_ptr<Scope>> scopes_;
  Scope * current_;
};

}  // namespace ouro
