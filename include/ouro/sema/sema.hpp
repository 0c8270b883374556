// ouro/sema/sema.hpp - Semantic pipeline entry point
#pragma once

#include <memory>
#include <vector>

#include "ouro/ast/ast.hpp"
#include "ouro/sema/resolution/symbol_table.hpp"
#include "ouro/sema/sema_error.hpp"
#include "ouro/sema/types/type_resolver.hpp"

namespace ouro
{

// ============================================================================
// Semantic Model
// ============================================================================

/**
 * Owner of everything semantic analysis attaches to an AST.
 *
 * Symbol and TypeDefinition pointers stored in the AST point into this
 * model, so they stay valid exactly as long as the model does. Both
 * members live behind unique_ptr so a model can be moved without
 * invalidating them.
 */
class SemanticModel
{
public:
  SemanticModel() { reset(); }

  /// Drop every symbol and type and start from the builtins.
  void reset()
  {
    types_.reset();
    symbols_ = std::make_unique<SymbolTable>();
    types_ = std::make_unique<TypeResolver>(*symbols_);
  }

  [[nodiscard]] SymbolTable & symbols() noexcept { return *symbols_; }
  [[nodiscard]] const SymbolTable & symbols() const noexcept { return *symbols_; }
  [[nodiscard]] TypeResolver & types() noexcept { return *types_; }
  [[nodiscard]] const TypeResolver & types() const noexcept { return *types_; }

private:
  std::unique_ptr<SymbolTable> symbols_;
  std::unique_ptr<TypeResolver> types_;
};

// ============================================================================
// Entry Point
// ============================================================================

/**
 * Run SemanticAnalyzer and then TypeChecker over `program`.
 *
 * The model is reset first, so checking the same program twice gives the
 * same result. Analyzer errors come before checker errors; each group is
 * in source order.
 */
std::vector<SymbolError> check(Program & program, SemanticModel & model);

}  // namespace ouro
