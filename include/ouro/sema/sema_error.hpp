// ouro/sema/sema_error.hpp - Errors produced by semantic analysis and type checking
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ouro/basic/diagnostic.hpp"
#include "ouro/basic/source_manager.hpp"

namespace ouro
{

enum class SymbolErrorKind : uint8_t {
  DuplicateDefinition,
  UndefinedType,
  UndefinedSymbol,
  TypeMismatch,
  MissingInterfaceMethod,
  IncompatibleTypes,
  InvalidOperation,
  InvalidOverride,
  CircularInheritance,
  InaccessibleMember,
  AbstractMethodCall,
  SuperclassIsInterface,
  NotAnInterface,
  ExtendsFinal,
  SealedNotPermitted,
  AbstractMemberInConcreteType,
  MissingAbstractImplementation,
  InvalidThis,
  InvalidSuper,
  InvalidJump,
  AssignToConstant,
  ArgumentCountMismatch,
  NotCallable,
  UnknownMember,
  MissingReturnValue,
};

[[nodiscard]] std::string_view to_string(SymbolErrorKind kind) noexcept;

/**
 * One semantic problem.
 *
 * `expected`/`got` are filled for TypeMismatch, `previous` for
 * DuplicateDefinition.
 */
struct SymbolError
{
  SymbolErrorKind kind = SymbolErrorKind::UndefinedSymbol;
  std::string message;
  uint32_t line = 1;
  uint32_t column = 1;
  SourceRange range;

  std::string expected;
  std::string got;

  std::optional<LineColumn> previous;
  SourceRange previous_range;

  /// Diagnostic with code `S00nn`; a duplicate also labels the first definition.
  [[nodiscard]] Diagnostic to_diagnostic() const;
};

/// Stable sort by line, then column.
void sort_by_position(std::vector<SymbolError> & errors);

}  // namespace ouro
