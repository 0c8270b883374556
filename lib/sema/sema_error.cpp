// ouro/sema/sema_error.cpp - SymbolError formatting
#include "ouro/sema/sema_error.hpp"

#include <algorithm>

namespace ouro
{

std::string_view to_string(SymbolErrorKind kind) noexcept
{
  switch (kind) {
    case SymbolErrorKind::DuplicateDefinition:
      return "duplicate definition";
    case SymbolErrorKind::UndefinedType:
      return "undefined type";
    case SymbolErrorKind::UndefinedSymbol:
      return "undefined symbol";
    case SymbolErrorKind::TypeMismatch:
      return "type mismatch";
    case SymbolErrorKind::MissingInterfaceMethod:
      return "missing interface method";
    case SymbolErrorKind::IncompatibleTypes:
      return "incompatible types";
    case SymbolErrorKind::InvalidOperation:
      return "invalid operation";
    case SymbolErrorKind::InvalidOverride:
      return "invalid override";
    case SymbolErrorKind::CircularInheritance:
      return "circular inheritance";
    case SymbolErrorKind::InaccessibleMember:
      return "inaccessible member";
    case SymbolErrorKind::AbstractMethodCall:
      return "abstract method call";
    case SymbolErrorKind::SuperclassIsInterface:
      return "superclass is an interface";
    case SymbolErrorKind::NotAnInterface:
      return "not an interface";
    case SymbolErrorKind::ExtendsFinal:
      return "extends final type";
    case SymbolErrorKind::SealedNotPermitted:
      return "sealed type not permitted";
    case SymbolErrorKind::AbstractMemberInConcreteType:
      return "abstract member in concrete type";
    case SymbolErrorKind::MissingAbstractImplementation:
      return "missing abstract implementation";
    case SymbolErrorKind::InvalidThis:
      return "invalid 'this'";
    case SymbolErrorKind::InvalidSuper:
      return "invalid 'super'";
    case SymbolErrorKind::InvalidJump:
      return "invalid jump";
    case SymbolErrorKind::AssignToConstant:
      return "assignment to constant";
    case SymbolErrorKind::ArgumentCountMismatch:
      return "argument count mismatch";
    case SymbolErrorKind::NotCallable:
      return "not callable";
    case SymbolErrorKind::UnknownMember:
      return "unknown member";
    case SymbolErrorKind::MissingReturnValue:
      return "missing return value";
  }
  return "semantic error";
}

Diagnostic SymbolError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;

  std::string number = std::to_string(static_cast<int>(kind) + 1);
  d.code = "S" + std::string(4 - std::min<size_t>(4, number.size()), '0') + number;
  d.message = message;

  std::string label(to_string(kind));
  if (kind == SymbolErrorKind::TypeMismatch && !expected.empty()) {
    label = "expected '" + expected + "', found '" + got + "'";
  }
  d.labels.push_back(Label{range, std::move(label), LabelStyle::Primary});

  if (previous && previous_range.is_valid()) {
    d.labels.push_back(
      Label{previous_range, "previous definition is here", LabelStyle::Secondary});
  }
  return d;
}

void sort_by_position(std::vector<SymbolError> & errors)
{
  std::stable_sort(errors.begin(), errors.end(), [](const SymbolError & a, const SymbolError & b) {
    return a.line != b.line ? a.line < b.line : a.column < b.column;
  });
}

}  // namespace ouro
