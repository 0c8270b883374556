// ouro/sema/resolution/symbol_table.cpp - Symbol table implementation
#include "ouro/sema/resolution/symbol_table.hpp"

#include <string>

namespace ouro
{

std::string_view to_string(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Variable:
      return "variable";
    case SymbolKind::Constant:
      return "constant";
    case SymbolKind::Function:
      return "function";
    case SymbolKind::Type:
      return "type";
  }
  return "symbol";
}

SymbolTable::SymbolTable()
{
  scopes_.push_back(std::make_unique<Scope>(k_global_scope_id, nullptr));
  current_ = scopes_.front().get();
}

Scope * SymbolTable::create_scope(Scope * parent)
{
  const auto id = static_cast<uint32_t>(scopes_.size());
  scopes_.push_back(std::make_unique<Scope>(id, parent ? parent : global_scope()));
  return scopes_.back().get();
}

Scope * SymbolTable::enter_scope()
{
  current_ = create_scope(current_);
  return current_;
}

bool SymbolTable::exit_scope() noexcept
{
  if (current_->parent() == nullptr) {
    return false;
  }
  current_ = current_->parent();
  return true;
}

Result<Symbol *, SymbolError> SymbolTable::define(Symbol symbol)
{
  return define_in(current_, symbol);
}

Result<Symbol *, SymbolError> SymbolTable::define_in(Scope * scope, Symbol symbol)
{
  auto [stored, inserted] = scope->define(symbol);
  if (inserted) {
    return stored;
  }

  SymbolError err;
  err.kind = SymbolErrorKind::DuplicateDefinition;
  err.message = "'" + std::string(symbol.name) + "' is already defined in this scope";
  err.line = symbol.declared_at.line;
  err.column = symbol.declared_at.column;
  err.range = symbol.definition_range;
  err.previous = stored->declared_at;
  err.previous_range = stored->definition_range;
  return err;
}

const Symbol * SymbolTable::resolve(std::string_view name) const
{
  return resolve_in(current_, name);
}

const Symbol * SymbolTable::resolve_in(const Scope * scope, std::string_view name) const
{
  return scope ? scope->lookup(name) : nullptr;
}

const Symbol * SymbolTable::resolve_type(std::string_view name) const
{
  // A value of the same name in an inner scope does not hide the type.
  for (const Scope * s = current_; s != nullptr; s = s->parent()) {
    if (const Symbol * sym = s->lookup_local(name); sym && sym->is_type()) {
      return sym;
    }
  }
  return nullptr;
}

void SymbolTable::attach_type(const Symbol * symbol, const TypeDefinition * type)
{
  if (symbol == nullptr) return;
  Scope * owner = scope(symbol->scope_id);
  if (owner == nullptr) return;
  if (Symbol * stored = owner->lookup_local_mut(symbol->name); stored == symbol) {
    stored->type = type;
  }
}

}  // namespace ouro
