// ouro/sema/types/type_resolver.cpp - Type resolution and compatibility rules
#include "ouro/sema/types/type_resolver.hpp"

#include <string>
#include <unordered_set>

#include "ouro/basic/casting.hpp"

namespace ouro
{

TypeResolver::TypeResolver(SymbolTable & symbols) : symbols_(symbols)
{
  // Signed integers
  add_builtin("Int8", TypeKind::Int8, "i8");
  add_builtin("Int16", TypeKind::Int16, "i16");
  int_ = add_builtin("Int", TypeKind::Int32, "i32");
  add_builtin("Int32", TypeKind::Int32, "i32");
  int64_ = add_builtin("Int64", TypeKind::Int64, "i64");

  // Unsigned integers
  add_builtin("UInt", TypeKind::UInt32, "ui32");
  add_builtin("UInt8", TypeKind::UInt8, "ui8");
  add_builtin("UInt16", TypeKind::UInt16, "ui16");
  add_builtin("UInt32", TypeKind::UInt32, "ui32");
  add_builtin("UInt64", TypeKind::UInt64, "ui64");

  // Floating point
  add_builtin("Float", TypeKind::Float32, "f32");
  add_builtin("Float16", TypeKind::Float16, "f16");
  add_builtin("Float32", TypeKind::Float32, "f32");
  add_builtin("Float64", TypeKind::Float64, "f64");
  double_ = add_builtin("Double", TypeKind::Float64, "f64");
  add_builtin("Decimal", TypeKind::Decimal, "f128");

  bool_ = add_builtin("Bool", TypeKind::Bool, "i1");
  char_ = add_builtin("Char", TypeKind::Char, "i32");
  add_builtin("Character", TypeKind::Char, "i32");
  string_ = add_builtin("String", TypeKind::String, "!ouro.string");
  void_ = add_builtin("Void", TypeKind::Void, "none");
  any_ = add_builtin("Any", TypeKind::Any, "!ouro.any");
  never_ = add_builtin("Never", TypeKind::Never, "!ouro.never");

  // Not nameable from source
  null_ = make("Null", TypeKind::Null, "!ouro.null");
  error_ = make("<error>", TypeKind::Error, "");

  add_alias("byte", lookup_builtin("Int8"));
  add_alias("ubyte", lookup_builtin("UInt8"));
  add_alias("short", lookup_builtin("Int16"));
  add_alias("ushort", lookup_builtin("UInt16"));
  add_alias("int", int_);
  add_alias("long", int64_);
  add_alias("ulong", lookup_builtin("UInt64"));
  add_alias("float", lookup_builtin("Float"));
  add_alias("double", double_);
  add_alias("boolean", bool_);
  add_alias("char", char_);
  add_alias("string", string_);
  add_alias("void", void_);
}

TypeDefinition * TypeResolver::make(std::string name, TypeKind kind, std::string canonical)
{
  TypeDefinition & def = definitions_.emplace_back();
  def.name = std::move(name);
  def.kind = kind;
  def.canonical_name = std::move(canonical);
  return &def;
}

const TypeDefinition * TypeResolver::add_builtin(
  std::string_view name, TypeKind kind, std::string_view canonical)
{
  TypeDefinition * def = make(std::string(name), kind, std::string(canonical));
  def->is_primitive = true;
  builtins_.emplace(def->name, def);
  return def;
}

void TypeResolver::add_alias(std::string_view alias, const TypeDefinition * target)
{
  builtins_.emplace(alias, target);
}

const TypeDefinition * TypeResolver::lookup_builtin(std::string_view name) const
{
  auto it = builtins_.find(name);
  return it != builtins_.end() ? it->second : nullptr;
}

// ============================================================================
// Creation
// ============================================================================

TypeDefinition * TypeResolver::create_user_type(
  std::string_view name, TypeKind kind, const TypeDecl * decl)
{
  TypeDefinition * def = make(std::string(name), kind, std::string(name));
  def->decl = decl;
  def->is_interface = kind == TypeKind::Interface;
  if (decl != nullptr) {
    def->is_abstract = decl->modifiers.has(Modifier::Abstract) || def->is_interface;
    def->is_sealed = decl->modifiers.has(Modifier::Sealed);
    // Structs and enums are value types and cannot be extended.
    def->is_final = decl->modifiers.has(Modifier::Final) || kind == TypeKind::Struct ||
                    kind == TypeKind::Enum;
  }
  return def;
}

const TypeDefinition * TypeResolver::create_type_parameter(std::string_view name)
{
  return make(std::string(name), TypeKind::TypeParameter, std::string(name));
}

const TypeDefinition * TypeResolver::array_of(const TypeDefinition * element)
{
  if (auto it = arrays_.find(element); it != arrays_.end()) {
    return it->second;
  }
  TypeDefinition * def =
    make(element->name + "[]", TypeKind::Array, "!ouro.array<" + element->canonical_name + ">");
  def->element = element;
  arrays_.emplace(element, def);
  return def;
}

const TypeDefinition * TypeResolver::generic_of(
  const TypeDefinition * origin, const std::vector<const TypeDefinition *> & args)
{
  std::vector<const TypeDefinition *> key;
  key.reserve(args.size() + 1);
  key.push_back(origin);
  key.insert(key.end(), args.begin(), args.end());
  if (auto it = generics_.find(key); it != generics_.end()) {
    return it->second;
  }

  std::string name = origin->name + "<";
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) name += ", ";
    name += args[i]->name;
  }
  name += ">";

  TypeDefinition * def = make(name, TypeKind::Generic, name);
  def->origin = origin;
  def->type_arguments = args;
  def->is_interface = origin->is_interface;
  generics_.emplace(std::move(key), def);
  return def;
}

// ============================================================================
// Resolution
// ============================================================================

const TypeDefinition * TypeResolver::resolve_name(std::string_view name) const
{
  if (const Symbol * sym = symbols_.resolve_type(name); sym && sym->type) {
    return sym->type;
  }
  return lookup_builtin(name);
}

const TypeDefinition * TypeResolver::resolve(TypeNode * node, const TypeNode ** unresolved)
{
  if (node == nullptr) {
    return nullptr;
  }

  const TypeDefinition * result = nullptr;
  switch (node->get_kind()) {
    case NodeKind::NamedType: {
      auto * named = cast<NamedType>(node);
      result = resolve_name(named->name);
      if (!result && unresolved) *unresolved = named;
      break;
    }
    case NodeKind::ArrayType: {
      auto * arr = cast<ArrayType>(node);
      if (const TypeDefinition * elem = resolve(arr->elementType, unresolved)) {
        result = array_of(elem);
      }
      break;
    }
    case NodeKind::GenericType: {
      auto * gen = cast<GenericType>(node);
      const TypeDefinition * origin = resolve_name(gen->name);
      if (!origin) {
        if (unresolved) *unresolved = gen;
        break;
      }
      std::vector<const TypeDefinition *> args;
      bool ok = true;
      for (auto * arg : gen->typeArgs) {
        const TypeDefinition * a = resolve(arg, unresolved);
        if (!a) {
          ok = false;
          break;
        }
        args.push_back(a);
      }
      if (ok) result = generic_of(origin, args);
      break;
    }
    default:
      break;
  }

  node->resolvedType = result;
  return result;
}

MemberLookup TypeResolver::lookup_member(
  const TypeDefinition * type, std::string_view name) const
{
  if (type == nullptr) return {};
  if (type->kind == TypeKind::Generic) type = type->origin;

  // Superclass chain first, so a class implementation wins over an
  // interface default.
  std::unordered_set<const TypeDefinition *> visited;
  std::vector<const TypeDefinition *> chain;
  for (const TypeDefinition * t = type; t && visited.insert(t).second; t = t->superclass) {
    if (const Symbol * sym = t->find_member(name)) {
      return {sym, t};
    }
    chain.push_back(t);
  }

  // Breadth-first over interfaces in declaration order.
  std::vector<const TypeDefinition *> queue;
  for (const TypeDefinition * t : chain) {
    queue.insert(queue.end(), t->interfaces.begin(), t->interfaces.end());
  }
  for (size_t i = 0; i < queue.size(); ++i) {
    const TypeDefinition * iface = queue[i];
    if (!visited.insert(iface).second) continue;
    if (const Symbol * sym = iface->find_member(name)) {
      return {sym, iface};
    }
    queue.insert(queue.end(), iface->interfaces.begin(), iface->interfaces.end());
  }
  return {};
}

// ============================================================================
// Compatibility
// ============================================================================

bool TypeResolver::numeric_widens(const TypeDefinition * from, const TypeDefinition * to) noexcept
{
  const int fr = from->numeric_rank();
  const int tr = to->numeric_rank();
  if (from->is_integer() && to->is_integer()) {
    if (from->is_signed_integer() == to->is_signed_integer()) return fr <= tr;
    // Unsigned fits into a strictly wider signed type only.
    return !from->is_signed_integer() && fr < tr;
  }
  if (from->is_integer() && to->is_float()) return true;
  if (from->is_float() && to->is_float()) return fr <= tr;
  return false;
}

bool TypeResolver::is_subtype(const TypeDefinition * sub, const TypeDefinition * super) const
{
  if (!sub || !super) return false;
  if (sub->kind == TypeKind::Generic) sub = sub->origin;
  if (super->kind == TypeKind::Generic) super = super->origin;

  std::unordered_set<const TypeDefinition *> visited;
  std::vector<const TypeDefinition *> pending{sub};
  while (!pending.empty()) {
    const TypeDefinition * t = pending.back();
    pending.pop_back();
    if (t == super) return true;
    if (!visited.insert(t).second) continue;
    if (t->superclass) pending.push_back(t->superclass);
    pending.insert(pending.end(), t->interfaces.begin(), t->interfaces.end());
  }
  return false;
}

bool TypeResolver::is_assignable(const TypeDefinition * from, const TypeDefinition * to) const
{
  // Unknown types were already diagnosed; do not cascade.
  if (!from || !to) return true;
  if (from == to) return true;
  if (from->is_error() || to->is_error()) return true;
  if (to->kind == TypeKind::Any) return true;
  if (from->kind == TypeKind::Never) return true;
  if (from->kind == TypeKind::Null) return to->is_reference();
  if (to->kind == TypeKind::Void || from->kind == TypeKind::Void) return false;

  // Int/Int32, Double/Float64, Char/Character...
  if (from->is_primitive && to->is_primitive && from->kind == to->kind) return true;
  if (from->is_numeric() && to->is_numeric()) return numeric_widens(from, to);

  if (from->kind == TypeKind::TypeParameter || to->kind == TypeKind::TypeParameter) return true;

  if (from->kind == TypeKind::Array && to->kind == TypeKind::Array) {
    return is_assignable(from->element, to->element);
  }

  if (from->kind == TypeKind::Generic && to->kind == TypeKind::Generic) {
    if (from->origin != to->origin) return is_subtype(from, to);
    if (from->type_arguments.size() != to->type_arguments.size()) return false;
    for (size_t i = 0; i < from->type_arguments.size(); ++i) {
      if (!is_assignable(from->type_arguments[i], to->type_arguments[i])) return false;
    }
    return true;
  }

  return is_subtype(from, to);
}

const TypeDefinition * TypeResolver::common_numeric(
  const TypeDefinition * a, const TypeDefinition * b) const
{
  if (!a || !b || !a->is_numeric() || !b->is_numeric()) return nullptr;
  if (numeric_widens(a, b)) return b;
  if (numeric_widens(b, a)) return a;
  // Mixed signedness at equal width, or a float narrower than its partner.
  if (a->is_float() || b->is_float()) return double_;
  return int64_;
}

const TypeDefinition * TypeResolver::common_type(
  const TypeDefinition * a, const TypeDefinition * b) const
{
  if (!a) return b;
  if (!b) return a;
  if (a->is_error()) return b;
  if (b->is_error()) return a;
  if (a->is_numeric() && b->is_numeric()) return common_numeric(a, b);
  if (is_assignable(a, b)) return b;
  if (is_assignable(b, a)) return a;
  return nullptr;
}

}  // namespace ouro
