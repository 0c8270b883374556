// ouro/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any hierarchy whose classes provide `static bool classof(const Base *)`.
//
//   if (isa<BinaryExpr>(e)) { ... }
//   if (isa<ClassDecl, StructDecl>(d)) { ... }
//   auto * bin = cast<BinaryExpr>(e);             // asserts on mismatch
//   if (auto * bin = dyn_cast<BinaryExpr>(e)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace ouro
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True if `node` is non-null and any of `Ts` accepts it.
template <typename... Ts, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(
    (detail::HasClassof<Ts, From>::value && ...), "isa<> target needs a classof() method");
  return node != nullptr && (Ts::classof(node) || ...);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on incompatible node");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on incompatible node");
  return static_cast<const T *>(node);
}

/// Returns nullptr when `node` is null or not a T.
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace ouro
