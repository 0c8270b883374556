// ouro/ast/ast_context.hpp - AST arena allocator and string pool
//
// AstContext owns every AST node and interned string of one compilation
// unit through a std::pmr::monotonic_buffer_resource.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ouro
{

class AstNode;

/**
 * Arena that owns all AST nodes and interned strings of one unit.
 *
 * Nodes are never freed individually; everything is released when the
 * context is destroyed, so node types must be trivially destructible.
 *
 * @code
 *   AstContext ctx;
 *   auto * v = ctx.create<VariableExpr>(ctx.intern("x"), range);
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /// Allocate and construct a node; the pointer stays valid for the context's lifetime.
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST nodes live in the arena and must be trivially destructible; "
      "use std::string_view and gsl::span instead of owning containers.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Return a stable view of `s`; equal strings share storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (const auto it = string_pool_.find(s); it != string_pool_.end()) {
      return *it;
    }
    if (s.empty()) {
      return *string_pool_.insert(std::string_view{}).first;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    const std::string_view stored(ptr, s.size());
    string_pool_.insert(stored);
    return stored;
  }

  /// Copy a temporary vector into the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  [[nodiscard]] size_t string_count() const noexcept { return string_pool_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace ouro
