// spawn_dsl/ast/ast_context.hpp - AST arena allocator
//
// AstContext owns every AST node and every array hanging off a node.
// Memory comes from a std::pmr::monotonic_buffer_resource and is released
// all at once when the context is destroyed.
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

namespace spawn_dsl
{

class AstNode;

/**
 * Arena for AST nodes and interned strings.
 *
 * @code
 *   AstContext ctx;
 *   auto * ref = ctx.create<NameRef>(ctx.intern("panel"), RefRole::Parent, range);
 *   gsl::span<Item *> items = ctx.copy_to_arena(item_vector);
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

  ~AstContext() = default;

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /**
   * Allocate and construct a node. The node lives as long as the context.
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST nodes are never destroyed individually; use string_view and gsl::span members");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Returns a stable view of `s`; equal strings share storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (auto it = string_pool_.find(s); it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    const std::string_view stored(ptr, s.size());
    string_pool_.insert(stored);
    return stored;
  }

  /// Copies `vec` into the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena arrays are never destroyed");
    if (vec.empty()) {
      return {};
    }
    T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * vec.size(), alignof(T)));
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  /// Copies `vec` into the arena as a read-only span.
  template <typename T>
  [[nodiscard]] gsl::span<const T> copy_to_arena_const(const std::vector<T> & vec)
  {
    const gsl::span<T> s = copy_to_arena(vec);
    return gsl::span<const T>(s.data(), s.size());
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace spawn_dsl
