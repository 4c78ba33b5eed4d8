// spawn_dsl/basic/casting.hpp - LLVM-style RTTI helpers
//
// Works with any hierarchy whose classes provide `static bool classof(const Base *)`.
//
//   if (isa<EntityForm>(item)) { ... }
//   auto * e = cast<EntityForm>(item);        // asserts on mismatch
//   if (auto * e = dyn_cast<EntityForm>(item)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace spawn_dsl
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

/// True if `node` is non-null and of dynamic kind T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::HasClassof<T, From>::value, "T must provide classof()");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<const T *>(node);
}

/// Checked cast; nullptr when `node` is null or of another kind.
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

}  // namespace spawn_dsl
