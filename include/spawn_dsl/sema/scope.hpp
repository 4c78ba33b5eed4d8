// spawn_dsl/sema/scope.hpp - Scope frames for entity name bindings
//
// One frame per top level, children group and flow body. A frame only sees
// bindings made before the current source position because names are
// defined as the resolver walks forward.
//
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "spawn_dsl/basic/source_manager.hpp"

namespace spawn_dsl
{

class EntityForm;

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/// A name bound to the entity form that declared it.
struct Binding
{
  std::string_view name;  ///< interned in the AstContext
  const EntityForm * site = nullptr;
  SourceRange range;
};

// ============================================================================
// Scope
// ============================================================================

/**
 * One frame of the binding stack.
 */
class Scope
{
public:
  explicit Scope(const Scope * parent = nullptr) : parent_(parent) {}

  /**
   * Bind a name in this frame.
   *
   * @return false if the name is already bound in this frame
   */
  bool define(Binding binding)
  {
    auto [it, inserted] = bindings_.emplace(binding.name, binding);
    return inserted;
  }

  [[nodiscard]] const Binding * lookup_local(std::string_view name) const
  {
    auto it = bindings_.find(name);
    return it != bindings_.end() ? &it->second : nullptr;
  }

  /// Current frame first, then every enclosing frame.
  [[nodiscard]] const Binding * lookup(std::string_view name) const
  {
    if (const Binding * b = lookup_local(name)) {
      return b;
    }
    return parent_ ? parent_->lookup(name) : nullptr;
  }

  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }
  [[nodiscard]] bool empty() const noexcept { return bindings_.empty(); }

private:
  const Scope * parent_;
  std::unordered_map<std::string_view, Binding, StringViewHash, StringViewEqual> bindings_;
};

// ============================================================================
// ScopeStack
// ============================================================================

/**
 * Owns the live frames. A popped frame is destroyed, so its bindings can
 * never leak into a sibling group.
 */
class ScopeStack
{
public:
  ScopeStack() { push(); }

  Scope & push()
  {
    const Scope * parent = frames_.empty() ? nullptr : frames_.back().get();
    frames_.push_back(std::make_unique<Scope>(parent));
    return *frames_.back();
  }

  void pop()
  {
    if (frames_.size() > 1) {
      frames_.pop_back();
    }
  }

  [[nodiscard]] Scope & current() { return *frames_.back(); }
  [[nodiscard]] const Scope & current() const { return *frames_.back(); }
  [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }

private:
  std::vector<std::unique_ptr<Scope>> frames_;
};

/// RAII frame for one children group or flow body.
class ScopeGuard
{
public:
  explicit ScopeGuard(ScopeStack & stack) : stack_(stack) { stack_.push(); }
  ~ScopeGuard() { stack_.pop(); }

  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard & operator=(const ScopeGuard &) = delete;

private:
  ScopeStack & stack_;
};

}  // namespace spawn_dsl
