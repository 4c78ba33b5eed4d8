// spawn_dsl/ast/visitor.hpp - CRTP visitor for AST traversal
#pragma once

#include <type_traits>

#include "spawn_dsl/ast/ast.hpp"
#include "spawn_dsl/ast/ast_enums.hpp"
#include "spawn_dsl/basic/casting.hpp"

namespace spawn_dsl
{

namespace detail
{

/// Propagates constness of NodePtrT to the concrete node pointer.
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

/**
 * CRTP visitor with static dispatch on NodeKind.
 *
 * Derived classes override `visit_<snake_name>` for the nodes they care
 * about. Unhandled items fall back to `visit_item`, unhandled extensions to
 * `visit_extension`, everything else to `visit_node`.
 *
 * @code
 *   class Counter : public AstVisitor<Counter, void, const AstNode *> {
 *   public:
 *     void visit_entity_form(const EntityForm *) { ++count; }
 *     void visit_item(const Item *) {}
 *     int count = 0;
 *   };
 * @endcode
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_ITEM(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXT(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "spawn_dsl/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // Defaults route to the category fallbacks.
#define AST_NODE_ITEM(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_item(node);                                  \
  }
#define AST_NODE_EXT(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_extension(node);                             \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "spawn_dsl/ast/ast_nodes.def"

  ReturnType visit_item(detail::propagate_const_t<NodePtrT, Item> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_extension(detail::propagate_const_t<NodePtrT, Extension> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

}  // namespace spawn_dsl
