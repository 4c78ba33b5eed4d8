// spawn_dsl/ast/ast_enums.hpp - AST enumerations
//
// Node kinds plus the small enums attached to nodes by the parser and the
// scope resolver.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace spawn_dsl
{

// ============================================================================
// NodeKind
// ============================================================================

/**
 * Node kind for LLVM-style RTTI, generated from ast_nodes.def.
 * Kinds are grouped by category so category checks are range compares.
 */
enum class NodeKind : uint8_t {
#define AST_NODE_ITEM(Class, Kind, Snake) Kind,
#define AST_NODE_EXT(Class, Kind, Snake) Kind,
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "spawn_dsl/ast/ast_nodes.def"
};

[[nodiscard]] constexpr bool is_item_kind(NodeKind k) noexcept
{
  return k >= NodeKind::EntityForm && k <= NodeKind::FlowJump;
}

[[nodiscard]] constexpr bool is_extension_kind(NodeKind k) noexcept
{
  return k >= NodeKind::MethodCallExt && k <= NodeKind::CodeBlockExt;
}

[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_ITEM(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_EXT(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "spawn_dsl/ast/ast_nodes.def"
  }
  return "<unknown>";
}

// ============================================================================
// Reference resolution
// ============================================================================

/// What a NameRef stands for syntactically.
enum class RefRole : uint8_t {
  Parent,           ///< `p > (...)`
  InsertionTarget,  ///< `t + (...)`
  Capture,          ///< identifier inside an opaque payload
};

/// Tag attached to each NameRef by the scope resolver.
enum class Resolution : uint8_t {
  Unresolved,      ///< resolver has not run
  Resolved,        ///< bound by an EntityForm visible at this point
  ExternalOpaque,  ///< not bound here, left to the host scope
  Error,           ///< see RefError
};

enum class RefError : uint8_t {
  None,
  UnboundReference,
  InsertionTargetNotLocal,
};

[[nodiscard]] constexpr std::string_view to_string(RefRole r) noexcept
{
  switch (r) {
    case RefRole::Parent:
      return "parent";
    case RefRole::InsertionTarget:
      return "insertion_target";
    case RefRole::Capture:
      return "capture";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Resolution r) noexcept
{
  switch (r) {
    case Resolution::Unresolved:
      return "unresolved";
    case Resolution::Resolved:
      return "resolved";
    case Resolution::ExternalOpaque:
      return "external_opaque";
    case Resolution::Error:
      return "error";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(RefError e) noexcept
{
  switch (e) {
    case RefError::None:
      return "none";
    case RefError::UnboundReference:
      return "UnboundReference";
    case RefError::InsertionTargetNotLocal:
      return "InsertionTargetNotLocal";
  }
  return "";
}

// ============================================================================
// Flow
// ============================================================================

enum class JumpKind : uint8_t {
  Break,
  Continue,
};

}  // namespace spawn_dsl
