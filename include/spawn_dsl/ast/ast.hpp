// spawn_dsl/ast/ast.hpp - AST node classes
//
// LLVM-style nodes with classof() RTTI. All nodes are arena-allocated by
// AstContext and must stay trivially destructible: strings are
// std::string_view, sequences are gsl::span.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "spawn_dsl/ast/ast_enums.hpp"
#include "spawn_dsl/basic/casting.hpp"
#include "spawn_dsl/basic/source_manager.hpp"
#include "spawn_dsl/syntax/token.hpp"

namespace spawn_dsl
{

class EntityForm;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes: a kind tag plus a source range.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base implementing classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/// Anything that may appear in a scope: entity forms, code blocks, flow.
class Item : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_item_kind(node->kind); }

protected:
  explicit Item(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Post-creation action chained on an entity form.
class Extension : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_extension_kind(node->kind); }

protected:
  explicit Extension(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/**
 * A reference to an entity name.
 *
 * Created by the parser for parent references, insertion targets and
 * identifiers captured by opaque payloads; tagged by the ScopeResolver.
 */
class NameRef : public NodeBase<NameRef, AstNode, NodeKind::NameRef>
{
public:
  std::string_view name;
  RefRole role = RefRole::Capture;

  Resolution resolution = Resolution::Unresolved;
  RefError error = RefError::None;
  const EntityForm * binding = nullptr;  ///< set when resolution == Resolved

  NameRef(std::string_view n, RefRole r, SourceRange range) : NodeBase(range), name(n), role(r) {}
};

/**
 * Host-language expression or statement list forwarded verbatim.
 *
 * `range_` covers exactly the payload text (without enclosing delimiters).
 * The compiler never interprets it beyond collecting identifier captures
 * and expanding literal macros at emission time.
 */
class OpaqueExpr : public NodeBase<OpaqueExpr, AstNode, NodeKind::OpaqueExpr>
{
public:
  std::string_view text;
  gsl::span<const syntax::Token> tokens;
  gsl::span<NameRef *> captures;

  OpaqueExpr(
    std::string_view t, gsl::span<const syntax::Token> toks, gsl::span<NameRef *> caps,
    SourceRange range)
  : NodeBase(range), text(t), tokens(toks), captures(caps)
  {
  }

  [[nodiscard]] bool empty() const noexcept { return tokens.empty(); }
};

/// `.[ item; item; ... ]` - one isolated child scope.
class ChildGroup : public NodeBase<ChildGroup, AstNode, NodeKind::ChildGroup>
{
public:
  gsl::span<Item *> items;

  ChildGroup(gsl::span<Item *> its, SourceRange range) : NodeBase(range), items(its) {}
};

// ============================================================================
// Extensions
// ============================================================================

/**
 * `.method(args)`, or the name-less shortcut `.(args)` that targets the
 * configured default method (`method` is empty then).
 */
class MethodCallExt : public NodeBase<MethodCallExt, Extension, NodeKind::MethodCallExt>
{
public:
  std::string_view method;
  SourceRange method_range;
  gsl::span<OpaqueExpr *> args;

  MethodCallExt(
    std::string_view m, SourceRange m_range, gsl::span<OpaqueExpr *> a, SourceRange range)
  : NodeBase(range), method(m), method_range(m_range), args(a)
  {
  }

  [[nodiscard]] bool is_shortcut() const noexcept { return method.empty(); }
};

/// `.{ stmts }` - runs with `this` and `entity` in scope.
class CodeBlockExt : public NodeBase<CodeBlockExt, Extension, NodeKind::CodeBlockExt>
{
public:
  OpaqueExpr * body = nullptr;

  CodeBlockExt(OpaqueExpr * b, SourceRange range) : NodeBase(range), body(b) {}
};

// ============================================================================
// Items
// ============================================================================

/**
 * One entity form:
 *
 *   [P >] [name] ( components ) .ext* .[group]*
 *   target + ( components ) .ext* .[group]*
 *
 * `parent_ref` and `parent_expr` are mutually exclusive; `insertion_target`
 * is set only for insertions, which never carry a name.
 */
class EntityForm : public NodeBase<EntityForm, Item, NodeKind::EntityForm>
{
public:
  std::string_view name;
  SourceRange name_range;

  NameRef * parent_ref = nullptr;
  OpaqueExpr * parent_expr = nullptr;
  NameRef * insertion_target = nullptr;

  gsl::span<OpaqueExpr *> components;
  gsl::span<Extension *> extensions;
  gsl::span<ChildGroup *> groups;

  /// Declared directly inside a children group (lowered with add_child).
  bool in_group = false;

  /// Set by the resolver when this construct must not be generated.
  bool invalid = false;

  explicit EntityForm(SourceRange range) : NodeBase(range) {}

  [[nodiscard]] bool has_name() const noexcept { return !name.empty(); }
  [[nodiscard]] bool is_insertion() const noexcept { return insertion_target != nullptr; }
  [[nodiscard]] bool has_parent() const noexcept
  {
    return parent_ref != nullptr || parent_expr != nullptr;
  }
};

/// `{ stmts }` interleaved with entity forms.
class InjectedCodeBlock : public NodeBase<InjectedCodeBlock, Item, NodeKind::InjectedCodeBlock>
{
public:
  OpaqueExpr * body = nullptr;

  InjectedCodeBlock(OpaqueExpr * b, SourceRange range) : NodeBase(range), body(b) {}
};

/**
 * `if (cond) { items } [else if ... | else { items }]`
 *
 * An `else if` chain is represented by `else_if`; a plain else by
 * `else_items` with `has_else` set.
 */
class IfFlow : public NodeBase<IfFlow, Item, NodeKind::IfFlow>
{
public:
  OpaqueExpr * condition = nullptr;
  gsl::span<Item *> then_items;
  IfFlow * else_if = nullptr;
  gsl::span<Item *> else_items;
  bool has_else = false;

  explicit IfFlow(SourceRange range) : NodeBase(range) {}
};

/// `for (header) { items }`
class ForFlow : public NodeBase<ForFlow, Item, NodeKind::ForFlow>
{
public:
  OpaqueExpr * header = nullptr;
  gsl::span<Item *> body;

  ForFlow(OpaqueExpr * h, gsl::span<Item *> b, SourceRange range)
  : NodeBase(range), header(h), body(b)
  {
  }
};

/// `while (cond) { items }`
class WhileFlow : public NodeBase<WhileFlow, Item, NodeKind::WhileFlow>
{
public:
  OpaqueExpr * condition = nullptr;
  gsl::span<Item *> body;

  WhileFlow(OpaqueExpr * c, gsl::span<Item *> b, SourceRange range)
  : NodeBase(range), condition(c), body(b)
  {
  }
};

/// `break` / `continue` inside a loop body.
class FlowJump : public NodeBase<FlowJump, Item, NodeKind::FlowJump>
{
public:
  JumpKind jump;

  FlowJump(JumpKind j, SourceRange range) : NodeBase(range), jump(j) {}
};

// ============================================================================
// Program
// ============================================================================

/**
 * Root of one compilation unit.
 *
 * `spawner` is the optional leading `[expr]`; when absent the configured
 * spawner identifier is used.
 */
class SpawnProgram : public NodeBase<SpawnProgram, AstNode, NodeKind::SpawnProgram>
{
public:
  OpaqueExpr * spawner = nullptr;
  gsl::span<Item *> items;

  SpawnProgram(OpaqueExpr * s, gsl::span<Item *> its, SourceRange range)
  : NodeBase(range), spawner(s), items(its)
  {
  }
};

}  // namespace spawn_dsl
