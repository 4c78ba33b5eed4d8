// spawn_dsl/sema/scope_resolver.hpp - Name resolution over entity scopes
//
// Tags every NameRef as Resolved, ExternalOpaque or Error and marks the
// entity forms that must not be generated.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "spawn_dsl/ast/ast.hpp"
#include "spawn_dsl/ast/visitor.hpp"
#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/sema/scope.hpp"

namespace spawn_dsl
{

struct ResolverOptions
{
  /// Emit W0100 when a parent reference is not bound in any visible frame.
  bool warn_unresolved_parent = true;

  /// Identifiers the generated code declares itself. An entity may not be
  /// named after one of them.
  std::vector<std::string> reserved_names = {"spawner", "entity", "self", "parent"};
};

/**
 * Scope resolution pass.
 *
 * Walks items depth-first, left to right, which is exactly emission order:
 * - a reference searches the frame stack top to bottom; a miss is
 *   ExternalOpaque, not an error
 * - an insertion target must be bound locally (InsertionTargetNotLocal)
 * - a name is bound in the current frame once its form is complete; a
 *   second binding in the same frame is a DuplicateBinding, and a name the
 *   generated code declares itself is a ReservedName
 *
 * Children groups and flow bodies each get their own frame, so siblings
 * never see each other's bindings.
 */
class ScopeResolver : public AstVisitor<ScopeResolver>
{
public:
  explicit ScopeResolver(DiagnosticBag & diags, ResolverOptions options = {})
  : diags_(diags), options_(options)
  {
  }

  /**
   * Resolve every reference in the program.
   *
   * @return true if no errors were reported
   */
  bool resolve(SpawnProgram * program);

  // Visitor methods
  void visit_entity_form(EntityForm * node);
  void visit_injected_code_block(InjectedCodeBlock * node);
  void visit_if_flow(IfFlow * node);
  void visit_for_flow(ForFlow * node);
  void visit_while_flow(WhileFlow * node);
  void visit_flow_jump(FlowJump * /*node*/) {}
  void visit_method_call_ext(MethodCallExt * node);
  void visit_code_block_ext(CodeBlockExt * node);
  void visit_node(AstNode * /*node*/) {}

private:
  void resolve_items(gsl::span<Item *> items);
  void resolve_scoped_items(gsl::span<Item *> items);
  void resolve_opaque(const OpaqueExpr * expr);

  /// Looks `ref` up and tags it; returns the binding when found.
  const Binding * tag(NameRef * ref);

  void resolve_parent(EntityForm * node);
  void resolve_insertion_target(EntityForm * node);
  void bind_name(EntityForm * node);
  [[nodiscard]] bool is_reserved(std::string_view name) const;

  DiagnosticBag & diags_;
  ResolverOptions options_;
  ScopeStack scopes_;
  size_t error_count_ = 0;
};

}  // namespace spawn_dsl
