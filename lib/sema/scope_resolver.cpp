// spawn_dsl/sema/scope_resolver.cpp - Scope resolution implementation
#include "spawn_dsl/sema/scope_resolver.hpp"

#include <algorithm>
#include <string>

namespace spawn_dsl
{

bool ScopeResolver::resolve(SpawnProgram * program)
{
  if (program == nullptr) {
    return false;
  }

  resolve_opaque(program->spawner);
  resolve_items(program->items);
  return error_count_ == 0;
}

// ============================================================================
// Helpers
// ============================================================================

void ScopeResolver::resolve_items(gsl::span<Item *> items)
{
  for (Item * item : items) {
    visit(item);
  }
}

void ScopeResolver::resolve_scoped_items(gsl::span<Item *> items)
{
  const ScopeGuard frame(scopes_);
  resolve_items(items);
}

void ScopeResolver::resolve_opaque(const OpaqueExpr * expr)
{
  if (expr == nullptr) {
    return;
  }
  for (NameRef * ref : expr->captures) {
    tag(ref);
  }
}

const Binding * ScopeResolver::tag(NameRef * ref)
{
  if (const Binding * b = scopes_.current().lookup(ref->name)) {
    ref->resolution = Resolution::Resolved;
    ref->binding = b->site;
    return b;
  }
  ref->resolution = Resolution::ExternalOpaque;
  ref->binding = nullptr;
  return nullptr;
}

// ============================================================================
// Items
// ============================================================================

void ScopeResolver::visit_entity_form(EntityForm * node)
{
  resolve_parent(node);
  resolve_insertion_target(node);

  for (const OpaqueExpr * component : node->components) {
    resolve_opaque(component);
  }
  for (Extension * ext : node->extensions) {
    visit(ext);
  }
  for (const ChildGroup * group : node->groups) {
    resolve_scoped_items(group->items);
  }

  bind_name(node);
}

void ScopeResolver::resolve_parent(EntityForm * node)
{
  resolve_opaque(node->parent_expr);

  NameRef * ref = node->parent_ref;
  if (ref == nullptr || tag(ref) != nullptr) {
    return;
  }

  if (options_.warn_unresolved_parent) {
    diags_
      .report(
        DiagCategory::UnboundReference, ref->get_range(),
        "parent '" + std::string(ref->name) + "' is not bound in this scope",
        "treated as an external handle")
      .with_help("declare '" + std::string(ref->name) + "' earlier, or ignore if it is a host variable");
  }
}

void ScopeResolver::resolve_insertion_target(EntityForm * node)
{
  NameRef * ref = node->insertion_target;
  if (ref == nullptr || tag(ref) != nullptr) {
    return;
  }

  ref->resolution = Resolution::Error;
  ref->error = RefError::InsertionTargetNotLocal;
  node->invalid = true;
  ++error_count_;

  diags_
    .report(
      DiagCategory::InsertionTargetNotLocal, ref->get_range(),
      "cannot insert into '" + std::string(ref->name) + "': no entity with this name is visible here",
      "not bound locally")
    .with_help("insertion needs an entity created earlier in this scope or an enclosing one");
}

void ScopeResolver::bind_name(EntityForm * node)
{
  if (!node->has_name()) {
    return;
  }

  if (is_reserved(node->name)) {
    node->invalid = true;
    ++error_count_;
    diags_
      .report(
        DiagCategory::ReservedName, node->name_range,
        "'" + std::string(node->name) + "' is declared by the generated code",
        "reserved name")
      .with_help("rename the entity, or change the generated names in the codegen section");
    return;
  }

  Scope & frame = scopes_.current();
  if (frame.define(Binding{node->name, node, node->name_range})) {
    return;
  }

  node->invalid = true;
  ++error_count_;

  const Binding * first = frame.lookup_local(node->name);
  auto diag = diags_.report(
    DiagCategory::DuplicateBinding, node->name_range,
    "duplicate binding '" + std::string(node->name) + "'", "bound again here");
  if (first != nullptr) {
    diag.with_secondary_label(first->range, "first bound here");
  }
  diag.with_help("use '" + std::string(node->name) + " + (...)' to add components to it");
}

bool ScopeResolver::is_reserved(std::string_view name) const
{
  return std::any_of(
    options_.reserved_names.begin(), options_.reserved_names.end(),
    [name](const std::string & reserved) { return reserved == name; });
}

void ScopeResolver::visit_injected_code_block(InjectedCodeBlock * node)
{
  resolve_opaque(node->body);
}

void ScopeResolver::visit_if_flow(IfFlow * node)
{
  resolve_opaque(node->condition);
  resolve_scoped_items(node->then_items);
  if (node->else_if != nullptr) {
    visit_if_flow(node->else_if);
  } else if (node->has_else) {
    resolve_scoped_items(node->else_items);
  }
}

void ScopeResolver::visit_for_flow(ForFlow * node)
{
  resolve_opaque(node->header);
  resolve_scoped_items(node->body);
}

void ScopeResolver::visit_while_flow(WhileFlow * node)
{
  resolve_opaque(node->condition);
  resolve_scoped_items(node->body);
}

// ============================================================================
// Extensions
// ============================================================================

void ScopeResolver::visit_method_call_ext(MethodCallExt * node)
{
  for (const OpaqueExpr * arg : node->args) {
    resolve_opaque(arg);
  }
}

void ScopeResolver::visit_code_block_ext(CodeBlockExt * node) { resolve_opaque(node->body); }

}  // namespace spawn_dsl
