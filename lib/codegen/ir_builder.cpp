// spawn_dsl/codegen/ir_builder.cpp - AST to IR lowering
#include "spawn_dsl/codegen/ir_builder.hpp"

#include <cstddef>
#include <utility>

namespace spawn_dsl::codegen
{

SpawnProgramIR IrBuilder::lower(const SpawnProgram * program)
{
  ir_ = SpawnProgramIR{};
  if (program == nullptr) {
    return std::move(ir_);
  }

  if (program->spawner != nullptr && !program->spawner->empty()) {
    if (auto expr = payload(program->spawner)) {
      emit(OpKind::BindSpawner, program->spawner->get_range()).text = std::move(*expr);
    }
  }

  lower_items(program->items);
  return std::move(ir_);
}

// ============================================================================
// Helpers
// ============================================================================

void IrBuilder::lower_items(gsl::span<Item *> items)
{
  for (const Item * item : items) {
    const size_t mark = ir_.instructions.size();
    if (!visit(item)) {
      ir_.instructions.erase(
        ir_.instructions.begin() + static_cast<std::ptrdiff_t>(mark), ir_.instructions.end());
    }
  }
}

std::optional<std::string> IrBuilder::payload(const OpaqueExpr * expr)
{
  if (expr == nullptr) {
    return std::string{};
  }
  return expander_.expand(*expr);
}

std::optional<std::vector<std::string>> IrBuilder::payloads(gsl::span<OpaqueExpr *> exprs)
{
  std::vector<std::string> out;
  bool ok = true;
  for (const OpaqueExpr * expr : exprs) {
    if (auto text = payload(expr)) {
      out.push_back(std::move(*text));
    } else {
      ok = false;
    }
  }
  if (!ok) {
    return std::nullopt;
  }
  return out;
}

Instruction & IrBuilder::emit(OpKind op, SourceRange range)
{
  Instruction inst{op, range};
  ir_.instructions.push_back(std::move(inst));
  return ir_.instructions.back();
}

// ============================================================================
// Entity forms
// ============================================================================

bool IrBuilder::visit_entity_form(const EntityForm * node)
{
  if (node->invalid) {
    return false;
  }

  auto components = payloads(node->components);
  std::optional<std::string> parent;
  if (node->parent_ref != nullptr) {
    parent = std::string(node->parent_ref->name);
  } else if (node->parent_expr != nullptr) {
    parent = payload(node->parent_expr);
  }
  bool ok = components.has_value() && (!node->has_parent() || parent.has_value());

  emit(OpKind::BeginEntity, node->get_range()).name = std::string(node->name);

  if (node->is_insertion()) {
    Instruction & insert = emit(OpKind::Insert, node->insertion_target->get_range());
    insert.target = std::string(node->insertion_target->name);
    insert.args = components.value_or(std::vector<std::string>{});
  } else if (node->in_group) {
    Instruction & add = emit(OpKind::AddChild, node->get_range());
    add.target = options_.parent_name;
    add.args = components.value_or(std::vector<std::string>{});
  } else {
    emit(OpKind::Create, node->get_range()).args =
      components.value_or(std::vector<std::string>{});
  }

  if (node->has_parent() && parent) {
    const SourceRange range = node->parent_ref != nullptr ? node->parent_ref->get_range()
                                                          : node->parent_expr->get_range();
    emit(OpKind::SetParent, range).target = std::move(*parent);
  }

  for (const Extension * ext : node->extensions) {
    ok = lower_extension(ext) && ok;
  }

  if (!node->groups.empty()) {
    emit(OpKind::ReleaseBuilder, node->get_range());
  }
  for (const ChildGroup * group : node->groups) {
    emit(OpKind::BeginGroup, group->get_range());
    lower_items(group->items);
    emit(OpKind::EndGroup, group->get_range());
  }

  emit(OpKind::EndEntity, node->get_range()).name = std::string(node->name);
  return ok;
}

bool IrBuilder::lower_extension(const Extension * ext)
{
  if (const auto * call = dyn_cast<MethodCallExt>(ext)) {
    auto args = payloads(call->args);
    if (!args) {
      return false;
    }
    Instruction & inst = emit(OpKind::CallMethod, call->get_range());
    inst.name = call->is_shortcut() ? options_.default_method : std::string(call->method);
    inst.args = std::move(*args);
    return true;
  }

  if (const auto * block = dyn_cast<CodeBlockExt>(ext)) {
    auto body = payload(block->body);
    if (!body) {
      return false;
    }
    emit(OpKind::RunBlock, block->get_range()).text = std::move(*body);
    return true;
  }

  return false;
}

// ============================================================================
// Code blocks and flow
// ============================================================================

bool IrBuilder::visit_injected_code_block(const InjectedCodeBlock * node)
{
  auto body = payload(node->body);
  if (!body) {
    return false;
  }
  emit(OpKind::InjectBlock, node->get_range()).text = std::move(*body);
  return true;
}

bool IrBuilder::visit_if_flow(const IfFlow * node)
{
  auto cond = payload(node->condition);
  bool ok = cond.has_value();

  Instruction & begin = emit(OpKind::BeginFlow, node->get_range());
  begin.flow = FlowKind::If;
  begin.text = cond.value_or(std::string{});
  lower_items(node->then_items);

  const IfFlow * tail = node;
  while (tail->else_if != nullptr) {
    tail = tail->else_if;
    auto else_cond = payload(tail->condition);
    ok = ok && else_cond.has_value();
    emit(OpKind::ElseBranch, tail->get_range()).text = else_cond.value_or(std::string{});
    lower_items(tail->then_items);
  }
  if (tail->has_else) {
    emit(OpKind::ElseBranch, tail->get_range());
    lower_items(tail->else_items);
  }

  emit(OpKind::EndFlow, node->get_range());
  return ok;
}

bool IrBuilder::visit_for_flow(const ForFlow * node)
{
  auto header = payload(node->header);
  Instruction & begin = emit(OpKind::BeginFlow, node->get_range());
  begin.flow = FlowKind::For;
  begin.text = header.value_or(std::string{});
  lower_items(node->body);
  emit(OpKind::EndFlow, node->get_range());
  return header.has_value();
}

bool IrBuilder::visit_while_flow(const WhileFlow * node)
{
  auto cond = payload(node->condition);
  Instruction & begin = emit(OpKind::BeginFlow, node->get_range());
  begin.flow = FlowKind::While;
  begin.text = cond.value_or(std::string{});
  lower_items(node->body);
  emit(OpKind::EndFlow, node->get_range());
  return cond.has_value();
}

bool IrBuilder::visit_flow_jump(const FlowJump * node)
{
  emit(OpKind::FlowJump, node->get_range()).jump = node->jump;
  return true;
}

}  // namespace spawn_dsl::codegen
