// spawn_dsl/codegen/ir_builder.hpp - Lowering of the resolved AST
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "spawn_dsl/ast/ast.hpp"
#include "spawn_dsl/ast/visitor.hpp"
#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/codegen/codegen_options.hpp"
#include "spawn_dsl/codegen/ir.hpp"
#include "spawn_dsl/literals/literal_expander.hpp"

namespace spawn_dsl::codegen
{

/**
 * Lowers a resolved SpawnProgram into a SpawnProgramIR.
 *
 * Items are lowered in source order. Each visit returns false when the
 * construct cannot be generated (marked invalid by the resolver, or a
 * malformed literal in one of its payloads); everything emitted since the
 * construct began is then rolled back and its siblings are lowered as usual.
 */
class IrBuilder : public AstVisitor<IrBuilder, bool, const AstNode *>
{
public:
  IrBuilder(const CodegenOptions & options, DiagnosticBag & diags)
  : options_(options), expander_(options_.literals, diags)
  {
  }

  [[nodiscard]] SpawnProgramIR lower(const SpawnProgram * program);

  // Visitor methods
  bool visit_entity_form(const EntityForm * node);
  bool visit_injected_code_block(const InjectedCodeBlock * node);
  bool visit_if_flow(const IfFlow * node);
  bool visit_for_flow(const ForFlow * node);
  bool visit_while_flow(const WhileFlow * node);
  bool visit_flow_jump(const FlowJump * node);
  bool visit_node(const AstNode * /*node*/) { return false; }

private:
  void lower_items(gsl::span<Item *> items);
  bool lower_extension(const Extension * ext);

  /// Payload text with literals expanded; nullopt on a literal error.
  std::optional<std::string> payload(const OpaqueExpr * expr);
  std::optional<std::vector<std::string>> payloads(gsl::span<OpaqueExpr *> exprs);

  Instruction & emit(OpKind op, SourceRange range);

  const CodegenOptions & options_;
  literals::LiteralExpander expander_;
  SpawnProgramIR ir_;
};

}  // namespace spawn_dsl::codegen
