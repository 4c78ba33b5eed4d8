// spawn_dsl/ast/json_visitor.cpp - JSON serialization implementation
//
#include "spawn_dsl/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "spawn_dsl/ast/ast_enums.hpp"
#include "spawn_dsl/ast/visitor.hpp"
#include "spawn_dsl/basic/casting.hpp"
#include "spawn_dsl/basic/source_manager.hpp"

namespace spawn_dsl
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

json j_str(std::string_view s) { return std::string(s); }

/**
 * Builds the JSON tree. Each visit returns the object for one node.
 */
class JsonBuilder : public AstVisitor<JsonBuilder, json, const AstNode *>
{
public:
  json visit_name_ref(const NameRef * node)
  {
    json j{
      {"type", "NameRef"},
      {"range", j_range(node->get_range())},
      {"name", j_str(node->name)},
      {"role", j_str(to_string(node->role))},
      {"resolution", j_str(to_string(node->resolution))}};
    if (node->error != RefError::None) {
      j["error"] = j_str(to_string(node->error));
    }
    if (node->binding != nullptr) {
      j["binding"] = j_range(node->binding->name_range);
    }
    return j;
  }

  json visit_opaque_expr(const OpaqueExpr * node)
  {
    json captures = json::array();
    for (const NameRef * ref : node->captures) {
      captures.push_back(visit(ref));
    }
    return json{
      {"type", "OpaqueExpr"},
      {"range", j_range(node->get_range())},
      {"text", j_str(node->text)},
      {"captures", captures}};
  }

  json visit_child_group(const ChildGroup * node)
  {
    return json{
      {"type", "ChildGroup"}, {"range", j_range(node->get_range())}, {"items", items(node->items)}};
  }

  json visit_method_call_ext(const MethodCallExt * node)
  {
    json j{
      {"type", "MethodCallExt"},
      {"range", j_range(node->get_range())},
      {"shortcut", node->is_shortcut()},
      {"args", exprs(node->args)}};
    if (!node->is_shortcut()) {
      j["method"] = j_str(node->method);
    }
    return j;
  }

  json visit_code_block_ext(const CodeBlockExt * node)
  {
    return json{
      {"type", "CodeBlockExt"}, {"range", j_range(node->get_range())}, {"body", visit(node->body)}};
  }

  json visit_entity_form(const EntityForm * node)
  {
    json j{
      {"type", "EntityForm"},
      {"range", j_range(node->get_range())},
      {"components", exprs(node->components)},
      {"in_group", node->in_group}};

    if (node->has_name()) {
      j["name"] = j_str(node->name);
    }
    if (node->parent_ref != nullptr) {
      j["parent"] = visit(node->parent_ref);
    } else if (node->parent_expr != nullptr) {
      j["parent"] = visit(node->parent_expr);
    }
    if (node->insertion_target != nullptr) {
      j["insertion_target"] = visit(node->insertion_target);
    }

    json extensions = json::array();
    for (const Extension * ext : node->extensions) {
      extensions.push_back(visit(ext));
    }
    j["extensions"] = extensions;

    json groups = json::array();
    for (const ChildGroup * group : node->groups) {
      groups.push_back(visit(group));
    }
    j["groups"] = groups;

    if (node->invalid) {
      j["invalid"] = true;
    }
    return j;
  }

  json visit_injected_code_block(const InjectedCodeBlock * node)
  {
    return json{
      {"type", "InjectedCodeBlock"},
      {"range", j_range(node->get_range())},
      {"body", visit(node->body)}};
  }

  json visit_if_flow(const IfFlow * node)
  {
    json j{
      {"type", "IfFlow"},
      {"range", j_range(node->get_range())},
      {"condition", visit(node->condition)},
      {"then", items(node->then_items)}};
    if (node->else_if != nullptr) {
      j["else_if"] = visit(node->else_if);
    } else if (node->has_else) {
      j["else"] = items(node->else_items);
    }
    return j;
  }

  json visit_for_flow(const ForFlow * node)
  {
    return json{
      {"type", "ForFlow"},
      {"range", j_range(node->get_range())},
      {"header", visit(node->header)},
      {"body", items(node->body)}};
  }

  json visit_while_flow(const WhileFlow * node)
  {
    return json{
      {"type", "WhileFlow"},
      {"range", j_range(node->get_range())},
      {"condition", visit(node->condition)},
      {"body", items(node->body)}};
  }

  json visit_flow_jump(const FlowJump * node)
  {
    return json{
      {"type", "FlowJump"},
      {"range", j_range(node->get_range())},
      {"jump", node->jump == JumpKind::Break ? "break" : "continue"}};
  }

  json visit_spawn_program(const SpawnProgram * node)
  {
    json j{
      {"type", "SpawnProgram"},
      {"range", j_range(node->get_range())},
      {"items", items(node->items)}};
    j["spawner"] = node->spawner != nullptr ? visit(node->spawner) : json(nullptr);
    return j;
  }

  json visit_node(const AstNode * node)
  {
    return json{{"type", j_str(to_string(node->get_kind()))}, {"range", j_range(node->get_range())}};
  }

private:
  json items(gsl::span<Item *> list)
  {
    json arr = json::array();
    for (const Item * item : list) {
      arr.push_back(visit(item));
    }
    return arr;
  }

  json exprs(gsl::span<OpaqueExpr *> list)
  {
    json arr = json::array();
    for (const OpaqueExpr * e : list) {
      arr.push_back(visit(e));
    }
    return arr;
  }
};

}  // namespace

json to_json(const AstNode * node)
{
  if (node == nullptr) {
    return json(nullptr);
  }
  JsonBuilder builder;
  return builder.visit(node);
}

json to_json(const SpawnProgram * program)
{
  if (program == nullptr) {
    return json(nullptr);
  }
  JsonBuilder builder;
  return builder.visit_spawn_program(program);
}

}  // namespace spawn_dsl
