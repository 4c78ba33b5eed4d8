// spawn_dsl/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `spawnc check --dump-ast` and by tests. Reference nodes carry
// their resolution tag, so the dump also shows the resolver's result.
//
#pragma once

#include <nlohmann/json.hpp>

#include "spawn_dsl/ast/ast.hpp"

namespace spawn_dsl
{

/**
 * Serialize an AST node to JSON.
 *
 * @param node The AST node to serialize (can be any node type)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a program including its spawner declaration and all items.
 */
[[nodiscard]] nlohmann::json to_json(const SpawnProgram * program);

}  // namespace spawn_dsl
