// spawn_dsl/codegen/codegen_options.hpp - Names used in generated code
#pragma once

#include <string>
#include <vector>

#include "spawn_dsl/literals/literal.hpp"

namespace spawn_dsl::codegen
{

struct CodegenOptions
{
  /// Spawner identifier when the program does not declare `[expr]`.
  std::string spawner = "spawner";

  /// Method called by the `.(args)` shortcut.
  std::string default_method = "on_event";

  /// Local carrying the entity's own handle (`this` in the DSL).
  std::string self_name = "self";

  /// Local holding the live builder of the entity.
  std::string builder_name = "entity";

  /// Local holding the handle of the entity whose group is being built.
  std::string parent_name = "parent";

  literals::LiteralOptions literals;

  int indent_width = 2;

  /// Identifiers every generated block may declare.
  [[nodiscard]] std::vector<std::string> declared_names() const
  {
    return {spawner, builder_name, self_name, parent_name};
  }
};

}  // namespace spawn_dsl::codegen
