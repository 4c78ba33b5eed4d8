// spawn_dsl/codegen/ir.hpp - Ordered spawn operations
//
// The generator lowers the resolved AST into a flat, source-ordered list of
// instructions before any C++ text is produced. Tests assert on this list;
// the CppEmitter only formats it.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "spawn_dsl/ast/ast_enums.hpp"
#include "spawn_dsl/basic/source_manager.hpp"

namespace spawn_dsl::codegen
{

enum class OpKind : uint8_t {
  BindSpawner,     ///< text = spawner expression
  BeginEntity,     ///< name = binding (may be empty)
  EndEntity,       ///< name = binding (may be empty)
  Create,          ///< args = components
  AddChild,        ///< target = parent local, args = components
  Insert,          ///< target = inserted entity, args = components
  SetParent,       ///< target = parent name or expression
  CallMethod,      ///< name = method, args = arguments
  RunBlock,        ///< text = block body
  ReleaseBuilder,  ///< before the first children group
  BeginGroup,
  EndGroup,
  InjectBlock,     ///< text = block body
  BeginFlow,       ///< flow + text (condition / header)
  ElseBranch,      ///< text = else-if condition, empty for plain else
  EndFlow,
  FlowJump,        ///< jump
};

[[nodiscard]] std::string_view to_string(OpKind op) noexcept;

enum class FlowKind : uint8_t {
  If,
  For,
  While,
};

struct Instruction
{
  OpKind op;
  SourceRange range;

  std::string name;
  std::string target;
  std::vector<std::string> args;
  std::string text;

  FlowKind flow = FlowKind::If;
  JumpKind jump = JumpKind::Break;
};

/// Result of lowering one program.
struct SpawnProgramIR
{
  std::vector<Instruction> instructions;

  /// Ops only, for order assertions.
  [[nodiscard]] std::vector<OpKind> ops() const
  {
    std::vector<OpKind> out;
    out.reserve(instructions.size());
    for (const auto & inst : instructions) {
      out.push_back(inst.op);
    }
    return out;
  }

  [[nodiscard]] size_t count(OpKind op) const
  {
    size_t n = 0;
    for (const auto & inst : instructions) {
      n += inst.op == op ? 1 : 0;
    }
    return n;
  }

  [[nodiscard]] bool empty() const noexcept { return instructions.empty(); }
  [[nodiscard]] size_t size() const noexcept { return instructions.size(); }
};

}  // namespace spawn_dsl::codegen
