// spawn_dsl/codegen/cpp_emitter.hpp - C++ text for a SpawnProgramIR
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "spawn_dsl/codegen/codegen_options.hpp"
#include "spawn_dsl/codegen/ir.hpp"

namespace spawn_dsl::codegen
{

/**
 * Formats lowered instructions as a C++ statement sequence.
 *
 * The output is meant to be included inside a function body that has a
 * spawner in scope. Each entity becomes an immediately invoked lambda whose
 * result is its handle:
 *
 * @code
 *   const auto panel = [&] {
 *     auto entity = spawner.create(Node{});
 *     const auto self = entity.id();
 *     entity.release();
 *     {
 *       const auto parent = self;
 *       [&] {
 *         auto entity = spawner.entity(parent).add_child(Text{"hi"});
 *         const auto self = entity.id();
 *         return self;
 *       }();
 *     }
 *     return self;
 *   }();
 * @endcode
 *
 * The lambda bounds the builder's lifetime, so the spawner is never held
 * across a sibling statement.
 */
class CppEmitter
{
public:
  explicit CppEmitter(const CodegenOptions & options) : options_(options) {}

  [[nodiscard]] std::string emit(const SpawnProgramIR & ir);

private:
  void line(std::string_view text);
  void emit_instruction(const Instruction & inst);
  void emit_block(std::string_view body);
  void emit_self_binding();

  [[nodiscard]] static std::string join_args(const std::vector<std::string> & args);

  const CodegenOptions & options_;
  std::string out_;
  int depth_ = 0;
};

}  // namespace spawn_dsl::codegen
