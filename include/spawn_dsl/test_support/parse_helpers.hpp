// spawn_dsl/test_support/parse_helpers.hpp - helpers for unit tests
//
// Runs the front end (and optionally the resolver and the IR builder) on an
// in-memory source. The unit is heap-allocated because AST payloads view
// into the source text, which must not move.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "spawn_dsl/ast/ast_context.hpp"
#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/basic/source_manager.hpp"
#include "spawn_dsl/codegen/codegen_options.hpp"
#include "spawn_dsl/codegen/ir.hpp"
#include "spawn_dsl/codegen/ir_builder.hpp"
#include "spawn_dsl/sema/scope_resolver.hpp"
#include "spawn_dsl/syntax/parser.hpp"

namespace spawn_dsl::test_support
{

struct TestParseUnit
{
  SourceFile source;
  AstContext ast;
  DiagnosticBag diags;
  SpawnProgram * program = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return source.get_slice(r);
  }

  /// Runs the scope resolver over the parsed program.
  bool resolve(ResolverOptions options = {})
  {
    ScopeResolver resolver(diags, options);
    return resolver.resolve(program);
  }

  /// Lowers the (resolved) program to IR.
  codegen::SpawnProgramIR lower(const codegen::CodegenOptions & options = {})
  {
    codegen::IrBuilder builder(options, diags);
    return builder.lower(program);
  }
};

[[nodiscard]] inline std::unique_ptr<TestParseUnit> parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.spawn")
{
  auto out = std::make_unique<TestParseUnit>();
  out->source = SourceFile(virtual_path, std::move(src));
  out->program = syntax::parse_source(out->source, out->ast, out->diags);
  return out;
}

/// parse() followed by resolve().
[[nodiscard]] inline std::unique_ptr<TestParseUnit> resolve(
  std::string src, ResolverOptions options = {})
{
  auto out = parse(std::move(src));
  out->resolve(options);
  return out;
}

}  // namespace spawn_dsl::test_support
