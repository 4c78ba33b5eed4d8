// spawn_dsl/driver/compiler.cpp - Compiler driver implementation
//
#include "spawn_dsl/driver/compiler.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "spawn_dsl/ast/ast_context.hpp"
#include "spawn_dsl/ast/json_visitor.hpp"
#include "spawn_dsl/codegen/cpp_emitter.hpp"
#include "spawn_dsl/codegen/ir_builder.hpp"
#include "spawn_dsl/syntax/parser.hpp"

namespace spawn_dsl
{

CompiledUnit Compiler::compile_source(SourceFile source, const CompileOptions & options)
{
  CompiledUnit unit;
  unit.source = std::move(source);

  AstContext ast;

  // 1. Parse
  SpawnProgram * program = syntax::parse_source(unit.source, ast, unit.diagnostics);

  // 2. Scope resolution
  ResolverOptions resolver_options = options.resolver;
  resolver_options.reserved_names = options.codegen.declared_names();
  ScopeResolver resolver(unit.diagnostics, resolver_options);
  resolver.resolve(program);

  if (options.dump_ast) {
    unit.ast = to_json(program);
  }

  // 3. Lowering (also validates literal macros)
  codegen::IrBuilder builder(options.codegen, unit.diagnostics);
  unit.ir = builder.lower(program);

  // 4. Emission
  if (options.mode == CompileMode::Build) {
    codegen::CppEmitter emitter(options.codegen);
    unit.generated = emitter.emit(unit.ir);
  }

  return unit;
}

CompileResult Compiler::compile_single_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  namespace fs = std::filesystem;

  CompileResult result;

  if (!fs::exists(file)) {
    result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
    return result;
  }

  auto content = read_file(file, result.diagnostics);
  if (!content) {
    return result;
  }

  result.units.push_back(compile_source(SourceFile(file, std::move(*content)), options));
  const CompiledUnit & unit = result.units.back();

  if (unit.success() && options.mode == CompileMode::Build) {
    fs::path output_path;
    if (options.output_file) {
      output_path = *options.output_file;
    } else if (options.output_dir) {
      std::error_code ec;
      fs::create_directories(*options.output_dir, ec);
      if (ec) {
        result.diagnostics.report_error(
          SourceRange{}, "failed to create output directory " + options.output_dir->string() +
                           ": " + ec.message());
        return result;
      }
      output_path = *options.output_dir / (file.stem().string() + ".hpp");
    } else {
      output_path = file.parent_path() / (file.stem().string() + ".hpp");
    }

    if (write_output(unit, output_path, result.diagnostics)) {
      result.generated_files.push_back(output_path);
    }
  }

  result.success = !result.diagnostics.has_errors() && unit.success();
  return result;
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  namespace fs = std::filesystem;

  CompileResult result;

  if (config.compiler.entry_points.empty()) {
    result.diagnostics.report_error(
      SourceRange{}, "no entry points defined in project configuration");
    return result;
  }

  const fs::path output_dir =
    options.output_dir.value_or(config.project_root / config.compiler.output_dir);
  if (options.mode == CompileMode::Build) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
      result.diagnostics.report_error(
        SourceRange{}, "failed to create output directory " + output_dir.string() + ": " +
                         ec.message());
      return result;
    }
  }

  // The project's codegen and diagnostics sections apply to every entry point.
  CompileOptions unit_options = options;
  unit_options.codegen = config.codegen;
  unit_options.resolver = config.diagnostics;

  bool units_ok = true;
  for (const auto & entry_rel : config.compiler.entry_points) {
    const fs::path entry_path = config.project_root / entry_rel;

    if (!fs::exists(entry_path)) {
      result.diagnostics.report_error(
        SourceRange{}, "entry point not found: " + entry_path.string());
      continue;
    }

    auto content = read_file(entry_path, result.diagnostics);
    if (!content) {
      continue;
    }

    result.units.push_back(
      compile_source(SourceFile(entry_path, std::move(*content)), unit_options));
    const CompiledUnit & unit = result.units.back();
    units_ok = units_ok && unit.success();

    if (unit.success() && options.mode == CompileMode::Build) {
      const fs::path output_path = output_dir / (entry_path.stem().string() + ".hpp");
      if (write_output(unit, output_path, result.diagnostics)) {
        result.generated_files.push_back(output_path);
      }
    }
  }

  result.success = units_ok && !result.diagnostics.has_errors();
  return result;
}

std::string Compiler::render_output(const CompiledUnit & unit)
{
  return fmt::format(
    "// Generated by spawnc from {}. Do not edit.\n"
    "// Include inside a function body that has the spawner in scope.\n"
    "\n"
    "{}",
    unit.source.display_name(), unit.generated);
}

std::optional<std::string> Compiler::read_file(
  const std::filesystem::path & path, DiagnosticBag & diags)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    diags.report_error(SourceRange{}, "failed to open file: " + path.string());
    return std::nullopt;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

bool Compiler::write_output(
  const CompiledUnit & unit, const std::filesystem::path & output_path, DiagnosticBag & diags)
{
  std::ofstream out(output_path);
  if (!out.is_open()) {
    diags.report_error(SourceRange{}, "failed to open output file: " + output_path.string());
    return false;
  }

  out << render_output(unit);
  if (!out) {
    diags.report_error(SourceRange{}, "failed to write output file: " + output_path.string());
    return false;
  }
  return true;
}

}  // namespace spawn_dsl
