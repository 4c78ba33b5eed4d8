// spawn_dsl/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline:
// parse -> resolve scopes -> lower to IR -> emit C++.
// Used by the CLI and by end-to-end tests.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/basic/source_manager.hpp"
#include "spawn_dsl/codegen/codegen_options.hpp"
#include "spawn_dsl/codegen/ir.hpp"
#include "spawn_dsl/project/project_config.hpp"
#include "spawn_dsl/sema/scope_resolver.hpp"

namespace spawn_dsl
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Parse, resolve and validate literals (no output)
  Build,  ///< Full build including C++ generation
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  /// Output file for a single-file build (`-o`)
  std::optional<std::filesystem::path> output_file;

  /// Output directory for generated files (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  codegen::CodegenOptions codegen;
  ResolverOptions resolver;

  /// Keep the JSON dump of the resolved AST in each unit
  bool dump_ast = false;

  bool verbose = false;
};

// ============================================================================
// Compile Result
// ============================================================================

/**
 * Everything produced for one `.spawn` source.
 */
struct CompiledUnit
{
  SourceFile source;
  DiagnosticBag diagnostics;

  /// Lowered instructions (erroring constructs are absent)
  codegen::SpawnProgramIR ir;

  /// Generated C++ (Build mode only)
  std::string generated;

  /// Resolved AST (when CompileOptions::dump_ast is set)
  std::optional<nlohmann::json> ast;

  [[nodiscard]] bool success() const { return !diagnostics.has_errors(); }
};

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Driver-level diagnostics (missing files, I/O errors)
  DiagnosticBag diagnostics;

  std::vector<CompiledUnit> units;

  /// Written files (Build mode only)
  std::vector<std::filesystem::path> generated_files;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full compilation pipeline.
 *
 * Errors stay local to the construct that caused them, so a unit with
 * errors still carries the IR of its valid siblings. Files are only written
 * for units without errors.
 */
class Compiler
{
public:
  /**
   * Compile an in-memory source. No I/O.
   */
  [[nodiscard]] static CompiledUnit compile_source(SourceFile source, const CompileOptions & options);

  /**
   * Compile a single `.spawn` file.
   *
   * Output goes to `options.output_file`, else `options.output_dir`, else
   * next to the source, as `<stem>.hpp`.
   */
  [[nodiscard]] static CompileResult compile_single_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Compile every entry point of a project.
   *
   * @param config Project configuration (from spawnc.yaml)
   * @param options Compile options (may override config settings)
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

  /// Text written to a generated file: banner plus the emitted statements.
  [[nodiscard]] static std::string render_output(const CompiledUnit & unit);

private:
  static std::optional<std::string> read_file(
    const std::filesystem::path & path, DiagnosticBag & diags);

  static bool write_output(
    const CompiledUnit & unit, const std::filesystem::path & output_path, DiagnosticBag & diags);
};

}  // namespace spawn_dsl
