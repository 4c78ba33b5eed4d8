// spawnc - Spawn DSL Compiler Command Line Interface
//
// Usage:
//   spawnc build [file.spawn | --project] [-o output]
//   spawnc check [file.spawn | --project] [--dump-ast]
//   spawnc init <project-name>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "spawn_dsl/basic/diagnostic_printer.hpp"
#include "spawn_dsl/driver/compiler.hpp"
#include "spawn_dsl/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Spawn DSL Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  build [file.spawn]       Generate C++ for a file or project\n"
            << "  check [file.spawn]       Parse, resolve and validate (no output)\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (single file) or directory (project)\n"
            << "  --project                Use spawnc.yaml from the current directory\n"
            << "  --dump-ast               Print the resolved AST as JSON (check only)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_result(const spawn_dsl::CompileResult & result, const std::string & default_name)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  spawn_dsl::DiagnosticPrinter printer(std::cerr, use_color);

  for (const auto & unit : result.units) {
    printer.print_all(unit.diagnostics, unit.source);
  }

  // Driver diagnostics have no source text
  if (!result.diagnostics.empty()) {
    const spawn_dsl::SourceFile none(fs::path(default_name), std::string());
    printer.print_all(result.diagnostics, none);
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  bool use_project = false;
  bool dump_ast = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--dump-ast") {
      args.dump_ast = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Shared by build and check; only the mode and the reporting differ.
int run_compile(const CommandArgs & args, spawn_dsl::CompileOptions options, const char * verb)
{
  options.verbose = args.verbose;
  options.dump_ast = args.dump_ast;

  spawn_dsl::CompileResult result;

  if (args.use_project || args.input_file.empty()) {
    auto config_path = spawn_dsl::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << spawn_dsl::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = spawn_dsl::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (!args.output_path.empty()) {
      options.output_dir = args.output_path;
    }
    if (args.verbose) {
      std::cerr << verb << " project: " << config_result.config.package.name << "\n";
    }

    result = spawn_dsl::Compiler::compile_project(config_result.config, options);
  } else {
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    if (!args.output_path.empty()) {
      options.output_file = args.output_path;
    }
    if (args.verbose) {
      std::cerr << verb << ": " << input_path.string() << "\n";
    }

    result = spawn_dsl::Compiler::compile_single_file(input_path, options);
  }

  print_result(result, args.input_file.empty() ? "project" : args.input_file);

  if (args.dump_ast) {
    for (const auto & unit : result.units) {
      if (unit.ast) {
        std::cout << unit.ast->dump(2) << "\n";
      }
    }
  }

  if (!result.success) {
    return 1;
  }

  if (options.mode == spawn_dsl::CompileMode::Build) {
    for (const auto & file : result.generated_files) {
      std::cerr << "Generated: " << file.string() << "\n";
    }
  } else if (!args.dump_ast) {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
  }

  return 0;
}

int cmd_build(const CommandArgs & args)
{
  spawn_dsl::CompileOptions options;
  options.mode = spawn_dsl::CompileMode::Build;
  return run_compile(args, options, "Building");
}

int cmd_check(const CommandArgs & args)
{
  spawn_dsl::CompileOptions options;
  options.mode = spawn_dsl::CompileMode::Check;
  return run_compile(args, options, "Checking");
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: spawnc init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "src");
    fs::create_directories(project_dir / "generated");

    std::ofstream config(project_dir / spawn_dsl::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << args.input_file << "'\n"
           << "  version: '0.1.0'\n\n"
           << "compiler:\n"
           << "  entry_points:\n"
           << "    - './src/main.spawn'\n"
           << "  output_dir: './generated'\n\n"
           << "codegen:\n"
           << "  spawner: 'spawner'\n";
    config.close();

    std::ofstream main(project_dir / "src" / "main.spawn");
    main << "root (Node, Style { width: v!(100%), ..default() }).[\n"
         << "  title (Text::new(\"Hello\"), TextColor(c!(white)));\n"
         << "]\n";
    main.close();

    std::cout << "Initialized new spawn project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  spawnc build\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    if (args.command == "build") {
      return cmd_build(args);
    }

    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "init") {
      return cmd_init(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
