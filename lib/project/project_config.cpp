// spawn_dsl/project/project_config.cpp - Project configuration implementation
//
#include "spawn_dsl/project/project_config.hpp"

#include <cctype>
#include <yaml-cpp/yaml.h>

namespace spawn_dsl
{

namespace
{

bool is_identifier(const std::string & s)
{
  if (s.empty() || (std::isalpha(static_cast<unsigned char>(s[0])) == 0 && s[0] != '_')) {
    return false;
  }
  for (const char c : s) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
      return false;
    }
  }
  return true;
}

/// Reads `section[key]` into `out` when present; identifiers must be valid C++ names.
bool read_identifier(
  const YAML::Node & section, const char * key, const std::string & path, std::string & out,
  std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    error = path + "." + key + " must be a string";
    return false;
  }
  const auto value = node.as<std::string>();
  if (!is_identifier(value)) {
    error = "invalid " + path + "." + key + ": '" + value + "' is not an identifier";
    return false;
  }
  out = value;
  return true;
}

/// Type names may be qualified (`ui::Val`).
bool read_type_name(
  const YAML::Node & section, const char * key, std::string & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  if (!node.IsScalar() || node.as<std::string>().empty()) {
    error = std::string("literals.") + key + " must be a non-empty string";
    return false;
  }
  out = node.as<std::string>();
  return true;
}

bool parse_codegen(const YAML::Node & cg, codegen::CodegenOptions & out, std::string & error)
{
  if (!cg.IsMap()) {
    error = "codegen must be a map";
    return false;
  }
  return read_identifier(cg, "spawner", "codegen", out.spawner, error) &&
         read_identifier(cg, "default_method", "codegen", out.default_method, error) &&
         read_identifier(cg, "self_name", "codegen", out.self_name, error) &&
         read_identifier(cg, "builder_name", "codegen", out.builder_name, error) &&
         read_identifier(cg, "parent_name", "codegen", out.parent_name, error);
}

bool parse_literals(const YAML::Node & lit, literals::LiteralOptions & out, std::string & error)
{
  if (!lit.IsMap()) {
    error = "literals must be a map";
    return false;
  }
  if (lit["expand"]) {
    out.expand = lit["expand"].as<bool>();
  }
  return read_type_name(lit, "length_type", out.length_type, error) &&
         read_type_name(lit, "color_type", out.color_type, error) &&
         read_type_name(lit, "rect_type", out.rect_type, error);
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'compiler' section
    if (root["compiler"]) {
      const auto & comp = root["compiler"];

      if (comp["entry_points"]) {
        if (!comp["entry_points"].IsSequence()) {
          return ConfigLoadResult::fail("compiler.entry_points must be a list");
        }
        for (const auto & ep : comp["entry_points"]) {
          config.compiler.entry_points.emplace_back(ep.as<std::string>());
        }
      }

      if (comp["output_dir"]) {
        config.compiler.output_dir = comp["output_dir"].as<std::string>();
      }
    }

    std::string error;

    if (root["codegen"] && !parse_codegen(root["codegen"], config.codegen, error)) {
      return ConfigLoadResult::fail(error);
    }

    if (root["literals"] && !parse_literals(root["literals"], config.codegen.literals, error)) {
      return ConfigLoadResult::fail(error);
    }

    if (root["diagnostics"]) {
      const auto & diag = root["diagnostics"];
      if (diag["warn_unresolved_parent"]) {
        config.diagnostics.warn_unresolved_parent = diag["warn_unresolved_parent"].as<bool>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_root(root, fs::absolute(config_path).parent_path());
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root, project_root);
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace spawn_dsl
