// tests/unit/project/test_project_config.cpp - Unit tests for spawnc.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include "spawn_dsl/project/project_config.hpp"

using namespace spawn_dsl;
namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;
  explicit TempDir(fs::path p) : path(std::move(p)) { fs::create_directories(path); }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

TEST(ProjectConfig, FullConfiguration)
{
  const std::string yaml = R"(
package:
  name: demo
  version: 0.1.0
compiler:
  entry_points: [src/ui.spawn, src/hud.spawn]
  output_dir: out
codegen:
  spawner: commands
  default_method: observe
  self_name: me
  builder_name: builder
  parent_name: up
diagnostics:
  warn_unresolved_parent: false
literals:
  expand: true
  length_type: Val
  color_type: bevy::Color
  rect_type: UiRect
)";

  const auto result = parse_project_config(yaml, "/proj");
  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & cfg = result.config;

  EXPECT_EQ(cfg.package.name, "demo");
  EXPECT_EQ(cfg.package.version, "0.1.0");
  ASSERT_EQ(cfg.compiler.entry_points.size(), 2U);
  EXPECT_EQ(cfg.compiler.entry_points[1], fs::path("src/hud.spawn"));
  EXPECT_EQ(cfg.compiler.output_dir, fs::path("out"));
  EXPECT_EQ(cfg.project_root, fs::path("/proj"));

  EXPECT_EQ(cfg.codegen.spawner, "commands");
  EXPECT_EQ(cfg.codegen.default_method, "observe");
  EXPECT_EQ(cfg.codegen.self_name, "me");
  EXPECT_EQ(cfg.codegen.builder_name, "builder");
  EXPECT_EQ(cfg.codegen.parent_name, "up");
  EXPECT_FALSE(cfg.diagnostics.warn_unresolved_parent);

  EXPECT_TRUE(cfg.codegen.literals.expand);
  EXPECT_EQ(cfg.codegen.literals.length_type, "Val");
  EXPECT_EQ(cfg.codegen.literals.color_namespace(), "bevy::");
  EXPECT_EQ(cfg.codegen.literals.rect_type, "UiRect");
}

TEST(ProjectConfig, DefaultsWhenSectionsAreMissing)
{
  const auto result = parse_project_config("package: { name: x }\n", "/p");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.config.codegen.spawner, "spawner");
  EXPECT_EQ(result.config.codegen.default_method, "on_event");
  EXPECT_EQ(result.config.compiler.output_dir, fs::path("generated"));
  EXPECT_TRUE(result.config.diagnostics.warn_unresolved_parent);

  const auto empty = parse_project_config("", "/p");
  EXPECT_TRUE(empty.success);
}

TEST(ProjectConfig, InvalidValuesFail)
{
  {
    const auto r = parse_project_config("codegen:\n  spawner: '1abc'\n", "/p");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "invalid codegen.spawner: '1abc' is not an identifier");
  }
  {
    const auto r = parse_project_config("codegen:\n  self_name: ''\n", "/p");
    EXPECT_FALSE(r.success);
  }
  {
    const auto r = parse_project_config("literals:\n  color_type: ''\n", "/p");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "literals.color_type must be a non-empty string");
  }
  {
    const auto r = parse_project_config("compiler:\n  entry_points: main.spawn\n", "/p");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "compiler.entry_points must be a list");
  }
  {
    const auto r = parse_project_config("diagnostics:\n  warn_unresolved_parent: maybe\n", "/p");
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("invalid configuration value"), std::string::npos);
  }
  {
    const auto r = parse_project_config("- a\n- b\n", "/p");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "configuration root must be a map");
  }
  {
    const auto r = parse_project_config("package: [unclosed\n", "/p");
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("failed to parse YAML"), std::string::npos);
  }
}

TEST(ProjectConfig, LoadAndFindFromDisk)
{
  const TempDir dir(fs::temp_directory_path() / "spawn_dsl_config_test");
  fs::create_directories(dir.path / "src" / "nested");
  {
    std::ofstream out(dir.path / k_project_config_file_name);
    out << "package:\n  name: disk\ncompiler:\n  entry_points: [src/main.spawn]\n";
  }

  const auto found = find_project_config(dir.path / "src" / "nested");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename(), fs::path(k_project_config_file_name));

  const auto result = load_project_config(*found);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.package.name, "disk");
  EXPECT_EQ(result.config.project_root, fs::absolute(dir.path));

  const auto missing = load_project_config(dir.path / "nope.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("configuration file not found"), std::string::npos);
}
