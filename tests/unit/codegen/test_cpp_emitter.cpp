// tests/unit/codegen/test_cpp_emitter.cpp - Unit tests for C++ emission
//
#include <gtest/gtest.h>

#include <string>

#include "spawn_dsl/codegen/cpp_emitter.hpp"
#include "spawn_dsl/test_support/parse_helpers.hpp"

using namespace spawn_dsl;
using namespace spawn_dsl::codegen;

namespace
{

std::string emit_source(const std::string & src, const CodegenOptions & options = {})
{
  auto unit = test_support::resolve(src);
  const SpawnProgramIR ir = unit->lower(options);
  CppEmitter emitter(options);
  return emitter.emit(ir);
}

}  // namespace

TEST(CodegenCppEmitter, NamedEntity)
{
  const std::string expected =
    "const auto a = [&] {\n"
    "  auto entity = spawner.create(Node, Name(\"a\"));\n"
    "  const auto self = entity.id();\n"
    "  return self;\n"
    "}();\n";
  EXPECT_EQ(emit_source("a (Node, Name(\"a\"))"), expected);
}

TEST(CodegenCppEmitter, AnonymousParentedEntityWithExtensions)
{
  const std::string expected =
    "[&] {\n"
    "  auto entity = spawner.create(Marker);\n"
    "  const auto self = entity.id();\n"
    "  entity.set_parent(root);\n"
    "  entity.observe(on_click);\n"
    "  entity.on_event(handler);\n"
    "  { log(self); }\n"
    "  return self;\n"
    "}();\n";
  EXPECT_EQ(
    emit_source("root > (Marker).observe(on_click).(handler).{ log(self); }"), expected);
}

TEST(CodegenCppEmitter, ChildrenGroupRunsAfterRelease)
{
  const std::string expected =
    "const auto list = [&] {\n"
    "  auto entity = spawner.create(Node);\n"
    "  const auto self = entity.id();\n"
    "  entity.release();\n"
    "  {\n"
    "    const auto parent = self;\n"
    "    const auto item = [&] {\n"
    "      auto entity = spawner.entity(parent).add_child(Text::new(\"x\"));\n"
    "      const auto self = entity.id();\n"
    "      return self;\n"
    "    }();\n"
    "  }\n"
    "  return self;\n"
    "}();\n";
  EXPECT_EQ(emit_source("list (Node).[ item (Text::new(\"x\")) ]"), expected);
}

TEST(CodegenCppEmitter, Insertion)
{
  const std::string expected =
    "const auto a = [&] {\n"
    "  auto entity = spawner.create();\n"
    "  const auto self = entity.id();\n"
    "  return self;\n"
    "}();\n"
    "[&] {\n"
    "  auto entity = spawner.entity(a);\n"
    "  entity.insert(Visible);\n"
    "  const auto self = entity.id();\n"
    "  return self;\n"
    "}();\n";
  EXPECT_EQ(emit_source("a (); a + (Visible)"), expected);
}

TEST(CodegenCppEmitter, InsertionWithoutComponentsSkipsInsert)
{
  const std::string out = emit_source("a (); a + ().show()");
  EXPECT_EQ(out.find(".insert("), std::string::npos);
  EXPECT_NE(out.find("entity.show();"), std::string::npos);
}

TEST(CodegenCppEmitter, SpawnerFlowAndCodeBlocks)
{
  const std::string expected =
    "auto && spawner = (world.spawner());\n"
    "{ int n = 0; }\n"
    "for (auto i : items) {\n"
    "  if (i == 2) {\n"
    "    continue;\n"
    "  } else if (i > 4) {\n"
    "    break;\n"
    "  } else {\n"
    "    [&] {\n"
    "      auto entity = spawner.create(Row(i));\n"
    "      const auto self = entity.id();\n"
    "      return self;\n"
    "    }();\n"
    "  }\n"
    "}\n"
    "while (more()) {\n"
    "}\n";
  EXPECT_EQ(
    emit_source(
      "[world.spawner()]\n"
      "{ int n = 0; }\n"
      "for (auto i : items) { if (i == 2) { continue } else if (i > 4) { break } else { (Row(i)) } }\n"
      "while (more()) {}\n"),
    expected);
}

TEST(CodegenCppEmitter, ConfiguredNames)
{
  CodegenOptions options;
  options.spawner = "cmds";
  options.builder_name = "e";
  options.self_name = "me";
  options.parent_name = "up";
  options.indent_width = 4;

  const std::string expected =
    "const auto a = [&] {\n"
    "    auto e = cmds.create();\n"
    "    const auto me = e.id();\n"
    "    e.release();\n"
    "    {\n"
    "        const auto up = me;\n"
    "        [&] {\n"
    "            auto e = cmds.entity(up).add_child();\n"
    "            const auto me = e.id();\n"
    "            return me;\n"
    "        }();\n"
    "    }\n"
    "    return me;\n"
    "}();\n";
  EXPECT_EQ(emit_source("a ().[ () ]", options), expected);
}

TEST(CodegenCppEmitter, ReservedNamesAreNotRedeclared)
{
  const std::string out = emit_source("x ().[ parent (A); ok (B) ]; spawner (C); (D)");
  EXPECT_EQ(out.find("const auto parent = [&]"), std::string::npos);
  EXPECT_EQ(out.find("const auto spawner = "), std::string::npos);
  EXPECT_NE(out.find("const auto ok = [&]"), std::string::npos);
  EXPECT_NE(out.find("auto entity = spawner.create(D);"), std::string::npos);
}

TEST(CodegenCppEmitter, EmptyProgram)
{
  EXPECT_EQ(emit_source(""), "");
}
