#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "spawn_dsl/ast/ast.hpp"
#include "spawn_dsl/basic/casting.hpp"
#include "spawn_dsl/literals/literal_expander.hpp"
#include "spawn_dsl/test_support/parse_helpers.hpp"

using namespace spawn_dsl;
using namespace spawn_dsl::literals;

namespace
{

/// Expands the first component of the first entity in `src`.
std::optional<std::string> expand_first(
  const std::string & src, DiagnosticBag & diags, LiteralOptions options = {})
{
  auto unit = test_support::parse(src);
  EXPECT_TRUE(unit->diags.empty());
  const auto * entity = cast<EntityForm>(unit->program->items[0]);
  LiteralExpander expander(options, diags);
  return expander.expand(*entity->components[0]);
}

}  // namespace

TEST(LiteralsExpander, ReplacesMacrosInPlace)
{
  DiagnosticBag diags;
  const auto out = expand_first(
    "(Style { width: v!(50%), border: e!(1px _), ..default() })", diags);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(
    *out,
    "Style { width: ui::Val::Percent(50.0f), "
    "border: ui::UiRect{ui::Val::Px(1.0f), ui::Val(), ui::Val::Px(1.0f), ui::Val()}, "
    "..default() }");
}

TEST(LiteralsExpander, ColorMacro)
{
  DiagnosticBag diags;
  const auto out = expand_first("(BackgroundColor(c!(#fff)))", diags);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "BackgroundColor(ui::Color(ui::Srgba(1.0f, 1.0f, 1.0f, 1.0f)))");
}

TEST(LiteralsExpander, MemberCallsAreNotMacros)
{
  DiagnosticBag diags;
  const auto out = expand_first("(obj.v!(x), Foo::c!(y))", diags);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "obj.v!(x)");
  EXPECT_TRUE(diags.empty());
}

TEST(LiteralsExpander, TextWithoutMacrosIsUnchanged)
{
  DiagnosticBag diags;
  const auto out = expand_first("(Text::new(\"v!(10px)\"))", diags);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "Text::new(\"v!(10px)\")");
}

TEST(LiteralsExpander, ReportsEveryMalformedLiteral)
{
  DiagnosticBag diags;
  const auto out = expand_first("(Pair(v!(10 vw), c!(blurple)))", diags);
  EXPECT_FALSE(out.has_value());
  EXPECT_EQ(diags.count(DiagCategory::LiteralError), 2U);
}

TEST(LiteralsExpander, ExpansionCanBeDisabled)
{
  DiagnosticBag diags;
  LiteralOptions options;
  options.expand = false;
  const auto out = expand_first("(Node(v!(10 vw)))", diags, options);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "Node(v!(10 vw))");
  EXPECT_TRUE(diags.empty());
}

TEST(LiteralsExpander, ConfiguredTypes)
{
  DiagnosticBag diags;
  LiteralOptions options;
  options.length_type = "Val";
  const auto out = expand_first("(Width(v!(auto)))", diags, options);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "Width(Val::Auto)");
}
