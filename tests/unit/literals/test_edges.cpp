#include <gtest/gtest.h>

#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/literals/edges.hpp"

using namespace spawn_dsl;
using namespace spawn_dsl::literals;

TEST(LiteralsEdges, SingleValueAppliesToAllSides)
{
  DiagnosticBag diags;
  const auto edges = parse_edges("10px", diags);
  ASSERT_TRUE(edges.has_value());
  for (const auto & side : edges->sides) {
    ASSERT_TRUE(side.has_value());
    EXPECT_EQ(side->unit, LengthUnit::Px);
    EXPECT_FLOAT_EQ(side->value, 10.0F);
  }
}

TEST(LiteralsEdges, CssStyleExpansion)
{
  DiagnosticBag diags;

  // vertical horizontal
  const auto two = parse_edges("1px 2px", diags);
  ASSERT_TRUE(two.has_value());
  EXPECT_FLOAT_EQ(two->top()->value, 1.0F);
  EXPECT_FLOAT_EQ(two->right()->value, 2.0F);
  EXPECT_FLOAT_EQ(two->bottom()->value, 1.0F);
  EXPECT_FLOAT_EQ(two->left()->value, 2.0F);

  // top horizontal bottom
  const auto three = parse_edges("1px 2px 3px", diags);
  ASSERT_TRUE(three.has_value());
  EXPECT_FLOAT_EQ(three->bottom()->value, 3.0F);
  EXPECT_FLOAT_EQ(three->left()->value, 2.0F);

  const auto four = parse_edges("1px 2px 3px 4%", diags);
  ASSERT_TRUE(four.has_value());
  EXPECT_EQ(four->left()->unit, LengthUnit::Percent);

  EXPECT_TRUE(diags.empty());
}

TEST(LiteralsEdges, UnderscoreKeepsDefault)
{
  DiagnosticBag diags;
  const auto edges = parse_edges("_ 5px", diags);
  ASSERT_TRUE(edges.has_value());
  EXPECT_FALSE(edges->top().has_value());
  EXPECT_TRUE(edges->right().has_value());
  EXPECT_FALSE(edges->bottom().has_value());
  EXPECT_TRUE(edges->left().has_value());

  const LiteralOptions options;
  EXPECT_EQ(
    render_edges(*edges, options),
    "ui::UiRect{ui::Val(), ui::Val::Px(5.0f), ui::Val(), ui::Val::Px(5.0f)}");
}

TEST(LiteralsEdges, Errors)
{
  {
    DiagnosticBag diags;
    EXPECT_FALSE(parse_edges("", diags).has_value());
    EXPECT_EQ(diags.all()[0].message, "Expected 1-4 value or '_'");
  }
  {
    DiagnosticBag diags;
    EXPECT_FALSE(parse_edges("1px 2px 3px 4px 5px", diags).has_value());
    EXPECT_EQ(diags.all()[0].message, "Expected 1-4 value or '_'");
  }
  {
    DiagnosticBag diags;
    EXPECT_FALSE(parse_edges("1px 2 vw", diags).has_value());
    EXPECT_EQ(diags.all()[0].message, "Invalid unit, expected px, vw, vh, vmin, vmax or %");
  }
}
