#include <gtest/gtest.h>

#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/literals/length.hpp"

using namespace spawn_dsl;
using namespace spawn_dsl::literals;

TEST(LiteralsLength, PercentAndPixels)
{
  DiagnosticBag diags;

  const auto percent = parse_length("10%", diags);
  ASSERT_TRUE(percent.has_value());
  EXPECT_EQ(percent->unit, LengthUnit::Percent);
  EXPECT_FLOAT_EQ(percent->value, 10.0F);

  const auto px = parse_length("10px", diags);
  ASSERT_TRUE(px.has_value());
  EXPECT_EQ(px->unit, LengthUnit::Px);
  EXPECT_FLOAT_EQ(px->value, 10.0F);

  EXPECT_TRUE(diags.empty());
}

TEST(LiteralsLength, ViewportUnits)
{
  DiagnosticBag diags;
  EXPECT_EQ(parse_length("5vw", diags)->unit, LengthUnit::Vw);
  EXPECT_EQ(parse_length("5vh", diags)->unit, LengthUnit::Vh);
  EXPECT_EQ(parse_length("1.5vmin", diags)->unit, LengthUnit::VMin);
  EXPECT_EQ(parse_length("2vmax", diags)->unit, LengthUnit::VMax);
  EXPECT_FLOAT_EQ(parse_length("1.5vmin", diags)->value, 1.5F);
  EXPECT_TRUE(diags.empty());
}

TEST(LiteralsLength, AutoForms)
{
  DiagnosticBag diags;
  EXPECT_EQ(parse_length("auto", diags)->unit, LengthUnit::Auto);
  EXPECT_EQ(parse_length("@", diags)->unit, LengthUnit::Auto);
  EXPECT_TRUE(diags.empty());
}

TEST(LiteralsLength, GluedMinusNegates)
{
  DiagnosticBag diags;
  const auto len = parse_length("-4px", diags);
  ASSERT_TRUE(len.has_value());
  EXPECT_FLOAT_EQ(len->value, -4.0F);
}

TEST(LiteralsLength, SpaceBeforeUnitIsError)
{
  DiagnosticBag diags;
  EXPECT_FALSE(parse_length("10 vw", diags).has_value());
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].code, "E0200");
  EXPECT_EQ(diags.all()[0].message, "Invalid unit, expected px, vw, vh, vmin, vmax or %");
}

TEST(LiteralsLength, Errors)
{
  {
    DiagnosticBag diags;
    EXPECT_FALSE(parse_length("10em", diags).has_value());
    EXPECT_EQ(diags.all()[0].message, "Invalid unit, expected px, vw, vh, vmin, vmax or %");
  }
  {
    DiagnosticBag diags;
    EXPECT_FALSE(parse_length("wide", diags).has_value());
    EXPECT_EQ(diags.all()[0].message, "Invalid value");
  }
  {
    DiagnosticBag diags;
    EXPECT_FALSE(parse_length("", diags).has_value());
    EXPECT_EQ(diags.all()[0].message, "Expected float or int");
  }
  {
    DiagnosticBag diags;
    EXPECT_FALSE(parse_length("0x10px", diags).has_value());
    EXPECT_EQ(diags.all()[0].message, "Invalid value");
  }
  {
    DiagnosticBag diags;
    EXPECT_FALSE(parse_length("10px 4px", diags).has_value());
    EXPECT_EQ(diags.all()[0].message, "unexpected tokens after length");
  }
}

TEST(LiteralsLength, Render)
{
  const LiteralOptions options;
  DiagnosticBag diags;

  EXPECT_EQ(render_length(*parse_length("10%", diags), options), "ui::Val::Percent(10.0f)");
  EXPECT_EQ(render_length(*parse_length("10px", diags), options), "ui::Val::Px(10.0f)");
  EXPECT_EQ(render_length(*parse_length("2.5vh", diags), options), "ui::Val::Vh(2.5f)");
  EXPECT_EQ(render_length(*parse_length("auto", diags), options), "ui::Val::Auto");

  LiteralOptions custom;
  custom.length_type = "Val";
  EXPECT_EQ(render_length(*parse_length("-3vw", diags), custom), "Val::Vw(-3.0f)");
}

TEST(LiteralsLength, FloatLiteralFormatting)
{
  EXPECT_EQ(float_literal(10.0F), "10.0f");
  EXPECT_EQ(float_literal(0.5F), "0.5f");
  EXPECT_EQ(float_literal(-1.0F), "-1.0f");
}
