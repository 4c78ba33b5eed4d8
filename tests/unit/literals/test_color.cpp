#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/literals/color.hpp"

using namespace spawn_dsl;
using namespace spawn_dsl::literals;

TEST(LiteralsColor, ShortAndLongHexAreEqual)
{
  DiagnosticBag diags;
  const auto short_form = parse_color("#fff", diags);
  const auto long_form = parse_color("#ffffff", diags);
  ASSERT_TRUE(short_form.has_value());
  ASSERT_TRUE(long_form.has_value());
  EXPECT_TRUE(diags.empty());

  EXPECT_TRUE(short_form->same_value(*long_form));

  const LiteralOptions options;
  EXPECT_EQ(render_color(*short_form, options), render_color(*long_form, options));
  EXPECT_EQ(render_color(*short_form, options), "ui::Color(ui::Srgba(1.0f, 1.0f, 1.0f, 1.0f))");
}

TEST(LiteralsColor, UnwrappedEqualsInnerValue)
{
  DiagnosticBag diags;
  const auto wrapped = parse_color("#000", diags);
  const auto unwrapped = parse_color("!#000", diags);
  ASSERT_TRUE(wrapped.has_value());
  ASSERT_TRUE(unwrapped.has_value());

  EXPECT_FALSE(wrapped->unwrapped);
  EXPECT_TRUE(unwrapped->unwrapped);
  EXPECT_TRUE(unwrapped->same_value(*wrapped));

  const LiteralOptions options;
  EXPECT_EQ(render_color(*unwrapped, options), "ui::Srgba(0.0f, 0.0f, 0.0f, 1.0f)");
  EXPECT_EQ(render_color(*wrapped, options), "ui::Color(" + render_color(*unwrapped, options) + ")");
}

TEST(LiteralsColor, HexWithAlpha)
{
  DiagnosticBag diags;
  const auto rgba = parse_color("#ff000080", diags);
  ASSERT_TRUE(rgba.has_value());
  EXPECT_FLOAT_EQ(rgba->channels[0], 1.0F);
  EXPECT_FLOAT_EQ(rgba->channels[3], 128.0F / 255.0F);

  const auto short_alpha = parse_color("#f008", diags);
  ASSERT_TRUE(short_alpha.has_value());
  EXPECT_FLOAT_EQ(short_alpha->channels[3], 0x88 / 255.0F);

  // Digits-first hex lexes as a number with a suffix.
  const auto numeric = parse_color("#62a7ff", diags);
  ASSERT_TRUE(numeric.has_value());
  EXPECT_FLOAT_EQ(numeric->channels[0], 0x62 / 255.0F);
  EXPECT_TRUE(diags.empty());
}

TEST(LiteralsColor, CssNames)
{
  DiagnosticBag diags;
  const auto red = parse_color("red", diags);
  ASSERT_TRUE(red.has_value());
  EXPECT_EQ(red->css_name, "red");
  EXPECT_FLOAT_EQ(red->channels[0], 1.0F);
  EXPECT_FLOAT_EQ(red->channels[1], 0.0F);

  const auto transparent = parse_color("transparent", diags);
  ASSERT_TRUE(transparent.has_value());
  EXPECT_FLOAT_EQ(transparent->channels[3], 0.0F);

  EXPECT_EQ(css_color_count(), 149U);
  EXPECT_NE(find_css_color("rebeccapurple"), nullptr);
  EXPECT_EQ(find_css_color("Red"), nullptr);
}

TEST(LiteralsColor, ColorFunctions)
{
  DiagnosticBag diags;
  const auto hsl = parse_color("hsl(120, 50%, 50%)", diags);
  ASSERT_TRUE(hsl.has_value());
  EXPECT_EQ(hsl->space, ColorSpace::Hsla);
  EXPECT_FLOAT_EQ(hsl->channels[0], 120.0F);
  EXPECT_FLOAT_EQ(hsl->channels[1], 0.5F);
  EXPECT_FLOAT_EQ(hsl->channels[3], 1.0F);

  const auto oklch = parse_color("!oklch(0.7, 0.1, 200, 0.5)", diags);
  ASSERT_TRUE(oklch.has_value());
  EXPECT_EQ(oklch->space, ColorSpace::Oklcha);
  EXPECT_FLOAT_EQ(oklch->channels[3], 0.5F);

  const LiteralOptions options;
  EXPECT_EQ(render_color(*hsl, options), "ui::Color(ui::Hsla(120.0f, 0.5f, 0.5f, 1.0f))");
  EXPECT_EQ(render_color(*oklch, options), "ui::Oklcha(0.7f, 0.1f, 200.0f, 0.5f)");
  EXPECT_TRUE(diags.empty());
}

TEST(LiteralsColor, ConfiguredColorType)
{
  DiagnosticBag diags;
  LiteralOptions options;
  options.color_type = "Color";
  EXPECT_EQ(render_color(*parse_color("#000", diags), options), "Color(Srgba(0.0f, 0.0f, 0.0f, 1.0f))");
}

TEST(LiteralsColor, Errors)
{
  const auto first_message = [](std::string_view text) {
    DiagnosticBag diags;
    EXPECT_FALSE(parse_color(text, diags).has_value()) << text;
    return diags.empty() ? std::string() : diags.all()[0].message;
  };

  EXPECT_EQ(first_message("#"), "expected hex color");
  EXPECT_EQ(first_message("#ff"), "invalid hex color");
  EXPECT_EQ(first_message("#ggg"), "invalid hex color");
  EXPECT_EQ(first_message("hsl"), "expected parenthesis");
  EXPECT_EQ(first_message("hsl(a, 1, 1)"), "expected float or integer");
  EXPECT_EQ(first_message("hsl(1 1 1)"), "expected ',' or ')'");
  EXPECT_EQ(first_message("hsl(1, 1)"), "expected 3 or 4 components");
  EXPECT_EQ(first_message("blurple"), "unknown color 'blurple'");
  EXPECT_EQ(first_message("42"), "expected hex color, color function or CSS color name");
  EXPECT_EQ(first_message("#fff #000"), "unexpected tokens after color");
}
