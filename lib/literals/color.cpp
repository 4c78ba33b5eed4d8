// spawn_dsl/literals/color.cpp - Color literal implementation
#include "spawn_dsl/literals/color.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <iterator>
#include <utility>
#include <vector>

namespace spawn_dsl::literals
{

using syntax::Token;
using syntax::TokenKind;

namespace
{

// clang-format off
constexpr CssColor k_css_colors[] = {
  {"black", 0x000000ff},
  {"silver", 0xc0c0c0ff},
  {"gray", 0x808080ff},
  {"white", 0xffffffff},
  {"maroon", 0x800000ff},
  {"red", 0xff0000ff},
  {"purple", 0x800080ff},
  {"fuchsia", 0xff00ffff},
  {"green", 0x008000ff},
  {"lime", 0x00ff00ff},
  {"olive", 0x808000ff},
  {"yellow", 0xffff00ff},
  {"navy", 0x000080ff},
  {"blue", 0x0000ffff},
  {"teal", 0x008080ff},
  {"aqua", 0x00ffffff},
  {"aliceblue", 0xf0f8ffff},
  {"antiquewhite", 0xfaebd7ff},
  {"aquamarine", 0x7fffd4ff},
  {"azure", 0xf0ffffff},
  {"beige", 0xf5f5dcff},
  {"bisque", 0xffe4c4ff},
  {"blanchedalmond", 0xffebcdff},
  {"blueviolet", 0x8a2be2ff},
  {"brown", 0xa52a2aff},
  {"burlywood", 0xdeb887ff},
  {"cadetblue", 0x5f9ea0ff},
  {"chartreuse", 0x7fff00ff},
  {"chocolate", 0xd2691eff},
  {"coral", 0xff7f50ff},
  {"cornflowerblue", 0x6495edff},
  {"cornsilk", 0xfff8dcff},
  {"crimson", 0xdc143cff},
  {"cyan", 0x00ffffff},
  {"darkblue", 0x00008bff},
  {"darkcyan", 0x008b8bff},
  {"darkgoldenrod", 0xb8860bff},
  {"darkgray", 0xa9a9a9ff},
  {"darkgreen", 0x006400ff},
  {"darkgrey", 0xa9a9a9ff},
  {"darkkhaki", 0xbdb76bff},
  {"darkmagenta", 0x8b008bff},
  {"darkolivegreen", 0x556b2fff},
  {"darkorange", 0xff8c00ff},
  {"darkorchid", 0x9932ccff},
  {"darkred", 0x8b0000ff},
  {"darksalmon", 0xe9967aff},
  {"darkseagreen", 0x8fbc8fff},
  {"darkslateblue", 0x483d8bff},
  {"darkslategray", 0x2f4f4fff},
  {"darkslategrey", 0x2f4f4fff},
  {"darkturquoise", 0x00ced1ff},
  {"darkviolet", 0x9400d3ff},
  {"deeppink", 0xff1493ff},
  {"deepskyblue", 0x00bfffff},
  {"dimgray", 0x696969ff},
  {"dimgrey", 0x696969ff},
  {"dodgerblue", 0x1e90ffff},
  {"firebrick", 0xb22222ff},
  {"floralwhite", 0xfffaf0ff},
  {"forestgreen", 0x228b22ff},
  {"gainsboro", 0xdcdcdcff},
  {"ghostwhite", 0xf8f8ffff},
  {"gold", 0xffd700ff},
  {"goldenrod", 0xdaa520ff},
  {"greenyellow", 0xadff2fff},
  {"grey", 0x808080ff},
  {"honeydew", 0xf0fff0ff},
  {"hotpink", 0xff69b4ff},
  {"indianred", 0xcd5c5cff},
  {"indigo", 0x4b0082ff},
  {"ivory", 0xfffff0ff},
  {"khaki", 0xf0e68cff},
  {"lavender", 0xe6e6faff},
  {"lavenderblush", 0xfff0f5ff},
  {"lawngreen", 0x7cfc00ff},
  {"lemonchiffon", 0xfffacdff},
  {"lightblue", 0xadd8e6ff},
  {"lightcoral", 0xf08080ff},
  {"lightcyan", 0xe0ffffff},
  {"lightgoldenrodyellow", 0xfafad2ff},
  {"lightgray", 0xd3d3d3ff},
  {"lightgreen", 0x90ee90ff},
  {"lightgrey", 0xd3d3d3ff},
  {"lightpink", 0xffb6c1ff},
  {"lightsalmon", 0xffa07aff},
  {"lightseagreen", 0x20b2aaff},
  {"lightskyblue", 0x87cefaff},
  {"lightslategray", 0x778899ff},
  {"lightslategrey", 0x778899ff},
  {"lightsteelblue", 0xb0c4deff},
  {"lightyellow", 0xffffe0ff},
  {"limegreen", 0x32cd32ff},
  {"linen", 0xfaf0e6ff},
  {"magenta", 0xff00ffff},
  {"mediumaquamarine", 0x66cdaaff},
  {"mediumblue", 0x0000cdff},
  {"mediumorchid", 0xba55d3ff},
  {"mediumpurple", 0x9370dbff},
  {"mediumseagreen", 0x3cb371ff},
  {"mediumslateblue", 0x7b68eeff},
  {"mediumspringgreen", 0x00fa9aff},
  {"mediumturquoise", 0x48d1ccff},
  {"mediumvioletred", 0xc71585ff},
  {"midnightblue", 0x191970ff},
  {"mintcream", 0xf5fffaff},
  {"mistyrose", 0xffe4e1ff},
  {"moccasin", 0xffe4b5ff},
  {"navajowhite", 0xffdeadff},
  {"oldlace", 0xfdf5e6ff},
  {"olivedrab", 0x6b8e23ff},
  {"orange", 0xffa500ff},
  {"orangered", 0xff4500ff},
  {"orchid", 0xda70d6ff},
  {"palegoldenrod", 0xeee8aaff},
  {"palegreen", 0x98fb98ff},
  {"paleturquoise", 0xafeeeeff},
  {"palevioletred", 0xdb7093ff},
  {"papayawhip", 0xffefd5ff},
  {"peachpuff", 0xffdab9ff},
  {"peru", 0xcd853fff},
  {"pink", 0xffc0cbff},
  {"plum", 0xdda0ddff},
  {"powderblue", 0xb0e0e6ff},
  {"rebeccapurple", 0x663399ff},
  {"rosybrown", 0xbc8f8fff},
  {"royalblue", 0x4169e1ff},
  {"saddlebrown", 0x8b4513ff},
  {"salmon", 0xfa8072ff},
  {"sandybrown", 0xf4a460ff},
  {"seagreen", 0x2e8b57ff},
  {"seashell", 0xfff5eeff},
  {"sienna", 0xa0522dff},
  {"skyblue", 0x87ceebff},
  {"slateblue", 0x6a5acdff},
  {"slategray", 0x708090ff},
  {"slategrey", 0x708090ff},
  {"snow", 0xfffafaff},
  {"springgreen", 0x00ff7fff},
  {"steelblue", 0x4682b4ff},
  {"tan", 0xd2b48cff},
  {"thistle", 0xd8bfd8ff},
  {"tomato", 0xff6347ff},
  {"turquoise", 0x40e0d0ff},
  {"violet", 0xee82eeff},
  {"wheat", 0xf5deb3ff},
  {"whitesmoke", 0xf5f5f5ff},
  {"yellowgreen", 0x9acd32ff},
  {"transparent", 0x00000000},
};
// clang-format on

constexpr std::pair<std::string_view, ColorSpace> k_color_functions[] = {
  {"srgb", ColorSpace::Srgba},   {"linear", ColorSpace::LinearRgba}, {"hsl", ColorSpace::Hsla},
  {"hsv", ColorSpace::Hsva},     {"hwb", ColorSpace::Hwba},          {"lab", ColorSpace::Laba},
  {"lch", ColorSpace::Lcha},     {"oklab", ColorSpace::Oklaba},      {"oklch", ColorSpace::Oklcha},
  {"xyz", ColorSpace::Xyza},
};

int hex_value(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

float channel(uint32_t rgba, int shift)
{
  return static_cast<float>((rgba >> shift) & 0xffU) / 255.0F;
}

std::optional<Color> parse_hex(
  TokenCursor & cursor, const Token & hash, bool unwrapped, DiagnosticBag & diags)
{
  if (!cursor.at(TokenKind::Identifier) && !cursor.at(TokenKind::Number)) {
    diags.report(DiagCategory::LiteralError, cursor.here(), "expected hex color");
    return std::nullopt;
  }

  const Token & tok = cursor.next();
  const std::string_view hex = tok.text;
  const bool all_hex =
    std::all_of(hex.begin(), hex.end(), [](char c) { return hex_value(c) >= 0; });
  if (!all_hex || (hex.size() != 3 && hex.size() != 4 && hex.size() != 6 && hex.size() != 8)) {
    diags
      .report(DiagCategory::LiteralError, hash.range.merge(tok.range), "invalid hex color")
      .with_help("use 3, 4, 6 or 8 hex digits: #rgb, #rgba, #rrggbb or #rrggbbaa");
    return std::nullopt;
  }

  Color color;
  color.space = ColorSpace::Srgba;
  color.unwrapped = unwrapped;
  color.range = hash.range.merge(tok.range);

  if (hex.size() <= 4) {
    for (size_t i = 0; i < hex.size(); ++i) {
      color.channels[i] = static_cast<float>(hex_value(hex[i]) * 0x11) / 255.0F;
    }
  } else {
    for (size_t i = 0; i * 2 < hex.size(); ++i) {
      const int byte = hex_value(hex[i * 2]) * 16 + hex_value(hex[i * 2 + 1]);
      color.channels[i] = static_cast<float>(byte) / 255.0F;
    }
  }
  return color;
}

/// One numeric argument of a color function: `0.5`, `-20`, `50%`.
std::optional<float> parse_component(TokenCursor & cursor, DiagnosticBag & diags)
{
  bool negative = false;
  if (cursor.at(TokenKind::Minus) && cursor.peek(1) != nullptr &&
      cursor.peek(1)->kind == TokenKind::Number) {
    cursor.next();
    negative = true;
  }

  float value = 0.0F;
  if (!cursor.at(TokenKind::Number) ||
      (!cursor.peek()->suffix.empty() && cursor.peek()->suffix != "f") ||
      !parse_decimal(*cursor.peek(), value)) {
    diags.report(DiagCategory::LiteralError, cursor.here(), "expected float or integer");
    return std::nullopt;
  }
  cursor.next();

  if (cursor.at(TokenKind::Percent)) {
    cursor.next();
    value /= 100.0F;
  }
  return negative ? -value : value;
}

std::optional<Color> parse_function(
  TokenCursor & cursor, const Token & name, ColorSpace space, bool unwrapped,
  DiagnosticBag & diags)
{
  if (!cursor.at(TokenKind::LParen)) {
    diags.report(DiagCategory::LiteralError, cursor.here(), "expected parenthesis");
    return std::nullopt;
  }
  const Token & open = cursor.next();

  std::vector<float> components;
  SourceRange close_range = open.range;
  while (true) {
    if (cursor.at(TokenKind::RParen)) {
      close_range = cursor.next().range;
      break;
    }
    const auto value = parse_component(cursor, diags);
    if (!value) {
      return std::nullopt;
    }
    components.push_back(*value);

    if (cursor.at(TokenKind::Comma)) {
      cursor.next();
      continue;
    }
    if (!cursor.at(TokenKind::RParen)) {
      diags.report(DiagCategory::LiteralError, cursor.here(), "expected ',' or ')'");
      return std::nullopt;
    }
  }

  const SourceRange range = name.range.merge(close_range);
  if (components.size() != 3 && components.size() != 4) {
    diags.report(DiagCategory::LiteralError, range, "expected 3 or 4 components");
    return std::nullopt;
  }

  Color color;
  color.space = space;
  color.unwrapped = unwrapped;
  color.range = range;
  std::copy(components.begin(), components.end(), color.channels.begin());
  return color;
}

}  // namespace

std::string_view to_string(ColorSpace space) noexcept
{
  switch (space) {
    case ColorSpace::Srgba:
      return "Srgba";
    case ColorSpace::LinearRgba:
      return "LinearRgba";
    case ColorSpace::Hsla:
      return "Hsla";
    case ColorSpace::Hsva:
      return "Hsva";
    case ColorSpace::Hwba:
      return "Hwba";
    case ColorSpace::Laba:
      return "Laba";
    case ColorSpace::Lcha:
      return "Lcha";
    case ColorSpace::Oklaba:
      return "Oklaba";
    case ColorSpace::Oklcha:
      return "Oklcha";
    case ColorSpace::Xyza:
      return "Xyza";
  }
  return "Srgba";
}

std::optional<ColorSpace> color_function(std::string_view name) noexcept
{
  for (const auto & [fn, space] : k_color_functions) {
    if (fn == name) {
      return space;
    }
  }
  return std::nullopt;
}

const CssColor * find_css_color(std::string_view name) noexcept
{
  const auto * it = std::find_if(
    std::begin(k_css_colors), std::end(k_css_colors),
    [name](const CssColor & c) { return c.name == name; });
  return it != std::end(k_css_colors) ? it : nullptr;
}

size_t css_color_count() noexcept { return std::size(k_css_colors); }

std::optional<Color> parse_color(TokenCursor & cursor, DiagnosticBag & diags)
{
  bool unwrapped = false;
  if (cursor.at(TokenKind::Bang)) {
    cursor.next();
    unwrapped = true;
  }

  if (cursor.at(TokenKind::Hash)) {
    const Token & hash = cursor.next();
    return parse_hex(cursor, hash, unwrapped, diags);
  }

  if (cursor.at(TokenKind::Identifier)) {
    const Token & ident = cursor.next();
    if (const auto space = color_function(ident.text)) {
      return parse_function(cursor, ident, *space, unwrapped, diags);
    }
    if (const CssColor * css = find_css_color(ident.text)) {
      Color color;
      color.space = ColorSpace::Srgba;
      color.channels = {
        channel(css->rgba, 24), channel(css->rgba, 16), channel(css->rgba, 8),
        channel(css->rgba, 0)};
      color.unwrapped = unwrapped;
      color.css_name = css->name;
      color.range = ident.range;
      return color;
    }
    diags
      .report(
        DiagCategory::LiteralError, ident.range,
        "unknown color '" + std::string(ident.text) + "'")
      .with_help("use a CSS color name, a #hex code or a color function such as hsl(...)");
    return std::nullopt;
  }

  diags.report(
    DiagCategory::LiteralError, cursor.here(),
    "expected hex color, color function or CSS color name");
  return std::nullopt;
}

std::optional<Color> parse_color(std::string_view text, DiagnosticBag & diags)
{
  const std::vector<Token> tokens = lex_literal(text);
  const auto end = static_cast<uint32_t>(text.size());
  TokenCursor cursor(tokens, SourceRange(end, end));

  auto color = parse_color(cursor, diags);
  if (color && !cursor.at_end()) {
    diags.report(DiagCategory::LiteralError, cursor.rest(), "unexpected tokens after color");
    return std::nullopt;
  }
  return color;
}

std::string render_color(const Color & color, const LiteralOptions & options)
{
  const auto & c = color.channels;
  std::string value = fmt::format(
    "{}{}({}, {}, {}, {})", options.color_namespace(), to_string(color.space),
    float_literal(c[0]), float_literal(c[1]), float_literal(c[2]), float_literal(c[3]));

  if (color.unwrapped) {
    return value;
  }
  return fmt::format("{}({})", options.color_type, value);
}

}  // namespace spawn_dsl::literals
