// spawn_dsl/literals/color.hpp - Color literal (`c!(...)`)
//
//   c     ::= '!'? color
//   color ::= '#' hex{3,4,6,8}
//           | ('srgb'|'linear'|'hsl'|'hsv'|'hwb'|'lab'|'lch'|'oklab'|'oklch'|'xyz')
//             '(' number (',' number){2,3} ')'
//           | css-color-name
//
// A leading `!` yields the bare color-space value instead of the wrapping
// color type.
//
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/literals/literal.hpp"

namespace spawn_dsl::literals
{

enum class ColorSpace : uint8_t {
  Srgba,
  LinearRgba,
  Hsla,
  Hsva,
  Hwba,
  Laba,
  Lcha,
  Oklaba,
  Oklcha,
  Xyza,
};

/// Type name of the color-space value (`Srgba`, `Hsla`, ...).
[[nodiscard]] std::string_view to_string(ColorSpace space) noexcept;

/// Color space for a color function name (`hsl` -> Hsla).
[[nodiscard]] std::optional<ColorSpace> color_function(std::string_view name) noexcept;

struct Color
{
  ColorSpace space = ColorSpace::Srgba;
  std::array<float, 4> channels{0.0F, 0.0F, 0.0F, 1.0F};
  bool unwrapped = false;
  std::string_view css_name;  ///< set for CSS named colors
  SourceRange range;

  /// Same color value; the `!` flag and source range are not compared.
  [[nodiscard]] bool same_value(const Color & other) const noexcept
  {
    return space == other.space && channels == other.channels;
  }
};

// ============================================================================
// CSS named colors
// ============================================================================

struct CssColor
{
  std::string_view name;
  uint32_t rgba;  ///< 0xRRGGBBAA
};

/// Looks up one of the 149 CSS color names (case-sensitive, lower case).
[[nodiscard]] const CssColor * find_css_color(std::string_view name) noexcept;

[[nodiscard]] size_t css_color_count() noexcept;

// ============================================================================
// Parsing / rendering
// ============================================================================

/// Reads one color at the cursor. Errors are reported as LiteralError.
[[nodiscard]] std::optional<Color> parse_color(TokenCursor & cursor, DiagnosticBag & diags);

/// Parses a standalone color such as `"#fff"` or `"!hsl(120, 1, 0.5)"`.
[[nodiscard]] std::optional<Color> parse_color(std::string_view text, DiagnosticBag & diags);

/**
 * Renders a color expression.
 *
 * Unwrapped: `ui::Srgba(1.0f, 1.0f, 1.0f, 1.0f)`.
 * Wrapped:   `ui::Color(ui::Srgba(1.0f, 1.0f, 1.0f, 1.0f))`.
 */
[[nodiscard]] std::string render_color(const Color & color, const LiteralOptions & options);

}  // namespace spawn_dsl::literals
