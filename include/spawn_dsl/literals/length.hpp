// spawn_dsl/literals/length.hpp - Length literal (`v!(...)`)
//
//   v ::= 'auto' | '@' | number '%' | number + ('px'|'vw'|'vh'|'vmin'|'vmax')
//
// The unit is the number token's own suffix, so `10 vw` (with a space) is
// rejected. `%` is a separate token and may be spaced.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/literals/literal.hpp"

namespace spawn_dsl::literals
{

enum class LengthUnit : uint8_t {
  Auto,
  Percent,
  Px,
  Vw,
  Vh,
  VMin,
  VMax,
};

[[nodiscard]] std::string_view to_string(LengthUnit unit) noexcept;

struct Length
{
  LengthUnit unit = LengthUnit::Auto;
  float value = 0.0F;
  SourceRange range;

  [[nodiscard]] bool operator==(const Length & other) const noexcept
  {
    return unit == other.unit && value == other.value;
  }
  [[nodiscard]] bool operator!=(const Length & other) const noexcept { return !(*this == other); }
};

/// Reads one length at the cursor. Errors are reported as LiteralError.
[[nodiscard]] std::optional<Length> parse_length(TokenCursor & cursor, DiagnosticBag & diags);

/// Parses a standalone length such as `"10px"`; trailing tokens are an error.
[[nodiscard]] std::optional<Length> parse_length(std::string_view text, DiagnosticBag & diags);

/// `ui::Val::Px(10.0f)`, `ui::Val::Auto`
[[nodiscard]] std::string render_length(const Length & length, const LiteralOptions & options);

}  // namespace spawn_dsl::literals
