// spawn_dsl/literals/edges.hpp - Edges literal (`e!(...)`)
//
//   e ::= (length | '_'){1,4}
//
// Expanded like CSS shorthands: one value for all sides, two for
// vertical/horizontal, three for top/horizontal/bottom, four for
// top/right/bottom/left. `_` keeps the side at its default.
//
#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "spawn_dsl/literals/length.hpp"

namespace spawn_dsl::literals
{

struct Edges
{
  /// top, right, bottom, left; nullopt is the default value
  std::array<std::optional<Length>, 4> sides;
  SourceRange range;

  [[nodiscard]] const std::optional<Length> & top() const noexcept { return sides[0]; }
  [[nodiscard]] const std::optional<Length> & right() const noexcept { return sides[1]; }
  [[nodiscard]] const std::optional<Length> & bottom() const noexcept { return sides[2]; }
  [[nodiscard]] const std::optional<Length> & left() const noexcept { return sides[3]; }
};

[[nodiscard]] std::optional<Edges> parse_edges(TokenCursor & cursor, DiagnosticBag & diags);

[[nodiscard]] std::optional<Edges> parse_edges(std::string_view text, DiagnosticBag & diags);

/// `ui::UiRect{top, right, bottom, left}`; defaults render as `ui::Val()`.
[[nodiscard]] std::string render_edges(const Edges & edges, const LiteralOptions & options);

}  // namespace spawn_dsl::literals
