// spawn_dsl/literals/length.cpp - Length literal implementation
#include "spawn_dsl/literals/length.hpp"

#include <fmt/format.h>

namespace spawn_dsl::literals
{

using syntax::Token;
using syntax::TokenKind;

std::string_view to_string(LengthUnit unit) noexcept
{
  switch (unit) {
    case LengthUnit::Auto:
      return "Auto";
    case LengthUnit::Percent:
      return "Percent";
    case LengthUnit::Px:
      return "Px";
    case LengthUnit::Vw:
      return "Vw";
    case LengthUnit::Vh:
      return "Vh";
    case LengthUnit::VMin:
      return "VMin";
    case LengthUnit::VMax:
      return "VMax";
  }
  return "Auto";
}

namespace
{

std::optional<LengthUnit> unit_from_suffix(std::string_view suffix)
{
  if (suffix == "px") return LengthUnit::Px;
  if (suffix == "vw") return LengthUnit::Vw;
  if (suffix == "vh") return LengthUnit::Vh;
  if (suffix == "vmin") return LengthUnit::VMin;
  if (suffix == "vmax") return LengthUnit::VMax;
  return std::nullopt;
}

}  // namespace

std::optional<Length> parse_length(TokenCursor & cursor, DiagnosticBag & diags)
{
  if (cursor.at(TokenKind::Identifier)) {
    const Token & ident = cursor.next();
    if (ident.text == "auto") {
      return Length{LengthUnit::Auto, 0.0F, ident.range};
    }
    diags.report(DiagCategory::LiteralError, ident.range, "Invalid value");
    return std::nullopt;
  }

  if (cursor.at(TokenKind::At)) {
    return Length{LengthUnit::Auto, 0.0F, cursor.next().range};
  }

  // A minus sign glued to the number negates it: `-4px`.
  const Token * minus = nullptr;
  if (cursor.at(TokenKind::Minus) && cursor.peek(1) != nullptr &&
      cursor.peek(1)->kind == TokenKind::Number && !cursor.peek(1)->leading_space) {
    minus = &cursor.next();
  }

  if (!cursor.at(TokenKind::Number)) {
    diags.report(DiagCategory::LiteralError, cursor.here(), "Expected float or int");
    return std::nullopt;
  }

  const Token & num = cursor.next();
  float value = 0.0F;
  if (!parse_decimal(num, value)) {
    diags.report(DiagCategory::LiteralError, num.range, "Invalid value");
    return std::nullopt;
  }
  if (minus != nullptr) {
    value = -value;
  }
  const SourceRange range = minus != nullptr ? minus->range.merge(num.range) : num.range;

  if (num.suffix.empty() && cursor.at(TokenKind::Percent)) {
    const Token & percent = cursor.next();
    return Length{LengthUnit::Percent, value, range.merge(percent.range)};
  }

  if (const auto unit = unit_from_suffix(num.suffix)) {
    return Length{*unit, value, range};
  }

  diags
    .report(
      DiagCategory::LiteralError, num.range, "Invalid unit, expected px, vw, vh, vmin, vmax or %")
    .with_help("write the unit directly after the number, without a space: `10px`");
  return std::nullopt;
}

std::optional<Length> parse_length(std::string_view text, DiagnosticBag & diags)
{
  const std::vector<Token> tokens = lex_literal(text);
  const auto end = static_cast<uint32_t>(text.size());
  TokenCursor cursor(tokens, SourceRange(end, end));

  auto length = parse_length(cursor, diags);
  if (length && !cursor.at_end()) {
    diags.report(DiagCategory::LiteralError, cursor.rest(), "unexpected tokens after length");
    return std::nullopt;
  }
  return length;
}

std::string render_length(const Length & length, const LiteralOptions & options)
{
  if (length.unit == LengthUnit::Auto) {
    return fmt::format("{}::Auto", options.length_type);
  }
  return fmt::format(
    "{}::{}({})", options.length_type, to_string(length.unit), float_literal(length.value));
}

}  // namespace spawn_dsl::literals
