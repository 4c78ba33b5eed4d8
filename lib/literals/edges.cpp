// spawn_dsl/literals/edges.cpp - Edges literal implementation
#include "spawn_dsl/literals/edges.hpp"

#include <fmt/format.h>
#include <vector>

namespace spawn_dsl::literals
{

using syntax::Token;
using syntax::TokenKind;

std::optional<Edges> parse_edges(TokenCursor & cursor, DiagnosticBag & diags)
{
  const SourceRange start = cursor.here();

  std::vector<std::optional<Length>> values;
  while (!cursor.at_end() && values.size() < 4) {
    const Token * tok = cursor.peek();
    if (tok->kind == TokenKind::Identifier && tok->text == "_") {
      cursor.next();
      values.emplace_back(std::nullopt);
      continue;
    }
    auto length = parse_length(cursor, diags);
    if (!length) {
      return std::nullopt;
    }
    values.emplace_back(*length);
  }

  if (values.empty() || !cursor.at_end()) {
    diags.report(DiagCategory::LiteralError, cursor.rest(), "Expected 1-4 value or '_'");
    return std::nullopt;
  }

  Edges edges;
  edges.range = start;
  switch (values.size()) {
    case 1:
      edges.sides = {values[0], values[0], values[0], values[0]};
      break;
    case 2:
      edges.sides = {values[0], values[1], values[0], values[1]};
      break;
    case 3:
      edges.sides = {values[0], values[1], values[2], values[1]};
      break;
    default:
      edges.sides = {values[0], values[1], values[2], values[3]};
      break;
  }
  return edges;
}

std::optional<Edges> parse_edges(std::string_view text, DiagnosticBag & diags)
{
  const std::vector<Token> tokens = lex_literal(text);
  const auto end = static_cast<uint32_t>(text.size());
  TokenCursor cursor(tokens, SourceRange(end, end));
  return parse_edges(cursor, diags);
}

std::string render_edges(const Edges & edges, const LiteralOptions & options)
{
  const auto side = [&options](const std::optional<Length> & v) {
    return v ? render_length(*v, options) : options.length_type + "()";
  };
  return fmt::format(
    "{}{{{}, {}, {}, {}}}", options.rect_type, side(edges.top()), side(edges.right()),
    side(edges.bottom()), side(edges.left()));
}

}  // namespace spawn_dsl::literals
