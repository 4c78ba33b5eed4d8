// spawn_dsl/literals/literal_expander.cpp - Literal macro expansion
#include "spawn_dsl/literals/literal_expander.hpp"

#include "spawn_dsl/literals/color.hpp"
#include "spawn_dsl/literals/edges.hpp"
#include "spawn_dsl/literals/length.hpp"

namespace spawn_dsl::literals
{

using syntax::Token;
using syntax::TokenKind;

namespace
{

bool is_literal_macro(std::string_view name)
{
  return name == "v" || name == "c" || name == "e";
}

/// Index of the `)` closing the `(` at `open`, or `tokens.size()`.
size_t find_close(gsl::span<const Token> tokens, size_t open)
{
  int depth = 0;
  for (size_t i = open; i < tokens.size(); ++i) {
    if (syntax::is_open_delim(tokens[i].kind)) {
      ++depth;
    } else if (syntax::is_close_delim(tokens[i].kind) && --depth == 0) {
      return i;
    }
  }
  return tokens.size();
}

}  // namespace

std::optional<std::string> LiteralExpander::expand(const OpaqueExpr & expr)
{
  if (!options_.expand) {
    return std::string(expr.text);
  }

  const gsl::span<const Token> tokens = expr.tokens;
  const uint32_t base = expr.get_range().get_begin().get_offset();

  std::string out;
  size_t copied = 0;  // offset into expr.text
  bool ok = true;

  for (size_t i = 0; i + 2 < tokens.size(); ++i) {
    const Token & name = tokens[i];
    if (name.kind != TokenKind::Identifier || !is_literal_macro(name.text) ||
        tokens[i + 1].kind != TokenKind::Bang || tokens[i + 2].kind != TokenKind::LParen) {
      continue;
    }
    // `a.v!(...)` is a member call, not a literal.
    if (i > 0 && (tokens[i - 1].kind == TokenKind::Dot || tokens[i - 1].kind == TokenKind::Arrow ||
                  tokens[i - 1].kind == TokenKind::ColonColon)) {
      continue;
    }

    const size_t close = find_close(tokens, i + 2);
    if (close == tokens.size()) {
      continue;
    }

    const gsl::span<const Token> inner = tokens.subspan(i + 3, close - (i + 3));
    TokenCursor cursor(inner, tokens[close].range);

    std::optional<std::string> rendered;
    if (name.text == "v") {
      if (auto length = parse_length(cursor, diags_)) {
        if (cursor.at_end()) {
          rendered = render_length(*length, options_);
        } else {
          diags_.report(DiagCategory::LiteralError, cursor.rest(), "unexpected tokens after length");
        }
      }
    } else if (name.text == "c") {
      if (auto color = parse_color(cursor, diags_)) {
        if (cursor.at_end()) {
          rendered = render_color(*color, options_);
        } else {
          diags_.report(DiagCategory::LiteralError, cursor.rest(), "unexpected tokens after color");
        }
      }
    } else {
      if (auto edges = parse_edges(cursor, diags_)) {
        rendered = render_edges(*edges, options_);
      }
    }

    if (!rendered) {
      ok = false;
    } else {
      const size_t begin = name.begin() - base;
      out.append(expr.text.substr(copied, begin - copied));
      out += *rendered;
      copied = tokens[close].end() - base;
    }
    i = close;
  }

  if (!ok) {
    return std::nullopt;
  }
  out.append(expr.text.substr(copied));
  return out;
}

}  // namespace spawn_dsl::literals
