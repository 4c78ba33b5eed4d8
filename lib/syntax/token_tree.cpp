// spawn_dsl/syntax/token_tree.cpp - Delimiter matching
#include "spawn_dsl/syntax/token_tree.hpp"

#include <string>

namespace spawn_dsl::syntax
{
namespace
{

Token synthetic_closer(TokenKind open, uint32_t at)
{
  Token t;
  t.kind = closing_delim(open);
  t.range = SourceRange(at, at);
  t.text = to_string(t.kind);
  return t;
}

}  // namespace

TokenTree build_token_tree(std::vector<Token> tokens, DiagnosticBag & diags)
{
  TokenTree tree;
  tree.tokens.reserve(tokens.size());
  tree.partner.reserve(tokens.size());

  std::vector<uint32_t> open_stack;

  const auto push = [&tree](const Token & t) {
    const auto idx = static_cast<uint32_t>(tree.tokens.size());
    tree.tokens.push_back(t);
    tree.partner.push_back(idx);
    return idx;
  };

  const auto close_top = [&](const Token & closer) {
    const uint32_t open_idx = open_stack.back();
    open_stack.pop_back();
    const uint32_t close_idx = push(closer);
    tree.partner[open_idx] = close_idx;
    tree.partner[close_idx] = open_idx;
  };

  for (const Token & t : tokens) {
    if (t.kind == TokenKind::Eof) {
      while (!open_stack.empty()) {
        const Token & open = tree.tokens[open_stack.back()];
        diags.report(DiagCategory::SyntaxError, open.range, "unterminated group", "opened here")
          .with_help(
            "add the missing '" + std::string(to_string(closing_delim(open.kind))) + "'");
        close_top(synthetic_closer(open.kind, t.begin()));
      }
      push(t);
      break;
    }

    if (t.kind == TokenKind::Unknown) {
      const bool quoted = !t.text.empty() && (t.text.front() == '"' || t.text.front() == '\'');
      diags.report(
        DiagCategory::SyntaxError, t.range,
        quoted ? "unterminated literal" : "unexpected character '" + std::string(t.text) + "'");
      continue;
    }

    if (is_open_delim(t.kind)) {
      open_stack.push_back(push(t));
      continue;
    }

    if (is_close_delim(t.kind)) {
      if (open_stack.empty()) {
        diags.report(
          DiagCategory::SyntaxError, t.range,
          "unexpected '" + std::string(to_string(t.kind)) + "'", "no matching opener");
        continue;
      }

      const Token & open = tree.tokens[open_stack.back()];
      if (closing_delim(open.kind) == t.kind) {
        close_top(t);
        continue;
      }

      diags
        .report(
          DiagCategory::SyntaxError, t.range,
          "mismatched '" + std::string(to_string(t.kind)) + "'",
          "expected '" + std::string(to_string(closing_delim(open.kind))) + "'")
        .with_secondary_label(open.range, "unterminated group opened here");

      bool enclosing_match = false;
      for (const uint32_t idx : open_stack) {
        if (closing_delim(tree.tokens[idx].kind) == t.kind) {
          enclosing_match = true;
        }
      }
      if (!enclosing_match) {
        continue;  // stray closer
      }

      // Close the unterminated inner groups here, then this closer ends
      // the enclosing group it belongs to.
      while (closing_delim(tree.tokens[open_stack.back()].kind) != t.kind) {
        const TokenKind inner = tree.tokens[open_stack.back()].kind;
        close_top(synthetic_closer(inner, t.begin()));
      }
      close_top(t);
      continue;
    }

    push(t);
  }

  return tree;
}

}  // namespace spawn_dsl::syntax
