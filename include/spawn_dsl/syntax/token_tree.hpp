// spawn_dsl/syntax/token_tree.hpp - Delimiter matching over a token stream
//
// The parser works on a balanced token tree: every `(`, `[` and `{` has a
// matching closer, so any group can be skipped or captured as one unit.
//
#pragma once

#include <cstdint>
#include <vector>

#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/syntax/token.hpp"

namespace spawn_dsl::syntax
{

/**
 * Token stream with matched delimiters.
 *
 * `partner[i]` is the index of the matching delimiter for open/close tokens
 * and `i` itself for every other token.
 */
struct TokenTree
{
  std::vector<Token> tokens;
  std::vector<uint32_t> partner;

  [[nodiscard]] size_t size() const noexcept { return tokens.size(); }
  [[nodiscard]] const Token & operator[](size_t i) const { return tokens[i]; }
};

/**
 * Build a balanced TokenTree from lexer output.
 *
 * Reports unterminated literals, stray closers and unterminated groups as
 * SyntaxErrors. The result is always balanced: stray closers are dropped
 * and missing closers are synthesized (with an empty range) so parsing can
 * continue and report further errors.
 */
[[nodiscard]] TokenTree build_token_tree(std::vector<Token> tokens, DiagnosticBag & diags);

}  // namespace spawn_dsl::syntax
