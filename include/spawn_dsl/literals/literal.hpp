// spawn_dsl/literals/literal.hpp - Shared pieces of the literal converters
//
// The length (`v!`), color (`c!`) and edges (`e!`) converters read the
// tokens between the macro's parentheses through a TokenCursor and render
// C++ expressions naming the configured UI types.
//
#pragma once

#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "spawn_dsl/basic/source_manager.hpp"
#include "spawn_dsl/syntax/token.hpp"

namespace spawn_dsl::literals
{

/// Output types and switches for literal expansion.
struct LiteralOptions
{
  bool expand = true;
  std::string length_type = "ui::Val";
  std::string color_type = "ui::Color";
  std::string rect_type = "ui::UiRect";

  /// Namespace prefix of `color_type` (`ui::` for `ui::Color`).
  [[nodiscard]] std::string color_namespace() const
  {
    const auto pos = color_type.rfind("::");
    return pos == std::string::npos ? std::string{} : color_type.substr(0, pos + 2);
  }
};

/**
 * Forward-only view over the tokens of one literal.
 *
 * `end_range` is used for "expected ..." errors at the end of input.
 */
class TokenCursor
{
public:
  TokenCursor(gsl::span<const syntax::Token> tokens, SourceRange end_range)
  : tokens_(tokens), end_range_(end_range)
  {
  }

  [[nodiscard]] bool at_end() const noexcept { return pos_ >= tokens_.size(); }

  [[nodiscard]] const syntax::Token * peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return i < tokens_.size() ? &tokens_[i] : nullptr;
  }

  [[nodiscard]] bool at(syntax::TokenKind k) const noexcept
  {
    const syntax::Token * t = peek();
    return t != nullptr && t->kind == k;
  }

  const syntax::Token & next() { return tokens_[pos_++]; }

  /// Range of the current token, or the end range when exhausted.
  [[nodiscard]] SourceRange here() const noexcept
  {
    return at_end() ? end_range_ : tokens_[pos_].range;
  }

  /// Range from the current token to the end of input.
  [[nodiscard]] SourceRange rest() const noexcept
  {
    if (at_end()) {
      return end_range_;
    }
    return tokens_[pos_].range.merge(tokens_[tokens_.size() - 1].range);
  }

private:
  gsl::span<const syntax::Token> tokens_;
  SourceRange end_range_;
  size_t pos_ = 0;
};

/**
 * Tokens of a standalone literal such as `"10px"` or `"!#fff"`.
 *
 * The tokens point into `text`, which must outlive them. The trailing Eof
 * token is dropped.
 */
[[nodiscard]] std::vector<syntax::Token> lex_literal(std::string_view text);

/// C++ float literal for a finite value: `10.0f`, `0.5f`, `1e+20f`.
[[nodiscard]] std::string float_literal(float value);

/// Parses a decimal number token (`10`, `2.5`, `1e3`) ignoring its suffix.
[[nodiscard]] bool parse_decimal(const syntax::Token & tok, float & out);

}  // namespace spawn_dsl::literals
